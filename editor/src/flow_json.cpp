#include "EvflEditor/editor/flow_json.hpp"
#include "EvflEditor/core/logger.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <cmath>
#include <format>
#include <limits>

namespace EvflEditor::editor {

// ============================================================================
// Error code to string
// ============================================================================

const char* flowJsonErrorToString(FlowJsonError error) {
  switch (error) {
  case FlowJsonError::InvalidJsonSyntax:
    return "Invalid JSON syntax";
  case FlowJsonError::MissingRequiredField:
    return "Missing required field";
  case FlowJsonError::InvalidFieldType:
    return "Invalid field type";
  case FlowJsonError::InvalidFieldValue:
    return "Invalid field value";
  case FlowJsonError::UnsupportedVersion:
    return "Unsupported version";
  case FlowJsonError::FileNotFound:
    return "File not found";
  case FlowJsonError::FileOpenFailed:
    return "Failed to open file";
  case FlowJsonError::FileWriteFailed:
    return "Failed to write file";
  default:
    return "Unknown error";
  }
}

namespace {

using flow::EventIndex;

FlowJsonFailure failure(FlowJsonError code, std::string message) {
  return {code, std::move(message)};
}

// ============================================================================
// Field extraction helpers
// ============================================================================

FlowJsonResult<QJsonValue> requireField(const QJsonObject& obj, const char* key,
                                        const std::string& context) {
  const QJsonValue value = obj.value(QLatin1String(key));
  if (value.isUndefined()) {
    return FlowJsonResult<QJsonValue>::error(failure(
        FlowJsonError::MissingRequiredField, std::format("{}: missing field '{}'", context, key)));
  }
  return FlowJsonResult<QJsonValue>::ok(value);
}

FlowJsonResult<std::string> getString(const QJsonObject& obj, const char* key,
                                      const std::string& context) {
  auto value = requireField(obj, key, context);
  if (value.isError()) {
    return FlowJsonResult<std::string>::error(value.error());
  }
  if (!value.value().isString()) {
    return FlowJsonResult<std::string>::error(
        failure(FlowJsonError::InvalidFieldType,
                std::format("{}: field '{}' must be a string", context, key)));
  }
  return FlowJsonResult<std::string>::ok(value.value().toString().toStdString());
}

FlowJsonResult<std::string> getOptionalString(const QJsonObject& obj, const char* key,
                                              const std::string& context) {
  if (!obj.contains(QLatin1String(key))) {
    return FlowJsonResult<std::string>::ok({});
  }
  return getString(obj, key, context);
}

FlowJsonResult<f64> getNumber(const QJsonObject& obj, const char* key,
                              const std::string& context) {
  auto value = requireField(obj, key, context);
  if (value.isError()) {
    return FlowJsonResult<f64>::error(value.error());
  }
  if (!value.value().isDouble()) {
    return FlowJsonResult<f64>::error(
        failure(FlowJsonError::InvalidFieldType,
                std::format("{}: field '{}' must be a number", context, key)));
  }
  return FlowJsonResult<f64>::ok(value.value().toDouble());
}

FlowJsonResult<i64> toInteger(const QJsonValue& value, i64 minValue, i64 maxValue,
                              const std::string& what) {
  if (!value.isDouble()) {
    return FlowJsonResult<i64>::error(
        failure(FlowJsonError::InvalidFieldType, std::format("{} must be an integer", what)));
  }
  const f64 number = value.toDouble();
  if (std::floor(number) != number) {
    return FlowJsonResult<i64>::error(
        failure(FlowJsonError::InvalidFieldType, std::format("{} must be an integer", what)));
  }
  if (number < static_cast<f64>(minValue) || number > static_cast<f64>(maxValue)) {
    return FlowJsonResult<i64>::error(
        failure(FlowJsonError::InvalidFieldValue, std::format("{} is out of range", what)));
  }
  return FlowJsonResult<i64>::ok(static_cast<i64>(number));
}

FlowJsonResult<EventIndex> toEventIndex(const QJsonValue& value, usize eventCount,
                                        const std::string& what) {
  auto number = toInteger(value, 0, std::numeric_limits<i32>::max(), what);
  if (number.isError()) {
    return FlowJsonResult<EventIndex>::error(number.error());
  }
  if (static_cast<usize>(number.value()) >= eventCount) {
    return FlowJsonResult<EventIndex>::error(
        failure(FlowJsonError::InvalidFieldValue,
                std::format("{} refers to missing event {}", what, number.value())));
  }
  return FlowJsonResult<EventIndex>::ok(static_cast<EventIndex>(number.value()));
}

/// Reads an optional event reference; absent or null means "none"
FlowJsonResult<std::optional<EventIndex>> getOptionalIndex(const QJsonObject& obj,
                                                           const char* key, usize eventCount,
                                                           const std::string& context) {
  const QJsonValue value = obj.value(QLatin1String(key));
  if (value.isUndefined() || value.isNull()) {
    return FlowJsonResult<std::optional<EventIndex>>::ok(std::nullopt);
  }
  auto idx = toEventIndex(value, eventCount, std::format("{}: field '{}'", context, key));
  if (idx.isError()) {
    return FlowJsonResult<std::optional<EventIndex>>::error(idx.error());
  }
  return FlowJsonResult<std::optional<EventIndex>>::ok(idx.value());
}

// ============================================================================
// Events
// ============================================================================

FlowJsonResult<flow::EventData> parseEventData(const QJsonObject& obj, const std::string& type,
                                               usize eventCount, const std::string& context) {
  using DataResult = FlowJsonResult<flow::EventData>;

  if (type == "unset") {
    return DataResult::ok(flow::UnsetEvent{});
  }

  if (type == "action" || type == "join" || type == "subflow") {
    auto next = getOptionalIndex(obj, "next", eventCount, context);
    if (next.isError()) {
      return DataResult::error(next.error());
    }

    if (type == "join") {
      return DataResult::ok(flow::JoinEvent{next.value()});
    }

    if (type == "action") {
      auto actor = getString(obj, "actor", context);
      if (actor.isError()) {
        return DataResult::error(actor.error());
      }
      auto action = getString(obj, "action", context);
      if (action.isError()) {
        return DataResult::error(action.error());
      }
      return DataResult::ok(flow::ActionEvent{actor.value(), action.value(), next.value()});
    }

    auto flowchartName = getOptionalString(obj, "flowchart", context);
    if (flowchartName.isError()) {
      return DataResult::error(flowchartName.error());
    }
    auto entryPoint = getString(obj, "entry_point", context);
    if (entryPoint.isError()) {
      return DataResult::error(entryPoint.error());
    }
    return DataResult::ok(
        flow::SubFlowEvent{flowchartName.value(), entryPoint.value(), next.value()});
  }

  if (type == "switch") {
    flow::SwitchEvent data;
    auto actor = getString(obj, "actor", context);
    if (actor.isError()) {
      return DataResult::error(actor.error());
    }
    auto query = getString(obj, "query", context);
    if (query.isError()) {
      return DataResult::error(query.error());
    }
    data.actor = actor.value();
    data.query = query.value();

    const QJsonValue cases = obj.value(QLatin1String("cases"));
    if (!cases.isUndefined()) {
      if (!cases.isArray()) {
        return DataResult::error(failure(FlowJsonError::InvalidFieldType,
                                         context + ": field 'cases' must be an array"));
      }
      for (const QJsonValue& entry : cases.toArray()) {
        if (!entry.isObject()) {
          return DataResult::error(
              failure(FlowJsonError::InvalidFieldType, context + ": switch case must be an object"));
        }
        const QJsonObject caseObj = entry.toObject();
        auto valueField = requireField(caseObj, "value", context);
        if (valueField.isError()) {
          return DataResult::error(valueField.error());
        }
        auto value = toInteger(valueField.value(), std::numeric_limits<i32>::min(),
                               std::numeric_limits<i32>::max(), context + ": case value");
        if (value.isError()) {
          return DataResult::error(value.error());
        }
        auto targetField = requireField(caseObj, "event", context);
        if (targetField.isError()) {
          return DataResult::error(targetField.error());
        }
        auto target = toEventIndex(targetField.value(), eventCount, context + ": case target");
        if (target.isError()) {
          return DataResult::error(target.error());
        }
        if (!data.cases.try_emplace(static_cast<i32>(value.value()), target.value()).second) {
          return DataResult::error(
              failure(FlowJsonError::InvalidFieldValue,
                      std::format("{}: duplicate switch case {}", context, value.value())));
        }
      }
    }
    return DataResult::ok(std::move(data));
  }

  if (type == "fork") {
    flow::ForkEvent data;
    const QJsonValue forks = obj.value(QLatin1String("forks"));
    if (!forks.isUndefined()) {
      if (!forks.isArray()) {
        return DataResult::error(failure(FlowJsonError::InvalidFieldType,
                                         context + ": field 'forks' must be an array"));
      }
      for (const QJsonValue& entry : forks.toArray()) {
        auto target = toEventIndex(entry, eventCount, context + ": fork branch");
        if (target.isError()) {
          return DataResult::error(target.error());
        }
        data.forks.push_back(target.value());
      }
    }
    auto join = getOptionalIndex(obj, "join", eventCount, context);
    if (join.isError()) {
      return DataResult::error(join.error());
    }
    data.join = join.value();
    return DataResult::ok(std::move(data));
  }

  return DataResult::error(failure(FlowJsonError::InvalidFieldValue,
                                   std::format("{}: unknown event type '{}'", context, type)));
}

FlowJsonResult<flow::Flowchart> parseFlowchart(const QJsonObject& obj) {
  using ChartResult = FlowJsonResult<flow::Flowchart>;

  auto name = getString(obj, "name", "flowchart");
  if (name.isError()) {
    return ChartResult::error(name.error());
  }
  flow::Flowchart chart(name.value());

  auto eventsField = requireField(obj, "events", "flowchart");
  if (eventsField.isError()) {
    return ChartResult::error(eventsField.error());
  }
  if (!eventsField.value().isArray()) {
    return ChartResult::error(
        failure(FlowJsonError::InvalidFieldType, "flowchart: field 'events' must be an array"));
  }

  const QJsonArray events = eventsField.value().toArray();
  const usize eventCount = static_cast<usize>(events.size());
  for (usize i = 0; i < eventCount; ++i) {
    const std::string context = std::format("event {}", i);
    const QJsonValue entry = events.at(static_cast<qsizetype>(i));
    if (!entry.isObject()) {
      return ChartResult::error(
          failure(FlowJsonError::InvalidFieldType, context + " must be an object"));
    }
    const QJsonObject eventObj = entry.toObject();

    auto eventName = getString(eventObj, "name", context);
    if (eventName.isError()) {
      return ChartResult::error(eventName.error());
    }
    auto type = getString(eventObj, "type", context);
    if (type.isError()) {
      return ChartResult::error(type.error());
    }
    auto data = parseEventData(eventObj, type.value(), eventCount, context);
    if (data.isError()) {
      return ChartResult::error(data.error());
    }
    chart.addEvent(eventName.value(), std::move(data).value());
  }

  const QJsonValue entryPoints = obj.value(QLatin1String("entry_points"));
  if (!entryPoints.isUndefined()) {
    if (!entryPoints.isObject()) {
      return ChartResult::error(failure(FlowJsonError::InvalidFieldType,
                                        "flowchart: field 'entry_points' must be an object"));
    }
    const QJsonObject entries = entryPoints.toObject();
    for (auto it = entries.begin(); it != entries.end(); ++it) {
      const std::string entryName = it.key().toStdString();
      auto idx = toEventIndex(it.value(), eventCount, std::format("entry point '{}'", entryName));
      if (idx.isError()) {
        return ChartResult::error(idx.error());
      }
      chart.setEntryPoint(entryName, idx.value());
    }
  }
  return ChartResult::ok(std::move(chart));
}

// ============================================================================
// Timeline
// ============================================================================

FlowJsonResult<flow::Timeline> parseTimeline(const QJsonObject& obj) {
  using TimelineResult = FlowJsonResult<flow::Timeline>;

  auto name = getOptionalString(obj, "name", "timeline");
  if (name.isError()) {
    return TimelineResult::error(name.error());
  }
  flow::Timeline timeline(name.value());

  const QJsonValue clips = obj.value(QLatin1String("clips"));
  if (clips.isUndefined()) {
    return TimelineResult::ok(std::move(timeline));
  }
  if (!clips.isArray()) {
    return TimelineResult::error(
        failure(FlowJsonError::InvalidFieldType, "timeline: field 'clips' must be an array"));
  }

  int index = 0;
  for (const QJsonValue& entry : clips.toArray()) {
    const std::string context = std::format("clip {}", index++);
    if (!entry.isObject()) {
      return TimelineResult::error(
          failure(FlowJsonError::InvalidFieldType, context + " must be an object"));
    }
    const QJsonObject clipObj = entry.toObject();

    flow::Clip clip;
    auto clipName = getString(clipObj, "name", context);
    if (clipName.isError()) {
      return TimelineResult::error(clipName.error());
    }
    clip.name = clipName.value();

    auto start = getNumber(clipObj, "start_time", context);
    if (start.isError()) {
      return TimelineResult::error(start.error());
    }
    auto duration = getNumber(clipObj, "duration", context);
    if (duration.isError()) {
      return TimelineResult::error(duration.error());
    }
    if (start.value() < 0.0 || duration.value() <= 0.0) {
      return TimelineResult::error(failure(FlowJsonError::InvalidFieldValue,
                                           context + ": negative start time or empty duration"));
    }
    clip.startTime = start.value();
    clip.duration = duration.value();

    auto typeName = getString(clipObj, "type", context);
    if (typeName.isError()) {
      return TimelineResult::error(typeName.error());
    }
    auto type = flow::clipTypeFromString(typeName.value());
    if (!type) {
      return TimelineResult::error(
          failure(FlowJsonError::InvalidFieldValue,
                  std::format("{}: unknown clip type '{}'", context, typeName.value())));
    }
    clip.type = *type;

    const QJsonValue actor = clipObj.value(QLatin1String("actor"));
    if (actor.isString()) {
      clip.actor = actor.toString().toStdString();
    } else if (!actor.isUndefined() && !actor.isNull()) {
      return TimelineResult::error(failure(FlowJsonError::InvalidFieldType,
                                           context + ": field 'actor' must be a string or null"));
    }
    timeline.addClip(std::move(clip));
  }
  return TimelineResult::ok(std::move(timeline));
}

// ============================================================================
// Serialization
// ============================================================================

QJsonValue indexOrNull(const std::optional<EventIndex>& idx) {
  return idx ? QJsonValue(static_cast<qint64>(*idx)) : QJsonValue(QJsonValue::Null);
}

QJsonObject serializeEvent(const flow::Event& event) {
  QJsonObject obj;
  obj.insert("name", QString::fromStdString(event.name));

  std::visit(flow::Overloaded{
                 [&](const flow::UnsetEvent&) { obj.insert("type", "unset"); },
                 [&](const flow::ActionEvent& e) {
                   obj.insert("type", "action");
                   obj.insert("actor", QString::fromStdString(e.actor));
                   obj.insert("action", QString::fromStdString(e.action));
                   obj.insert("next", indexOrNull(e.next));
                 },
                 [&](const flow::JoinEvent& e) {
                   obj.insert("type", "join");
                   obj.insert("next", indexOrNull(e.next));
                 },
                 [&](const flow::SubFlowEvent& e) {
                   obj.insert("type", "subflow");
                   obj.insert("flowchart", QString::fromStdString(e.flowchartName));
                   obj.insert("entry_point", QString::fromStdString(e.entryPointName));
                   obj.insert("next", indexOrNull(e.next));
                 },
                 [&](const flow::SwitchEvent& e) {
                   obj.insert("type", "switch");
                   obj.insert("actor", QString::fromStdString(e.actor));
                   obj.insert("query", QString::fromStdString(e.query));
                   QJsonArray cases;
                   for (const auto& [value, target] : e.cases) {
                     QJsonObject entry;
                     entry.insert("value", value);
                     entry.insert("event", static_cast<qint64>(target));
                     cases.append(entry);
                   }
                   obj.insert("cases", cases);
                 },
                 [&](const flow::ForkEvent& e) {
                   obj.insert("type", "fork");
                   QJsonArray forks;
                   for (EventIndex target : e.forks) {
                     forks.append(static_cast<qint64>(target));
                   }
                   obj.insert("forks", forks);
                   obj.insert("join", indexOrNull(e.join));
                 },
             },
             event.data);
  return obj;
}

QJsonObject serializeFlowchart(const flow::Flowchart& chart) {
  QJsonArray events;
  for (const auto& event : chart.events()) {
    events.append(serializeEvent(event));
  }
  QJsonObject entryPoints;
  for (const auto& [name, idx] : chart.entryPoints()) {
    entryPoints.insert(QString::fromStdString(name), static_cast<qint64>(idx));
  }

  QJsonObject obj;
  obj.insert("name", QString::fromStdString(chart.name()));
  obj.insert("events", events);
  obj.insert("entry_points", entryPoints);
  return obj;
}

QJsonObject serializeTimeline(const flow::Timeline& timeline) {
  QJsonArray clips;
  for (const auto& clip : timeline.clips()) {
    QJsonObject obj;
    obj.insert("name", QString::fromStdString(clip.name));
    obj.insert("start_time", clip.startTime);
    obj.insert("duration", clip.duration);
    obj.insert("type", QString::fromLatin1(flow::clipTypeToString(clip.type)));
    obj.insert("actor", clip.actor ? QJsonValue(QString::fromStdString(*clip.actor))
                                   : QJsonValue(QJsonValue::Null));
    clips.append(obj);
  }

  QJsonObject obj;
  obj.insert("name", QString::fromStdString(timeline.name()));
  obj.insert("clips", clips);
  return obj;
}

} // namespace

// ============================================================================
// FlowJsonHandler
// ============================================================================

FlowJsonResult<flow::EventFlow> FlowJsonHandler::parseFromString(const QByteArray& json) {
  using FlowResult = FlowJsonResult<flow::EventFlow>;

  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    return FlowResult::error(failure(FlowJsonError::InvalidJsonSyntax,
                                     std::format("JSON parse error at offset {}: {}",
                                                 parseError.offset,
                                                 parseError.errorString().toStdString())));
  }
  if (!doc.isObject()) {
    return FlowResult::error(
        failure(FlowJsonError::InvalidFieldType, "document root must be an object"));
  }
  const QJsonObject root = doc.object();

  auto versionField = requireField(root, "version", "document");
  if (versionField.isError()) {
    return FlowResult::error(versionField.error());
  }
  auto version = toInteger(versionField.value(), 0, std::numeric_limits<i32>::max(), "version");
  if (version.isError()) {
    return FlowResult::error(version.error());
  }
  if (version.value() != static_cast<i64>(getCurrentVersion())) {
    return FlowResult::error(failure(
        FlowJsonError::UnsupportedVersion,
        std::format("version {} is not supported (expected {})", version.value(),
                    getCurrentVersion())));
  }

  flow::EventFlow result;
  auto name = getOptionalString(root, "name", "document");
  if (name.isError()) {
    return FlowResult::error(name.error());
  }
  result.name = name.value();

  const QJsonValue flowchart = root.value(QLatin1String("flowchart"));
  if (!flowchart.isUndefined() && !flowchart.isNull()) {
    if (!flowchart.isObject()) {
      return FlowResult::error(
          failure(FlowJsonError::InvalidFieldType, "field 'flowchart' must be an object"));
    }
    auto chart = parseFlowchart(flowchart.toObject());
    if (chart.isError()) {
      return FlowResult::error(chart.error());
    }
    result.flowchart = std::move(chart).value();
  }

  const QJsonValue timeline = root.value(QLatin1String("timeline"));
  if (!timeline.isUndefined() && !timeline.isNull()) {
    if (!timeline.isObject()) {
      return FlowResult::error(
          failure(FlowJsonError::InvalidFieldType, "field 'timeline' must be an object"));
    }
    auto parsed = parseTimeline(timeline.toObject());
    if (parsed.isError()) {
      return FlowResult::error(parsed.error());
    }
    result.timeline = std::move(parsed).value();
  }

  return FlowResult::ok(std::move(result));
}

QByteArray FlowJsonHandler::serializeToString(const flow::EventFlow& flow) {
  QJsonObject root;
  root.insert("version", static_cast<int>(getCurrentVersion()));
  root.insert("name", QString::fromStdString(flow.name));
  if (flow.flowchart) {
    root.insert("flowchart", serializeFlowchart(*flow.flowchart));
  }
  if (flow.timeline) {
    root.insert("timeline", serializeTimeline(*flow.timeline));
  }
  return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

FlowJsonResult<flow::EventFlow> FlowJsonHandler::loadFromFile(const QString& path) {
  using FlowResult = FlowJsonResult<flow::EventFlow>;

  QFile file(path);
  if (!file.exists()) {
    return FlowResult::error(
        failure(FlowJsonError::FileNotFound, "File not found: " + path.toStdString()));
  }
  if (!file.open(QIODevice::ReadOnly)) {
    return FlowResult::error(failure(FlowJsonError::FileOpenFailed,
                                     std::format("Cannot open {}: {}", path.toStdString(),
                                                 file.errorString().toStdString())));
  }

  auto parsed = parseFromString(file.readAll());
  if (parsed.isError()) {
    EVFLEDITOR_LOG_WARN("Failed to load {}: {}", path.toStdString(), parsed.error().message);
    return parsed;
  }
  EVFLEDITOR_LOG_INFO("Loaded event flow '{}' from {}", parsed.value().name, path.toStdString());
  return parsed;
}

FlowJsonResult<void> FlowJsonHandler::saveToFile(const QString& path,
                                                 const flow::EventFlow& flow) {
  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    return FlowJsonResult<void>::error(
        failure(FlowJsonError::FileOpenFailed,
                std::format("Cannot open {} for writing: {}", path.toStdString(),
                            file.errorString().toStdString())));
  }

  const QByteArray data = serializeToString(flow);
  if (file.write(data) != data.size() || !file.commit()) {
    return FlowJsonResult<void>::error(
        failure(FlowJsonError::FileWriteFailed,
                std::format("Cannot write {}: {}", path.toStdString(),
                            file.errorString().toStdString())));
  }

  EVFLEDITOR_LOG_INFO("Saved event flow '{}' to {}", flow.name, path.toStdString());
  return FlowJsonResult<void>::ok();
}

} // namespace EvflEditor::editor
