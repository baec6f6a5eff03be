#include "EvflEditor/editor/timeline_document.hpp"
#include "EvflEditor/core/logger.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>
#include <cmath>
#include <format>

namespace EvflEditor::editor {

TimelineDocument::TimelineDocument(FlowData& flowData, TimelineViewSettings settings)
    : m_flowData(flowData), m_settings(settings),
      m_zoom(std::clamp(settings.initialZoom, settings.minZoom, settings.maxZoom)) {}

// ============================================================================
// Zoom
// ============================================================================

void TimelineDocument::zoomIn() {
  m_zoom = std::min(m_zoom * m_settings.zoomStep, m_settings.maxZoom);
}

void TimelineDocument::zoomOut() {
  m_zoom = std::max(m_zoom / m_settings.zoomStep, m_settings.minZoom);
}

// ============================================================================
// Selection
// ============================================================================

bool TimelineDocument::selectClip(int clipId) {
  const auto* timeline = m_flowData.timeline();
  if (!timeline || clipId < 0 || static_cast<usize>(clipId) >= timeline->clipCount()) {
    EVFLEDITOR_LOG_DEBUG("Ignoring selection of unknown clip {}", clipId);
    return false;
  }
  m_selected = static_cast<usize>(clipId);
  publishSelection();
  return true;
}

bool TimelineDocument::selectClipFromBridge(const QString& payload) {
  bool isNumber = false;
  const int directId = payload.trimmed().toInt(&isNumber);
  if (isNumber) {
    return selectClip(directId);
  }

  const QJsonDocument doc = QJsonDocument::fromJson(payload.toUtf8());
  if (!doc.isObject() || !doc.object().value("id").isDouble()) {
    EVFLEDITOR_LOG_WARN("Malformed clip selection from timeline view: {}", payload.toStdString());
    return false;
  }
  return selectClip(doc.object().value("id").toInt(-1));
}

void TimelineDocument::clearSelection() {
  if (!m_selected) {
    return;
  }
  m_selected.reset();
  publishSelection();
}

const flow::Clip* TimelineDocument::selectedClip() const {
  const auto* timeline = m_flowData.timeline();
  if (!timeline || !m_selected || *m_selected >= timeline->clipCount()) {
    return nullptr;
  }
  return &timeline->clip(*m_selected);
}

void TimelineDocument::publishSelection() {
  const int index = m_selected ? static_cast<int>(*m_selected) : -1;
  m_flowData.bus().publish(events::ClipSelectedEvent(index));
}

// ============================================================================
// Clip editing
// ============================================================================

Result<void> TimelineDocument::validateDraft(const ClipDraft& draft) {
  if (draft.name.empty()) {
    return Result<void>::error("Please enter a clip name.");
  }
  if (draft.startTime < MIN_START_TIME || draft.startTime > MAX_TIME) {
    return Result<void>::error(
        std::format("Start time must be between {} and {} seconds.", MIN_START_TIME, MAX_TIME));
  }
  if (draft.duration < MIN_DURATION || draft.duration > MAX_TIME) {
    return Result<void>::error(
        std::format("Duration must be between {} and {} seconds.", MIN_DURATION, MAX_TIME));
  }
  return Result<void>::ok();
}

flow::Clip TimelineDocument::clipFromDraft(const ClipDraft& draft) const {
  flow::Clip clip;
  clip.name = draft.name;
  clip.startTime = draft.startTime;
  clip.duration = draft.duration;
  clip.type = draft.type;
  clip.actor = draft.actor;
  return clip;
}

Result<usize> TimelineDocument::addClip(const ClipDraft& draft) {
  auto* timeline = m_flowData.timeline();
  if (!timeline) {
    return Result<usize>::error("No timeline is loaded.");
  }
  auto valid = validateDraft(draft);
  if (valid.isError()) {
    return Result<usize>::error(valid.error());
  }

  const usize index = timeline->addClip(clipFromDraft(draft));
  EVFLEDITOR_LOG_DEBUG("Added clip '{}' at {}s", draft.name, draft.startTime);
  m_flowData.notifyChanged(events::FlowDataChangeReason::Timeline);
  return Result<usize>::ok(index);
}

Result<void> TimelineDocument::updateSelectedClip(const ClipDraft& draft) {
  auto* timeline = m_flowData.timeline();
  if (!timeline || !m_selected || *m_selected >= timeline->clipCount()) {
    return Result<void>::error("Please select a clip to edit.");
  }
  auto valid = validateDraft(draft);
  if (valid.isError()) {
    return valid;
  }

  flow::Clip& clip = timeline->clip(*m_selected);
  // The properties form does not edit the actor; keep the existing one
  flow::Clip updated = clipFromDraft(draft);
  if (!draft.actor) {
    updated.actor = clip.actor;
  }
  if (updated == clip) {
    return Result<void>::ok();
  }

  clip = std::move(updated);
  EVFLEDITOR_LOG_DEBUG("Updated clip {} ('{}')", *m_selected, clip.name);
  m_flowData.notifyChanged(events::FlowDataChangeReason::Timeline);
  return Result<void>::ok();
}

Result<void> TimelineDocument::deleteSelectedClip() {
  auto* timeline = m_flowData.timeline();
  if (!timeline || !m_selected || *m_selected >= timeline->clipCount()) {
    return Result<void>::error("Please select a clip to delete.");
  }

  const std::string name = timeline->clip(*m_selected).name;
  timeline->removeClip(*m_selected);
  m_selected.reset();
  EVFLEDITOR_LOG_DEBUG("Deleted clip '{}'", name);
  publishSelection();
  m_flowData.notifyChanged(events::FlowDataChangeReason::Timeline);
  return Result<void>::ok();
}

// ============================================================================
// View data
// ============================================================================

std::vector<TimelineTrack> TimelineDocument::tracks() const {
  std::vector<TimelineTrack> result;
  const auto* timeline = m_flowData.timeline();
  if (!timeline) {
    return result;
  }

  for (usize i = 0; i < timeline->clipCount(); ++i) {
    const flow::Clip& clip = timeline->clip(i);
    std::string trackName;
    if (clip.actor && !clip.actor->empty()) {
      trackName = *clip.actor;
    } else {
      trackName = flow::clipTypeToString(clip.type);
    }

    auto it = std::find_if(result.begin(), result.end(),
                           [&](const TimelineTrack& t) { return t.name == trackName; });
    if (it == result.end()) {
      result.push_back({trackName, {i}});
    } else {
      it->clipIndices.push_back(i);
    }
  }
  return result;
}

f64 TimelineDocument::rulerEnd() const {
  const auto* timeline = m_flowData.timeline();
  const f64 end = timeline ? timeline->endTime() : 0.0;
  return end + m_settings.rulerPadding;
}

std::string TimelineDocument::formatTimecode(f64 seconds) {
  const i64 centis = std::llround(std::max(seconds, 0.0) * 100.0);
  const i64 minutes = centis / 6000;
  const i64 secs = (centis / 100) % 60;
  return std::format("{:02}:{:02}.{:02}", minutes, secs, centis % 100);
}

QJsonObject TimelineDocument::bridgeData() const {
  QJsonArray clips;
  if (const auto* timeline = m_flowData.timeline()) {
    for (usize i = 0; i < timeline->clipCount(); ++i) {
      const flow::Clip& clip = timeline->clip(i);
      QJsonObject obj;
      obj.insert("id", static_cast<int>(i));
      obj.insert("name", QString::fromStdString(clip.name));
      obj.insert("start_time", clip.startTime);
      obj.insert("duration", clip.duration);
      obj.insert("type", QString::fromLatin1(flow::clipTypeToString(clip.type)));
      obj.insert("actor", clip.actor ? QJsonValue(QString::fromStdString(*clip.actor))
                                     : QJsonValue(QJsonValue::Null));
      obj.insert("selected", m_selected && *m_selected == i);
      clips.append(obj);
    }
  }

  QJsonArray trackArray;
  for (const auto& track : tracks()) {
    QJsonArray ids;
    for (usize idx : track.clipIndices) {
      ids.append(static_cast<int>(idx));
    }
    QJsonObject obj;
    obj.insert("name", QString::fromStdString(track.name));
    obj.insert("clips", ids);
    trackArray.append(obj);
  }

  QJsonObject ruler;
  ruler.insert("max_time", rulerEnd());
  ruler.insert("major", m_settings.rulerMajorInterval);
  ruler.insert("minor", m_settings.rulerMinorInterval);

  QJsonObject data;
  data.insert("clips", clips);
  data.insert("tracks", trackArray);
  data.insert("ruler", ruler);
  return data;
}

} // namespace EvflEditor::editor
