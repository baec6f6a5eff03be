#include "EvflEditor/editor/editor_settings.hpp"

#include <QSettings>
#include <cmath>

namespace EvflEditor::editor {

namespace {

f64 readDouble(QSettings& settings, const QString& key, f64 fallback, f64 minValue,
               f64 maxValue) {
  bool ok = false;
  const f64 value = settings.value(key, fallback).toDouble(&ok);
  if (!ok || !std::isfinite(value) || value < minValue || value > maxValue) {
    EVFLEDITOR_LOG_WARN("Ignoring invalid setting {}", key.toStdString());
    return fallback;
  }
  return value;
}

int readInt(QSettings& settings, const QString& key, int fallback, int minValue, int maxValue) {
  bool ok = false;
  const int value = settings.value(key, fallback).toInt(&ok);
  if (!ok || value < minValue || value > maxValue) {
    EVFLEDITOR_LOG_WARN("Ignoring invalid setting {}", key.toStdString());
    return fallback;
  }
  return value;
}

} // namespace

EditorSettings EditorSettings::load(QSettings& settings) {
  EditorSettings result;
  const TimelineViewSettings defaults;
  TimelineViewSettings& tl = result.timeline;

  tl.minZoom = readDouble(settings, "timeline/minZoom", defaults.minZoom, 0.001, 1000.0);
  tl.maxZoom = readDouble(settings, "timeline/maxZoom", defaults.maxZoom, 0.001, 1000.0);
  if (tl.minZoom > tl.maxZoom) {
    EVFLEDITOR_LOG_WARN("timeline/minZoom exceeds timeline/maxZoom, using defaults");
    tl.minZoom = defaults.minZoom;
    tl.maxZoom = defaults.maxZoom;
  }
  tl.initialZoom =
      readDouble(settings, "timeline/initialZoom", defaults.initialZoom, tl.minZoom, tl.maxZoom);
  tl.zoomStep = readDouble(settings, "timeline/zoomStep", defaults.zoomStep, 1.01, 10.0);
  tl.basePixelsPerSecond = readDouble(settings, "timeline/basePixelsPerSecond",
                                      defaults.basePixelsPerSecond, 1.0, 10000.0);
  tl.minClipWidthPx =
      readInt(settings, "timeline/minClipWidthPx", defaults.minClipWidthPx, 1, 1000);
  tl.rulerMajorInterval = readDouble(settings, "timeline/rulerMajorInterval",
                                     defaults.rulerMajorInterval, 0.01, 3600.0);
  tl.rulerMinorInterval = readDouble(settings, "timeline/rulerMinorInterval",
                                     defaults.rulerMinorInterval, 0.01, 3600.0);
  tl.rulerPadding =
      readDouble(settings, "timeline/rulerPadding", defaults.rulerPadding, 0.0, 3600.0);

  const QString levelName = settings.value("logging/level", "info").toString();
  if (auto level = core::logLevelFromString(levelName.toStdString())) {
    result.logging.level = *level;
  } else {
    EVFLEDITOR_LOG_WARN("Unknown log level '{}', using info", levelName.toStdString());
  }
  result.logging.filePath = settings.value("logging/file").toString();

  result.lastDirectory = settings.value("files/lastDirectory").toString();
  return result;
}

void EditorSettings::save(QSettings& settings) const {
  settings.setValue("timeline/initialZoom", timeline.initialZoom);
  settings.setValue("timeline/zoomStep", timeline.zoomStep);
  settings.setValue("timeline/minZoom", timeline.minZoom);
  settings.setValue("timeline/maxZoom", timeline.maxZoom);
  settings.setValue("timeline/basePixelsPerSecond", timeline.basePixelsPerSecond);
  settings.setValue("timeline/minClipWidthPx", timeline.minClipWidthPx);
  settings.setValue("timeline/rulerMajorInterval", timeline.rulerMajorInterval);
  settings.setValue("timeline/rulerMinorInterval", timeline.rulerMinorInterval);
  settings.setValue("timeline/rulerPadding", timeline.rulerPadding);

  settings.setValue("logging/level", QString(core::logLevelToString(logging.level)).toLower());
  settings.setValue("logging/file", logging.filePath);

  settings.setValue("files/lastDirectory", lastDirectory);
  settings.sync();
}

EditorSettings EditorSettings::loadDefault() {
  QSettings settings(ORGANIZATION, APPLICATION);
  return load(settings);
}

void EditorSettings::saveDefault() const {
  QSettings settings(ORGANIZATION, APPLICATION);
  save(settings);
}

bool applyLoggingSettings(const LoggingSettings& logging) {
  auto& logger = core::Logger::instance();
  logger.setLevel(logging.level);

  if (logging.filePath.isEmpty()) {
    logger.closeOutputFile();
    return true;
  }
  if (!logger.setOutputFile(logging.filePath.toStdString())) {
    EVFLEDITOR_LOG_ERROR("Cannot open log file {}", logging.filePath.toStdString());
    return false;
  }
  return true;
}

} // namespace EvflEditor::editor
