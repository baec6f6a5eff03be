#pragma once

/**
 * @file editor_settings.hpp
 * @brief Persistent editor preferences
 *
 * Stored through QSettings ("EvflEditor", "Editor") on the user's machine.
 * Values read back are validated; anything out of range falls back to the
 * built-in default so a hand-edited settings file cannot break the editor.
 */

#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/core/types.hpp"
#include <QString>

class QSettings;

namespace EvflEditor::editor {

struct TimelineViewSettings {
  f64 initialZoom = 1.0;
  f64 zoomStep = 1.5;
  f64 minZoom = 0.1;
  f64 maxZoom = 10.0;
  f64 basePixelsPerSecond = 60.0; ///< pixels per second at zoom 1.0
  int minClipWidthPx = 30;
  f64 rulerMajorInterval = 5.0; ///< seconds between labelled ruler marks
  f64 rulerMinorInterval = 1.0; ///< seconds between ruler ticks
  f64 rulerPadding = 5.0;       ///< seconds drawn past the last clip

  bool operator==(const TimelineViewSettings&) const = default;
};

struct LoggingSettings {
  core::LogLevel level = core::LogLevel::Info;
  QString filePath; ///< empty logs to the console only

  bool operator==(const LoggingSettings&) const = default;
};

struct EditorSettings {
  TimelineViewSettings timeline;
  LoggingSettings logging;
  QString lastDirectory;

  bool operator==(const EditorSettings&) const = default;

  static constexpr const char* ORGANIZATION = "EvflEditor";
  static constexpr const char* APPLICATION = "Editor";

  [[nodiscard]] static EditorSettings load(QSettings& settings);
  void save(QSettings& settings) const;

  /// Convenience wrappers over the default QSettings location
  [[nodiscard]] static EditorSettings loadDefault();
  void saveDefault() const;
};

/**
 * @brief Configure the global Logger from the settings
 * @return false if the log file could not be opened (console logging stays on)
 */
bool applyLoggingSettings(const LoggingSettings& logging);

} // namespace EvflEditor::editor
