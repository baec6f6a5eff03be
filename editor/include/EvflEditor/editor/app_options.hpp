#pragma once

/**
 * @file app_options.hpp
 * @brief Command line shared by the editor executables
 *
 * Usage:
 *   evfl_editor [--verbose] [--log-file <path>] [file]
 */

#include "EvflEditor/core/result.hpp"
#include "EvflEditor/editor/editor_settings.hpp"
#include <QString>
#include <QStringList>

namespace EvflEditor::editor {

struct AppOptions {
  QString file;    ///< flow to open on startup, empty for none
  bool verbose = false;
  QString logFile; ///< overrides logging/file for this run

  /// Help or version text; when set the program prints it and exits
  QString earlyExitText;
};

/**
 * @brief Parse arguments (including the program name at index 0)
 *
 * An error result carries the message for an invalid command line.
 */
[[nodiscard]] Result<AppOptions> parseAppOptions(const QStringList& arguments,
                                                 const QString& description);

/**
 * @brief Logging configuration for this run: settings overridden by options
 */
[[nodiscard]] LoggingSettings effectiveLogging(const LoggingSettings& settings,
                                               const AppOptions& options);

} // namespace EvflEditor::editor
