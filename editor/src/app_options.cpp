#include "EvflEditor/editor/app_options.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>

namespace EvflEditor::editor {

Result<AppOptions> parseAppOptions(const QStringList& arguments, const QString& description) {
  QCommandLineParser parser;
  parser.setApplicationDescription(description);
  const QCommandLineOption helpOption = parser.addHelpOption();
  const QCommandLineOption versionOption = parser.addVersionOption();

  const QCommandLineOption verboseOption(QStringList{"V", "verbose"},
                                         "Enable debug logging.");
  const QCommandLineOption logFileOption("log-file", "Also write the log to <path>.", "path");
  parser.addOption(verboseOption);
  parser.addOption(logFileOption);
  parser.addPositionalArgument("file", "Event flow to open.", "[file]");

  if (!parser.parse(arguments)) {
    return Result<AppOptions>::error(parser.errorText().toStdString());
  }
  AppOptions options;
  if (parser.isSet(helpOption)) {
    options.earlyExitText = parser.helpText();
    return Result<AppOptions>::ok(options);
  }
  if (parser.isSet(versionOption)) {
    options.earlyExitText = QString("%1 %2").arg(QCoreApplication::applicationName(),
                                                 QCoreApplication::applicationVersion());
    return Result<AppOptions>::ok(options);
  }

  const QStringList positional = parser.positionalArguments();
  if (positional.size() > 1) {
    return Result<AppOptions>::error("Only one file can be opened at a time.");
  }

  options.verbose = parser.isSet(verboseOption);
  options.logFile = parser.value(logFileOption);
  if (!positional.isEmpty()) {
    options.file = positional.first();
  }
  return Result<AppOptions>::ok(options);
}

LoggingSettings effectiveLogging(const LoggingSettings& settings, const AppOptions& options) {
  LoggingSettings result = settings;
  if (options.verbose && result.level > core::LogLevel::Debug) {
    result.level = core::LogLevel::Debug;
  }
  if (!options.logFile.isEmpty()) {
    result.filePath = options.logFile;
  }
  return result;
}

} // namespace EvflEditor::editor
