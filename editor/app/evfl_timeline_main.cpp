/**
 * @file evfl_timeline_main.cpp
 * @brief BFEVFL timeline editor entry point
 *
 * Usage:
 *   evfl_timeline [--verbose] [--log-file <path>] [flow.json]
 */

#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/editor/app_options.hpp"
#include "EvflEditor/editor/editor_settings.hpp"
#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/editor/qt/ev_timeline_window.hpp"

#include <QApplication>
#include <iostream>

int main(int argc, char* argv[]) {
  using namespace EvflEditor::editor;

  QApplication app(argc, argv);
  QCoreApplication::setOrganizationName(EditorSettings::ORGANIZATION);
  QCoreApplication::setApplicationName(EditorSettings::APPLICATION);
  QCoreApplication::setApplicationVersion("1.0.0");

  auto options = parseAppOptions(QCoreApplication::arguments(),
                                 "Edit the timeline of a BFEVFL event flow.");
  if (options.isError()) {
    std::cerr << options.error() << std::endl;
    return 1;
  }
  if (!options.value().earlyExitText.isEmpty()) {
    std::cout << options.value().earlyExitText.toStdString() << std::endl;
    return 0;
  }

  EditorSettings settings = EditorSettings::loadDefault();
  if (!applyLoggingSettings(effectiveLogging(settings.logging, options.value()))) {
    EVFLEDITOR_LOG_WARN("Continuing with console logging only");
  }
  EVFLEDITOR_LOG_INFO("BFEVFL timeline editor starting");

  qt::EVTimelineWindow window(settings, EventBus::instance());
  window.show();
  if (!options.value().file.isEmpty()) {
    window.openFile(options.value().file);
  }

  const int code = QApplication::exec();
  EVFLEDITOR_LOG_INFO("BFEVFL timeline editor exiting with code {}", code);
  return code;
}
