/**
 * @file test_editor_settings.cpp
 * @brief Integration tests for persisted editor settings and log setup
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "EvflEditor/editor/editor_settings.hpp"
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

using namespace EvflEditor;
using namespace EvflEditor::editor;

namespace {

class LoggerLevelGuard {
public:
  LoggerLevelGuard() : m_level(core::Logger::instance().getLevel()) {}
  ~LoggerLevelGuard() {
    core::Logger::instance().closeOutputFile();
    core::Logger::instance().setLevel(m_level);
  }

private:
  core::LogLevel m_level;
};

} // namespace

TEST_CASE("EditorSettings - Defaults when nothing is stored", "[settings]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QSettings settings(dir.filePath("empty.ini"), QSettings::IniFormat);

  const EditorSettings loaded = EditorSettings::load(settings);
  CHECK(loaded == EditorSettings{});
  CHECK(loaded.logging.level == core::LogLevel::Info);
  CHECK(loaded.lastDirectory.isEmpty());
}

TEST_CASE("EditorSettings - Saved values load back", "[settings]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  const QString path = dir.filePath("editor.ini");

  EditorSettings original;
  original.timeline.initialZoom = 2.0;
  original.timeline.zoomStep = 1.25;
  original.timeline.basePixelsPerSecond = 80.0;
  original.timeline.minClipWidthPx = 12;
  original.timeline.rulerPadding = 0.0;
  original.logging.level = core::LogLevel::Warning;
  original.logging.filePath = dir.filePath("editor.log");
  original.lastDirectory = dir.path();

  {
    QSettings settings(path, QSettings::IniFormat);
    original.save(settings);
  }

  QSettings settings(path, QSettings::IniFormat);
  CHECK(settings.value("logging/level").toString() == QStringLiteral("warn"));
  CHECK(EditorSettings::load(settings) == original);
}

TEST_CASE("EditorSettings - Invalid values fall back to defaults", "[settings]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QSettings settings(dir.filePath("broken.ini"), QSettings::IniFormat);
  settings.setValue("timeline/zoomStep", "fast");
  settings.setValue("timeline/basePixelsPerSecond", -5.0);
  settings.setValue("timeline/minClipWidthPx", 0);
  settings.setValue("timeline/rulerMinorInterval", 2.0);
  settings.setValue("logging/level", "loud");

  const TimelineViewSettings defaults;
  const EditorSettings loaded = EditorSettings::load(settings);
  CHECK(loaded.timeline.zoomStep == Catch::Approx(defaults.zoomStep));
  CHECK(loaded.timeline.basePixelsPerSecond == Catch::Approx(defaults.basePixelsPerSecond));
  CHECK(loaded.timeline.minClipWidthPx == defaults.minClipWidthPx);
  CHECK(loaded.timeline.rulerMinorInterval == Catch::Approx(2.0));
  CHECK(loaded.logging.level == core::LogLevel::Info);

  SECTION("Inverted zoom range") {
    settings.setValue("timeline/minZoom", 5.0);
    settings.setValue("timeline/maxZoom", 2.0);
    const EditorSettings inverted = EditorSettings::load(settings);
    CHECK(inverted.timeline.minZoom == Catch::Approx(defaults.minZoom));
    CHECK(inverted.timeline.maxZoom == Catch::Approx(defaults.maxZoom));
  }

  SECTION("Initial zoom outside the range") {
    settings.setValue("timeline/initialZoom", 50.0);
    CHECK(EditorSettings::load(settings).timeline.initialZoom ==
          Catch::Approx(defaults.initialZoom));
  }
}

TEST_CASE("applyLoggingSettings - Level and log file", "[settings][logging]") {
  LoggerLevelGuard guard;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  LoggingSettings logging;
  logging.level = core::LogLevel::Error;
  REQUIRE(applyLoggingSettings(logging));
  CHECK(core::Logger::instance().getLevel() == core::LogLevel::Error);

  logging.level = core::LogLevel::Info;
  logging.filePath = dir.filePath("run.log");
  REQUIRE(applyLoggingSettings(logging));
  EVFLEDITOR_LOG_INFO("written to the log file");
  core::Logger::instance().closeOutputFile();

  QFile file(logging.filePath);
  REQUIRE(file.open(QIODevice::ReadOnly));
  CHECK(file.readAll().contains("written to the log file"));

  logging.filePath = dir.filePath("missing/dir/run.log");
  CHECK_FALSE(applyLoggingSettings(logging));
}
