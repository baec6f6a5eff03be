/**
 * @file test_app_options.cpp
 * @brief Integration tests for command line parsing of the editor executables
 */

#include <catch2/catch_test_macros.hpp>

#include "EvflEditor/editor/app_options.hpp"
#include <QCoreApplication>
#include <memory>

using namespace EvflEditor;
using namespace EvflEditor::editor;

namespace {

// Helper to ensure QCoreApplication exists for Qt tests
class QtTestFixture {
public:
  QtTestFixture() {
    if (!QCoreApplication::instance()) {
      static int argc = 1;
      static char arg0[] = "evfleditor_tests";
      static char* argv[] = {arg0, nullptr};
      m_app = std::make_unique<QCoreApplication>(argc, argv);
    }
  }

private:
  std::unique_ptr<QCoreApplication> m_app;
};

Result<AppOptions> parse(QStringList args) {
  args.prepend(QStringLiteral("evfl_editor"));
  return parseAppOptions(args, QStringLiteral("Event flow editor"));
}

} // namespace

TEST_CASE("AppOptions - Command line parsing", "[app_options]") {
  QtTestFixture fixture;

  SECTION("No arguments") {
    auto options = parse({});
    REQUIRE(options.isOk());
    CHECK(options.value().file.isEmpty());
    CHECK_FALSE(options.value().verbose);
    CHECK(options.value().earlyExitText.isEmpty());
  }

  SECTION("File and flags") {
    auto options = parse({"--verbose", "--log-file", "/tmp/evfl.log", "scene.json"});
    REQUIRE(options.isOk());
    CHECK(options.value().file == QStringLiteral("scene.json"));
    CHECK(options.value().verbose);
    CHECK(options.value().logFile == QStringLiteral("/tmp/evfl.log"));
  }

  SECTION("Short verbose flag") {
    auto options = parse({"-V"});
    REQUIRE(options.isOk());
    CHECK(options.value().verbose);
  }

  SECTION("Help is reported as text to print") {
    auto options = parse({"--help"});
    REQUIRE(options.isOk());
    CHECK(options.value().earlyExitText.contains(QStringLiteral("Event flow editor")));
  }

  SECTION("Errors") {
    CHECK(parse({"--frobnicate"}).isError());
    CHECK(parse({"--log-file"}).isError());

    auto twoFiles = parse({"a.json", "b.json"});
    REQUIRE(twoFiles.isError());
    CHECK(twoFiles.error() == "Only one file can be opened at a time.");
  }
}

TEST_CASE("AppOptions - Logging overrides", "[app_options]") {
  LoggingSettings stored;
  stored.level = core::LogLevel::Warning;
  stored.filePath = QStringLiteral("/var/log/evfl.log");

  AppOptions options;
  CHECK(effectiveLogging(stored, options) == stored);

  options.verbose = true;
  options.logFile = QStringLiteral("/tmp/run.log");
  const LoggingSettings effective = effectiveLogging(stored, options);
  CHECK(effective.level == core::LogLevel::Debug);
  CHECK(effective.filePath == QStringLiteral("/tmp/run.log"));

  // Verbose never raises an already chattier level
  stored.level = core::LogLevel::Trace;
  CHECK(effectiveLogging(stored, options).level == core::LogLevel::Trace);
}
