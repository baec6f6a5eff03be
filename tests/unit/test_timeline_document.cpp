/**
 * @file test_timeline_document.cpp
 * @brief Unit tests for timeline zoom, selection, clip editing and view data
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "EvflEditor/editor/timeline_document.hpp"
#include <QJsonArray>

using namespace EvflEditor;
using namespace EvflEditor::editor;

namespace {

std::unique_ptr<flow::EventFlow> makeFlow() {
  auto flow = std::make_unique<flow::EventFlow>();
  flow->name = "Cutscene";
  flow::Timeline timeline("Cutscene");
  timeline.addClip({"Walk in", 0.0, 2.0, flow::ClipType::Action, std::string("Link")});
  timeline.addClip({"Pan", 1.0, 3.0, flow::ClipType::Camera, std::nullopt});
  timeline.addClip({"Wave", 2.5, 1.0, flow::ClipType::Action, std::string("Link")});
  flow->timeline = std::move(timeline);
  return flow;
}

struct TimelineFixture {
  EventBus bus;
  FlowData data{bus};
  std::vector<int> selections;
  int timelineChanges = 0;
  std::vector<EventSubscription> subs;

  TimelineFixture() {
    data.setFlow(makeFlow());
    subs.push_back(bus.subscribe<events::ClipSelectedEvent>(
        [this](const events::ClipSelectedEvent& e) { selections.push_back(e.clipIndex); }));
    subs.push_back(bus.subscribe<events::FlowDataChangedEvent>(
        [this](const events::FlowDataChangedEvent& e) {
          if (e.reason == events::FlowDataChangeReason::Timeline) {
            ++timelineChanges;
          }
        }));
  }
  ~TimelineFixture() {
    for (const auto& sub : subs) {
      bus.unsubscribe(sub);
    }
  }
};

ClipDraft draft(std::string name, f64 start, f64 duration,
                flow::ClipType type = flow::ClipType::Event) {
  ClipDraft d;
  d.name = std::move(name);
  d.startTime = start;
  d.duration = duration;
  d.type = type;
  return d;
}

} // namespace

TEST_CASE("TimelineDocument: zoom is clamped", "[unit][editor][timeline]") {
  TimelineFixture f;
  TimelineViewSettings settings;
  settings.initialZoom = 1.0;
  settings.zoomStep = 2.0;
  settings.minZoom = 0.25;
  settings.maxZoom = 4.0;
  settings.basePixelsPerSecond = 50.0;
  TimelineDocument doc(f.data, settings);

  doc.zoomIn();
  CHECK(doc.zoomLevel() == Catch::Approx(2.0));
  CHECK(doc.pixelsPerSecond() == Catch::Approx(100.0));
  doc.zoomIn();
  doc.zoomIn();
  CHECK(doc.zoomLevel() == Catch::Approx(4.0));

  for (int i = 0; i < 10; ++i) {
    doc.zoomOut();
  }
  CHECK(doc.zoomLevel() == Catch::Approx(0.25));

  settings.initialZoom = 100.0;
  TimelineDocument clamped(f.data, settings);
  CHECK(clamped.zoomLevel() == Catch::Approx(4.0));
}

TEST_CASE("TimelineDocument: selection", "[unit][editor][timeline]") {
  TimelineFixture f;
  TimelineDocument doc(f.data);

  SECTION("Valid index") {
    REQUIRE(doc.selectClip(1));
    CHECK(doc.selectedIndex() == 1u);
    REQUIRE(doc.selectedClip() != nullptr);
    CHECK(doc.selectedClip()->name == "Pan");
    CHECK(f.selections == std::vector<int>{1});
  }

  SECTION("Unknown index keeps the current selection") {
    REQUIRE(doc.selectClip(0));
    CHECK_FALSE(doc.selectClip(3));
    CHECK_FALSE(doc.selectClip(-1));
    CHECK(doc.selectedIndex() == 0u);
    CHECK(f.selections == std::vector<int>{0});
  }

  SECTION("Payloads from the web view") {
    CHECK(doc.selectClipFromBridge("2"));
    CHECK(doc.selectedIndex() == 2u);
    CHECK(doc.selectClipFromBridge(R"({"id": 1})"));
    CHECK(doc.selectedIndex() == 1u);
    CHECK_FALSE(doc.selectClipFromBridge("not json"));
    CHECK_FALSE(doc.selectClipFromBridge(R"({"name": "Pan"})"));
    CHECK(doc.selectedIndex() == 1u);
  }

  SECTION("Clearing") {
    doc.clearSelection();
    CHECK(f.selections.empty());
    REQUIRE(doc.selectClip(2));
    doc.clearSelection();
    CHECK_FALSE(doc.selectedIndex().has_value());
    CHECK(doc.selectedClip() == nullptr);
    CHECK(f.selections == std::vector<int>{2, -1});
  }
}

TEST_CASE("TimelineDocument: draft validation", "[unit][editor][timeline]") {
  CHECK(TimelineDocument::validateDraft(draft("Ok", 0.0, 0.01)).isOk());
  CHECK(TimelineDocument::validateDraft(draft("Ok", 9999.0, 9999.0)).isOk());

  auto unnamed = TimelineDocument::validateDraft(draft("", 1.0, 1.0));
  REQUIRE(unnamed.isError());
  CHECK(unnamed.error() == "Please enter a clip name.");

  CHECK(TimelineDocument::validateDraft(draft("Early", -0.5, 1.0)).isError());
  CHECK(TimelineDocument::validateDraft(draft("Late", 10000.0, 1.0)).isError());
  CHECK(TimelineDocument::validateDraft(draft("Short", 0.0, 0.0)).isError());
}

TEST_CASE("TimelineDocument: clip editing", "[unit][editor][timeline]") {
  TimelineFixture f;
  TimelineDocument doc(f.data);
  const flow::Timeline& timeline = *f.data.timeline();

  SECTION("Add") {
    auto added = doc.addClip(draft("Boom", 4.0, 0.5, flow::ClipType::Effect));
    REQUIRE(added.isOk());
    CHECK(added.value() == 3u);
    CHECK(timeline.clip(3).type == flow::ClipType::Effect);
    CHECK(f.timelineChanges == 1);
    CHECK(f.data.isModified());

    CHECK(doc.addClip(draft("", 0.0, 1.0)).isError());
    CHECK(timeline.clipCount() == 4);
    CHECK(f.timelineChanges == 1);
  }

  SECTION("Update keeps the actor") {
    REQUIRE(doc.selectClip(0));
    REQUIRE(doc.updateSelectedClip(draft("Run in", 0.5, 1.5, flow::ClipType::Action)).isOk());

    const auto& clip = timeline.clip(0);
    CHECK(clip.name == "Run in");
    CHECK(clip.startTime == Catch::Approx(0.5));
    CHECK(clip.actor == std::optional<std::string>("Link"));
    CHECK(f.timelineChanges == 1);

    // Unchanged values are not an edit
    REQUIRE(doc.updateSelectedClip(draft("Run in", 0.5, 1.5, flow::ClipType::Action)).isOk());
    CHECK(f.timelineChanges == 1);
  }

  SECTION("Update needs a selection") {
    auto result = doc.updateSelectedClip(draft("Nope", 0.0, 1.0));
    REQUIRE(result.isError());
    CHECK(result.error() == "Please select a clip to edit.");
  }

  SECTION("Delete") {
    REQUIRE(doc.selectClip(1));
    REQUIRE(doc.deleteSelectedClip().isOk());
    CHECK(timeline.clipCount() == 2);
    CHECK(timeline.clip(1).name == "Wave");
    CHECK_FALSE(doc.selectedIndex().has_value());
    CHECK(f.selections == std::vector<int>{1, -1});
    CHECK(f.timelineChanges == 1);

    auto again = doc.deleteSelectedClip();
    REQUIRE(again.isError());
    CHECK(again.error() == "Please select a clip to delete.");
  }
}

TEST_CASE("TimelineDocument: without a timeline", "[unit][editor][timeline]") {
  EventBus bus;
  FlowData data(bus);
  TimelineDocument doc(data);

  CHECK_FALSE(doc.hasTimeline());
  CHECK_FALSE(doc.selectClip(0));
  CHECK(doc.addClip(draft("Clip", 0.0, 1.0)).error() == "No timeline is loaded.");
  CHECK(doc.tracks().empty());
  CHECK(doc.bridgeData().value("clips").toArray().isEmpty());
}

TEST_CASE("TimelineDocument: tracks and view data", "[unit][editor][timeline]") {
  TimelineFixture f;
  TimelineViewSettings settings;
  settings.rulerPadding = 2.0;
  TimelineDocument doc(f.data, settings);

  const auto tracks = doc.tracks();
  REQUIRE(tracks.size() == 2);
  CHECK(tracks[0].name == "Link");
  CHECK(tracks[0].clipIndices == std::vector<usize>{0, 2});
  CHECK(tracks[1].name == "camera");
  CHECK(tracks[1].clipIndices == std::vector<usize>{1});

  CHECK(doc.rulerEnd() == Catch::Approx(6.0));

  REQUIRE(doc.selectClip(2));
  const QJsonObject data = doc.bridgeData();
  const QJsonArray clips = data.value("clips").toArray();
  REQUIRE(clips.size() == 3);

  const QJsonObject pan = clips.at(1).toObject();
  CHECK(pan.value("id").toInt() == 1);
  CHECK(pan.value("name").toString() == QStringLiteral("Pan"));
  CHECK(pan.value("type").toString() == QStringLiteral("camera"));
  CHECK(pan.value("actor").isNull());
  CHECK_FALSE(pan.value("selected").toBool());
  CHECK(clips.at(2).toObject().value("selected").toBool());

  CHECK(data.value("tracks").toArray().size() == 2);
  CHECK(data.value("ruler").toObject().value("max_time").toDouble() == Catch::Approx(6.0));
}

TEST_CASE("TimelineDocument: timecode formatting", "[unit][editor][timeline]") {
  CHECK(TimelineDocument::formatTimecode(0.0) == "00:00.00");
  CHECK(TimelineDocument::formatTimecode(75.5) == "01:15.50");
  CHECK(TimelineDocument::formatTimecode(59.999) == "01:00.00");
  CHECK(TimelineDocument::formatTimecode(-3.0) == "00:00.00");
}
