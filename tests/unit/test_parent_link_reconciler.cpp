/**
 * @file test_parent_link_reconciler.cpp
 * @brief Unit tests for rewriting the parent links of one event
 */

#include <catch2/catch_test_macros.hpp>

#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/editor/parent_link_reconciler.hpp"

using namespace EvflEditor;
using namespace EvflEditor::editor;

namespace {

constexpr flow::EventIndex kChild = 0;
constexpr flow::EventIndex kOtherChild = 1;
constexpr flow::EventIndex kAction = 2;
constexpr flow::EventIndex kSwitch = 3;
constexpr flow::EventIndex kFork = 4;
constexpr flow::EventIndex kJoin = 5;
constexpr flow::EventIndex kSubFlow = 6;
constexpr flow::EventIndex kUnset = 7;

// Child is reached from the action, twice from the switch and twice from
// the fork. The subflow points at another event.
flow::Flowchart makeFlowchart() {
  flow::Flowchart fc("Test");
  fc.addEvent("Child", flow::ActionEvent{"Npc", "Wave", std::nullopt});
  fc.addEvent("OtherChild", flow::ActionEvent{"Npc", "Bow", std::nullopt});
  fc.addEvent("Greet", flow::ActionEvent{"Npc", "Talk", kChild});
  fc.addEvent("Ask", flow::SwitchEvent{"Npc", "Choice", {{1, kChild}, {2, kChild}, {5, kOtherChild}}});
  fc.addEvent("Split", flow::ForkEvent{{kChild, kOtherChild, kChild}, kJoin});
  fc.addEvent("Merge", flow::JoinEvent{std::nullopt});
  fc.addEvent("Cutscene", flow::SubFlowEvent{"Other", "Entry", kOtherChild});
  fc.addEvent("Placeholder", flow::UnsetEvent{});
  return fc;
}

ParentLink nextLink(flow::EventIndex parent) { return {parent, ParentLinkType::Next, std::nullopt}; }
ParentLink forkLink(flow::EventIndex parent) {
  return {parent, ParentLinkType::ForkBranch, std::nullopt};
}
ParentLink caseLink(flow::EventIndex parent, i32 value) {
  return {parent, ParentLinkType::SwitchCase, value};
}

const std::vector<flow::EventIndex>& forksOf(const flow::Flowchart& fc) {
  return std::get<flow::ForkEvent>(fc.event(kFork).data).forks;
}

const std::map<i32, flow::EventIndex>& casesOf(const flow::Flowchart& fc) {
  return std::get<flow::SwitchEvent>(fc.event(kSwitch).data).cases;
}

bool acceptAll(const std::vector<flow::EventIndex>&) { return true; }

} // namespace

TEST_CASE("ParentLinkReconciler: applied set matches the graph exactly",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);

  const std::vector<ParentLink> desired = {nextLink(kAction), caseLink(kSwitch, 1), forkLink(kFork),
                                           nextLink(kSubFlow)};
  auto result = reconciler.apply(desired, acceptAll);
  REQUIRE(result.isOk());

  // Gathered in graph order
  CHECK(gatherParentLinks(fc, kChild) == desired);
  CHECK(casesOf(fc).at(5) == kOtherChild);
  CHECK(std::get<flow::ForkEvent>(fc.event(kFork).data).join == kJoin);
}

TEST_CASE("ParentLinkReconciler: reapplying the gathered links changes nothing",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);

  REQUIRE(reconciler.apply({nextLink(kSubFlow), caseLink(kSwitch, 7), forkLink(kFork), forkLink(kFork),
                            forkLink(kFork)},
                           acceptAll)
              .isOk());
  const auto snapshot = fc;

  bool asked = false;
  auto again = reconciler.apply(gatherParentLinks(fc, kChild),
                                [&asked](const std::vector<flow::EventIndex>&) {
                                  asked = true;
                                  return true;
                                });
  REQUIRE(again.isOk());
  CHECK_FALSE(asked);
  CHECK(fc == snapshot);
}

TEST_CASE("ParentLinkReconciler: fork branch count edits", "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);
  std::vector<ParentLink> desired = {nextLink(kAction), caseLink(kSwitch, 1),
                                     caseLink(kSwitch, 2)};

  SECTION("Lowering the count drops trailing branches only") {
    desired.push_back(forkLink(kFork));
    REQUIRE(reconciler.apply(desired, acceptAll).isOk());
    CHECK(forksOf(fc) == std::vector<flow::EventIndex>{kChild, kOtherChild});
  }

  SECTION("Raising the count appends branches") {
    for (int i = 0; i < 5; ++i) {
      desired.push_back(forkLink(kFork));
    }
    REQUIRE(reconciler.apply(desired, acceptAll).isOk());
    CHECK(forksOf(fc) == std::vector<flow::EventIndex>{kChild, kOtherChild, kChild, kChild,
                                                       kChild, kChild});
  }

  SECTION("No fork link removes every branch to the child") {
    REQUIRE(reconciler.apply(desired, acceptAll).isOk());
    CHECK(forksOf(fc) == std::vector<flow::EventIndex>{kOtherChild});
  }
}

TEST_CASE("ParentLinkReconciler: switch conflict leaves the graph untouched",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  const auto snapshot = fc;
  ParentLinkReconciler reconciler(fc, kChild);

  // Dropping the action link would reset its next pointer if anything ran
  bool asked = false;
  auto result = reconciler.apply({forkLink(kFork), caseLink(kSwitch, 5)},
                                 [&asked](const std::vector<flow::EventIndex>&) {
                                   asked = true;
                                   return true;
                                 });

  REQUIRE(result.isError());
  CHECK(result.error().code == ParentLinkErrorCode::Conflict);
  CHECK_FALSE(asked);
  CHECK(fc == snapshot);
}

TEST_CASE("ParentLinkReconciler: overwriting a next pointer needs confirmation",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  const auto snapshot = fc;
  ParentLinkReconciler reconciler(fc, kChild);
  const std::vector<ParentLink> desired = {nextLink(kAction), nextLink(kSubFlow), caseLink(kSwitch, 1),
                                           caseLink(kSwitch, 2), forkLink(kFork), forkLink(kFork)};

  SECTION("Declined") {
    std::vector<flow::EventIndex> offered;
    auto result = reconciler.apply(desired, [&offered](const std::vector<flow::EventIndex>& p) {
      offered = p;
      return false;
    });

    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::OverwriteDeclined);
    CHECK(offered == std::vector<flow::EventIndex>{kSubFlow});
    CHECK(fc == snapshot);
  }

  SECTION("No confirmation callback counts as declined") {
    auto result = reconciler.apply(desired, {});
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::OverwriteDeclined);
    CHECK(fc == snapshot);
  }

  SECTION("Accepted") {
    REQUIRE(reconciler.apply(desired, acceptAll).isOk());
    CHECK(std::get<flow::SubFlowEvent>(fc.event(kSubFlow).data).next == kChild);
  }
}

TEST_CASE("ParentLinkReconciler: removed links are cleared", "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);

  SECTION("Switch case") {
    REQUIRE(reconciler.apply({nextLink(kAction), caseLink(kSwitch, 1), forkLink(kFork), forkLink(kFork)},
                             acceptAll)
                .isOk());
    const std::map<i32, flow::EventIndex> expected = {{1, kChild}, {5, kOtherChild}};
    CHECK(casesOf(fc) == expected);
  }

  SECTION("Next pointer") {
    REQUIRE(reconciler.apply({caseLink(kSwitch, 1), caseLink(kSwitch, 2), forkLink(kFork),
                              forkLink(kFork)},
                             acceptAll)
                .isOk());
    CHECK_FALSE(std::get<flow::ActionEvent>(fc.event(kAction).data).next.has_value());
  }

  SECTION("Everything") {
    REQUIRE(reconciler.apply({}, acceptAll).isOk());
    CHECK(gatherParentLinks(fc, kChild).empty());
    CHECK(gatherParentLinks(fc, kOtherChild).size() == 3);
  }
}

TEST_CASE("ParentLinkReconciler: new switch case is added", "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kOtherChild);

  REQUIRE(reconciler.apply({caseLink(kSwitch, 5), caseLink(kSwitch, 9), forkLink(kFork),
                            nextLink(kSubFlow)},
                           acceptAll)
              .isOk());
  CHECK(casesOf(fc).at(9) == kOtherChild);
  CHECK(casesOf(fc).at(1) == kChild);
}

TEST_CASE("ParentLinkReconciler: invalid desired links are rejected",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  const auto snapshot = fc;

  SECTION("Duplicate switch case") {
    ParentLinkReconciler reconciler(fc, kChild);
    auto result = reconciler.apply({caseLink(kSwitch, 1), caseLink(kSwitch, 1)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
  }

  SECTION("Link type does not match the parent") {
    ParentLinkReconciler reconciler(fc, kChild);
    auto result = reconciler.apply({nextLink(kSwitch)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
  }

  SECTION("Unset parent") {
    ParentLinkReconciler reconciler(fc, kChild);
    auto result = reconciler.apply({nextLink(kUnset)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
  }

  SECTION("Unknown parent") {
    ParentLinkReconciler reconciler(fc, kChild);
    auto result = reconciler.apply({nextLink(42)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
  }

  SECTION("New link from the child to itself") {
    ParentLinkReconciler reconciler(fc, kChild);
    auto result = reconciler.apply({nextLink(kChild)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
  }

  SECTION("Unknown child") {
    ParentLinkReconciler reconciler(fc, 42);
    CHECK(reconciler.apply({}, acceptAll).isError());
  }

  CHECK(fc == snapshot);
}

TEST_CASE("ParentLinkReconciler: plan lists overwritten next pointers",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);

  auto plan = reconciler.plan({nextLink(kAction), nextLink(kSubFlow), forkLink(kFork), forkLink(kFork)});
  REQUIRE(plan.isOk());
  CHECK(plan.value().overwrittenNextParents == std::vector<flow::EventIndex>{kSubFlow});
  CHECK(plan.value().forkBranchCounts.at(kFork) == 2);
  CHECK(plan.value().nextParents.size() == 2);
}

TEST_CASE("ParentLinkReconciler: existing self loops can be kept or dropped",
          "[unit][editor][parent_links]") {
  flow::Flowchart fc("Loop");
  fc.addEvent("Menu", flow::SwitchEvent{"Npc", "Choice", {{3, 0u}, {4, 1u}}});
  fc.addEvent("Back", flow::ActionEvent{"Npc", "Talk", 0u});
  const auto snapshot = fc;
  ParentLinkReconciler reconciler(fc, 0);

  const auto gathered = gatherParentLinks(fc, 0);
  REQUIRE(gathered == std::vector<ParentLink>{caseLink(0, 3), nextLink(1)});

  SECTION("Unchanged list") {
    REQUIRE(reconciler.apply(gathered, acceptAll).isOk());
    CHECK(fc == snapshot);
  }

  SECTION("Removing the loop") {
    REQUIRE(reconciler.apply({nextLink(1)}, acceptAll).isOk());
    CHECK_FALSE(std::get<flow::SwitchEvent>(fc.event(0).data).cases.contains(3));
    CHECK(std::get<flow::SwitchEvent>(fc.event(0).data).cases.at(4) == 1u);
  }

  SECTION("A second loop is not created") {
    auto result = reconciler.apply({caseLink(0, 3), caseLink(0, 5), nextLink(1)}, acceptAll);
    REQUIRE(result.isError());
    CHECK(result.error().code == ParentLinkErrorCode::Validation);
    CHECK(fc == snapshot);
  }
}

TEST_CASE("ParentLinkReconciler: a declined overwrite is logged as a warning",
          "[unit][editor][parent_links]") {
  auto fc = makeFlowchart();
  ParentLinkReconciler reconciler(fc, kChild);

  auto& logger = core::Logger::instance();
  const core::LogLevel previous = logger.getLevel();
  std::vector<core::LogLevel> levels;
  logger.setConsoleOutput(false);
  logger.setLevel(core::LogLevel::Warning);
  logger.addLogCallback(
      [&levels](core::LogLevel level, const std::string&) { levels.push_back(level); });

  auto result = reconciler.apply({nextLink(kSubFlow)}, {});

  logger.clearLogCallbacks();
  logger.setConsoleOutput(true);
  logger.setLevel(previous);

  REQUIRE(result.isError());
  CHECK(result.error().code == ParentLinkErrorCode::OverwriteDeclined);
  REQUIRE(levels.size() == 1);
  CHECK(levels.front() == core::LogLevel::Warning);
}
