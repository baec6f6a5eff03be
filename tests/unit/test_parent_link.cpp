/**
 * @file test_parent_link.cpp
 * @brief Unit tests for parent link descriptions and the pending link list
 */

#include <catch2/catch_test_macros.hpp>

#include "EvflEditor/editor/parent_link.hpp"

using namespace EvflEditor;
using namespace EvflEditor::editor;

namespace {

flow::Flowchart makeFlowchart() {
  flow::Flowchart fc("Links");
  fc.addEvent("Target", flow::ActionEvent{"Npc", "Idle", std::nullopt});               // 0
  fc.addEvent("Walk", flow::ActionEvent{"Npc", "Walk", 0u});                           // 1
  fc.addEvent("Ask", flow::SwitchEvent{"Npc", "Ask", {{0, 0u}, {3, 0u}, {4, 1u}}});     // 2
  fc.addEvent("Split", flow::ForkEvent{{0u, 0u, 1u}, std::nullopt});                   // 3
  fc.addEvent("Merge", flow::JoinEvent{0u});                                           // 4
  fc.addEvent("Sub", flow::SubFlowEvent{"Other", "Main", std::nullopt});               // 5
  fc.addEvent("Blank", flow::UnsetEvent{});                                            // 6
  return fc;
}

} // namespace

TEST_CASE("parentLinkTypeFor follows the candidate's event type", "[unit][editor][parent_links]") {
  const auto fc = makeFlowchart();

  CHECK(parentLinkTypeFor(fc, 1, 0).value() == ParentLinkType::Next);
  CHECK(parentLinkTypeFor(fc, 4, 0).value() == ParentLinkType::Next);
  CHECK(parentLinkTypeFor(fc, 5, 0).value() == ParentLinkType::Next);
  CHECK(parentLinkTypeFor(fc, 2, 0).value() == ParentLinkType::SwitchCase);
  CHECK(parentLinkTypeFor(fc, 3, 0).value() == ParentLinkType::ForkBranch);

  auto unset = parentLinkTypeFor(fc, 6, 0);
  REQUIRE(unset.isError());
  CHECK(unset.error().code == ParentLinkErrorCode::UnsupportedParentKind);

  auto self = parentLinkTypeFor(fc, 0, 0);
  REQUIRE(self.isError());
  CHECK(self.error().code == ParentLinkErrorCode::SelfParent);

  CHECK(parentLinkTypeFor(fc, 99, 0).isError());
}

TEST_CASE("makeParentLink requires a case value for switch parents",
          "[unit][editor][parent_links]") {
  const auto fc = makeFlowchart();

  auto missing = makeParentLink(fc, 0, 2, std::nullopt);
  REQUIRE(missing.isError());
  CHECK(missing.error().code == ParentLinkErrorCode::Validation);

  auto withValue = makeParentLink(fc, 0, 2, 7);
  REQUIRE(withValue.isOk());
  CHECK(withValue.value() == ParentLink{2, ParentLinkType::SwitchCase, 7});

  // A case value offered for a non-switch parent is dropped
  auto action = makeParentLink(fc, 0, 1, 7);
  REQUIRE(action.isOk());
  CHECK_FALSE(action.value().detail.has_value());
}

TEST_CASE("gatherParentLinks lists every incoming link in graph order",
          "[unit][editor][parent_links]") {
  const auto fc = makeFlowchart();

  const std::vector<ParentLink> expected = {
      {1, ParentLinkType::Next, std::nullopt},       {2, ParentLinkType::SwitchCase, 0},
      {2, ParentLinkType::SwitchCase, 3},            {3, ParentLinkType::ForkBranch, std::nullopt},
      {3, ParentLinkType::ForkBranch, std::nullopt}, {4, ParentLinkType::Next, std::nullopt},
  };
  CHECK(gatherParentLinks(fc, 0) == expected);
  CHECK(gatherParentLinks(fc, 6).empty());
}

TEST_CASE("describeLink", "[unit][editor][parent_links]") {
  CHECK(describeLink({1, ParentLinkType::Next, std::nullopt}) == "Next");
  CHECK(describeLink({1, ParentLinkType::ForkBranch, std::nullopt}) == "Fork branch");
  CHECK(describeLink({1, ParentLinkType::SwitchCase, -2}) == "Switch case = -2");
}

TEST_CASE("ParentLinkList", "[unit][editor][parent_links]") {
  ParentLinkList list;
  const ParentLink caseOne{2, ParentLinkType::SwitchCase, 1};
  const ParentLink branch{3, ParentLinkType::ForkBranch, std::nullopt};

  SECTION("Rejects an identical link") {
    REQUIRE(list.append(caseOne).isOk());
    auto again = list.append(caseOne);
    REQUIRE(again.isError());
    CHECK(again.error().code == ParentLinkErrorCode::DuplicateLink);
    CHECK(list.size() == 1);
  }

  SECTION("Different case values of one switch are distinct links") {
    REQUIRE(list.append(caseOne).isOk());
    REQUIRE(list.append({2, ParentLinkType::SwitchCase, 2}).isOk());
    CHECK(list.isValid());
  }

  SECTION("Duplicate switch cases make the list invalid") {
    ParentLinkList loaded({caseOne, branch, caseOne});
    CHECK_FALSE(loaded.isValid());
  }

  SECTION("Removing rows") {
    REQUIRE(list.append(caseOne).isOk());
    REQUIRE(list.append(branch).isOk());

    REQUIRE(list.removeAt(0).isOk());
    CHECK(list.links() == std::vector<ParentLink>{branch});

    auto outOfRange = list.removeAt(5);
    REQUIRE(outOfRange.isError());
    CHECK(outOfRange.error().code == ParentLinkErrorCode::InvalidRow);
    CHECK(list.size() == 1);
  }

  CHECK(std::string(parentLinkErrorToString(ParentLinkErrorCode::Conflict)) == "Conflict");
}
