/**
 * @file test_parent_link_model.cpp
 * @brief Integration tests for the table model shown by the edit-parents dialog
 */

#include <catch2/catch_test_macros.hpp>

#include "EvflEditor/editor/qt/ev_parent_link_model.hpp"
#include <QCoreApplication>
#include <memory>

using namespace EvflEditor;
using namespace EvflEditor::editor;
using namespace EvflEditor::editor::qt;

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

std::unique_ptr<flow::EventFlow> makeFlow() {
  auto flow = std::make_unique<flow::EventFlow>();
  flow::Flowchart fc("Model");
  fc.addEvent("Target", flow::ActionEvent{"Npc", "Idle", std::nullopt});       // 0
  fc.addEvent("Intro", flow::ActionEvent{"Npc", "Talk", 0u});                  // 1
  fc.addEvent("Ask", flow::SwitchEvent{"Npc", "Choice", {{4, 0u}}});           // 2
  fc.addEvent("Split", flow::ForkEvent{{}, std::nullopt});                     // 3
  flow->flowchart = std::move(fc);
  return flow;
}

QString cell(const EVParentLinkModel& model, int row, int column) {
  return model.data(model.index(row, column)).toString();
}

} // namespace

TEST_CASE("EVParentLinkModel - Rows mirror the session", "[parent_links][model]") {
  QtTestFixture fixture;
  EventBus bus;
  FlowData data(bus);
  data.setFlow(makeFlow());
  ParentLinkEditSession session(data, 0);
  EVParentLinkModel model(session);

  REQUIRE(model.rowCount() == 2);
  CHECK(model.columnCount() == EVParentLinkModel::ColumnCount);
  CHECK(model.headerData(EVParentLinkModel::ParentColumn, Qt::Horizontal).toString() ==
        QStringLiteral("Parent event"));
  CHECK(cell(model, 0, EVParentLinkModel::ParentColumn) ==
        QStringLiteral("Intro (Action: Npc.Talk)"));
  CHECK(cell(model, 0, EVParentLinkModel::LinkColumn) == QStringLiteral("Next"));
  CHECK(cell(model, 1, EVParentLinkModel::LinkColumn) == QStringLiteral("Switch case = 4"));
  CHECK_FALSE(model.data(model.index(5, 0)).isValid());

  SECTION("Adding a parent adds a row") {
    REQUIRE(model.addParent(3, std::nullopt).isOk());
    REQUIRE(model.rowCount() == 3);
    CHECK(cell(model, 2, EVParentLinkModel::LinkColumn) == QStringLiteral("Fork branch"));

    CHECK(model.addParent(3, std::nullopt).isError());
    CHECK(model.rowCount() == 3);
  }

  SECTION("Removing rows") {
    REQUIRE(model.removeLink(0).isOk());
    CHECK(model.rowCount() == 1);
    CHECK(cell(model, 0, EVParentLinkModel::ParentColumn) ==
          QStringLiteral("Ask (Switch: Npc.Choice)"));

    auto invalid = model.removeLink(-1);
    REQUIRE(invalid.isError());
    CHECK(invalid.error().code == ParentLinkErrorCode::InvalidRow);
  }

  // Nothing reaches the flowchart before the session commits
  CHECK(gatherParentLinks(*data.flowchart(), 0).size() == 2);
}
