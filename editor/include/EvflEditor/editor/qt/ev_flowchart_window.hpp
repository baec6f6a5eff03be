#pragma once

#include "EvflEditor/editor/qt/ev_flow_main_window.hpp"

class QPushButton;
class QTableView;

namespace EvflEditor::editor::qt {

class EVEventTableModel;

/**
 * @brief Event list of the open flowchart with access to the parents editor
 */
class EVFlowchartWindow final : public EVFlowMainWindow {
  Q_OBJECT

public:
  EVFlowchartWindow(EditorSettings& settings, EventBus& bus, QWidget* parent = nullptr);

  /// Opens the edit-parents dialog for the selected event, if any
  void editParentsOfSelection();

protected:
  [[nodiscard]] QString applicationTitle() const override;
  [[nodiscard]] QString aboutText() const override;
  void onFlowOpened() override;

private:
  void buildUi();
  void showContextMenu(const QPoint& pos);
  void updateActions();

  EVEventTableModel* m_model = nullptr;
  QTableView* m_table = nullptr;
  QPushButton* m_editParentsButton = nullptr;
  QAction* m_editParentsAction = nullptr;
};

} // namespace EvflEditor::editor::qt
