#pragma once

/**
 * @file ev_edit_parents_dialog.hpp
 * @brief Dialog listing and editing every link that points at one event
 */

#include "EvflEditor/editor/parent_link_session.hpp"

#include <QDialog>
#include <memory>

class QPushButton;
class QTableView;

namespace EvflEditor::editor::qt {

class EVParentLinkModel;

class EVEditParentsDialog final : public QDialog {
  Q_OBJECT

public:
  EVEditParentsDialog(FlowData& flowData, flow::EventIndex child, QWidget* parent = nullptr);
  ~EVEditParentsDialog() override;

  void accept() override;

private:
  void buildUi();
  void addParent();
  void showContextMenu(const QPoint& pos);
  void showLinkError(const ParentLinkError& error);
  bool confirmOverwrite(const std::vector<flow::EventIndex>& parents);

  std::unique_ptr<ParentLinkEditSession> m_session;
  EVParentLinkModel* m_model = nullptr;
  QTableView* m_table = nullptr;
  QPushButton* m_addButton = nullptr;
  QPushButton* m_saveButton = nullptr;
  QPushButton* m_cancelButton = nullptr;
};

} // namespace EvflEditor::editor::qt
