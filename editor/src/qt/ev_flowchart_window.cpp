#include "EvflEditor/editor/qt/ev_flowchart_window.hpp"
#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "EvflEditor/editor/qt/ev_edit_parents_dialog.hpp"
#include "EvflEditor/editor/qt/ev_event_table_model.hpp"

#include <QAction>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QMenu>
#include <QMenuBar>
#include <QPushButton>
#include <QTableView>
#include <QVBoxLayout>

namespace EvflEditor::editor::qt {

EVFlowchartWindow::EVFlowchartWindow(EditorSettings &settings, EventBus &bus,
                                     QWidget *parent)
    : EVFlowMainWindow(settings, bus, parent) {
  buildUi();
  resize(900, 600);
}

QString EVFlowchartWindow::applicationTitle() const {
  return tr("EVFL Flowchart Editor");
}

QString EVFlowchartWindow::aboutText() const {
  return tr("EVFL Flowchart Editor\n\n"
            "Browse the events of an event flow and edit the links that "
            "lead into them.");
}

void EVFlowchartWindow::buildUi() {
  createFileMenu();

  QMenu *editMenu = menuBar()->addMenu(tr("&Edit"));
  m_editParentsAction = editMenu->addAction(tr("Edit parents..."));
  connect(m_editParentsAction, &QAction::triggered, this,
          &EVFlowchartWindow::editParentsOfSelection);

  createHelpMenu();

  auto *central = new QWidget(this);
  auto *layout = new QVBoxLayout(central);

  m_model = new EVEventTableModel(flowData(), this);
  m_table = new QTableView(central);
  m_table->setModel(m_model);
  m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
  m_table->setSelectionMode(QAbstractItemView::SingleSelection);
  m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
  m_table->verticalHeader()->hide();
  m_table->horizontalHeader()->setStretchLastSection(true);
  m_table->setContextMenuPolicy(Qt::CustomContextMenu);
  connect(m_table, &QTableView::customContextMenuRequested, this,
          &EVFlowchartWindow::showContextMenu);
  connect(m_table, &QTableView::doubleClicked, this,
          &EVFlowchartWindow::editParentsOfSelection);
  connect(m_table->selectionModel(), &QItemSelectionModel::selectionChanged,
          this, &EVFlowchartWindow::updateActions);
  connect(m_model, &QAbstractItemModel::modelReset, this,
          &EVFlowchartWindow::updateActions);
  layout->addWidget(m_table, 1);

  auto *buttonRow = new QHBoxLayout();
  buttonRow->addStretch();
  m_editParentsButton = new QPushButton(tr("Edit parents..."), central);
  connect(m_editParentsButton, &QPushButton::clicked, this,
          &EVFlowchartWindow::editParentsOfSelection);
  buttonRow->addWidget(m_editParentsButton);
  layout->addLayout(buttonRow);

  setCentralWidget(central);
  updateActions();
}

void EVFlowchartWindow::onFlowOpened() {
  if (!flowData().flowchart()) {
    EVMessageDialog::showWarning(
        this, tr("No Flowchart Data"),
        tr("The opened file does not contain a flowchart."));
  }
  updateActions();
}

void EVFlowchartWindow::updateActions() {
  const bool hasSelection = m_table->selectionModel()->hasSelection();
  m_editParentsAction->setEnabled(hasSelection);
  m_editParentsButton->setEnabled(hasSelection);
}

void EVFlowchartWindow::showContextMenu(const QPoint &pos) {
  const QModelIndex index = m_table->indexAt(pos);
  if (!index.isValid()) {
    return;
  }
  m_table->selectRow(index.row());

  QMenu menu(this);
  menu.addAction(m_editParentsAction);
  menu.exec(m_table->viewport()->mapToGlobal(pos));
}

void EVFlowchartWindow::editParentsOfSelection() {
  const QModelIndexList rows = m_table->selectionModel()->selectedRows();
  if (rows.isEmpty()) {
    return;
  }
  const auto child = m_model->eventAt(rows.first());
  if (!child) {
    return;
  }

  EVEditParentsDialog dialog(flowData(), *child, this);
  dialog.exec();
}

} // namespace EvflEditor::editor::qt
