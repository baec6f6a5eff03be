#include "EvflEditor/editor/qt/ev_edit_parents_dialog.hpp"
#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "EvflEditor/editor/qt/ev_event_chooser_dialog.hpp"
#include "EvflEditor/editor/qt/ev_parent_link_model.hpp"
#include "ev_dialogs_detail.hpp"

#include <QHBoxLayout>
#include <QHeaderView>
#include <QMenu>
#include <QPushButton>
#include <QStringList>
#include <QTableView>
#include <QVBoxLayout>
#include <limits>

namespace EvflEditor::editor::qt {

EVEditParentsDialog::EVEditParentsDialog(FlowData &flowData,
                                         flow::EventIndex child,
                                         QWidget *parent)
    : QDialog(parent),
      m_session(std::make_unique<ParentLinkEditSession>(flowData, child)) {
  setWindowTitle(tr("Edit parents"));
  setModal(true);
  setObjectName("EVEditParentsDialog");
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  setMinimumSize(500, 300);
  buildUi();
  detail::applyDialogFrameStyle(this);
}

EVEditParentsDialog::~EVEditParentsDialog() = default;

void EVEditParentsDialog::buildUi() {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN, detail::DIALOG_MARGIN);
  layout->setSpacing(detail::DIALOG_SPACING);

  m_model = new EVParentLinkModel(*m_session, this);

  m_table = new QTableView(this);
  m_table->setModel(m_model);
  m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
  m_table->setSelectionMode(QAbstractItemView::SingleSelection);
  m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
  m_table->verticalHeader()->hide();
  m_table->horizontalHeader()->setStretchLastSection(true);
  m_table->horizontalHeader()->setSectionResizeMode(
      EVParentLinkModel::ParentColumn, QHeaderView::Stretch);
  m_table->setContextMenuPolicy(Qt::CustomContextMenu);
  connect(m_table, &QTableView::customContextMenuRequested, this,
          &EVEditParentsDialog::showContextMenu);
  layout->addWidget(m_table, 1);

  auto *buttonRow = new QHBoxLayout();
  m_addButton = new QPushButton(tr("Add parent..."), this);
  m_addButton->setObjectName("EVSecondaryButton");
  m_addButton->setEnabled(m_session->flowData().flowchart() != nullptr);
  connect(m_addButton, &QPushButton::clicked, this,
          &EVEditParentsDialog::addParent);
  buttonRow->addWidget(m_addButton);

  buttonRow->addLayout(detail::createStandardButtonBar(
      tr("Save"), tr("Cancel"), &m_saveButton, &m_cancelButton, this));
  connect(m_saveButton, &QPushButton::clicked, this,
          &EVEditParentsDialog::accept);
  connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
  layout->addLayout(buttonRow);
}

void EVEditParentsDialog::addParent() {
  const auto *flowchart = m_session->flowData().flowchart();
  if (!flowchart) {
    return;
  }

  const auto candidate =
      EVEventChooserDialog::chooseEvent(this, *flowchart, tr("Add parent"));
  if (!candidate) {
    return;
  }

  auto linkType = m_session->linkTypeFor(*candidate);
  if (linkType.isError()) {
    showLinkError(linkType.error());
    return;
  }

  std::optional<i32> switchValue;
  if (linkType.value() == ParentLinkType::SwitchCase) {
    bool ok = false;
    const int value = EVInputDialog::getInt(this, tr("Add parent"),
                                            tr("Switch case value:"), 0,
                                            std::numeric_limits<i32>::min(),
                                            std::numeric_limits<i32>::max(), 1, &ok);
    if (!ok) {
      return;
    }
    switchValue = value;
  }

  auto added = m_model->addParent(*candidate, switchValue);
  if (added.isError()) {
    showLinkError(added.error());
    return;
  }
  m_table->selectRow(m_model->rowCount() - 1);
}

void EVEditParentsDialog::showContextMenu(const QPoint &pos) {
  const QModelIndex index = m_table->indexAt(pos);
  if (!index.isValid()) {
    return;
  }

  QMenu menu(this);
  QAction *removeAction = menu.addAction(tr("Remove"));
  if (menu.exec(m_table->viewport()->mapToGlobal(pos)) != removeAction) {
    return;
  }

  auto removed = m_model->removeLink(index.row());
  if (removed.isError()) {
    showLinkError(removed.error());
  }
}

void EVEditParentsDialog::showLinkError(const ParentLinkError &error) {
  QString title;
  switch (error.code) {
  case ParentLinkErrorCode::SelfParent:
    title = tr("Invalid choice");
    break;
  case ParentLinkErrorCode::UnsupportedParentKind:
    title = tr("Not supported");
    break;
  case ParentLinkErrorCode::Conflict:
    title = tr("Conflict");
    break;
  case ParentLinkErrorCode::DuplicateLink:
  case ParentLinkErrorCode::Validation:
  case ParentLinkErrorCode::InvalidRow:
    title = tr("Invalid data");
    break;
  case ParentLinkErrorCode::OverwriteDeclined:
  case ParentLinkErrorCode::NoFlowchart:
    title = tr("Edit parents");
    break;
  }
  EVMessageDialog::showError(this, title, QString::fromStdString(error.message));
}

bool EVEditParentsDialog::confirmOverwrite(
    const std::vector<flow::EventIndex> &parents) {
  QStringList names;
  for (flow::EventIndex idx : parents) {
    names << QString::fromStdString(m_session->eventName(idx));
  }
  const QString childName =
      QString::fromStdString(m_session->eventName(m_session->child()));
  const QString message =
      tr("This will overwrite the child link of the following events to "
         "point to %1:\n\n%2\n\nContinue?")
          .arg(childName, names.join('\n'));

  const auto choice = EVMessageDialog::showQuestion(
      this, tr("Overwrite links"), message,
      {EVDialogButton::No, EVDialogButton::Yes}, EVDialogButton::Yes);
  return choice == EVDialogButton::Yes;
}

void EVEditParentsDialog::accept() {
  auto committed = m_session->commit(
      [this](const std::vector<flow::EventIndex> &parents) {
        return confirmOverwrite(parents);
      });

  if (committed.isError()) {
    if (committed.error().code == ParentLinkErrorCode::OverwriteDeclined) {
      EVMessageDialog::showInfo(this, tr("Edit parents"),
                                tr("No links were changed. Adjust the list "
                                   "and save again."));
    } else {
      showLinkError(committed.error());
    }
    return;
  }
  QDialog::accept();
}

} // namespace EvflEditor::editor::qt
