#include "EvflEditor/editor/qt/ev_event_chooser_dialog.hpp"
#include "ev_dialogs_detail.hpp"

#include <QLineEdit>
#include <QListWidget>
#include <QPushButton>
#include <QVBoxLayout>

namespace EvflEditor::editor::qt {

namespace {
constexpr int kEventIndexRole = Qt::UserRole + 1;
}

EVEventChooserDialog::EVEventChooserDialog(const flow::Flowchart &flowchart,
                                           const QString &title,
                                           QWidget *parent)
    : QDialog(parent), m_flowchart(flowchart) {
  setWindowTitle(title);
  setModal(true);
  setObjectName("EVEventChooserDialog");
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  resize(detail::DIALOG_MIN_WIDTH + 100, 420);
  buildUi();
  detail::applyDialogFrameStyle(this);
}

void EVEventChooserDialog::buildUi() {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN, detail::DIALOG_MARGIN);
  layout->setSpacing(detail::DIALOG_SPACING);

  m_filterEdit = new QLineEdit(this);
  m_filterEdit->setPlaceholderText(tr("Filter events..."));
  m_filterEdit->setClearButtonEnabled(true);
  layout->addWidget(m_filterEdit);

  m_list = new QListWidget(this);
  m_list->setSelectionMode(QAbstractItemView::SingleSelection);
  for (flow::EventIndex idx = 0; idx < m_flowchart.eventCount(); ++idx) {
    auto *item = new QListWidgetItem(
        QString::fromStdString(flow::describeEvent(m_flowchart, idx)), m_list);
    item->setData(kEventIndexRole, static_cast<uint>(idx));
  }
  layout->addWidget(m_list, 1);

  layout->addLayout(detail::createStandardButtonBar(
      tr("Select"), tr("Cancel"), &m_okButton, &m_cancelButton, this));

  connect(m_filterEdit, &QLineEdit::textChanged, this,
          &EVEventChooserDialog::applyFilter);
  connect(m_list, &QListWidget::itemSelectionChanged, this,
          &EVEventChooserDialog::updateAcceptState);
  connect(m_list, &QListWidget::itemDoubleClicked, this, &QDialog::accept);
  connect(m_okButton, &QPushButton::clicked, this, &QDialog::accept);
  connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);

  updateAcceptState();
  m_filterEdit->setFocus();
}

void EVEventChooserDialog::applyFilter(const QString &text) {
  const QString needle = text.trimmed();
  for (int row = 0; row < m_list->count(); ++row) {
    QListWidgetItem *item = m_list->item(row);
    const bool visible =
        needle.isEmpty() || item->text().contains(needle, Qt::CaseInsensitive);
    item->setHidden(!visible);
    if (!visible && item->isSelected()) {
      item->setSelected(false);
    }
  }
  updateAcceptState();
}

void EVEventChooserDialog::updateAcceptState() {
  m_okButton->setEnabled(selectedEvent().has_value());
}

std::optional<flow::EventIndex> EVEventChooserDialog::selectedEvent() const {
  const auto items = m_list->selectedItems();
  if (items.isEmpty()) {
    return std::nullopt;
  }
  return static_cast<flow::EventIndex>(items.first()->data(kEventIndexRole).toUInt());
}

std::optional<flow::EventIndex>
EVEventChooserDialog::chooseEvent(QWidget *parent,
                                  const flow::Flowchart &flowchart,
                                  const QString &title) {
  EVEventChooserDialog dialog(flowchart, title, parent);
  if (dialog.exec() != QDialog::Accepted) {
    return std::nullopt;
  }
  return dialog.selectedEvent();
}

} // namespace EvflEditor::editor::qt
