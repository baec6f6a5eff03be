#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "EvflEditor/editor/timeline_document.hpp"
#include "EvflEditor/flow/timeline.hpp"
#include "ev_dialogs_detail.hpp"

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace EvflEditor::editor::qt {

EVAddClipDialog::EVAddClipDialog(QWidget *parent) : QDialog(parent) {
  setWindowTitle(tr("Add Clip"));
  setModal(true);
  setObjectName("EVAddClipDialog");
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  buildUi();
  detail::applyDialogFrameStyle(this);
}

void EVAddClipDialog::buildUi() {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN, detail::DIALOG_MARGIN);
  layout->setSpacing(detail::DIALOG_SPACING);

  auto *form = new QFormLayout();

  m_nameEdit = new QLineEdit(this);
  m_nameEdit->setPlaceholderText(tr("Enter clip name"));
  form->addRow(tr("Name:"), m_nameEdit);

  m_startSpin = new QDoubleSpinBox(this);
  m_startSpin->setRange(TimelineDocument::MIN_START_TIME,
                        TimelineDocument::MAX_TIME);
  m_startSpin->setDecimals(2);
  m_startSpin->setSuffix(tr(" sec"));
  form->addRow(tr("Start Time:"), m_startSpin);

  m_durationSpin = new QDoubleSpinBox(this);
  m_durationSpin->setRange(TimelineDocument::MIN_DURATION,
                           TimelineDocument::MAX_TIME);
  m_durationSpin->setDecimals(2);
  m_durationSpin->setSuffix(tr(" sec"));
  m_durationSpin->setValue(1.0);
  form->addRow(tr("Duration:"), m_durationSpin);

  m_typeCombo = new QComboBox(this);
  for (flow::ClipType type : flow::kAllClipTypes) {
    m_typeCombo->addItem(QString::fromLatin1(flow::clipTypeToString(type)));
  }
  form->addRow(tr("Type:"), m_typeCombo);

  layout->addLayout(form);
  layout->addLayout(detail::createStandardButtonBar(
      tr("OK"), tr("Cancel"), &m_okButton, &m_cancelButton, this));
  connect(m_okButton, &QPushButton::clicked, this, &EVAddClipDialog::accept);
  connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);

  m_nameEdit->setFocus();
}

QString EVAddClipDialog::clipName() const { return m_nameEdit->text(); }

double EVAddClipDialog::startTime() const { return m_startSpin->value(); }

double EVAddClipDialog::duration() const { return m_durationSpin->value(); }

QString EVAddClipDialog::clipType() const { return m_typeCombo->currentText(); }

void EVAddClipDialog::accept() {
  if (m_nameEdit->text().isEmpty()) {
    EVMessageDialog::showWarning(this, tr("Invalid Name"),
                                 tr("Please enter a clip name."));
    return;
  }
  QDialog::accept();
}

} // namespace EvflEditor::editor::qt
