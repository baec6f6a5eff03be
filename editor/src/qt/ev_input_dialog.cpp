#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "ev_dialogs_detail.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

namespace EvflEditor::editor::qt {

EVInputDialog::EVInputDialog(QWidget *parent, const QString &title,
                             const QString &label)
    : QDialog(parent) {
  setWindowTitle(title);
  setModal(true);
  setObjectName("EVInputDialog");
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);

  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(12, 12, 12, 12);
  layout->setSpacing(8);

  m_label = new QLabel(label, this);
  m_label->setWordWrap(true);
  layout->addWidget(m_label);

  m_intSpin = new QSpinBox(this);
  layout->addWidget(m_intSpin);

  layout->addLayout(detail::createStandardButtonBar(
      tr("OK"), tr("Cancel"), &m_okButton, &m_cancelButton, this));
  connect(m_okButton, &QPushButton::clicked, this, &QDialog::accept);
  connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);

  detail::applyDialogFrameStyle(this);
}

int EVInputDialog::getInt(QWidget *parent, const QString &title,
                          const QString &label, int value, int minValue,
                          int maxValue, int step, bool *ok) {
  EVInputDialog dialog(parent, title, label);
  dialog.m_intSpin->setRange(minValue, maxValue);
  dialog.m_intSpin->setSingleStep(step);
  dialog.m_intSpin->setValue(value);
  dialog.m_intSpin->selectAll();
  dialog.m_intSpin->setFocus();

  const int result = dialog.exec();
  if (ok) {
    *ok = (result == QDialog::Accepted);
  }
  return result == QDialog::Accepted ? dialog.m_intSpin->value() : value;
}

} // namespace EvflEditor::editor::qt
