#include "ev_dialogs_detail.hpp"

#include <QDialog>
#include <QHBoxLayout>
#include <QPushButton>

namespace EvflEditor::editor::qt::detail {

void applyDialogFrameStyle(QDialog *dialog) {
  if (!dialog) {
    return;
  }

  dialog->setStyleSheet(QString(R"(
    QDialog {
      background-color: #2b2b2b;
      border: 1px solid #555555;
    }
    QLabel {
      color: #e0e0e0;
    }
    QLabel#EVMessageText {
      font-size: 13px;
    }
    QPushButton#EVPrimaryButton {
      background-color: #4a9eff;
      color: #ffffff;
      border: none;
      border-radius: 4px;
      padding: 8px 16px;
      font-weight: 600;
      min-width: %1px;
      min-height: %2px;
    }
    QPushButton#EVPrimaryButton:hover {
      background-color: #6bb0ff;
    }
    QPushButton#EVSecondaryButton {
      background-color: #3a3a3a;
      color: #ffffff;
      border: 1px solid #555555;
      border-radius: 4px;
      padding: 8px 16px;
      min-width: %1px;
      min-height: %2px;
    }
    QPushButton#EVSecondaryButton:hover {
      border-color: #4a9eff;
    }
    QLineEdit, QComboBox, QSpinBox, QDoubleSpinBox {
      background-color: #3a3a3a;
      border: 1px solid #555555;
      border-radius: 4px;
      padding: 6px 10px;
      color: #e0e0e0;
    }
    QLineEdit:focus, QComboBox:focus, QSpinBox:focus, QDoubleSpinBox:focus {
      border-color: #4a9eff;
    }
  )")
                            .arg(DIALOG_BUTTON_MIN_WIDTH)
                            .arg(DIALOG_BUTTON_HEIGHT));
}

QHBoxLayout *createStandardButtonBar(const QString &primaryText,
                                     const QString &secondaryText,
                                     QPushButton **outPrimary,
                                     QPushButton **outSecondary,
                                     QWidget *parent) {
  auto *layout = new QHBoxLayout();
  layout->setSpacing(DIALOG_SPACING);
  layout->addStretch();

  auto *secondary = new QPushButton(secondaryText, parent);
  secondary->setObjectName("EVSecondaryButton");
  layout->addWidget(secondary);

  auto *primary = new QPushButton(primaryText, parent);
  primary->setObjectName("EVPrimaryButton");
  primary->setDefault(true);
  layout->addWidget(primary);

  if (outPrimary) {
    *outPrimary = primary;
  }
  if (outSecondary) {
    *outSecondary = secondary;
  }
  return layout;
}

} // namespace EvflEditor::editor::qt::detail
