#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "ev_dialogs_detail.hpp"

#include <QApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QStyle>
#include <QVBoxLayout>

namespace EvflEditor::editor::qt {

namespace {

QString buttonText(EVDialogButton button) {
  switch (button) {
  case EVDialogButton::Ok:
    return QObject::tr("OK");
  case EVDialogButton::Cancel:
    return QObject::tr("Cancel");
  case EVDialogButton::Yes:
    return QObject::tr("Yes");
  case EVDialogButton::No:
    return QObject::tr("No");
  case EVDialogButton::Save:
    return QObject::tr("Save");
  case EVDialogButton::Discard:
    return QObject::tr("Discard");
  case EVDialogButton::None:
    break;
  }
  return {};
}

QStyle::StandardPixmap iconFor(EVMessageType type) {
  switch (type) {
  case EVMessageType::Warning:
    return QStyle::SP_MessageBoxWarning;
  case EVMessageType::Error:
    return QStyle::SP_MessageBoxCritical;
  case EVMessageType::Question:
    return QStyle::SP_MessageBoxQuestion;
  case EVMessageType::Info:
    break;
  }
  return QStyle::SP_MessageBoxInformation;
}

} // namespace

EVMessageDialog::EVMessageDialog(QWidget *parent, const QString &title,
                                 const QString &message, EVMessageType type,
                                 const QList<EVDialogButton> &buttons,
                                 EVDialogButton defaultButton)
    : QDialog(parent) {
  setWindowTitle(title);
  setModal(true);
  setObjectName("EVMessageDialog");
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  setMinimumWidth(detail::DIALOG_MIN_WIDTH);
  buildUi(message, type, buttons, defaultButton);
  detail::applyDialogFrameStyle(this);
}

void EVMessageDialog::buildUi(const QString &message, EVMessageType type,
                              const QList<EVDialogButton> &buttons,
                              EVDialogButton defaultButton) {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN, detail::DIALOG_MARGIN);
  layout->setSpacing(detail::DIALOG_SPACING);

  auto *body = new QHBoxLayout();
  auto *icon = new QLabel(this);
  icon->setPixmap(style()->standardIcon(iconFor(type)).pixmap(32, 32));
  icon->setAlignment(Qt::AlignTop);
  body->addWidget(icon);

  auto *text = new QLabel(message, this);
  text->setObjectName("EVMessageText");
  text->setWordWrap(true);
  text->setTextInteractionFlags(Qt::TextSelectableByMouse);
  body->addWidget(text, 1);
  layout->addLayout(body);

  auto *buttonLayout = new QHBoxLayout();
  buttonLayout->addStretch();
  for (EVDialogButton button : buttons) {
    auto *btn = new QPushButton(buttonText(button), this);
    const bool primary = button == defaultButton;
    btn->setObjectName(primary ? "EVPrimaryButton" : "EVSecondaryButton");
    btn->setDefault(primary);
    connect(btn, &QPushButton::clicked, this, [this, button]() {
      m_choice = button;
      const bool negative = button == EVDialogButton::Cancel || button == EVDialogButton::No;
      if (negative) {
        reject();
      } else {
        accept();
      }
    });
    buttonLayout->addWidget(btn);
  }
  layout->addLayout(buttonLayout);
}

EVDialogButton EVMessageDialog::showInfo(QWidget *parent, const QString &title,
                                         const QString &message) {
  EVMessageDialog dialog(parent, title, message, EVMessageType::Info,
                         {EVDialogButton::Ok});
  dialog.exec();
  return dialog.choice();
}

EVDialogButton EVMessageDialog::showWarning(QWidget *parent,
                                            const QString &title,
                                            const QString &message) {
  EVMessageDialog dialog(parent, title, message, EVMessageType::Warning,
                         {EVDialogButton::Ok});
  dialog.exec();
  return dialog.choice();
}

EVDialogButton EVMessageDialog::showError(QWidget *parent, const QString &title,
                                          const QString &message) {
  EVMessageDialog dialog(parent, title, message, EVMessageType::Error,
                         {EVDialogButton::Ok});
  dialog.exec();
  return dialog.choice();
}

EVDialogButton EVMessageDialog::showQuestion(
    QWidget *parent, const QString &title, const QString &message,
    const QList<EVDialogButton> &buttons, EVDialogButton defaultButton) {
  EVMessageDialog dialog(parent, title, message, EVMessageType::Question,
                         buttons, defaultButton);
  dialog.exec();
  return dialog.choice();
}

} // namespace EvflEditor::editor::qt
