#pragma once

#include <QDialog>
#include <QList>
#include <QString>
#include <limits>

class QDoubleSpinBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QSpinBox;

namespace EvflEditor::editor::qt {

enum class EVDialogButton { None, Ok, Cancel, Yes, No, Save, Discard };

enum class EVMessageType { Info, Warning, Error, Question };

class EVMessageDialog final : public QDialog {
  Q_OBJECT

public:
  EVMessageDialog(QWidget* parent, const QString& title, const QString& message, EVMessageType type,
                  const QList<EVDialogButton>& buttons,
                  EVDialogButton defaultButton = EVDialogButton::Ok);

  [[nodiscard]] EVDialogButton choice() const { return m_choice; }

  static EVDialogButton showInfo(QWidget* parent, const QString& title, const QString& message);
  static EVDialogButton showWarning(QWidget* parent, const QString& title, const QString& message);
  static EVDialogButton showError(QWidget* parent, const QString& title, const QString& message);
  static EVDialogButton showQuestion(QWidget* parent, const QString& title, const QString& message,
                                     const QList<EVDialogButton>& buttons,
                                     EVDialogButton defaultButton);

private:
  void buildUi(const QString& message, EVMessageType type, const QList<EVDialogButton>& buttons,
               EVDialogButton defaultButton);

  EVDialogButton m_choice = EVDialogButton::None;
};

class EVInputDialog final : public QDialog {
  Q_OBJECT

public:
  static int getInt(QWidget* parent, const QString& title, const QString& label, int value = 0,
                    int minValue = std::numeric_limits<int>::min(),
                    int maxValue = std::numeric_limits<int>::max(), int step = 1,
                    bool* ok = nullptr);

private:
  EVInputDialog(QWidget* parent, const QString& title, const QString& label);

  QLabel* m_label = nullptr;
  QSpinBox* m_intSpin = nullptr;
  QPushButton* m_okButton = nullptr;
  QPushButton* m_cancelButton = nullptr;
};

/**
 * @brief Form for a new timeline clip
 *
 * Rejects an empty name in place; the caller validates the rest through
 * TimelineDocument.
 */
class EVAddClipDialog final : public QDialog {
  Q_OBJECT

public:
  explicit EVAddClipDialog(QWidget* parent = nullptr);

  [[nodiscard]] QString clipName() const;
  [[nodiscard]] double startTime() const;
  [[nodiscard]] double duration() const;
  [[nodiscard]] QString clipType() const;

  void accept() override;

private:
  void buildUi();

  QLineEdit* m_nameEdit = nullptr;
  QDoubleSpinBox* m_startSpin = nullptr;
  QDoubleSpinBox* m_durationSpin = nullptr;
  QComboBox* m_typeCombo = nullptr;
  QPushButton* m_okButton = nullptr;
  QPushButton* m_cancelButton = nullptr;
};

} // namespace EvflEditor::editor::qt
