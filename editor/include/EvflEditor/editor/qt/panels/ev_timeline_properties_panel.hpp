#pragma once

#include "EvflEditor/editor/timeline_document.hpp"

#include <QWidget>
#include <optional>

class QComboBox;
class QDoubleSpinBox;
class QLineEdit;
class QPushButton;

namespace EvflEditor::editor::qt {

/**
 * @brief Form editing the selected clip's name, timing and type
 *
 * Disabled while no clip is loaded. "Cancel" restores the values of the
 * loaded clip.
 */
class EVTimelinePropertiesPanel final : public QWidget {
  Q_OBJECT

public:
  explicit EVTimelinePropertiesPanel(QWidget* parent = nullptr);

  void loadClip(const flow::Clip& clip);
  void clear();

  /// Current form values; the actor is left unset
  [[nodiscard]] ClipDraft draft() const;

signals:
  void saveRequested();

private:
  void buildUi();
  void cancelChanges();

  std::optional<flow::Clip> m_loadedClip;
  QLineEdit* m_nameEdit = nullptr;
  QDoubleSpinBox* m_startSpin = nullptr;
  QDoubleSpinBox* m_durationSpin = nullptr;
  QComboBox* m_typeCombo = nullptr;
  QPushButton* m_saveButton = nullptr;
  QPushButton* m_cancelButton = nullptr;
};

} // namespace EvflEditor::editor::qt
