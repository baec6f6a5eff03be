#pragma once

#include "EvflEditor/flow/flowchart.hpp"

#include <QDialog>
#include <optional>

class QLineEdit;
class QListWidget;
class QPushButton;

namespace EvflEditor::editor::qt {

/**
 * @brief Filterable list of every event in a flowchart
 */
class EVEventChooserDialog final : public QDialog {
  Q_OBJECT

public:
  EVEventChooserDialog(const flow::Flowchart& flowchart, const QString& title,
                       QWidget* parent = nullptr);

  [[nodiscard]] std::optional<flow::EventIndex> selectedEvent() const;

  /// @return the chosen event, or nullopt if the user cancelled
  static std::optional<flow::EventIndex> chooseEvent(QWidget* parent,
                                                     const flow::Flowchart& flowchart,
                                                     const QString& title);

private:
  void buildUi();
  void applyFilter(const QString& text);
  void updateAcceptState();

  const flow::Flowchart& m_flowchart;
  QLineEdit* m_filterEdit = nullptr;
  QListWidget* m_list = nullptr;
  QPushButton* m_okButton = nullptr;
  QPushButton* m_cancelButton = nullptr;
};

} // namespace EvflEditor::editor::qt
