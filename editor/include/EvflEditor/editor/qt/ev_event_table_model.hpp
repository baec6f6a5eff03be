#pragma once

#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/editor/flow_data.hpp"

#include <QAbstractTableModel>
#include <optional>

namespace EvflEditor::editor::qt {

/**
 * @brief Events of the open flowchart, one row per event
 *
 * Resets itself whenever FlowData announces a change.
 */
class EVEventTableModel final : public QAbstractTableModel {
  Q_OBJECT

public:
  enum Column { NameColumn = 0, DescriptionColumn = 1, ColumnCount = 2 };

  explicit EVEventTableModel(FlowData& flowData, QObject* parent = nullptr);
  ~EVEventTableModel() override;

  [[nodiscard]] int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  [[nodiscard]] int columnCount(const QModelIndex& parent = QModelIndex()) const override;
  [[nodiscard]] QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
  [[nodiscard]] QVariant headerData(int section, Qt::Orientation orientation,
                                    int role = Qt::DisplayRole) const override;

  [[nodiscard]] std::optional<flow::EventIndex> eventAt(const QModelIndex& index) const;

private:
  FlowData& m_flowData;
  EventSubscription m_subscription;
};

} // namespace EvflEditor::editor::qt
