#include "EvflEditor/editor/qt/ev_event_table_model.hpp"

namespace EvflEditor::editor::qt {

EVEventTableModel::EVEventTableModel(FlowData &flowData, QObject *parent)
    : QAbstractTableModel(parent), m_flowData(flowData) {
  m_subscription = m_flowData.bus().subscribe<events::FlowDataChangedEvent>(
      [this](const events::FlowDataChangedEvent &) {
        beginResetModel();
        endResetModel();
      });
}

EVEventTableModel::~EVEventTableModel() {
  m_flowData.bus().unsubscribe(m_subscription);
}

int EVEventTableModel::rowCount(const QModelIndex &parent) const {
  if (parent.isValid()) {
    return 0;
  }
  const auto *flowchart = m_flowData.flowchart();
  return flowchart ? static_cast<int>(flowchart->eventCount()) : 0;
}

int EVEventTableModel::columnCount(const QModelIndex &parent) const {
  return parent.isValid() ? 0 : ColumnCount;
}

QVariant EVEventTableModel::data(const QModelIndex &index, int role) const {
  const auto idx = eventAt(index);
  if (!idx || role != Qt::DisplayRole) {
    return {};
  }
  const auto &flowchart = *m_flowData.flowchart();
  if (index.column() == NameColumn) {
    return QString::fromStdString(flowchart.event(*idx).name);
  }
  if (index.column() == DescriptionColumn) {
    return QString::fromStdString(flow::describeEvent(flowchart, *idx));
  }
  return {};
}

QVariant EVEventTableModel::headerData(int section,
                                       Qt::Orientation orientation,
                                       int role) const {
  if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
    return {};
  }
  switch (section) {
  case NameColumn:
    return tr("Event");
  case DescriptionColumn:
    return tr("Description");
  default:
    return {};
  }
}

std::optional<flow::EventIndex>
EVEventTableModel::eventAt(const QModelIndex &index) const {
  if (!index.isValid() || index.row() >= rowCount()) {
    return std::nullopt;
  }
  return static_cast<flow::EventIndex>(index.row());
}

} // namespace EvflEditor::editor::qt
