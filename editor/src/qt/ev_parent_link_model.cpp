#include "EvflEditor/editor/qt/ev_parent_link_model.hpp"

namespace EvflEditor::editor::qt {

EVParentLinkModel::EVParentLinkModel(ParentLinkEditSession &session,
                                     QObject *parent)
    : QAbstractTableModel(parent), m_session(session) {}

int EVParentLinkModel::rowCount(const QModelIndex &parent) const {
  if (parent.isValid()) {
    return 0;
  }
  return static_cast<int>(m_session.links().size());
}

int EVParentLinkModel::columnCount(const QModelIndex &parent) const {
  return parent.isValid() ? 0 : ColumnCount;
}

QVariant EVParentLinkModel::data(const QModelIndex &index, int role) const {
  if (!index.isValid() || role != Qt::DisplayRole ||
      index.row() >= rowCount()) {
    return {};
  }

  const ParentLink &link = m_session.links().at(static_cast<usize>(index.row()));
  if (index.column() == ParentColumn) {
    const auto *flowchart = m_session.flowData().flowchart();
    if (!flowchart) {
      return {};
    }
    return QString::fromStdString(flow::describeEvent(*flowchart, link.parent));
  }
  if (index.column() == LinkColumn) {
    return QString::fromStdString(describeLink(link));
  }
  return {};
}

QVariant EVParentLinkModel::headerData(int section,
                                       Qt::Orientation orientation,
                                       int role) const {
  if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
    return {};
  }
  switch (section) {
  case ParentColumn:
    return tr("Parent event");
  case LinkColumn:
    return tr("Link");
  default:
    return {};
  }
}

ParentLinkResult<ParentLink>
EVParentLinkModel::addParent(flow::EventIndex candidate,
                             std::optional<i32> switchValue) {
  // Whether a row appears is only known after the session validated the link
  beginResetModel();
  auto added = m_session.addParent(candidate, switchValue);
  endResetModel();
  return added;
}

ParentLinkResult<void> EVParentLinkModel::removeLink(int row) {
  if (row < 0 || row >= rowCount()) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::InvalidRow, "No parent link is selected."});
  }
  beginRemoveRows(QModelIndex(), row, row);
  auto removed = m_session.removeRow(static_cast<usize>(row));
  endRemoveRows();
  return removed;
}

} // namespace EvflEditor::editor::qt
