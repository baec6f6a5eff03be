#pragma once

/**
 * @file ev_parent_link_model.hpp
 * @brief Table model over the working list of an edit-parents session
 */

#include "EvflEditor/editor/parent_link_session.hpp"

#include <QAbstractTableModel>
#include <optional>

namespace EvflEditor::editor::qt {

class EVParentLinkModel final : public QAbstractTableModel {
  Q_OBJECT

public:
  enum Column { ParentColumn = 0, LinkColumn = 1, ColumnCount = 2 };

  explicit EVParentLinkModel(ParentLinkEditSession& session, QObject* parent = nullptr);

  [[nodiscard]] int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  [[nodiscard]] int columnCount(const QModelIndex& parent = QModelIndex()) const override;
  [[nodiscard]] QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
  [[nodiscard]] QVariant headerData(int section, Qt::Orientation orientation,
                                    int role = Qt::DisplayRole) const override;

  /// Appends through the session; attached views are reset either way
  ParentLinkResult<ParentLink> addParent(flow::EventIndex candidate,
                                         std::optional<i32> switchValue);
  ParentLinkResult<void> removeLink(int row);

private:
  ParentLinkEditSession& m_session;
};

} // namespace EvflEditor::editor::qt
