#pragma once

#include <QObject>
#include <QString>

namespace EvflEditor::editor::qt {

/**
 * @brief Object exposed to the timeline page over QWebChannel
 *
 * The page calls clipSelected() with the clip id; the editor widget listens
 * to clipSelectionRequested().
 */
class EVTimelineBridge final : public QObject {
  Q_OBJECT

public:
  explicit EVTimelineBridge(QObject* parent = nullptr) : QObject(parent) {}

public slots:
  void clipSelected(const QString& payload) { emit clipSelectionRequested(payload); }

signals:
  void clipSelectionRequested(const QString& payload);
};

} // namespace EvflEditor::editor::qt
