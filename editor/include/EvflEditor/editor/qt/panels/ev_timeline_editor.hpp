#pragma once

/**
 * @file ev_timeline_editor.hpp
 * @brief Timeline editing widget
 *
 * Toolbar on top, the rendered timeline (QWebEngineView) in the middle and
 * the clip properties form below. Clicks in the page come back through a
 * QWebChannel bridge object.
 */

#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/editor/timeline_document.hpp"

#include <QWidget>
#include <vector>

class QLabel;
class QToolBar;
class QWebChannel;
class QWebEngineView;

namespace EvflEditor::editor::qt {

class EVTimelineBridge;
class EVTimelinePropertiesPanel;

class EVTimelineEditor final : public QWidget {
  Q_OBJECT

public:
  EVTimelineEditor(FlowData& flowData, const TimelineViewSettings& settings,
                   QWidget* parent = nullptr);
  ~EVTimelineEditor() override;

  [[nodiscard]] TimelineDocument& document() { return m_document; }

  void addClip();
  void deleteSelectedClip();
  void zoomIn();
  void zoomOut();

  /// Rebuild the page from the current document state
  void renderTimeline();

private:
  void buildUi();
  QToolBar* createToolbar();
  void onClipSelected(int clipIndex);
  void saveClipChanges();
  void updateTimeLabel();

  FlowData& m_flowData;
  TimelineDocument m_document;
  std::vector<EventSubscription> m_subscriptions;

  QWebEngineView* m_view = nullptr;
  QWebChannel* m_channel = nullptr;
  EVTimelineBridge* m_bridge = nullptr;
  EVTimelinePropertiesPanel* m_properties = nullptr;
  QLabel* m_timeLabel = nullptr;
};

} // namespace EvflEditor::editor::qt
