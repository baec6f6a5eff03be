#include "EvflEditor/editor/qt/panels/ev_timeline_editor.hpp"
#include "EvflEditor/core/logger.hpp"
#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "EvflEditor/editor/qt/panels/ev_timeline_bridge.hpp"
#include "EvflEditor/editor/qt/panels/ev_timeline_properties_panel.hpp"
#include "EvflEditor/editor/timeline_html.hpp"

#include <QAction>
#include <QLabel>
#include <QSplitter>
#include <QStyle>
#include <QToolBar>
#include <QUrl>
#include <QVBoxLayout>
#include <QWebChannel>
#include <QWebEnginePage>
#include <QWebEngineView>

namespace EvflEditor::editor::qt {

EVTimelineEditor::EVTimelineEditor(FlowData &flowData,
                                   const TimelineViewSettings &settings,
                                   QWidget *parent)
    : QWidget(parent), m_flowData(flowData), m_document(flowData, settings) {
  buildUi();

  auto &bus = m_flowData.bus();
  m_subscriptions.push_back(bus.subscribe<events::FlowDataChangedEvent>(
      [this](const events::FlowDataChangedEvent &event) {
        if (event.reason == events::FlowDataChangeReason::Reset) {
          m_document.clearSelection();
          m_properties->clear();
        } else if (auto selected = m_document.selectedIndex()) {
          onClipSelected(static_cast<int>(*selected));
        }
        renderTimeline();
      }));
  m_subscriptions.push_back(bus.subscribe<events::ClipSelectedEvent>(
      [this](const events::ClipSelectedEvent &event) {
        onClipSelected(event.clipIndex);
      }));

  renderTimeline();
}

EVTimelineEditor::~EVTimelineEditor() {
  for (const auto &sub : m_subscriptions) {
    m_flowData.bus().unsubscribe(sub);
  }
}

void EVTimelineEditor::buildUi() {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->addWidget(createToolbar());

  auto *splitter = new QSplitter(Qt::Vertical, this);

  m_view = new QWebEngineView(splitter);
  m_bridge = new EVTimelineBridge(this);
  m_channel = new QWebChannel(this);
  m_channel->registerObject(
      QString::fromLatin1(TimelineHtmlBuilder::BRIDGE_OBJECT_NAME), m_bridge);
  m_view->page()->setWebChannel(m_channel);
  connect(m_bridge, &EVTimelineBridge::clipSelectionRequested, this,
          [this](const QString &payload) {
            m_document.selectClipFromBridge(payload);
          });
  splitter->addWidget(m_view);

  m_properties = new EVTimelinePropertiesPanel(splitter);
  connect(m_properties, &EVTimelinePropertiesPanel::saveRequested, this,
          &EVTimelineEditor::saveClipChanges);
  splitter->addWidget(m_properties);

  splitter->setSizes({700, 300});
  layout->addWidget(splitter, 1);
}

QToolBar *EVTimelineEditor::createToolbar() {
  auto *toolbar = new QToolBar(this);

  QAction *addAction =
      toolbar->addAction(style()->standardIcon(QStyle::SP_FileIcon), tr("Add Clip"));
  connect(addAction, &QAction::triggered, this, &EVTimelineEditor::addClip);

  QAction *deleteAction =
      toolbar->addAction(style()->standardIcon(QStyle::SP_TrashIcon), tr("Delete"));
  connect(deleteAction, &QAction::triggered, this,
          &EVTimelineEditor::deleteSelectedClip);

  toolbar->addSeparator();

  QAction *zoomInAction =
      toolbar->addAction(style()->standardIcon(QStyle::SP_ArrowUp), tr("Zoom In"));
  connect(zoomInAction, &QAction::triggered, this, &EVTimelineEditor::zoomIn);

  QAction *zoomOutAction =
      toolbar->addAction(style()->standardIcon(QStyle::SP_ArrowDown), tr("Zoom Out"));
  connect(zoomOutAction, &QAction::triggered, this, &EVTimelineEditor::zoomOut);

  toolbar->addSeparator();

  m_timeLabel = new QLabel(this);
  toolbar->addWidget(m_timeLabel);
  updateTimeLabel();
  return toolbar;
}

void EVTimelineEditor::renderTimeline() {
  if (!m_document.hasTimeline()) {
    m_view->setHtml(QString());
    updateTimeLabel();
    return;
  }
  m_view->setHtml(TimelineHtmlBuilder::build(m_document.bridgeData(),
                                             m_document.pixelsPerSecond(),
                                             m_document.settings()),
                  QUrl(QStringLiteral("qrc:///")));
  updateTimeLabel();
}

void EVTimelineEditor::updateTimeLabel() {
  const flow::Clip *clip = m_document.selectedClip();
  const f64 seconds = clip ? clip->startTime : 0.0;
  m_timeLabel->setText(QString::fromStdString(TimelineDocument::formatTimecode(seconds)));
}

void EVTimelineEditor::onClipSelected(int clipIndex) {
  const flow::Clip *clip = m_document.selectedClip();
  if (clipIndex < 0 || !clip) {
    m_properties->clear();
  } else {
    m_properties->loadClip(*clip);
  }
  updateTimeLabel();
}

void EVTimelineEditor::addClip() {
  if (!m_document.hasTimeline()) {
    EVMessageDialog::showWarning(this, tr("No Timeline"),
                                 tr("Open a file with timeline data first."));
    return;
  }

  EVAddClipDialog dialog(this);
  if (dialog.exec() != QDialog::Accepted) {
    return;
  }

  ClipDraft draft;
  draft.name = dialog.clipName().toStdString();
  draft.startTime = dialog.startTime();
  draft.duration = dialog.duration();
  draft.type = flow::clipTypeFromString(dialog.clipType().toStdString())
                   .value_or(flow::ClipType::Action);

  auto added = m_document.addClip(draft);
  if (added.isError()) {
    EVMessageDialog::showWarning(this, tr("Invalid Clip"),
                                 QString::fromStdString(added.error()));
  }
}

void EVTimelineEditor::deleteSelectedClip() {
  const flow::Clip *clip = m_document.selectedClip();
  if (!clip) {
    EVMessageDialog::showWarning(this, tr("No Selection"),
                                 tr("Please select a clip to delete."));
    return;
  }

  const auto choice = EVMessageDialog::showQuestion(
      this, tr("Delete Clip"),
      tr("Delete clip '%1'?").arg(QString::fromStdString(clip->name)),
      {EVDialogButton::No, EVDialogButton::Yes}, EVDialogButton::Yes);
  if (choice != EVDialogButton::Yes) {
    return;
  }

  auto deleted = m_document.deleteSelectedClip();
  if (deleted.isError()) {
    EVMessageDialog::showWarning(this, tr("Delete Clip"),
                                 QString::fromStdString(deleted.error()));
  }
}

void EVTimelineEditor::saveClipChanges() {
  auto updated = m_document.updateSelectedClip(m_properties->draft());
  if (updated.isError()) {
    EVMessageDialog::showWarning(this, tr("Invalid Clip"),
                                 QString::fromStdString(updated.error()));
    return;
  }
  EVMessageDialog::showInfo(this, tr("Saved"), tr("Clip changes saved!"));
}

void EVTimelineEditor::zoomIn() {
  m_document.zoomIn();
  EVFLEDITOR_LOG_DEBUG("Timeline zoom {:.3f}", m_document.zoomLevel());
  renderTimeline();
}

void EVTimelineEditor::zoomOut() {
  m_document.zoomOut();
  EVFLEDITOR_LOG_DEBUG("Timeline zoom {:.3f}", m_document.zoomLevel());
  renderTimeline();
}

} // namespace EvflEditor::editor::qt
