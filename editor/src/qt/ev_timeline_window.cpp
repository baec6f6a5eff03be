#include "EvflEditor/editor/qt/ev_timeline_window.hpp"
#include "EvflEditor/editor/qt/ev_dialogs.hpp"
#include "EvflEditor/editor/qt/panels/ev_timeline_editor.hpp"

namespace EvflEditor::editor::qt {

EVTimelineWindow::EVTimelineWindow(EditorSettings &settings, EventBus &bus,
                                   QWidget *parent)
    : EVFlowMainWindow(settings, bus, parent) {
  createFileMenu();
  createHelpMenu();

  m_editor = new EVTimelineEditor(flowData(), m_settings.timeline, this);
  setCentralWidget(m_editor);
  resize(1200, 800);
}

QString EVTimelineWindow::applicationTitle() const {
  return tr("BFEVFL Timeline Editor");
}

QString EVTimelineWindow::aboutText() const {
  return tr("BFEVFL Timeline Editor\n\n"
            "A visual editor for event flow timelines.\n"
            "Place, retime and retype the clips of a timeline.");
}

void EVTimelineWindow::onFlowOpened() {
  if (!flowData().timeline()) {
    EVMessageDialog::showWarning(
        this, tr("No Timeline Data"),
        tr("This file does not contain timeline data."));
  }
}

} // namespace EvflEditor::editor::qt
