#pragma once

#include "EvflEditor/editor/qt/ev_flow_main_window.hpp"

namespace EvflEditor::editor::qt {

class EVTimelineEditor;

class EVTimelineWindow final : public EVFlowMainWindow {
  Q_OBJECT

public:
  EVTimelineWindow(EditorSettings& settings, EventBus& bus, QWidget* parent = nullptr);

  [[nodiscard]] EVTimelineEditor* editor() const { return m_editor; }

protected:
  [[nodiscard]] QString applicationTitle() const override;
  [[nodiscard]] QString aboutText() const override;
  void onFlowOpened() override;

private:
  EVTimelineEditor* m_editor = nullptr;
};

} // namespace EvflEditor::editor::qt
