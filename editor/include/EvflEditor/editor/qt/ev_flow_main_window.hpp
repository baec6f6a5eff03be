#pragma once

/**
 * @file ev_flow_main_window.hpp
 * @brief Main window base shared by the flowchart and timeline editors
 *
 * Owns the open flow and its file binding and provides the File and Help
 * menus, the modified marker in the title and the unsaved-changes prompt.
 */

#include "EvflEditor/editor/editor_settings.hpp"
#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/editor/flow_data.hpp"
#include "EvflEditor/editor/flow_document.hpp"

#include <QMainWindow>
#include <vector>

class QAction;
class QCloseEvent;
class QMenu;

namespace EvflEditor::editor::qt {

class EVFlowMainWindow : public QMainWindow {
  Q_OBJECT

public:
  EVFlowMainWindow(EditorSettings& settings, EventBus& bus, QWidget* parent = nullptr);
  ~EVFlowMainWindow() override;

  /**
   * @brief Open a flow file, reporting failures in a message box
   * @return true if the flow was loaded
   */
  bool openFile(const QString& path);

  [[nodiscard]] FlowData& flowData() { return m_flowData; }
  [[nodiscard]] FlowDocument& document() { return m_document; }

protected:
  /// Name shown after the file name in the title bar
  [[nodiscard]] virtual QString applicationTitle() const = 0;
  [[nodiscard]] virtual QString aboutText() const = 0;

  /// Called after a flow was loaded from disk
  virtual void onFlowOpened() {}

  /// File and Help menus; subclasses add their own menus in between
  QMenu* createFileMenu();
  void createHelpMenu();

  void closeEvent(QCloseEvent* event) override;

  EditorSettings& m_settings;

private:
  void openFileDialog();
  bool save();
  bool saveAs();
  /// @return false if the user cancelled
  bool maybeSave();
  void updateTitle();
  void rememberDirectory(const QString& path);

  FlowData m_flowData;
  FlowDocument m_document;
  std::vector<EventSubscription> m_subscriptions;
};

} // namespace EvflEditor::editor::qt
