#include "EvflEditor/editor/flow_document.hpp"

#include <QFileInfo>
#include <memory>

namespace EvflEditor::editor {

FlowJsonResult<void> FlowDocument::open(const QString& path) {
  auto loaded = FlowJsonHandler::loadFromFile(path);
  if (loaded.isError()) {
    return FlowJsonResult<void>::error(loaded.error());
  }

  m_path = path;
  m_flowData.setFlow(std::make_unique<flow::EventFlow>(std::move(loaded).value()));
  return FlowJsonResult<void>::ok();
}

FlowJsonResult<void> FlowDocument::save() {
  if (m_path.isEmpty()) {
    return FlowJsonResult<void>::error(
        {FlowJsonError::FileOpenFailed, "The flow has not been saved before."});
  }
  return saveAs(m_path);
}

FlowJsonResult<void> FlowDocument::saveAs(const QString& path) {
  const auto* flow = m_flowData.flow();
  if (!flow) {
    return FlowJsonResult<void>::error(
        {FlowJsonError::FileWriteFailed, "No event flow is open."});
  }

  auto saved = FlowJsonHandler::saveToFile(path, *flow);
  if (saved.isError()) {
    return saved;
  }

  m_path = path;
  m_flowData.markSaved();
  m_flowData.bus().publish(events::FlowSavedEvent(path.toStdString()));
  return saved;
}

QString FlowDocument::displayName() const {
  if (m_path.isEmpty()) {
    return QStringLiteral("Untitled");
  }
  return QFileInfo(m_path).fileName();
}

} // namespace EvflEditor::editor
