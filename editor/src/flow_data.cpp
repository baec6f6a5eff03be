#include "EvflEditor/editor/flow_data.hpp"
#include "EvflEditor/core/logger.hpp"

namespace EvflEditor::editor {

FlowData::FlowData(EventBus& bus) : m_bus(bus) {}

void FlowData::setFlow(std::unique_ptr<flow::EventFlow> flow) {
  m_flow = std::move(flow);
  m_modified = false;
  m_bus.publish(events::FlowDataChangedEvent(events::FlowDataChangeReason::Reset));
}

flow::Flowchart* FlowData::flowchart() {
  if (!m_flow || !m_flow->flowchart) {
    return nullptr;
  }
  return &*m_flow->flowchart;
}

const flow::Flowchart* FlowData::flowchart() const {
  if (!m_flow || !m_flow->flowchart) {
    return nullptr;
  }
  return &*m_flow->flowchart;
}

flow::Timeline* FlowData::timeline() {
  if (!m_flow || !m_flow->timeline) {
    return nullptr;
  }
  return &*m_flow->timeline;
}

const flow::Timeline* FlowData::timeline() const {
  if (!m_flow || !m_flow->timeline) {
    return nullptr;
  }
  return &*m_flow->timeline;
}

void FlowData::notifyChanged(events::FlowDataChangeReason reason) {
  m_modified = true;
  EVFLEDITOR_LOG_DEBUG("Flow data changed ({})", events::flowDataChangeReasonToString(reason));
  m_bus.publish(events::FlowDataChangedEvent(reason));
}

} // namespace EvflEditor::editor
