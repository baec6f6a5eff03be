#pragma once

/**
 * @file flow_data.hpp
 * @brief Holder of the event flow open in the editor
 *
 * FlowData owns the document and is the single place that announces
 * structural changes. Code that mutates the flow calls notifyChanged() once
 * it is done; views subscribe to FlowDataChangedEvent on the bus.
 */

#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/editor/events/flow_events.hpp"
#include "EvflEditor/flow/event_flow.hpp"
#include <memory>

namespace EvflEditor::editor {

class FlowData {
public:
  explicit FlowData(EventBus& bus = EventBus::instance());

  FlowData(const FlowData&) = delete;
  FlowData& operator=(const FlowData&) = delete;

  /**
   * @brief Replace the open flow (nullptr closes it)
   *
   * Clears the modified flag and publishes a Reset change.
   */
  void setFlow(std::unique_ptr<flow::EventFlow> flow);

  [[nodiscard]] bool hasFlow() const { return m_flow != nullptr; }
  [[nodiscard]] flow::EventFlow* flow() { return m_flow.get(); }
  [[nodiscard]] const flow::EventFlow* flow() const { return m_flow.get(); }

  /// nullptr when no flow is open or the flow has no flowchart
  [[nodiscard]] flow::Flowchart* flowchart();
  [[nodiscard]] const flow::Flowchart* flowchart() const;

  /// nullptr when no flow is open or the flow has no timeline
  [[nodiscard]] flow::Timeline* timeline();
  [[nodiscard]] const flow::Timeline* timeline() const;

  /**
   * @brief Mark the flow modified and publish a FlowDataChangedEvent
   */
  void notifyChanged(events::FlowDataChangeReason reason);

  [[nodiscard]] bool isModified() const { return m_modified; }
  void markSaved() { m_modified = false; }

  [[nodiscard]] EventBus& bus() { return m_bus; }

private:
  EventBus& m_bus;
  std::unique_ptr<flow::EventFlow> m_flow;
  bool m_modified = false;
};

} // namespace EvflEditor::editor
