#include "EvflEditor/flow/flowchart.hpp"

#include <format>

namespace EvflEditor::flow {

// ============================================================================
// Event payload helpers
// ============================================================================

ParentKind parentKindOf(const EventData& data) {
  return std::visit(Overloaded{
                        [](const ActionEvent&) { return ParentKind::Sequential; },
                        [](const JoinEvent&) { return ParentKind::Sequential; },
                        [](const SubFlowEvent&) { return ParentKind::Sequential; },
                        [](const SwitchEvent&) { return ParentKind::Switch; },
                        [](const ForkEvent&) { return ParentKind::Fork; },
                        [](const UnsetEvent&) { return ParentKind::Other; },
                    },
                    data);
}

std::optional<EventIndex>* nextSlot(EventData& data) {
  if (auto* action = std::get_if<ActionEvent>(&data)) {
    return &action->next;
  }
  if (auto* join = std::get_if<JoinEvent>(&data)) {
    return &join->next;
  }
  if (auto* subflow = std::get_if<SubFlowEvent>(&data)) {
    return &subflow->next;
  }
  return nullptr;
}

const std::optional<EventIndex>* nextSlot(const EventData& data) {
  return nextSlot(const_cast<EventData&>(data));
}

const char* eventTypeName(const EventData& data) {
  return std::visit(Overloaded{
                        [](const ActionEvent&) { return "Action"; },
                        [](const JoinEvent&) { return "Join"; },
                        [](const SubFlowEvent&) { return "SubFlow"; },
                        [](const SwitchEvent&) { return "Switch"; },
                        [](const ForkEvent&) { return "Fork"; },
                        [](const UnsetEvent&) { return "Unset"; },
                    },
                    data);
}

// ============================================================================
// Flowchart
// ============================================================================

EventIndex Flowchart::addEvent(Event event) {
  m_events.push_back(std::move(event));
  return static_cast<EventIndex>(m_events.size() - 1);
}

EventIndex Flowchart::addEvent(std::string name, EventData data) {
  return addEvent(Event{std::move(name), std::move(data)});
}

std::optional<EventIndex> Flowchart::findEvent(const std::string& name) const {
  for (usize i = 0; i < m_events.size(); ++i) {
    if (m_events[i].name == name) {
      return static_cast<EventIndex>(i);
    }
  }
  return std::nullopt;
}

void Flowchart::setEntryPoint(const std::string& name, EventIndex mainEvent) {
  m_entryPoints[name] = mainEvent;
}

void Flowchart::removeEntryPoint(const std::string& name) { m_entryPoints.erase(name); }

std::string describeEvent(const Flowchart& flowchart, EventIndex idx) {
  if (!flowchart.contains(idx)) {
    return std::format("<invalid event #{}>", idx);
  }

  const Event& e = flowchart.event(idx);
  const std::string details = std::visit(
      Overloaded{
          [](const ActionEvent& a) { return std::format("Action: {}.{}", a.actor, a.action); },
          [](const SwitchEvent& s) { return std::format("Switch: {}.{}", s.actor, s.query); },
          [](const SubFlowEvent& s) {
            return std::format("SubFlow: {}<{}>", s.flowchartName, s.entryPointName);
          },
          [](const ForkEvent&) { return std::string("Fork"); },
          [](const JoinEvent&) { return std::string("Join"); },
          [](const UnsetEvent&) { return std::string("Unset"); },
      },
      e.data);

  return std::format("{} ({})", e.name, details);
}

} // namespace EvflEditor::flow
