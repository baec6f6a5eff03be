#pragma once

/**
 * @file flowchart.hpp
 * @brief Flowchart: event arena plus named entry points
 */

#include "EvflEditor/flow/event.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace EvflEditor::flow {

class Flowchart {
public:
  Flowchart() = default;
  explicit Flowchart(std::string name) : m_name(std::move(name)) {}

  [[nodiscard]] const std::string& name() const { return m_name; }
  void setName(std::string name) { m_name = std::move(name); }

  /**
   * @brief Append an event to the arena
   * @return Handle of the new event
   */
  EventIndex addEvent(Event event);
  EventIndex addEvent(std::string name, EventData data);

  [[nodiscard]] bool contains(EventIndex idx) const { return idx < m_events.size(); }

  /// Precondition: contains(idx)
  [[nodiscard]] Event& event(EventIndex idx) { return m_events.at(idx); }
  [[nodiscard]] const Event& event(EventIndex idx) const { return m_events.at(idx); }

  [[nodiscard]] std::optional<EventIndex> findEvent(const std::string& name) const;

  [[nodiscard]] const std::vector<Event>& events() const { return m_events; }
  [[nodiscard]] usize eventCount() const { return m_events.size(); }

  void setEntryPoint(const std::string& name, EventIndex mainEvent);
  void removeEntryPoint(const std::string& name);
  [[nodiscard]] const std::map<std::string, EventIndex>& entryPoints() const {
    return m_entryPoints;
  }

  bool operator==(const Flowchart&) const = default;

private:
  std::string m_name;
  std::vector<Event> m_events;
  std::map<std::string, EventIndex> m_entryPoints;
};

/**
 * @brief One-line description of an event for tables and choosers
 *
 * e.g. "Talk (Action: Npc.Talk)", "Check (Switch: Npc.HasItem)", "Split (Fork)"
 */
[[nodiscard]] std::string describeEvent(const Flowchart& flowchart, EventIndex idx);

} // namespace EvflEditor::flow
