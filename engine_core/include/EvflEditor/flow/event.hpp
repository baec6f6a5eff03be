#pragma once

/**
 * @file event.hpp
 * @brief Flowchart event node and its payload variants
 *
 * Events live in an arena owned by a Flowchart and refer to each other through
 * EventIndex handles. A handle stays valid for the lifetime of the flowchart.
 */

#include "EvflEditor/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace EvflEditor::flow {

using EventIndex = u32;

/// Event whose payload has not been chosen yet. Never a valid link parent.
struct UnsetEvent {
  bool operator==(const UnsetEvent&) const = default;
};

struct ActionEvent {
  std::string actor;
  std::string action;
  std::optional<EventIndex> next;

  bool operator==(const ActionEvent&) const = default;
};

struct JoinEvent {
  std::optional<EventIndex> next;

  bool operator==(const JoinEvent&) const = default;
};

struct SubFlowEvent {
  std::string flowchartName;
  std::string entryPointName;
  std::optional<EventIndex> next;

  bool operator==(const SubFlowEvent&) const = default;
};

struct SwitchEvent {
  std::string actor;
  std::string query;
  std::map<i32, EventIndex> cases; ///< discriminant -> target

  bool operator==(const SwitchEvent&) const = default;
};

struct ForkEvent {
  std::vector<EventIndex> forks; ///< branch targets, duplicates are meaningful
  std::optional<EventIndex> join;

  bool operator==(const ForkEvent&) const = default;
};

using EventData =
    std::variant<UnsetEvent, ActionEvent, JoinEvent, SubFlowEvent, SwitchEvent, ForkEvent>;

/**
 * @brief How an event can act as the parent of another event
 */
enum class ParentKind : u8 {
  Sequential, ///< single "next" slot (action, join, subflow)
  Switch,     ///< discriminant-keyed cases
  Fork,       ///< parallel branches
  Other       ///< cannot be a parent
};

struct Event {
  std::string name;
  EventData data;

  bool operator==(const Event&) const = default;
};

[[nodiscard]] ParentKind parentKindOf(const EventData& data);

/**
 * @brief Access the "next" slot of a sequential payload
 * @return nullptr for switch, fork and unset payloads
 */
[[nodiscard]] std::optional<EventIndex>* nextSlot(EventData& data);
[[nodiscard]] const std::optional<EventIndex>* nextSlot(const EventData& data);

/// "Action", "Switch", "Fork", "Join", "SubFlow" or "Unset"
[[nodiscard]] const char* eventTypeName(const EventData& data);

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace EvflEditor::flow
