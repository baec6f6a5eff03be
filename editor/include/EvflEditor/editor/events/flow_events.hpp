#pragma once

/**
 * @file flow_events.hpp
 * @brief Events published when the open event flow changes
 *
 * Usage:
 * - Publishers: bus.publish(FlowDataChangedEvent{FlowDataChangeReason::Events});
 * - Subscribers: bus.subscribe<FlowDataChangedEvent>([](const auto& e){...});
 */

#include "EvflEditor/editor/event_bus.hpp"
#include <string>

namespace EvflEditor::editor::events {

enum class FlowDataChangeReason : u8 {
  Reset,       ///< a different flow was loaded or closed
  Events,      ///< event payloads or links changed
  EntryPoints, ///< entry point table changed
  Timeline     ///< timeline clips changed
};

[[nodiscard]] inline const char* flowDataChangeReasonToString(FlowDataChangeReason reason) {
  switch (reason) {
  case FlowDataChangeReason::Reset:
    return "Reset";
  case FlowDataChangeReason::Events:
    return "Events";
  case FlowDataChangeReason::EntryPoints:
    return "EntryPoints";
  case FlowDataChangeReason::Timeline:
    return "Timeline";
  }
  return "Unknown";
}

/**
 * @brief Emitted after the structure of the open flow changed
 *
 * Views holding cached state about the flow must refresh on receipt.
 */
struct FlowDataChangedEvent : EditorEvent {
  FlowDataChangeReason reason = FlowDataChangeReason::Reset;

  explicit FlowDataChangedEvent(FlowDataChangeReason changeReason)
      : EditorEvent(EditorEventType::FlowDataChanged), reason(changeReason) {}

  [[nodiscard]] std::string getDescription() const override {
    return std::string("Flow data changed: ") + flowDataChangeReasonToString(reason);
  }
};

/**
 * @brief Emitted after a flow was written to disk
 */
struct FlowSavedEvent : EditorEvent {
  std::string path;

  explicit FlowSavedEvent(std::string savedPath)
      : EditorEvent(EditorEventType::FlowSaved), path(std::move(savedPath)) {}

  [[nodiscard]] std::string getDescription() const override { return "Flow saved: " + path; }
};

/**
 * @brief Emitted when a timeline clip is selected or the selection cleared
 */
struct ClipSelectedEvent : EditorEvent {
  int clipIndex = -1; ///< -1 when nothing is selected

  explicit ClipSelectedEvent(int index)
      : EditorEvent(EditorEventType::ClipSelected), clipIndex(index) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Clip selected: " + std::to_string(clipIndex);
  }
};

} // namespace EvflEditor::editor::events
