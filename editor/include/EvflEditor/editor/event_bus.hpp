#pragma once

/**
 * @file event_bus.hpp
 * @brief Editor-wide publish/subscribe bus
 *
 * Decouples the document model from the views that mirror it. Windows,
 * table models and the timeline view subscribe to the events they render;
 * model code publishes without knowing who listens.
 *
 * Subscribing or unsubscribing from inside a handler is allowed; such
 * changes take effect once the outermost dispatch has finished.
 */

#include "EvflEditor/core/types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace EvflEditor::editor {

enum class EditorEventType : u8 {
  FlowDataChanged,
  FlowSaved,
  ClipSelected,
  Custom
};

/**
 * @brief Base of every event published on the bus
 */
struct EditorEvent {
  EditorEventType type;
  u64 timestamp; ///< steady clock, nanoseconds

  explicit EditorEvent(EditorEventType eventType);
  virtual ~EditorEvent() = default;

  EditorEvent(const EditorEvent&) = default;
  EditorEvent& operator=(const EditorEvent&) = default;

  [[nodiscard]] virtual std::string getDescription() const;
};

using EventHandler = std::function<void(const EditorEvent&)>;
using EventFilter = std::function<bool(const EditorEvent&)>;

class EventSubscription {
public:
  EventSubscription() = default;
  explicit EventSubscription(u64 id) : m_id(id) {}

  [[nodiscard]] bool isValid() const { return m_id != 0; }
  [[nodiscard]] u64 getId() const { return m_id; }

private:
  u64 m_id = 0;
};

class EventBus {
public:
  EventBus();
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  static EventBus& instance();

  /**
   * @brief Dispatch an event to every matching subscriber before returning
   */
  void publish(const EditorEvent& event);

  EventSubscription subscribe(EventHandler handler);
  EventSubscription subscribe(EditorEventType type, EventHandler handler);
  EventSubscription subscribe(EventFilter filter, EventHandler handler);

  /**
   * @brief Subscribe to one concrete event struct
   */
  template <typename TEvent>
  EventSubscription subscribe(std::function<void(const TEvent&)> handler) {
    return subscribe(
        [](const EditorEvent& e) { return dynamic_cast<const TEvent*>(&e) != nullptr; },
        [h = std::move(handler)](const EditorEvent& e) { h(static_cast<const TEvent&>(e)); });
  }

  void unsubscribe(const EventSubscription& subscription);

  [[nodiscard]] usize subscriberCount() const;

private:
  struct Subscriber {
    u64 id = 0;
    EventHandler handler;
    std::optional<EditorEventType> typeFilter;
    std::optional<EventFilter> customFilter;
  };

  struct PendingOperation {
    enum class Type { Add, Remove };
    Type type = Type::Add;
    Subscriber subscriber;
    u64 subscriptionId = 0;
  };

  EventSubscription addSubscriber(Subscriber sub);
  void applyOrDefer(PendingOperation op);
  void applyOperation(const PendingOperation& op);
  void dispatchEvent(const EditorEvent& event);
  void processPendingOperations();

  std::vector<Subscriber> m_subscribers;
  std::vector<PendingOperation> m_pendingOperations;

  mutable std::mutex m_mutex;
  u64 m_nextSubscriberId = 1;
  int m_dispatchDepth = 0;
};

} // namespace EvflEditor::editor
