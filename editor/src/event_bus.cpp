#include "EvflEditor/editor/event_bus.hpp"
#include "EvflEditor/core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace EvflEditor::editor {

// ============================================================================
// EditorEvent
// ============================================================================

EditorEvent::EditorEvent(EditorEventType eventType)
    : type(eventType),
      timestamp(static_cast<u64>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count())) {}

std::string EditorEvent::getDescription() const {
  switch (type) {
  case EditorEventType::FlowDataChanged:
    return "FlowDataChanged";
  case EditorEventType::FlowSaved:
    return "FlowSaved";
  case EditorEventType::ClipSelected:
    return "ClipSelected";
  case EditorEventType::Custom:
    return "Custom";
  }
  return "Unknown";
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::EventBus() = default;

EventBus::~EventBus() = default;

EventBus& EventBus::instance() {
  static EventBus instance;
  return instance;
}

void EventBus::publish(const EditorEvent& event) { dispatchEvent(event); }

void EventBus::dispatchEvent(const EditorEvent& event) {
  std::vector<Subscriber> subscribersCopy;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_dispatchDepth;
    subscribersCopy = m_subscribers;
  }

  // Handlers run without the mutex held so they can subscribe/unsubscribe
  for (const auto& subscriber : subscribersCopy) {
    if (subscriber.typeFilter.has_value() && *subscriber.typeFilter != event.type) {
      continue;
    }
    if (subscriber.customFilter.has_value() && !(*subscriber.customFilter)(event)) {
      continue;
    }
    if (!subscriber.handler) {
      continue;
    }

    try {
      subscriber.handler(event);
    } catch (const std::exception& e) {
      EVFLEDITOR_LOG_ERROR("Event handler #{} failed on {}: {}", subscriber.id,
                           event.getDescription(), e.what());
    }
  }

  bool outermost = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    outermost = (--m_dispatchDepth == 0);
  }
  if (outermost) {
    processPendingOperations();
  }
}

void EventBus::processPendingOperations() {
  std::lock_guard<std::mutex> lock(m_mutex);
  for (const auto& op : m_pendingOperations) {
    applyOperation(op);
  }
  m_pendingOperations.clear();
}

void EventBus::applyOperation(const PendingOperation& op) {
  switch (op.type) {
  case PendingOperation::Type::Add:
    m_subscribers.push_back(op.subscriber);
    break;

  case PendingOperation::Type::Remove:
    std::erase_if(m_subscribers,
                  [&op](const Subscriber& sub) { return sub.id == op.subscriptionId; });
    break;
  }
}

// Caller holds m_mutex
void EventBus::applyOrDefer(PendingOperation op) {
  if (m_dispatchDepth > 0) {
    m_pendingOperations.push_back(std::move(op));
  } else {
    applyOperation(op);
  }
}

// ============================================================================
// Subscription
// ============================================================================

EventSubscription EventBus::addSubscriber(Subscriber sub) {
  std::lock_guard<std::mutex> lock(m_mutex);
  sub.id = m_nextSubscriberId++;
  const u64 id = sub.id;

  PendingOperation op;
  op.type = PendingOperation::Type::Add;
  op.subscriber = std::move(sub);
  applyOrDefer(std::move(op));

  return EventSubscription(id);
}

EventSubscription EventBus::subscribe(EventHandler handler) {
  Subscriber sub;
  sub.handler = std::move(handler);
  return addSubscriber(std::move(sub));
}

EventSubscription EventBus::subscribe(EditorEventType type, EventHandler handler) {
  Subscriber sub;
  sub.handler = std::move(handler);
  sub.typeFilter = type;
  return addSubscriber(std::move(sub));
}

EventSubscription EventBus::subscribe(EventFilter filter, EventHandler handler) {
  Subscriber sub;
  sub.handler = std::move(handler);
  sub.customFilter = std::move(filter);
  return addSubscriber(std::move(sub));
}

void EventBus::unsubscribe(const EventSubscription& subscription) {
  if (!subscription.isValid()) {
    return;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  PendingOperation op;
  op.type = PendingOperation::Type::Remove;
  op.subscriptionId = subscription.getId();
  applyOrDefer(std::move(op));
}

usize EventBus::subscriberCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_subscribers.size();
}

} // namespace EvflEditor::editor
