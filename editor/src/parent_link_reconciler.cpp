#include "EvflEditor/editor/parent_link_reconciler.hpp"
#include "EvflEditor/core/logger.hpp"

#include <algorithm>
#include <format>

namespace EvflEditor::editor {

ParentLinkReconciler::ParentLinkReconciler(flow::Flowchart& flowchart, flow::EventIndex child)
    : m_flowchart(flowchart), m_child(child) {}

ParentLinkResult<void> ParentLinkReconciler::validateLink(const ParentLink& link) const {
  if (!m_flowchart.contains(link.parent)) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::Validation,
         std::format("Parent event #{} does not exist.", link.parent)});
  }

  const flow::Event& parent = m_flowchart.event(link.parent);
  ParentLinkType expected = ParentLinkType::Next;
  switch (flow::parentKindOf(parent.data)) {
  case flow::ParentKind::Sequential:
    expected = ParentLinkType::Next;
    break;
  case flow::ParentKind::Switch:
    expected = ParentLinkType::SwitchCase;
    break;
  case flow::ParentKind::Fork:
    expected = ParentLinkType::ForkBranch;
    break;
  case flow::ParentKind::Other:
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::Validation,
         std::format("Event {} cannot be a parent.", parent.name)});
  }

  if (link.type != expected) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::Validation,
         std::format("Link type '{}' does not match {} event {}.", describeLink(link),
                     flow::eventTypeName(parent.data), parent.name)});
  }
  if (link.type == ParentLinkType::SwitchCase && !link.detail) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::Validation,
         std::format("Switch link from {} has no case value.", parent.name)});
  }
  return ParentLinkResult<void>::ok();
}

ParentLinkResult<ParentLinkPlan>
ParentLinkReconciler::plan(const std::vector<ParentLink>& desired) const {
  ParentLinkPlan result;

  if (!m_flowchart.contains(m_child)) {
    return ParentLinkResult<ParentLinkPlan>::error(
        {ParentLinkErrorCode::Validation, std::format("Child event #{} does not exist.", m_child)});
  }

  // Self links are only kept, never created
  std::vector<ParentLink> existingSelfLinks;
  for (const auto& link : gatherParentLinks(m_flowchart, m_child)) {
    if (link.parent == m_child) {
      existingSelfLinks.push_back(link);
    }
  }

  for (const auto& link : desired) {
    auto valid = validateLink(link);
    if (valid.isError()) {
      return ParentLinkResult<ParentLinkPlan>::error(valid.error());
    }
    if (link.parent == m_child) {
      auto existing = std::find(existingSelfLinks.begin(), existingSelfLinks.end(), link);
      if (existing == existingSelfLinks.end()) {
        return ParentLinkResult<ParentLinkPlan>::error(
            {ParentLinkErrorCode::Validation, "An event cannot be its own parent."});
      }
      existingSelfLinks.erase(existing);
    }

    switch (link.type) {
    case ParentLinkType::Next:
      result.nextParents.insert(link.parent);
      break;
    case ParentLinkType::SwitchCase:
      if (!result.switchCases[link.parent].insert(*link.detail).second) {
        return ParentLinkResult<ParentLinkPlan>::error(
            {ParentLinkErrorCode::Validation,
             "Please ensure there are no duplicate switch cases for the same parent."});
      }
      break;
    case ParentLinkType::ForkBranch:
      ++result.forkBranchCounts[link.parent];
      break;
    }
  }

  // Conflicts are detected up front so that a late conflict cannot leave
  // earlier parents already rewritten.
  for (const auto& [parent, values] : result.switchCases) {
    const auto& event = m_flowchart.event(parent);
    const auto& cases = std::get<flow::SwitchEvent>(event.data).cases;
    for (i32 value : values) {
      auto it = cases.find(value);
      if (it != cases.end() && it->second != m_child) {
        return ParentLinkResult<ParentLinkPlan>::error(
            {ParentLinkErrorCode::Conflict,
             std::format("Switch event {} already has a case for value {} pointing elsewhere.",
                         event.name, value)});
      }
    }
  }

  for (flow::EventIndex parent : result.nextParents) {
    const auto* next = flow::nextSlot(m_flowchart.event(parent).data);
    if (next && next->has_value() && **next != m_child) {
      result.overwrittenNextParents.push_back(parent);
    }
  }

  return ParentLinkResult<ParentLinkPlan>::ok(std::move(result));
}

ParentLinkResult<void> ParentLinkReconciler::apply(const std::vector<ParentLink>& desired,
                                                   const OverwriteConfirmation& confirmOverwrite) {
  auto planned = plan(desired);
  if (planned.isError()) {
    EVFLEDITOR_LOG_WARN("Parent links of event #{} rejected: {}", m_child,
                        planned.error().message);
    return ParentLinkResult<void>::error(planned.error());
  }

  const ParentLinkPlan& p = planned.value();
  if (!p.overwrittenNextParents.empty()) {
    if (!confirmOverwrite || !confirmOverwrite(p.overwrittenNextParents)) {
      EVFLEDITOR_LOG_WARN("Overwrite of {} next pointer(s) declined",
                          p.overwrittenNextParents.size());
      return ParentLinkResult<void>::error(
          {ParentLinkErrorCode::OverwriteDeclined, "Overwriting existing links was declined."});
    }
  }

  commit(p);
  return ParentLinkResult<void>::ok();
}

void ParentLinkReconciler::commit(const ParentLinkPlan& plan) {
  const flow::EventIndex child = m_child;
  usize changed = 0;

  for (usize i = 0; i < m_flowchart.eventCount(); ++i) {
    const auto idx = static_cast<flow::EventIndex>(i);
    flow::Event& event = m_flowchart.event(idx);

    std::visit(
        flow::Overloaded{
            [&](flow::SwitchEvent& s) {
              static const std::set<i32> kNone;
              auto desiredIt = plan.switchCases.find(idx);
              const std::set<i32>& desired =
                  desiredIt != plan.switchCases.end() ? desiredIt->second : kNone;

              changed += std::erase_if(s.cases, [&](const auto& entry) {
                return entry.second == child && !desired.contains(entry.first);
              });

              for (i32 value : desired) {
                if (s.cases.try_emplace(value, child).second) {
                  ++changed;
                }
              }
            },
            [&](flow::ForkEvent& f) {
              auto countIt = plan.forkBranchCounts.find(idx);
              const usize desired = countIt != plan.forkBranchCounts.end() ? countIt->second : 0;
              const auto current =
                  static_cast<usize>(std::count(f.forks.begin(), f.forks.end(), child));

              if (desired < current) {
                // Keep the first `desired` branches to the child, drop the rest
                std::vector<flow::EventIndex> forks;
                forks.reserve(f.forks.size());
                usize kept = 0;
                for (flow::EventIndex target : f.forks) {
                  if (target != child) {
                    forks.push_back(target);
                  } else if (kept < desired) {
                    forks.push_back(target);
                    ++kept;
                  }
                }
                f.forks = std::move(forks);
                changed += current - desired;
              } else if (desired > current) {
                f.forks.insert(f.forks.end(), desired - current, child);
                changed += desired - current;
              }
            },
            [](flow::UnsetEvent&) {},
            [&](auto& sequential) {
              if (plan.nextParents.contains(idx)) {
                if (sequential.next != child) {
                  sequential.next = child;
                  ++changed;
                }
              } else if (sequential.next == child) {
                sequential.next.reset();
                ++changed;
              }
            },
        },
        event.data);
  }

  EVFLEDITOR_LOG_INFO("Reconciled parents of {}: {} link change(s)", m_flowchart.event(child).name,
                      changed);
}

} // namespace EvflEditor::editor
