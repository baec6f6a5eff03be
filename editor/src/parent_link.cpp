#include "EvflEditor/editor/parent_link.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <utility>

namespace EvflEditor::editor {

const char* parentLinkErrorToString(ParentLinkErrorCode code) {
  switch (code) {
  case ParentLinkErrorCode::DuplicateLink:
    return "Duplicate link";
  case ParentLinkErrorCode::SelfParent:
    return "Self parent";
  case ParentLinkErrorCode::UnsupportedParentKind:
    return "Unsupported parent kind";
  case ParentLinkErrorCode::Validation:
    return "Validation error";
  case ParentLinkErrorCode::Conflict:
    return "Conflict";
  case ParentLinkErrorCode::OverwriteDeclined:
    return "Overwrite declined";
  case ParentLinkErrorCode::InvalidRow:
    return "Invalid row";
  case ParentLinkErrorCode::NoFlowchart:
    return "No flowchart";
  }
  return "Unknown error";
}

ParentLinkResult<ParentLinkType> parentLinkTypeFor(const flow::Flowchart& flowchart,
                                                   flow::EventIndex candidate,
                                                   flow::EventIndex child) {
  if (candidate == child) {
    return ParentLinkResult<ParentLinkType>::error(
        {ParentLinkErrorCode::SelfParent, "Cannot set an event as a parent of itself."});
  }
  if (!flowchart.contains(candidate)) {
    return ParentLinkResult<ParentLinkType>::error(
        {ParentLinkErrorCode::UnsupportedParentKind,
         std::format("Event #{} does not exist.", candidate)});
  }

  switch (flow::parentKindOf(flowchart.event(candidate).data)) {
  case flow::ParentKind::Sequential:
    return ParentLinkResult<ParentLinkType>::ok(ParentLinkType::Next);
  case flow::ParentKind::Switch:
    return ParentLinkResult<ParentLinkType>::ok(ParentLinkType::SwitchCase);
  case flow::ParentKind::Fork:
    return ParentLinkResult<ParentLinkType>::ok(ParentLinkType::ForkBranch);
  case flow::ParentKind::Other:
    break;
  }
  return ParentLinkResult<ParentLinkType>::error(
      {ParentLinkErrorCode::UnsupportedParentKind, "Unsupported parent event type."});
}

ParentLinkResult<ParentLink> makeParentLink(const flow::Flowchart& flowchart,
                                            flow::EventIndex child, flow::EventIndex candidate,
                                            std::optional<i32> switchValue) {
  auto type = parentLinkTypeFor(flowchart, candidate, child);
  if (type.isError()) {
    return ParentLinkResult<ParentLink>::error(type.error());
  }

  ParentLink link;
  link.parent = candidate;
  link.type = type.value();
  if (link.type == ParentLinkType::SwitchCase) {
    if (!switchValue) {
      return ParentLinkResult<ParentLink>::error(
          {ParentLinkErrorCode::Validation, "A switch parent needs a case value."});
    }
    link.detail = switchValue;
  }
  return ParentLinkResult<ParentLink>::ok(link);
}

std::vector<ParentLink> gatherParentLinks(const flow::Flowchart& flowchart,
                                          flow::EventIndex child) {
  std::vector<ParentLink> links;
  const auto& events = flowchart.events();

  for (usize i = 0; i < events.size(); ++i) {
    const auto parent = static_cast<flow::EventIndex>(i);
    std::visit(flow::Overloaded{
                   [&](const flow::SwitchEvent& s) {
                     for (const auto& [value, target] : s.cases) {
                       if (target == child) {
                         links.push_back({parent, ParentLinkType::SwitchCase, value});
                       }
                     }
                   },
                   [&](const flow::ForkEvent& f) {
                     for (flow::EventIndex target : f.forks) {
                       if (target == child) {
                         links.push_back({parent, ParentLinkType::ForkBranch, std::nullopt});
                       }
                     }
                   },
                   [](const flow::UnsetEvent&) {},
                   [&](const auto& sequential) {
                     if (sequential.next == child) {
                       links.push_back({parent, ParentLinkType::Next, std::nullopt});
                     }
                   },
               },
               events[i].data);
  }

  return links;
}

std::string describeLink(const ParentLink& link) {
  switch (link.type) {
  case ParentLinkType::Next:
    return "Next";
  case ParentLinkType::ForkBranch:
    return "Fork branch";
  case ParentLinkType::SwitchCase:
    return std::format("Switch case = {}", link.detail.value_or(0));
  }
  return "Unknown";
}

// ============================================================================
// ParentLinkList
// ============================================================================

ParentLinkResult<void> ParentLinkList::append(ParentLink link) {
  if (contains(link)) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::DuplicateLink, "This parent link already exists."});
  }
  m_links.push_back(link);
  return ParentLinkResult<void>::ok();
}

ParentLinkResult<void> ParentLinkList::removeAt(usize row) {
  if (row >= m_links.size()) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::InvalidRow, std::format("Row {} is out of range.", row)});
  }
  m_links.erase(m_links.begin() + static_cast<std::ptrdiff_t>(row));
  return ParentLinkResult<void>::ok();
}

bool ParentLinkList::isValid() const {
  std::set<std::pair<flow::EventIndex, i32>> seen;
  for (const auto& link : m_links) {
    if (link.type != ParentLinkType::SwitchCase || !link.detail) {
      continue;
    }
    if (!seen.emplace(link.parent, *link.detail).second) {
      return false;
    }
  }
  return true;
}

bool ParentLinkList::contains(const ParentLink& link) const {
  return std::find(m_links.begin(), m_links.end(), link) != m_links.end();
}

} // namespace EvflEditor::editor
