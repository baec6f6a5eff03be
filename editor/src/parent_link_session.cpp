#include "EvflEditor/editor/parent_link_session.hpp"
#include "EvflEditor/core/logger.hpp"

namespace EvflEditor::editor {

namespace {

ParentLinkError noFlowchartError() {
  return {ParentLinkErrorCode::NoFlowchart, "No flowchart is loaded."};
}

} // namespace

ParentLinkEditSession::ParentLinkEditSession(FlowData& flowData, flow::EventIndex child)
    : m_flowData(flowData), m_child(child) {
  if (const auto* flowchart = m_flowData.flowchart()) {
    m_links = ParentLinkList(gatherParentLinks(*flowchart, m_child));
  }
}

ParentLinkResult<ParentLinkType>
ParentLinkEditSession::linkTypeFor(flow::EventIndex candidate) const {
  const auto* flowchart = m_flowData.flowchart();
  if (!flowchart) {
    return ParentLinkResult<ParentLinkType>::error(noFlowchartError());
  }
  return parentLinkTypeFor(*flowchart, candidate, m_child);
}

ParentLinkResult<ParentLink> ParentLinkEditSession::addParent(flow::EventIndex candidate,
                                                              std::optional<i32> switchValue) {
  const auto* flowchart = m_flowData.flowchart();
  if (!flowchart) {
    return ParentLinkResult<ParentLink>::error(noFlowchartError());
  }

  auto link = makeParentLink(*flowchart, m_child, candidate, switchValue);
  if (link.isError()) {
    return link;
  }

  auto appended = m_links.append(link.value());
  if (appended.isError()) {
    return ParentLinkResult<ParentLink>::error(appended.error());
  }
  EVFLEDITOR_LOG_DEBUG("Parent link added: {} ({})", eventName(candidate),
                       describeLink(link.value()));
  return link;
}

ParentLinkResult<void> ParentLinkEditSession::removeRow(usize row) {
  return m_links.removeAt(row);
}

ParentLinkResult<void>
ParentLinkEditSession::commit(const ParentLinkReconciler::OverwriteConfirmation& confirm) {
  auto* flowchart = m_flowData.flowchart();
  if (!flowchart) {
    return ParentLinkResult<void>::error(noFlowchartError());
  }

  if (!m_links.isValid()) {
    return ParentLinkResult<void>::error(
        {ParentLinkErrorCode::Validation,
         "Please ensure there are no duplicate switch cases for the same parent."});
  }

  ParentLinkReconciler reconciler(*flowchart, m_child);
  auto applied = reconciler.apply(m_links.links(), confirm);
  if (applied.isError()) {
    return applied;
  }

  m_flowData.notifyChanged(events::FlowDataChangeReason::Events);
  return applied;
}

std::string ParentLinkEditSession::eventName(flow::EventIndex idx) const {
  const auto* flowchart = m_flowData.flowchart();
  if (!flowchart || !flowchart->contains(idx)) {
    return {};
  }
  return flowchart->event(idx).name;
}

} // namespace EvflEditor::editor
