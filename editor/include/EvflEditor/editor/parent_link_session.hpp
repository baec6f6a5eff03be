#pragma once

/**
 * @file parent_link_session.hpp
 * @brief Editing session behind the "Edit parents" dialog
 *
 * The session seeds its working list from the links currently pointing at
 * the child, lets the user add and remove entries, and on commit reconciles
 * the flowchart and announces the change through FlowData.
 */

#include "EvflEditor/editor/flow_data.hpp"
#include "EvflEditor/editor/parent_link.hpp"
#include "EvflEditor/editor/parent_link_reconciler.hpp"

namespace EvflEditor::editor {

class ParentLinkEditSession {
public:
  ParentLinkEditSession(FlowData& flowData, flow::EventIndex child);

  /**
   * @brief Link type the candidate would get, so the UI knows whether to ask
   *        for a switch case value
   */
  [[nodiscard]] ParentLinkResult<ParentLinkType> linkTypeFor(flow::EventIndex candidate) const;

  /**
   * @brief Add a parent chosen by the user
   * @param switchValue case value, required when the candidate is a switch
   */
  ParentLinkResult<ParentLink> addParent(flow::EventIndex candidate,
                                         std::optional<i32> switchValue = std::nullopt);

  ParentLinkResult<void> removeRow(usize row);

  /**
   * @brief Reconcile the flowchart with the working list
   *
   * Publishes FlowDataChangedEvent{Events} on success. The working list is
   * kept either way so a failed commit can be corrected and retried.
   */
  ParentLinkResult<void> commit(const ParentLinkReconciler::OverwriteConfirmation& confirm);

  [[nodiscard]] const ParentLinkList& links() const { return m_links; }
  [[nodiscard]] flow::EventIndex child() const { return m_child; }
  [[nodiscard]] const FlowData& flowData() const { return m_flowData; }

  /// Name of an event in the open flowchart, empty if unknown
  [[nodiscard]] std::string eventName(flow::EventIndex idx) const;

private:
  FlowData& m_flowData;
  flow::EventIndex m_child;
  ParentLinkList m_links;
};

} // namespace EvflEditor::editor
