#pragma once

/**
 * @file parent_link_reconciler.hpp
 * @brief Rewrites a flowchart so that the parents of one event match a
 *        desired link set
 *
 * Links into the child that are no longer desired are removed, newly desired
 * links are added, and every other edge of the graph is left alone. Apply is
 * all-or-nothing: every check, including switch case conflicts, runs before
 * the first mutation.
 */

#include "EvflEditor/editor/parent_link.hpp"
#include <functional>
#include <map>
#include <set>
#include <vector>

namespace EvflEditor::editor {

/**
 * @brief Validated, per-parent view of a desired link set
 */
struct ParentLinkPlan {
  std::set<flow::EventIndex> nextParents;
  std::map<flow::EventIndex, std::set<i32>> switchCases;
  std::map<flow::EventIndex, usize> forkBranchCounts;

  /// Sequential parents whose next pointer would be redirected to the child,
  /// in graph order
  std::vector<flow::EventIndex> overwrittenNextParents;
};

class ParentLinkReconciler {
public:
  /**
   * @brief Asked before next pointers that point elsewhere are overwritten
   * @return true to proceed
   */
  using OverwriteConfirmation = std::function<bool(const std::vector<flow::EventIndex>&)>;

  ParentLinkReconciler(flow::Flowchart& flowchart, flow::EventIndex child);

  /**
   * @brief Validate desired links against the graph without mutating it
   *
   * Fails with Validation for unknown parents, mismatched link types and
   * duplicate switch cases, and with Conflict when a desired case value is
   * already bound to another event.
   */
  [[nodiscard]] ParentLinkResult<ParentLinkPlan>
  plan(const std::vector<ParentLink>& desired) const;

  /**
   * @brief Plan, confirm overwrites, then mutate the graph
   *
   * An empty confirmation callback counts as declining. On any failure the
   * graph is unchanged.
   */
  ParentLinkResult<void> apply(const std::vector<ParentLink>& desired,
                               const OverwriteConfirmation& confirmOverwrite);

  [[nodiscard]] flow::EventIndex child() const { return m_child; }

private:
  ParentLinkResult<void> validateLink(const ParentLink& link) const;

  /// Expects a plan produced by plan() against the current graph
  void commit(const ParentLinkPlan& plan);

  flow::Flowchart& m_flowchart;
  flow::EventIndex m_child;
};

} // namespace EvflEditor::editor
