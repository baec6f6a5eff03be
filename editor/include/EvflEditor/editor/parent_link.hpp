#pragma once

/**
 * @file parent_link.hpp
 * @brief Parent links of a flowchart event and the editable list of them
 *
 * A parent link describes one edge from some event into the event being
 * edited (the "child"): a next pointer, a switch case or a fork branch.
 */

#include "EvflEditor/core/result.hpp"
#include "EvflEditor/core/types.hpp"
#include "EvflEditor/flow/flowchart.hpp"
#include <optional>
#include <string>
#include <vector>

namespace EvflEditor::editor {

enum class ParentLinkType : u8 {
  Next,       ///< parent is an action, join or subflow event
  SwitchCase, ///< parent is a switch event; detail holds the case value
  ForkBranch  ///< parent is a fork event
};

struct ParentLink {
  flow::EventIndex parent = 0;
  ParentLinkType type = ParentLinkType::Next;
  std::optional<i32> detail; ///< switch case value, empty for other link types

  bool operator==(const ParentLink&) const = default;
};

enum class ParentLinkErrorCode : u8 {
  DuplicateLink,         ///< identical link already in the list
  SelfParent,            ///< event chosen as its own parent
  UnsupportedParentKind, ///< chosen event cannot own links
  Validation,            ///< desired links are inconsistent (e.g. duplicate switch cases)
  Conflict,              ///< switch case value already points to another event
  OverwriteDeclined,     ///< user refused to overwrite existing next pointers
  InvalidRow,            ///< list row out of range
  NoFlowchart            ///< the open flow has no flowchart
};

[[nodiscard]] const char* parentLinkErrorToString(ParentLinkErrorCode code);

struct ParentLinkError {
  ParentLinkErrorCode code;
  std::string message;
};

template <typename T> using ParentLinkResult = Result<T, ParentLinkError>;

/**
 * @brief Link type an event would use as a parent
 * @return UnsupportedParentKind for events with no link slot
 */
[[nodiscard]] ParentLinkResult<ParentLinkType>
parentLinkTypeFor(const flow::Flowchart& flowchart, flow::EventIndex candidate,
                  flow::EventIndex child);

/**
 * @brief Build a link from a candidate parent chosen by the user
 *
 * Rejects the child itself (SelfParent) and events that cannot be parents
 * (UnsupportedParentKind). switchValue is required for switch parents and
 * ignored otherwise.
 */
[[nodiscard]] ParentLinkResult<ParentLink> makeParentLink(const flow::Flowchart& flowchart,
                                                          flow::EventIndex child,
                                                          flow::EventIndex candidate,
                                                          std::optional<i32> switchValue);

/**
 * @brief Every link currently pointing at child, in graph order
 *
 * Switch cases are listed in ascending case order; a fork that branches to
 * the child several times yields one link per branch.
 */
[[nodiscard]] std::vector<ParentLink> gatherParentLinks(const flow::Flowchart& flowchart,
                                                        flow::EventIndex child);

/// "Next", "Fork branch" or "Switch case = N"
[[nodiscard]] std::string describeLink(const ParentLink& link);

/**
 * @brief Working list of desired parent links edited in the parents dialog
 */
class ParentLinkList {
public:
  ParentLinkList() = default;
  explicit ParentLinkList(std::vector<ParentLink> links) : m_links(std::move(links)) {}

  /**
   * @brief Append a link at the end
   * @return DuplicateLink if an identical link is already present; the list
   *         is left unchanged
   */
  ParentLinkResult<void> append(ParentLink link);

  /**
   * @brief Remove the link at row
   * @return InvalidRow if row is out of range
   */
  ParentLinkResult<void> removeAt(usize row);

  /**
   * @brief True when no switch parent has the same case value twice
   */
  [[nodiscard]] bool isValid() const;

  [[nodiscard]] bool contains(const ParentLink& link) const;
  [[nodiscard]] const std::vector<ParentLink>& links() const { return m_links; }
  [[nodiscard]] const ParentLink& at(usize row) const { return m_links.at(row); }
  [[nodiscard]] usize size() const { return m_links.size(); }
  [[nodiscard]] bool empty() const { return m_links.empty(); }

private:
  std::vector<ParentLink> m_links;
};

} // namespace EvflEditor::editor
