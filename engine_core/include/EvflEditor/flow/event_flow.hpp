#pragma once

#include "EvflEditor/flow/flowchart.hpp"
#include "EvflEditor/flow/timeline.hpp"
#include <optional>
#include <string>

namespace EvflEditor::flow {

/**
 * @brief An event flow document: a flowchart, a timeline, or both
 */
struct EventFlow {
  std::string name;
  std::optional<Flowchart> flowchart;
  std::optional<Timeline> timeline;

  bool operator==(const EventFlow&) const = default;
};

} // namespace EvflEditor::flow
