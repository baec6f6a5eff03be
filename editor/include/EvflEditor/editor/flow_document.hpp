#pragma once

/**
 * @file flow_document.hpp
 * @brief File binding of the open flow (open, save, save as)
 */

#include "EvflEditor/editor/flow_data.hpp"
#include "EvflEditor/editor/flow_json.hpp"
#include <QString>

namespace EvflEditor::editor {

class FlowDocument {
public:
  static constexpr const char* FILE_FILTER = "Event flows (*.json);;All files (*)";

  explicit FlowDocument(FlowData& flowData) : m_flowData(flowData) {}

  /**
   * @brief Load path into FlowData
   *
   * On failure the currently open flow and path are kept.
   */
  FlowJsonResult<void> open(const QString& path);

  /// Save to the current path; fails with FileOpenFailed if there is none
  FlowJsonResult<void> save();
  FlowJsonResult<void> saveAs(const QString& path);

  [[nodiscard]] const QString& path() const { return m_path; }
  [[nodiscard]] bool hasPath() const { return !m_path.isEmpty(); }

  /// File name for window titles, "Untitled" without a path
  [[nodiscard]] QString displayName() const;

  [[nodiscard]] FlowData& flowData() { return m_flowData; }

private:
  FlowData& m_flowData;
  QString m_path;
};

} // namespace EvflEditor::editor
