#pragma once

/**
 * @file timeline_html.hpp
 * @brief HTML page shown by the timeline web view
 */

#include "EvflEditor/editor/editor_settings.hpp"
#include <QJsonObject>
#include <QString>

namespace EvflEditor::editor {

class TimelineHtmlBuilder {
public:
  /// Name under which the clip selection bridge is registered on the web channel
  static constexpr const char* BRIDGE_OBJECT_NAME = "bridge";

  /**
   * @brief Render a self-contained page for the given bridge payload
   * @param data Output of TimelineDocument::bridgeData()
   * @param pixelsPerSecond Horizontal scale at the current zoom
   * @param settings Supplies the minimum clip width
   *
   * The page draws a ruler and one row per track, and reports clicks through
   * bridge.clipSelected(id) once qwebchannel.js has connected.
   */
  [[nodiscard]] static QString build(const QJsonObject& data, double pixelsPerSecond,
                                     const TimelineViewSettings& settings);
};

} // namespace EvflEditor::editor
