#pragma once

/**
 * @file timeline_document.hpp
 * @brief Editing logic behind the timeline editor widget
 *
 * Owns zoom and clip selection, validates clip edits, and produces the JSON
 * payload the web view renders. The clips themselves live in the Timeline of
 * the open flow; every successful edit goes through FlowData so that other
 * views hear about it.
 */

#include "EvflEditor/core/result.hpp"
#include "EvflEditor/editor/editor_settings.hpp"
#include "EvflEditor/editor/flow_data.hpp"
#include "EvflEditor/flow/timeline.hpp"
#include <QJsonObject>
#include <QString>
#include <optional>
#include <string>
#include <vector>

namespace EvflEditor::editor {

/**
 * @brief Field values entered for a new or edited clip
 */
struct ClipDraft {
  std::string name;
  f64 startTime = 0.0;
  f64 duration = 1.0;
  flow::ClipType type = flow::ClipType::Action;
  std::optional<std::string> actor;
};

struct TimelineTrack {
  std::string name;
  std::vector<usize> clipIndices;
};

class TimelineDocument {
public:
  static constexpr f64 MIN_START_TIME = 0.0;
  static constexpr f64 MAX_TIME = 9999.0;
  static constexpr f64 MIN_DURATION = 0.01;

  explicit TimelineDocument(FlowData& flowData, TimelineViewSettings settings = {});

  [[nodiscard]] bool hasTimeline() const { return m_flowData.timeline() != nullptr; }

  // =========================================================================
  // Zoom
  // =========================================================================

  [[nodiscard]] f64 zoomLevel() const { return m_zoom; }
  void zoomIn();
  void zoomOut();
  [[nodiscard]] f64 pixelsPerSecond() const { return m_zoom * m_settings.basePixelsPerSecond; }

  // =========================================================================
  // Selection
  // =========================================================================

  /**
   * @brief Select a clip by index
   * @return false (and selection unchanged) if there is no such clip
   */
  bool selectClip(int clipId);

  /**
   * @brief Select the clip described by a payload sent from the web view
   *
   * Accepts either a bare index or a JSON object with an "id" member.
   */
  bool selectClipFromBridge(const QString& payload);

  void clearSelection();
  [[nodiscard]] std::optional<usize> selectedIndex() const { return m_selected; }
  [[nodiscard]] const flow::Clip* selectedClip() const;

  // =========================================================================
  // Clip editing
  // =========================================================================

  [[nodiscard]] static Result<void> validateDraft(const ClipDraft& draft);

  /// @return index of the new clip
  Result<usize> addClip(const ClipDraft& draft);
  Result<void> updateSelectedClip(const ClipDraft& draft);
  Result<void> deleteSelectedClip();

  // =========================================================================
  // View data
  // =========================================================================

  /**
   * @brief Tracks in first-appearance order; a clip sits on its actor's
   *        track, else on its type's track
   */
  [[nodiscard]] std::vector<TimelineTrack> tracks() const;

  /// Last clip end plus ruler padding
  [[nodiscard]] f64 rulerEnd() const;

  /**
   * @brief Payload consumed by the timeline page
   *
   * { clips: [{id, name, start_time, duration, type, actor}],
   *   tracks: [{name, clips: [id...]}],
   *   ruler: {max_time, major, minor} }
   */
  [[nodiscard]] QJsonObject bridgeData() const;

  [[nodiscard]] const TimelineViewSettings& settings() const { return m_settings; }

  /// "MM:SS.cc", e.g. 75.5 -> "01:15.50"
  [[nodiscard]] static std::string formatTimecode(f64 seconds);

private:
  flow::Clip clipFromDraft(const ClipDraft& draft) const;
  void publishSelection();

  FlowData& m_flowData;
  TimelineViewSettings m_settings;
  f64 m_zoom;
  std::optional<usize> m_selected;
};

} // namespace EvflEditor::editor
