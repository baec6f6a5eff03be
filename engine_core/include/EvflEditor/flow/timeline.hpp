#pragma once

/**
 * @file timeline.hpp
 * @brief Timeline: clips placed on actor tracks
 */

#include "EvflEditor/core/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace EvflEditor::flow {

enum class ClipType : u8 { Action, Camera, Audio, Event, Effect };

inline constexpr std::array<ClipType, 5> kAllClipTypes = {
    ClipType::Action, ClipType::Camera, ClipType::Audio, ClipType::Event, ClipType::Effect};

/// Lower-case name used in files and in the timeline view ("action", "camera", ...)
[[nodiscard]] const char* clipTypeToString(ClipType type);
[[nodiscard]] std::optional<ClipType> clipTypeFromString(std::string_view name);

struct Clip {
  std::string name;
  f64 startTime = 0.0; ///< seconds
  f64 duration = 1.0;  ///< seconds
  ClipType type = ClipType::Action;
  std::optional<std::string> actor;

  bool operator==(const Clip&) const = default;
};

class Timeline {
public:
  Timeline() = default;
  explicit Timeline(std::string name) : m_name(std::move(name)) {}

  [[nodiscard]] const std::string& name() const { return m_name; }
  void setName(std::string name) { m_name = std::move(name); }

  [[nodiscard]] const std::vector<Clip>& clips() const { return m_clips; }
  [[nodiscard]] usize clipCount() const { return m_clips.size(); }

  /// Precondition: index < clipCount()
  [[nodiscard]] Clip& clip(usize index) { return m_clips.at(index); }
  [[nodiscard]] const Clip& clip(usize index) const { return m_clips.at(index); }

  usize addClip(Clip clip);

  /// @return false if index is out of range
  bool removeClip(usize index);

  /// End of the last clip in seconds, 0 when empty
  [[nodiscard]] f64 endTime() const;

  bool operator==(const Timeline&) const = default;

private:
  std::string m_name;
  std::vector<Clip> m_clips;
};

} // namespace EvflEditor::flow
