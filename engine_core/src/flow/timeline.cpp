#include "EvflEditor/flow/timeline.hpp"

#include <algorithm>

namespace EvflEditor::flow {

const char* clipTypeToString(ClipType type) {
  switch (type) {
  case ClipType::Action:
    return "action";
  case ClipType::Camera:
    return "camera";
  case ClipType::Audio:
    return "audio";
  case ClipType::Event:
    return "event";
  case ClipType::Effect:
    return "effect";
  }
  return "action";
}

std::optional<ClipType> clipTypeFromString(std::string_view name) {
  for (ClipType type : kAllClipTypes) {
    if (name == clipTypeToString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

usize Timeline::addClip(Clip clip) {
  m_clips.push_back(std::move(clip));
  return m_clips.size() - 1;
}

bool Timeline::removeClip(usize index) {
  if (index >= m_clips.size()) {
    return false;
  }
  m_clips.erase(m_clips.begin() + static_cast<std::ptrdiff_t>(index));
  return true;
}

f64 Timeline::endTime() const {
  f64 end = 0.0;
  for (const auto& clip : m_clips) {
    end = std::max(end, clip.startTime + clip.duration);
  }
  return end;
}

} // namespace EvflEditor::flow
