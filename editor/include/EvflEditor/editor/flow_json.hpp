#pragma once

/**
 * @file flow_json.hpp
 * @brief JSON document format for event flows
 *
 * This module provides:
 * - Strict parsing with validation of every event reference
 * - Atomic file writes (QSaveFile)
 * - Explicit error codes
 *
 * Layout (version 1):
 * {
 *   "version": 1,
 *   "name": "...",
 *   "flowchart": { "name", "events": [...], "entry_points": { name: index } },
 *   "timeline":  { "name", "clips": [...] }
 * }
 * Events refer to each other by their position in "events".
 */

#include "EvflEditor/core/result.hpp"
#include "EvflEditor/core/types.hpp"
#include "EvflEditor/flow/event_flow.hpp"
#include <QByteArray>
#include <QString>
#include <string>

namespace EvflEditor::editor {

/**
 * @brief Error codes for flow JSON operations
 */
enum class FlowJsonError : u32 {
  // Parse errors (1xx)
  InvalidJsonSyntax = 101,
  MissingRequiredField = 103,
  InvalidFieldType = 104,
  InvalidFieldValue = 105,

  // Validation errors (2xx)
  UnsupportedVersion = 202,

  // I/O errors (3xx)
  FileNotFound = 301,
  FileOpenFailed = 302,
  FileWriteFailed = 303
};

[[nodiscard]] const char* flowJsonErrorToString(FlowJsonError error);

struct FlowJsonFailure {
  FlowJsonError code;
  std::string message;
};

template <typename T> using FlowJsonResult = Result<T, FlowJsonFailure>;

class FlowJsonHandler {
public:
  [[nodiscard]] static FlowJsonResult<flow::EventFlow> parseFromString(const QByteArray& json);

  [[nodiscard]] static QByteArray serializeToString(const flow::EventFlow& flow);

  [[nodiscard]] static FlowJsonResult<flow::EventFlow> loadFromFile(const QString& path);

  /**
   * @brief Save atomically; the previous file survives a failed write
   */
  [[nodiscard]] static FlowJsonResult<void> saveToFile(const QString& path,
                                                       const flow::EventFlow& flow);

  [[nodiscard]] static constexpr u32 getCurrentVersion() { return 1; }
};

} // namespace EvflEditor::editor
