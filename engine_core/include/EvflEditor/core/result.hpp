#pragma once

/**
 * @file result.hpp
 * @brief Result type used across the editor for recoverable failures
 *
 * Operations that can fail return Result<T, E> instead of throwing. The error
 * type defaults to a message string; modules that need callers to branch on
 * the failure kind use a structured error type instead.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace EvflEditor {

template <typename T, typename E = std::string> class [[nodiscard]] Result {
public:
  static Result ok(T value) { return Result(std::move(value), OkTag{}); }

  static Result error(E err) { return Result(std::move(err), ErrorTag{}); }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }
  explicit operator bool() const { return isOk(); }

  T& value() & {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return *m_value;
  }

  const T& value() const& {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return *m_value;
  }

  T&& value() && {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return std::move(*m_value);
  }

  const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on a successful result");
    }
    return *m_error;
  }

  [[nodiscard]] T valueOr(T fallback) const { return m_value ? *m_value : std::move(fallback); }

private:
  struct OkTag {};
  struct ErrorTag {};

  Result(T value, OkTag) : m_value(std::move(value)) {}
  Result(E err, ErrorTag) : m_error(std::move(err)) {}

  std::optional<T> m_value;
  std::optional<E> m_error;
};

template <typename E> class [[nodiscard]] Result<void, E> {
public:
  static Result ok() { return Result(); }

  static Result error(E err) {
    Result r;
    r.m_error = std::move(err);
    return r;
  }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }
  explicit operator bool() const { return isOk(); }

  const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on a successful result");
    }
    return *m_error;
  }

private:
  Result() = default;

  std::optional<E> m_error;
};

} // namespace EvflEditor
