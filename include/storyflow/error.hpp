#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace storyflow {

enum class ErrorKind : std::uint8_t {
  Validation,    // bad input: unknown stage, duplicate prefix, malformed config
  NotFound,      // story or project does not exist
  StateConflict, // board or workspace state needs manual intervention
  Git,           // external git process failed
  Busy,          // a concurrent invocation holds the lock
  Timeout,       // an external call exceeded its deadline
  Io,            // filesystem failure
};

// What git was asked to do and how it answered. stderr is kept verbatim.
struct GitFailure {
  std::string operation;
  std::string url; // credentials redacted
  int exit_code = 0;
  std::string stderr_text;
};

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;
  std::string step; // pipeline step that produced the error
  std::string hint; // repair suggestion, if any
  std::optional<GitFailure> git;
};

auto kind_name(ErrorKind kind) -> std::string_view;

// Process exit status for an error kind.
auto exit_code_for(ErrorKind kind) -> int;

// One-line rendering: "[step] kind: message"
auto describe(const Error& err) -> std::string;

inline Error make_error(ErrorKind kind, std::string message, std::string hint = {}) {
  return Error{.kind = kind, .message = std::move(message), .step = {}, .hint = std::move(hint),
               .git = std::nullopt};
}

// Value-or-error. Accessing the wrong alternative throws std::logic_error.
template <typename T> class [[nodiscard]] Result {
public:
  Result(T value) : v_(std::in_place_index<0>, std::move(value)) {}
  Result(Error err) : v_(std::in_place_index<1>, std::move(err)) {}

  [[nodiscard]] bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  T& value() & {
    if (!ok())
      throw std::logic_error("Result::value on error: " + std::get<1>(v_).message);
    return std::get<0>(v_);
  }
  const T& value() const& {
    if (!ok())
      throw std::logic_error("Result::value on error: " + std::get<1>(v_).message);
    return std::get<0>(v_);
  }
  T&& value() && {
    if (!ok())
      throw std::logic_error("Result::value on error: " + std::get<1>(v_).message);
    return std::get<0>(std::move(v_));
  }

  Error& error() & {
    if (ok())
      throw std::logic_error("Result::error on success");
    return std::get<1>(v_);
  }
  const Error& error() const& {
    if (ok())
      throw std::logic_error("Result::error on success");
    return std::get<1>(v_);
  }

private:
  std::variant<T, Error> v_;
};

template <> class [[nodiscard]] Result<void> {
public:
  Result() = default;
  Result(Error err) : err_(std::move(err)) {}

  [[nodiscard]] bool ok() const { return !err_.has_value(); }
  explicit operator bool() const { return ok(); }

  void value() const {
    if (err_)
      throw std::logic_error("Result::value on error: " + err_->message);
  }
  Error& error() & {
    if (!err_)
      throw std::logic_error("Result::error on success");
    return *err_;
  }
  const Error& error() const& {
    if (!err_)
      throw std::logic_error("Result::error on success");
    return *err_;
  }

private:
  std::optional<Error> err_;
};

} // namespace storyflow
