#include "storyflow/error.hpp"

#include "storyflow/consts.hpp"

namespace storyflow {

std::string_view kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation error";
  case ErrorKind::NotFound:
    return "not found";
  case ErrorKind::StateConflict:
    return "state conflict";
  case ErrorKind::Git:
    return "git error";
  case ErrorKind::Busy:
    return "busy";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Io:
    return "i/o error";
  }
  return "error";
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
  case ErrorKind::NotFound:
  case ErrorKind::Io:
    return consts::kExitValidation;
  case ErrorKind::StateConflict:
    return consts::kExitConflict;
  case ErrorKind::Git:
    return consts::kExitGit;
  case ErrorKind::Busy:
  case ErrorKind::Timeout:
    return consts::kExitTimeout;
  }
  return consts::kExitValidation;
}

std::string describe(const Error &err) {
  std::string out;
  if (!err.step.empty())
    out += "[" + err.step + "] ";
  out += std::string(kind_name(err.kind)) + ": " + err.message;
  return out;
}

} // namespace storyflow
