#include "toolsmith/common/result.hpp"

namespace toolsmith::common {

std::string_view error_code_to_string(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "Ok";
  case ErrorCode::CompileError:
    return "CompileError";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::ArityMismatch:
    return "ArityMismatch";
  case ErrorCode::AlreadyQueued:
    return "AlreadyQueued";
  case ErrorCode::IOError:
    return "IOError";
  case ErrorCode::NetworkError:
    return "NetworkError";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::RuntimeError:
    return "RuntimeError";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  }
  return "Unknown";
}

std::string Status::describe() const {
  if (ok()) {
    return "Ok";
  }
  return std::string(error_code_to_string(code_)) + ": " + error_;
}

} // namespace toolsmith::common
