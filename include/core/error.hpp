#pragma once

#include <boost/system/error_code.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

// namespace core: error taxonomy shared by every module.
// Fallible operations return Status / Result<T> (std::expected) instead of
// throwing; Asio/Beast error codes are converted at module edges with a stage
// prefix so the log line says which step failed.
namespace core {

enum class ErrorKind {
  negotiation,   // malformed or rejected description exchange
  transport,     // channel closed, send/receive failure
  io,            // file open/create/read/write failure
  config,        // invalid flags or configuration file
  end_of_stream, // expected termination, not a failure
};

struct Error {
  ErrorKind kind;
  std::string message;

  bool operator==(const Error &) const = default;
};

using Status = std::expected<void, Error>;

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> MakeError(ErrorKind kind, std::string message) {
  return std::unexpected(Error{kind, std::move(message)});
}

inline Error FromErrorCode(ErrorKind kind, std::string_view stage,
                           const boost::system::error_code &ec) {
  std::string msg(stage);
  msg += ": ";
  msg += ec.message();
  return Error{kind, std::move(msg)};
}

inline Status MakeStatus(ErrorKind kind, std::string_view stage,
                         const boost::system::error_code &ec) {
  if (ec) {
    return std::unexpected(FromErrorCode(kind, stage, ec));
  }
  return {};
}

inline Error EndOfStream() { return Error{ErrorKind::end_of_stream, "EOF"}; }

inline bool IsEndOfStream(const Error &e) {
  return e.kind == ErrorKind::end_of_stream;
}

inline const char *KindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::negotiation:
    return "negotiation";
  case ErrorKind::transport:
    return "transport";
  case ErrorKind::io:
    return "io";
  case ErrorKind::config:
    return "config";
  case ErrorKind::end_of_stream:
    return "end of stream";
  }
  return "unknown";
}

// "<kind> error: <message>" for logs; the bare message is what HTTP bodies
// and test assertions compare.
inline std::string Describe(const Error &e) {
  return std::string(KindName(e.kind)) + " error: " + e.message;
}

} // namespace core
