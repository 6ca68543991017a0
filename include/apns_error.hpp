#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <boost/system/error_code.hpp>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "data/delivery_response.hpp"
#include "openssl/crypt_util.hpp"
#include "result_monad.hpp"

namespace apnsclient {

enum class ErrorKind {
  Serialize,
  Connection,
  Timeout,
  Signing,
  RemoteRejection,
  InvalidOptions,
  Tls,
  Read,
};

// Who can act on a failure: the caller fixing the request, the operator
// fixing the environment, or nobody but the gateway.
enum class ErrorClass {
  LocalInput,
  Infrastructure,
  RemoteOutcome,
};

// Request or response JSON was faulty.
struct SerializeFailure {
  bool operator==(const SerializeFailure &) const = default;
};

// The transport could not reach the gateway.
struct ConnectionFailure {
  bool operator==(const ConnectionFailure &) const = default;
};

// The caller's time budget for a send elapsed.
struct TimeoutFailure {
  bool operator==(const TimeoutFailure &) const = default;
};

// A provider token could not be created with the configured key.
struct SigningFailure {
  std::string message;
  bool operator==(const SigningFailure &) const = default;
};

// The gateway answered and refused the notification.
struct RemoteRejection {
  DeliveryResponse response;
  bool operator==(const RemoteRejection &) const = default;
};

// Notification options failed local validation.
struct InvalidOptions {
  std::string message;
  bool operator==(const InvalidOptions &) const = default;
};

struct TlsFailure {
  std::string message;
  bool operator==(const TlsFailure &) const = default;
};

// A certificate or key could not be read from storage.
struct ReadFailure {
  std::string message;
  bool operator==(const ReadFailure &) const = default;
};

class Error {
 public:
  using Payload =
      std::variant<SerializeFailure, ConnectionFailure, TimeoutFailure,
                   SigningFailure, RemoteRejection, InvalidOptions,
                   TlsFailure, ReadFailure>;

  Error(Payload payload) : payload_(std::move(payload)) {}

  ErrorKind kind() const noexcept;
  ErrorClass error_class() const noexcept;

  // Stable text per kind; never includes payload data.
  std::string_view describe() const noexcept;
  // Enumerator name, e.g. "RemoteRejection".
  std::string_view kind_name() const noexcept;
  // Numeric code from my_error_codes.hpp.
  int code() const noexcept;

  // describe(), plus ` (reason: "<reason>")` for a rejection that carries one.
  std::string to_string() const;

  // The diagnostic message of Signing, InvalidOptions, Tls and Read failures.
  std::optional<std::string_view> detail() const noexcept;
  // The gateway response of a RemoteRejection, nullptr otherwise.
  const DeliveryResponse *response() const noexcept;

  const Payload &payload() const noexcept { return payload_; }

  bool operator==(const Error &) const = default;

 private:
  Payload payload_;
};

std::ostream &operator<<(std::ostream &os, const Error &err);

template <typename T>
using ApnsResult = monad::Result<T, Error>;

// Boost.JSON parse failure. The error detail is dropped.
Error from_json_error(const boost::system::error_code &ec);
// Exception thrown while decoding a JSON value into a typed structure. The
// error detail is dropped.
Error from_json_exception(const std::exception &ex);
// OpenSSL failure inside the signing path.
Error from_openssl(const cryptutil::OpensslErrorStack &stack);
// Exception thrown by the JWT library while signing.
Error from_signer_exception(const std::exception &ex);
// Failure opening or reading a key or certificate file.
Error from_io(const std::system_error &ex);
// Resolver, socket or HTTP stream failure. The error detail is dropped.
Error from_connection(const boost::system::error_code &ec);
// TLS context setup or handshake failure.
Error from_tls(const boost::system::error_code &ec);
Error timed_out();
Error invalid_options(std::string message);
Error rejected(DeliveryResponse response);

} // namespace apnsclient

template <>
struct fmt::formatter<apnsclient::Error> : fmt::ostream_formatter {};
