#include "apns_error.hpp"

#include <type_traits>

#include "my_error_codes.hpp"

namespace apnsclient {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

ErrorKind Error::kind() const noexcept {
  return std::visit(
      overloaded{
          [](const SerializeFailure &) { return ErrorKind::Serialize; },
          [](const ConnectionFailure &) { return ErrorKind::Connection; },
          [](const TimeoutFailure &) { return ErrorKind::Timeout; },
          [](const SigningFailure &) { return ErrorKind::Signing; },
          [](const RemoteRejection &) { return ErrorKind::RemoteRejection; },
          [](const InvalidOptions &) { return ErrorKind::InvalidOptions; },
          [](const TlsFailure &) { return ErrorKind::Tls; },
          [](const ReadFailure &) { return ErrorKind::Read; },
      },
      payload_);
}

ErrorClass Error::error_class() const noexcept {
  switch (kind()) {
  case ErrorKind::Serialize:
  case ErrorKind::InvalidOptions:
    return ErrorClass::LocalInput;
  case ErrorKind::RemoteRejection:
    return ErrorClass::RemoteOutcome;
  case ErrorKind::Connection:
  case ErrorKind::Timeout:
  case ErrorKind::Signing:
  case ErrorKind::Tls:
  case ErrorKind::Read:
    break;
  }
  return ErrorClass::Infrastructure;
}

std::string_view Error::describe() const noexcept {
  switch (kind()) {
  case ErrorKind::Serialize:
    return "Error serializing to JSON";
  case ErrorKind::Connection:
    return "Error connecting to the gateway";
  case ErrorKind::Timeout:
    return "Timeout in sending a push notification";
  case ErrorKind::Signing:
    return "Error creating a signature";
  case ErrorKind::RemoteRejection:
    return "Notification was not accepted by the gateway";
  case ErrorKind::InvalidOptions:
    return "Invalid options for the notification payload";
  case ErrorKind::Tls:
    return "Error in creating a TLS connection";
  case ErrorKind::Read:
    return "Error in reading a certificate file";
  }
  return "Unknown error";
}

std::string_view Error::kind_name() const noexcept {
  switch (kind()) {
  case ErrorKind::Serialize:
    return "SerializeFailure";
  case ErrorKind::Connection:
    return "ConnectionFailure";
  case ErrorKind::Timeout:
    return "TimeoutFailure";
  case ErrorKind::Signing:
    return "SigningFailure";
  case ErrorKind::RemoteRejection:
    return "RemoteRejection";
  case ErrorKind::InvalidOptions:
    return "InvalidOptions";
  case ErrorKind::Tls:
    return "TlsFailure";
  case ErrorKind::Read:
    return "ReadFailure";
  }
  return "Unknown";
}

int Error::code() const noexcept {
  switch (kind()) {
  case ErrorKind::Serialize:
    return my_errors::APNS::SERIALIZE_ERROR;
  case ErrorKind::Connection:
    return my_errors::APNS::CONNECTION_ERROR;
  case ErrorKind::Timeout:
    return my_errors::APNS::TIMEOUT_ERROR;
  case ErrorKind::Signing:
    return my_errors::APNS::SIGNER_ERROR;
  case ErrorKind::RemoteRejection:
    return my_errors::APNS::RESPONSE_ERROR;
  case ErrorKind::InvalidOptions:
    return my_errors::APNS::INVALID_OPTIONS;
  case ErrorKind::Tls:
    return my_errors::APNS::TLS_ERROR;
  case ErrorKind::Read:
    return my_errors::APNS::READ_ERROR;
  }
  return 0;
}

std::string Error::to_string() const {
  std::string text(describe());
  if (const auto *res = response(); res != nullptr && res->error) {
    text += fmt::format(" (reason: \"{}\")", res->error->reason);
  }
  return text;
}

std::optional<std::string_view> Error::detail() const noexcept {
  return std::visit(
      [](const auto &p) -> std::optional<std::string_view> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SigningFailure> ||
                      std::is_same_v<T, InvalidOptions> ||
                      std::is_same_v<T, TlsFailure> ||
                      std::is_same_v<T, ReadFailure>) {
          return std::string_view(p.message);
        } else {
          return std::nullopt;
        }
      },
      payload_);
}

const DeliveryResponse *Error::response() const noexcept {
  if (const auto *rej = std::get_if<RemoteRejection>(&payload_)) {
    return &rej->response;
  }
  return nullptr;
}

std::ostream &operator<<(std::ostream &os, const Error &err) {
  return os << err.to_string();
}

Error from_json_error(const boost::system::error_code &) {
  return Error(SerializeFailure{});
}

Error from_json_exception(const std::exception &) {
  return Error(SerializeFailure{});
}

Error from_openssl(const cryptutil::OpensslErrorStack &stack) {
  return Error(SigningFailure{stack.message()});
}

Error from_signer_exception(const std::exception &ex) {
  return Error(SigningFailure{ex.what()});
}

Error from_io(const std::system_error &ex) {
  return Error(ReadFailure{ex.what()});
}

Error from_connection(const boost::system::error_code &) {
  return Error(ConnectionFailure{});
}

Error from_tls(const boost::system::error_code &ec) {
  return Error(TlsFailure{ec.message()});
}

Error timed_out() { return Error(TimeoutFailure{}); }

Error invalid_options(std::string message) {
  return Error(InvalidOptions{std::move(message)});
}

Error rejected(DeliveryResponse response) {
  return Error(RemoteRejection{std::move(response)});
}

} // namespace apnsclient
