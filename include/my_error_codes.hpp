#pragma once

namespace my_errors {

namespace APNS {  // Failure kinds reported by the client

constexpr int SERIALIZE_ERROR = 9000;  // JSON encode/decode failed
constexpr int CONNECTION_ERROR = 5200;  // Connect error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SIGNER_ERROR = 8001;  // Signing key rejected
constexpr int RESPONSE_ERROR = 5300;  // Gateway rejected the notification
constexpr int INVALID_OPTIONS = 5000;  // Invalid notification options
constexpr int TLS_ERROR = 5204;  // SSL error
constexpr int READ_ERROR = 5020;  // File read error
}  // namespace APNS

}  // namespace my_errors
