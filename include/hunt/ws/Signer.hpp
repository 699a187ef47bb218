#pragma once

#include <string>

namespace hunt::ws {

// Path signed by the websocket login request.
constexpr const char* kLoginVerifyPath = "/users/self/verify";

// base64(HMAC-SHA256(secret, message)), single line.
std::string hmacSha256Base64(const std::string& secret, const std::string& message);

// Login signature: timestamp + "GET" + "/users/self/verify".
std::string loginSignature(const std::string& secret, const std::string& timestampMs);

} // namespace hunt::ws
