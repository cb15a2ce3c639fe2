#pragma once

namespace wiregate {

// Semantic versioning for the public API
inline constexpr int version_major = 0;
inline constexpr int version_minor = 1;
inline constexpr int version_patch = 0;

// Sent as the User-Agent of the WebSocket upgrade request
inline constexpr const char* user_agent = "wiregate/0.1.0";

} // namespace wiregate
