#pragma once


namespace twinkit::config::dispatch {

// Environment variable read once when the kernels are first resolved.
// Accepted values: "auto" | "native" | "fallback"
inline constexpr static const char* BACKEND_ENV = "TWINKIT_BACKEND";

} // namespace twinkit::config::dispatch
