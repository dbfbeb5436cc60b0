#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace majcpp::log {

enum class Level {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kOff = 4,
};

using Sink = std::function<void(Level, std::string_view)>;

// Threshold comes from MAJCPP_LOG (off|error|warn|info|debug), default warn.
Level Threshold();
void SetThreshold(Level level);
bool Enabled(Level level);

// Replaces the stderr sink; an empty function restores it.
void SetSink(Sink sink);

void Write(Level level, std::string_view message);

inline void Debug(std::string_view message) { Write(Level::kDebug, message); }
inline void Info(std::string_view message) { Write(Level::kInfo, message); }
inline void Warn(std::string_view message) { Write(Level::kWarn, message); }
inline void Error(std::string_view message) { Write(Level::kError, message); }

void KV(Level level, std::string_view key, std::string_view value);
void KV(Level level, std::string_view key, std::uint64_t value);
void KV(Level level, std::string_view key, double value);

std::string_view ToString(Level level);

}  // namespace majcpp::log
