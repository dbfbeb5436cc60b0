#include "majcpp/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace majcpp::log {
namespace {

Level ParseLevel(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (value == "off" || value == "0" || value == "false" || value == "none") {
    return Level::kOff;
  }
  if (value == "error") {
    return Level::kError;
  }
  if (value == "info") {
    return Level::kInfo;
  }
  if (value == "debug" || value == "1" || value == "true" || value == "all") {
    return Level::kDebug;
  }
  return Level::kWarn;
}

std::atomic<int>& ThresholdStorage() {
  static std::atomic<int> threshold = []() {
    const char* env = std::getenv("MAJCPP_LOG");
    if (env == nullptr) {
      return static_cast<int>(Level::kWarn);
    }
    return static_cast<int>(ParseLevel(env));
  }();
  return threshold;
}

std::mutex& SinkMutex() {
  static std::mutex mutex;
  return mutex;
}

Sink& CustomSink() {
  static Sink sink;
  return sink;
}

}  // namespace

Level Threshold() {
  return static_cast<Level>(ThresholdStorage().load(std::memory_order_relaxed));
}

void SetThreshold(Level level) {
  ThresholdStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Enabled(Level level) {
  return level != Level::kOff && static_cast<int>(level) >= static_cast<int>(Threshold());
}

void SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(SinkMutex());
  CustomSink() = std::move(sink);
}

void Write(Level level, std::string_view message) {
  if (!Enabled(level)) {
    return;
  }
  Sink sink{};
  {
    std::lock_guard<std::mutex> lock(SinkMutex());
    sink = CustomSink();
  }
  // Called unlocked: a sink may log or replace itself.
  if (sink) {
    sink(level, message);
    return;
  }
  std::lock_guard<std::mutex> lock(SinkMutex());
  std::cerr << "[majcpp] " << ToString(level) << ": " << message << "\n";
}

void KV(Level level, std::string_view key, std::string_view value) {
  if (!Enabled(level)) {
    return;
  }
  std::string line{};
  line.reserve(key.size() + value.size() + 1);
  line.append(key);
  line.push_back('=');
  line.append(value);
  Write(level, line);
}

void KV(Level level, std::string_view key, std::uint64_t value) {
  KV(level, key, std::string_view(std::to_string(value)));
}

void KV(Level level, std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  KV(level, key, std::string_view(out.str()));
}

std::string_view ToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kOff:
      return "OFF";
  }
  return "UNKNOWN";
}

}  // namespace majcpp::log
