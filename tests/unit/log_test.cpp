#include "majcpp/log.hpp"

#include "../test_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

struct Captured {
  majcpp::log::Level level = majcpp::log::Level::kInfo;
  std::string message;
};

std::vector<Captured>& Lines() {
  static std::vector<Captured> lines;
  return lines;
}

void InstallCapture() {
  Lines().clear();
  majcpp::log::SetSink([](majcpp::log::Level level, std::string_view message) {
    Lines().push_back(Captured{level, std::string(message)});
  });
}

void ScenarioThresholdFiltering() {
  majcpp::tests::Log("scenario: threshold filtering");
  InstallCapture();
  majcpp::log::SetThreshold(majcpp::log::Level::kInfo);
  majcpp::log::Debug("hidden");
  majcpp::log::Info("shown");
  majcpp::log::Error("also shown");
  Require(Lines().size() == 2, "debug line must be filtered at info threshold");
  Require(Lines()[0].message == "shown" && Lines()[0].level == majcpp::log::Level::kInfo, "info line captured");
  Require(Lines()[1].level == majcpp::log::Level::kError, "error line captured");
  Require(!majcpp::log::Enabled(majcpp::log::Level::kDebug), "debug disabled at info threshold");

  majcpp::log::SetThreshold(majcpp::log::Level::kOff);
  majcpp::log::Error("dropped");
  Require(Lines().size() == 2, "off threshold drops everything");
  Require(!majcpp::log::Enabled(majcpp::log::Level::kOff), "off is never an enabled level");
}

void ScenarioKeyValue() {
  majcpp::tests::Log("scenario: key value lines");
  InstallCapture();
  majcpp::log::SetThreshold(majcpp::log::Level::kDebug);
  majcpp::log::KV(majcpp::log::Level::kInfo, "created", static_cast<std::uint64_t>(5));
  majcpp::log::KV(majcpp::log::Level::kInfo, "store", std::string_view("sqlite"));
  majcpp::log::KV(majcpp::log::Level::kDebug, "score", 0.5);
  Require(Lines().size() == 3, "three key/value lines expected");
  Require(Lines()[0].message == "created=5", "integer key/value format");
  Require(Lines()[1].message == "store=sqlite", "string key/value format");
  Require(Lines()[2].message == "score=0.5", "double key/value format");
}

void ScenarioReentrantSink() {
  majcpp::tests::Log("scenario: re-entrant sink");
  InstallCapture();
  majcpp::log::SetThreshold(majcpp::log::Level::kInfo);
  majcpp::log::SetSink([](majcpp::log::Level level, std::string_view message) {
    Lines().push_back(Captured{level, std::string(message)});
    if (message == "outer") {
      majcpp::log::Info("nested");
      majcpp::log::SetSink([](majcpp::log::Level inner_level, std::string_view inner_message) {
        Lines().push_back(Captured{inner_level, "replaced: " + std::string(inner_message)});
      });
    }
  });
  majcpp::log::Warn("outer");
  majcpp::log::Info("after");
  Require(Lines().size() == 3, "sink may log and replace itself");
  Require(Lines()[0].message == "outer" && Lines()[1].message == "nested", "nested line reaches the sink");
  Require(Lines()[2].message == "replaced: after", "replacement sink takes over");
}

void ScenarioLevelNames() {
  majcpp::tests::Log("scenario: level names");
  Require(majcpp::log::ToString(majcpp::log::Level::kWarn) == "WARN", "warn name");
  Require(majcpp::log::ToString(majcpp::log::Level::kDebug) == "DEBUG", "debug name");
}

}  // namespace

int main() {
  try {
    majcpp::tests::Log("log_test: start");
    ScenarioThresholdFiltering();
    ScenarioKeyValue();
    ScenarioReentrantSink();
    ScenarioLevelNames();
    majcpp::log::SetSink({});
    majcpp::log::SetThreshold(majcpp::log::Level::kWarn);
    majcpp::tests::Log("log_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    majcpp::log::SetSink({});
    majcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
