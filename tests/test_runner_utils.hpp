#pragma once

#include "http_message.hpp"
#include "log.hpp"
#include "node_engine.hpp"
#include "peer_error.hpp"
#include "settings_manager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace friendsync::test {

inline void write_config_before_start(const std::filesystem::path& workspace,
                                      const std::string& filename,
                                      const nlohmann::json& content) {
  auto config_dir = workspace / ".config";
  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  std::ofstream out(config_dir / filename, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::filesystem::path fresh_directory(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

inline void configure(const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value) {
  std::string error;
  if(!settings->set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

// Loopback node on an ephemeral port with a fixed id.
inline std::shared_ptr<SettingsManager> loopback_settings(const std::filesystem::path& workspace,
                                                          const std::string& peer_id,
                                                          const std::string& node_name) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(workspace / ".config" / "settings.json");
  configure(settings, "listen_ip", "127.0.0.1");
  configure(settings, "listen_port", 0);
  configure(settings, "peer_id", peer_id);
  configure(settings, "node_name", node_name);
  configure(settings, "peer_timeout_ms", 2000);
  return settings;
}

// Builds a request as HttpServer would hand it to a handler.
inline HttpRequest make_request(const std::string& method,
                                const std::string& target,
                                const std::string& body = std::string()) {
  std::string head = method + " " + target + " HTTP/1.1\r\nHost: test";
  if(!body.empty()) {
    head += "\r\nContent-Type: application/json\r\nContent-Length: " + std::to_string(body.size());
  }
  auto request = parse_request_head(head);
  request.body = body;
  return request;
}

inline nlohmann::json response_json(const HttpResponse& response) {
  auto j = nlohmann::json::parse(response.body, nullptr, false);
  if(j.is_discarded()) {
    throw std::runtime_error("response is not JSON: " + response.body);
  }
  return j;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the engine's logger, so the capture may outlive the engine.
  void attach(NodeEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Fails the enclosing test with a message when `cond` is false.
#define FRIENDSYNC_CHECK(cond) \
  do { \
    if(!(cond)) { \
      std::cout << "\n    check failed: " #cond " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return false; \
    } \
  } while(0)

template<typename Fn>
bool expect_peer_error(Fn&& fn, ErrorKind expected) {
  try {
    fn();
  } catch(const PeerError& e) {
    if(e.kind() != expected) {
      std::cout << "\n    expected " << error_kind_name(expected)
                << " but got " << e.kind_name() << ": " << e.what() << "\n";
      return false;
    }
    return true;
  }
  std::cout << "\n    expected " << error_kind_name(expected) << " but nothing was thrown\n";
  return false;
}

inline int run_tests(const char* suite, std::vector<TestCase> tests, int argc, char** argv) {
  bool verbose = (std::getenv("FRIENDSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("FRIENDSYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace friendsync::test
