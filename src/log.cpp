#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::once_flag g_sinks_once;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const std::string& pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

DefaultSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.info = make_sink_logger("friendsync.info",
                                    std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                    stamped, spdlog::level::warn);
    g_sinks.error = make_sink_logger("friendsync.error",
                                     std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                     stamped, spdlog::level::err);
    g_sinks.plain_out = make_sink_logger("friendsync.print",
                                         std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                         "%v", spdlog::level::info);
    g_sinks.plain_err = make_sink_logger("friendsync.print_err",
                                         std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                         "%v", spdlog::level::err);
  });
  return g_sinks;
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.plain_out->set_level(spdlog::level::info);
  s.plain_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(LogChannel channel, spdlog::level::level_enum level, const std::string& message) {
  const std::string base = log_channel_name(channel);
  const std::string prefix = name();
  const std::string channel_name = prefix.empty() ? base : prefix + ":" + base;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  auto& s = sinks();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = s.plain_out.get(); break;
    case LogChannel::PrintErr: sink = s.plain_err.get(); break;
    case LogChannel::Error: sink = s.error.get(); break;
    default: sink = s.info.get(); break;
  }
  if(!sink) return;

  if(!channel_name.empty() && channel_name != log_channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
