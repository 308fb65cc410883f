#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::mutex g_create_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  std::lock_guard<std::mutex> lock(g_create_mutex);
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  auto info = std::make_shared<spdlog::logger>("dircache.info", std::move(info_sink));
  auto error = std::make_shared<spdlog::logger>("dircache.error", std::move(error_sink));
  auto print = std::make_shared<spdlog::logger>("dircache.print", std::move(plain_out_sink));
  auto print_err = std::make_shared<spdlog::logger>("dircache.print_err", std::move(plain_err_sink));

  info->flush_on(spdlog::level::warn);
  error->flush_on(spdlog::level::err);
  print->flush_on(spdlog::level::info);
  print_err->flush_on(spdlog::level::err);

  g_error_logger = std::move(error);
  g_print_logger = std::move(print);
  g_print_err_logger = std::move(print_err);
  g_info_logger = std::move(info);
}

void ensure_loggers() {
  if(!g_info_logger) create_loggers();
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Info:
    case LogChannel::Print: break;
  }
  return spdlog::level::info;
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error: return g_error_logger.get();
    default: break;
  }
  return g_info_logger.get();
}

} // namespace

const char* channel_name(LogChannel channel) {
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

void init_logging(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(LogChannel channel, const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, name_, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, name_,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel, const std::string& message) const {
  detail::emit_to_default(channel, name_, message);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& logger_name,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !logger_name.empty()) {
    sink->log(level_for(channel), fmt::format("[{}] {}", logger_name, message));
  } else {
    sink->log(level_for(channel), message);
  }
}

} // namespace detail
