#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

class Logger {
 public:
  enum class Level { Debug, Info, Warn, Error };

  Logger() = default;
  explicit Logger(std::string component) : component_(std::move(component)) {}

  void enable_file(const std::filesystem::path& path) {
    file_.open(path, std::ios::binary | std::ios::trunc);
  }

  void set_debug(bool enabled) { debug_enabled_ = enabled; }

  void log(Level level, const std::string& msg) {
    if (level == Level::Debug && !debug_enabled_) return;
    const std::string line = format(level, msg);
    std::cerr << line;
    if (file_.is_open()) file_ << line;
  }

  void info(const std::string& msg) { log(Level::Info, msg); }
  void warn(const std::string& msg) { log(Level::Warn, msg); }
  void error(const std::string& msg) { log(Level::Error, msg); }
  void debug(const std::string& msg) { log(Level::Debug, msg); }

 private:
  static const char* level_tag(Level l) {
    switch (l) {
      case Level::Debug:
        return "DEBUG";
      case Level::Info:
        return "INFO";
      case Level::Warn:
        return "WARN";
      case Level::Error:
        return "ERROR";
    }
    return "INFO";
  }

  std::string format(Level l, const std::string& msg) const {
    std::string out;
    out.reserve(msg.size() + component_.size() + 20);
    out += "[";
    out += level_tag(l);
    out += "] ";
    if (!component_.empty()) {
      out += "[";
      out += component_;
      out += "] ";
    }
    out += msg;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    return out;
  }

  std::string component_;
  bool debug_enabled_ = false;
  std::ofstream file_;
};

// Null-safe helpers for modules that take an optional Logger*.
inline void log_info(Logger* log, const std::string& msg) {
  if (log) log->info(msg);
}
inline void log_warn(Logger* log, const std::string& msg) {
  if (log) log->warn(msg);
}
inline void log_debug(Logger* log, const std::string& msg) {
  if (log) log->debug(msg);
}
