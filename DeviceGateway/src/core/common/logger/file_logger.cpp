#include "core/common/logger/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace devgw::core::common::log {

const char* ToString(Level level) {
  switch (level) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    case Level::Fatal: return "FATAL";
    default:           return "UNKNOWN";
  }
}

bool ParseLevel(std::string_view s, Level& out) {
  std::string t;
  t.reserve(s.size());
  for (const char c : s) {
    const unsigned char uc = static_cast<unsigned char>(c);
    t.push_back((uc >= 'A' && uc <= 'Z') ? static_cast<char>(uc - 'A' + 'a') : c);
  }
  if (t == "trace") out = Level::Trace;
  else if (t == "debug") out = Level::Debug;
  else if (t == "info") out = Level::Info;
  else if (t == "warn" || t == "warning") out = Level::Warn;
  else if (t == "error") out = Level::Error;
  else if (t == "fatal") out = Level::Fatal;
  else return false;
  return true;
}

std::string FormatLine(const Event& e) {
  const auto tt = std::chrono::system_clock::to_time_t(e.ts);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << " [" << ToString(e.level) << "]";
  if (!e.tag.empty()) oss << " [" << e.tag << "]";
  oss << " " << e.message << "\n";
  return oss.str();
}

Logger::Logger(std::shared_ptr<Sink> sink) : sink_(std::move(sink)) {}

void Logger::SetLevel(Level level) {
  std::lock_guard<std::mutex> lk(mu_);
  level_ = level;
}

Level Logger::GetLevel() const {
  std::lock_guard<std::mutex> lk(mu_);
  return level_;
}

bool Logger::IsEnabled(Level level) const {
  std::lock_guard<std::mutex> lk(mu_);
  return sink_ != nullptr && ShouldLog(level);
}

bool Logger::ShouldLog(Level level) const {
  return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(level_);
}

void Logger::Log(Level level, std::string_view msg) {
  Log(level, std::string_view{}, msg);
}

void Logger::Log(Level level, std::string_view tag, std::string_view msg) {
  std::shared_ptr<Sink> sink;
  Event e;

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!sink_ || !ShouldLog(level)) return;
    sink = sink_;
    e.level = level;
    e.ts = std::chrono::system_clock::now();
    e.tag.assign(tag.data(), tag.size());
    e.message.assign(msg.data(), msg.size());
  }

  sink->Write(e);
}

void Logger::Trace(std::string_view msg) { Log(Level::Trace, msg); }
void Logger::Debug(std::string_view msg) { Log(Level::Debug, msg); }
void Logger::Info(std::string_view msg) { Log(Level::Info, msg); }
void Logger::Warn(std::string_view msg) { Log(Level::Warn, msg); }
void Logger::Error(std::string_view msg) { Log(Level::Error, msg); }
void Logger::Fatal(std::string_view msg) { Log(Level::Fatal, msg); }

void Logger::Flush() {
  std::shared_ptr<Sink> sink;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sink = sink_;
  }
  if (sink) sink->Flush();
}

FileSink::FileSink(std::filesystem::path file_path)
    : file_path_(std::move(file_path)), ofs_(file_path_, std::ios::out | std::ios::app) {}

std::filesystem::path FileSink::Path() const {
  std::lock_guard<std::mutex> lk(mu_);
  return file_path_;
}

bool FileSink::IsOpen() const {
  std::lock_guard<std::mutex> lk(mu_);
  return ofs_.is_open();
}

void FileSink::Write(const Event& e) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!ofs_) return;
  ofs_ << FormatLine(e);
  if (e.level >= Level::Warn) ofs_.flush();
}

void FileSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  if (ofs_) ofs_.flush();
}

void ConsoleSink::Write(const Event& e) {
  std::lock_guard<std::mutex> lk(mu_);
  std::cerr << FormatLine(e);
}

void ConsoleSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  std::cerr.flush();
}

TeeSink::TeeSink(std::vector<std::shared_ptr<Sink>> sinks) : sinks_(std::move(sinks)) {}

void TeeSink::Write(const Event& e) {
  for (const auto& s : sinks_) {
    if (s) s->Write(e);
  }
}

void TeeSink::Flush() {
  for (const auto& s : sinks_) {
    if (s) s->Flush();
  }
}

}  // namespace devgw::core::common::log
