/* @file Logger.cpp
 * @brief ring buffer producer side and the CSV drain worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// apctl headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace apctl::core;

namespace {
  constexpr auto kIdleWait = std::chrono::milliseconds{ 50 };
  constexpr const char* kCsvHeader = "timestamp_ms,level,tag,message\n";
} // namespace

const char* apctl::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  finishRun();

  std::lock_guard<std::mutex> lock(runMtx_);
  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open run file: " + csvPath);
  csvFile_.write(kCsvHeader);

  running_ = true;
  worker_ = std::thread([this] { drain(); });
}

void Logger::finishRun() {
  std::lock_guard<std::mutex> lock(runMtx_);
  if (!running_)
    return;
  running_ = false;
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();
  csvFile_.close();
}

void Logger::log(const LogEvent& event) {
  if (event.level == LogLevel::Debug && !verbose_)
    return;

  if (!running_) {
    if (event.level >= LogLevel::Warn)
      std::cerr << '[' << event.tag << "] " << event.message << '\n';
    return;
  }

  if (!buffer_->push(event)) {
    ++dropped_;
    return;
  }
  wake_.notify_one();
}

void Logger::debug(const std::string& tag, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, tag, message });
}

void Logger::info(const std::string& tag, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, tag, message });
}

void Logger::warn(const std::string& tag, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, tag, message });
}

void Logger::error(const std::string& tag, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, tag, message });
}

std::string Logger::toCsv(const LogEvent& event) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      event.timestamp.time_since_epoch())
                      .count();

  std::string line = std::to_string(ms);
  line += ',';
  line += toString(event.level);
  line += ',';
  line += event.tag;
  line += ",\"";
  for (char c : event.message) {
    if (c == '"')
      line += '"'; // CSV escapes quotes by doubling
    line += c;
  }
  line += "\"\n";
  return line;
}

void Logger::drain() {
  for (;;) {
    while (auto event = buffer_->pop())
      csvFile_.write(toCsv(*event));
    if (!running_)
      break;

    std::unique_lock<std::mutex> lock(wakeMtx_);
    wake_.wait_for(lock, kIdleWait, [this] { return !running_ || !buffer_->empty(); });
  }

  while (auto event = buffer_->pop())
    csvFile_.write(toCsv(*event));
  if (!csvFile_.flush())
    std::cerr << "[Logger] flush of run file failed\n";
}
