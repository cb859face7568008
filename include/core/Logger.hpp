#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace apctl {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string tag;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief `log()` never blocks: events go into a bounded ring buffer drained
 *        into the run's CSV file by one worker thread.
 *
 *  * Outside a run, warnings and errors are echoed to std::cerr and
 *    everything else is discarded.
 *  * Debug events are discarded unless verbose logging is on.
 *  * A full buffer drops the event and counts it.
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      ~Logger(); ///< finishRun()

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      void debug(const std::string& tag, const std::string& message);
      void info(const std::string& tag, const std::string& message);
      void warn(const std::string& tag, const std::string& message);
      void error(const std::string& tag, const std::string& message);

      void setVerbose(bool verbose) { verbose_ = verbose; }
      bool verbose() const { return verbose_; }
      bool isRunning() const { return running_; }
      std::size_t droppedEvents() const { return dropped_; }

      /// One CSV record (with trailing newline) for \p event.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<bool> verbose_{ false };
      std::atomic<std::size_t> dropped_{ 0 };

      std::mutex runMtx_; ///< serialises startNewRun / finishRun
      std::mutex wakeMtx_;
      std::condition_variable wake_;
    };

  } // namespace core
} // namespace apctl
