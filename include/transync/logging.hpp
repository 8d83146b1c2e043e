/**
 * @file logging.hpp
 * @brief Logger and timing collection utilities
 *
 * @details Provides:
 *          - Logger: verbosity-aware reporter passed to every component
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase timings
 *
 * @note All output uses fmt::print for type-safe formatting and is flushed
 *       immediately so progress stays visible when piped.
 */

#ifndef TRANSYNC_LOGGING_HPP
#define TRANSYNC_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace transync {

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global output mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @enum Verbosity
 * @brief How much the Logger prints.
 */
enum class Verbosity { Quiet, Normal, Verbose };

// **----- LOGGER -----**

/**
 * @class Logger
 * @brief Reporter handed to the pipeline and its stages at construction.
 *
 * @attention LEVELS:
 *
 *   - Quiet: errors only
 *
 *   - Normal: info, warnings, phases and successes
 *
 *   - Verbose: everything above plus debug lines
 *
 * @note Lines from concurrent workers never interleave; every write holds
 *       log_mutex.
 */
class Logger {
public:
  explicit Logger(Verbosity verbosity = Verbosity::Normal)
      : verbosity_(verbosity) {}

  Verbosity verbosity() const { return verbosity_; }
  void set_verbosity(Verbosity v) { verbosity_ = v; }
  bool verbose() const { return verbosity_ == Verbosity::Verbose; }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    if (verbosity_ == Verbosity::Quiet)
      return;
    write(fmt::text_style(), "[INFO] ",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    if (verbosity_ == Verbosity::Quiet)
      return;
    write(fg(fmt::color::yellow), "[WARN] ",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    write(fg(fmt::color::red), "[ERROR] ",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void phase(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    if (verbosity_ == Verbosity::Quiet)
      return;
    write(fg(fmt::color::cyan), "",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void success(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    if (verbosity_ == Verbosity::Quiet)
      return;
    write(fg(fmt::color::green), "",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt_str, Args &&...args) const {
    if (verbosity_ != Verbosity::Verbose)
      return;
    write(fg(fmt::color::gray), "[DEBUG] ",
          fmt::format(fmt_str, std::forward<Args>(args)...));
  }

private:
  /**
   * @brief Emit one complete line under the output mutex.
   */
  static void write(const fmt::text_style &style, const char *prefix,
                    const std::string &msg);

  Verbosity verbosity_;
};

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase timings.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called at the start of every run.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    transync::TimingCollector::record(#name, timer_duration_##name);           \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace transync

#endif // TRANSYNC_LOGGING_HPP
