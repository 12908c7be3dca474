/*
 * Paren - prefix-notation to C call syntax compiler
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * Time the enclosing function; statistics are collected under its name
 */
#define PAREN_FUNCTION_BENCHMARK \
  ::prn::execution_timer _paren_function_timer {__func__};


namespace prn {

/**
 * Utility class to measure execution time of code blocks
 *
 * The timer starts when constructed and stops when destroyed, or timing
 * can be controlled manually with start() and stop() methods. Every stop adds
 * the measured interval to process-wide statistics kept per timer name; the
 * statistics may be updated from several threads.
 *
 * Usage example:
 * {
 *     execution_timer timer("Operation name");
 *     // Code to measure
 * }
 */
class execution_timer {
  public:
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  execution_timer& operator = (const execution_timer&) = delete;

  /**
   * Log total and maximal duration of every timer name seen so far
   */
  static void
  report_global_stats();

  static void
  reset_global_stats();

  void
  start();

  // Stop the timer and record the elapsed interval
  void
  stop();

  void
  reset();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  // Log the time accumulated by this timer
  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class prn::execution_timer


/**
 * Human readable duration, e.g. "12.345 ms"
 */
std::string
format_duration(std::chrono::nanoseconds duration);

} // namespace prn
