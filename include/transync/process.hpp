/**
 * @file process.hpp
 * @brief External process execution with cancellation
 *
 * @details Runs a command line through /bin/sh in its own process group,
 *          captures its combined stdout/stderr and stops it abortively when
 *          the run is canceled. Used for the encoder and the fast-copy
 *          utility.
 */

#ifndef TRANSYNC_PROCESS_HPP
#define TRANSYNC_PROCESS_HPP

#include <string>

#include "cancellation.hpp"

namespace transync {

/**
 * @struct ProcessResult
 * @brief Outcome of one external command.
 */
struct ProcessResult {
  bool launched = false; //< fork/pipe succeeded
  bool canceled = false; //< Stopped because cancellation was requested
  int exit_code = -1;    //< Exit status, -1 if killed by a signal
  int term_signal = 0;   //< Terminating signal, 0 if exited normally
  std::string output;    //< Tail of combined stdout/stderr

  bool ok() const { return launched && !canceled && exit_code == 0; }

  /**
   * @brief Human-readable diagnostic ("exit code 1: <output>").
   */
  std::string describe() const;
};

/**
 * @brief Run a shell command and wait for it.
 *
 * @attention CANCELLATION:
 *
 *   - The token is polled every 100 ms while the command runs
 *
 *   - On request the whole process group gets SIGTERM, then SIGKILL after
 *     a two second grace period
 *
 * @param command Command line passed to `/bin/sh -c`
 * @param token Cancellation token
 * @return Result; never throws for command failures
 */
ProcessResult run_shell_command(const std::string &command,
                                const CancellationToken &token);

} // namespace transync

#endif // TRANSYNC_PROCESS_HPP
