/**
 * @file cli.hpp
 * @brief Command-line parsing into SyncOptions
 */

#ifndef TRANSYNC_CLI_HPP
#define TRANSYNC_CLI_HPP

#include <functional>
#include <string>

#include "config.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace transync {

/**
 * @enum CliAction
 * @brief What main() should do after parsing.
 */
enum class CliAction { Run, Help };

/**
 * @brief Parse argv on top of the environment defaults in `options`.
 *
 * @note Usage: transync [options] SOURCE_DIR DEST_DIR
 *
 * @throws ConfigError on unknown options, bad values or a wrong number of
 *         positional arguments
 */
CliAction parse_arguments(int argc, char *argv[], SyncOptions &options);

/**
 * @brief Usage text for --help and usage errors.
 */
std::string usage(const char *program);

/**
 * @brief Run a sync, print its summary and map the outcome to an exit code.
 *
 * @details Any exception escaping `run` is logged and reported as
 *          RunStatus::SetupError after the stack has unwound, so staging
 *          and in-flight files are cleaned up on the way out.
 */
int run_guarded(const std::function<RunReport()> &run, const Logger &logger);

} // namespace transync

#endif // TRANSYNC_CLI_HPP
