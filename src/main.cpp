/**
 * @file main.cpp
 * @brief Entry point for transync
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing on top of environment defaults
 *
 *          - Wiring the encoder, copy utility and tag reader into a
 *            SyncPipeline
 *
 *          - Mapping the run outcome to the process exit code
 *
 * @note Exit codes: 0 finished, 1 finished with per-file failures,
 *       2 setup or unexpected fatal error, 130 canceled (SIGINT/SIGTERM).
 */

#include <cstdio>
#include <memory>

#include <fmt/core.h>

#include "transync/cancellation.hpp"
#include "transync/cli.hpp"
#include "transync/config.hpp"
#include "transync/copier.hpp"
#include "transync/fingerprint.hpp"
#include "transync/logging.hpp"
#include "transync/pipeline.hpp"
#include "transync/system.hpp"
#include "transync/transcoder.hpp"

using namespace transync;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  SyncOptions options;
  Logger logger;

  try {
    if (parse_arguments(argc, argv, options) == CliAction::Help) {
      fmt::print("{}", usage(argv[0]));
      return 0;
    }
  } catch (const ConfigError &e) {
    logger.error("{}", e.what());
    fmt::print(stderr, "{}", usage(argv[0]));
    return static_cast<int>(RunStatus::SetupError);
  }

  logger.set_verbosity(options.verbosity);

  CancellationToken token;
  SignalGuard signals(token);

  /// Missing tools are only fatal for the files that need them
  if (!options.dry_run && !find_executable(options.encoder_path))
    logger.warn("Encoder '{}' not found; transcoding will fail",
                options.encoder_path);

  AvTagReader tags;
  FFmpegTranscoder transcoder(options.encoder_path, logger);
  std::unique_ptr<Copier> copier = make_copier(options.copy_utility, logger);
  logger.debug("Copying with {}", copier->name());

  return run_guarded(
      [&] {
        SyncPipeline pipeline(options, logger, transcoder, *copier, tags,
                              token);
        return pipeline.run();
      },
      logger);
}
