/**
 * @file cli.cpp
 * @brief Command-line parsing implementation
 */

#include "transync/cli.hpp"

#include <cstdlib>
#include <exception>

#include <getopt.h>

#include <fmt/core.h>

#include "transync/pipeline.hpp"

namespace transync {

namespace {

int parse_job_count(const char *arg) {
  char *end = nullptr;
  long value = std::strtol(arg, &end, 10);
  if (!end || *end != '\0' || end == arg || value < 0 || value > 1024)
    throw ConfigError(
        fmt::format("Job count must be a non-negative integer, got '{}'", arg));
  return static_cast<int>(value);
}

} // anonymous namespace

std::string usage(const char *program) {
  return fmt::format(
      "Usage: {} [options] SOURCE_DIR DEST_DIR\n"
      "\n"
      "Mirror SOURCE_DIR into DEST_DIR, transcoding selected formats.\n"
      "\n"
      "  -f, --formats LIST          formats to transcode, comma separated "
      "(default: flac)\n"
      "  -t, --target FMT            target format (default: mp3)\n"
      "  -e, --encoder PATH          encoder executable (default: ffmpeg)\n"
      "  -o, --encoder-options STR   options appended to the encoder command\n"
      "  -c, --copy-utility PATH     fast-copy utility (default: rsync)\n"
      "  -T, --temp-dir DIR          parent of the staging directory\n"
      "  -j, --jobs N                transcode workers, 0 = sequential "
      "(default: CPUs)\n"
      "  -n, --dry-run               decide everything, write nothing\n"
      "  -a, --include-hidden        include dotfiles and dot-directories\n"
      "  -d, --delete                delete destination files with no source\n"
      "  -F, --force                 rewrite every destination file\n"
      "  -N, --no-checksum           compare modification times only\n"
      "  -q, --quiet                 print errors only\n"
      "  -v, --verbose               print per-file details and timings\n"
      "  -h, --help                  show this help\n"
      "\n"
      "Environment: TRANSYNC_JOBS, TRANSYNC_STALE_CHECK_THREADS, "
      "TRANSYNC_FFMPEG,\n"
      "             TRANSYNC_COPY_UTILITY, TMPDIR\n",
      program);
}

CliAction parse_arguments(int argc, char *argv[], SyncOptions &options) {
  static const struct option long_options[] = {
      {"formats", required_argument, nullptr, 'f'},
      {"target", required_argument, nullptr, 't'},
      {"encoder", required_argument, nullptr, 'e'},
      {"encoder-options", required_argument, nullptr, 'o'},
      {"copy-utility", required_argument, nullptr, 'c'},
      {"temp-dir", required_argument, nullptr, 'T'},
      {"jobs", required_argument, nullptr, 'j'},
      {"dry-run", no_argument, nullptr, 'n'},
      {"include-hidden", no_argument, nullptr, 'a'},
      {"delete", no_argument, nullptr, 'd'},
      {"force", no_argument, nullptr, 'F'},
      {"no-checksum", no_argument, nullptr, 'N'},
      {"quiet", no_argument, nullptr, 'q'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  /// getopt keeps global state; allow repeated parsing (tests)
  optind = 0;
  opterr = 0;

  int opt;
  while ((opt = getopt_long(argc, argv, ":f:t:e:o:c:T:j:nadFNqvh",
                            long_options, nullptr)) != -1) {
    switch (opt) {
    case 'f':
      options.transcode_formats = parse_format_list(optarg);
      break;
    case 't':
      options.target_format = normalize_format(optarg);
      break;
    case 'e':
      options.encoder_path = optarg;
      break;
    case 'o':
      options.encoder_options = std::string(optarg);
      break;
    case 'c':
      options.copy_utility = optarg;
      break;
    case 'T':
      options.temp_dir = optarg;
      break;
    case 'j':
      options.jobs = parse_job_count(optarg);
      break;
    case 'n':
      options.dry_run = true;
      break;
    case 'a':
      options.include_hidden = true;
      break;
    case 'd':
      options.delete_extraneous = true;
      break;
    case 'F':
      options.force = true;
      break;
    case 'N':
      options.checksum_mode = false;
      break;
    case 'q':
      options.verbosity = Verbosity::Quiet;
      break;
    case 'v':
      options.verbosity = Verbosity::Verbose;
      break;
    case 'h':
      return CliAction::Help;
    case ':':
      throw ConfigError(
          fmt::format("Option '{}' needs a value", argv[optind - 1]));
    default:
      throw ConfigError(
          fmt::format("Unknown option '{}'", argv[optind - 1]));
    }
  }

  int positional = argc - optind;
  if (positional != 2)
    throw ConfigError(fmt::format(
        "Expected SOURCE_DIR and DEST_DIR, got {} argument(s)", positional));

  options.source_dir = argv[optind];
  options.dest_dir = argv[optind + 1];
  return CliAction::Run;
}

int run_guarded(const std::function<RunReport()> &run, const Logger &logger) {
  RunReport report;
  try {
    report = run();
  } catch (const ConfigError &e) {
    logger.error("{}", e.what());
    return static_cast<int>(RunStatus::SetupError);
  } catch (const std::exception &e) {
    logger.error("Fatal: {}", e.what());
    return static_cast<int>(RunStatus::SetupError);
  }

  SyncPipeline::print_summary(report, logger);
  return static_cast<int>(report.status);
}

} // namespace transync
