/**
 * @file types.hpp
 * @brief Core data types and constants for transync
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Fingerprint tag constants
 *
 *          - JobRecord for one source-to-destination mapping
 *
 *          - StageResult carried across the worker-pool boundary
 *
 *          - RunStatus / RunReport for terminal reporting
 */

#ifndef TRANSYNC_TYPES_HPP
#define TRANSYNC_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace transync {

namespace fs = std::filesystem;

// **----- CONSTANTS -----**

/**
 * @brief Metadata key holding the source fingerprint inside transcoded files.
 * @note Written by the encoder, read back through the container's tag
 *       namespace. Lookups are case-insensitive.
 */
constexpr const char *FINGERPRINT_TAG = "transync_fingerprint";

/// Number of digest bytes kept in the fingerprint (hex encoded on disk)
constexpr size_t FINGERPRINT_BYTES = 32;

/**
 * @brief CPU cache line size for alignment.
 * @note Aligning shared counters to cache lines prevents false sharing
 *       between the transcode workers.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

// **----- DATA STRUCTURES -----**

/**
 * @enum Staleness
 * @brief Cached staleness verdict of a job.
 */
enum class Staleness : uint8_t {
  Unknown,   //< Not computed yet
  Stale,     //< Destination must be (re)produced
  UpToDate   //< Destination already reflects the source
};

/**
 * @struct JobRecord
 * @brief One source-tree file and where it lands in the destination tree.
 *
 * @attention The identity fields are fixed at construction by the
 *            JobScanner. Only the staleness verdict, the cached source
 *            fingerprint and the transient staged path are written later,
 *            each by exactly one stage.
 */
struct JobRecord {
  fs::path source_path;                       //< Absolute source file
  fs::path dest_path;                         //< Absolute destination file
  fs::path relative_path;                     //< Source path relative to root
  bool needs_transcode = false;               //< Source ext in format set
  std::optional<std::string> encoder_options; //< User encoder options
  bool checksum_mode = true;                  //< Fingerprint vs mtime

  Staleness staleness = Staleness::Unknown;      //< Cached verdict
  std::optional<std::string> source_fingerprint; //< Cached source digest
  std::optional<fs::path> staged_path;           //< Set during transcode
};

/**
 * @enum FailureKind
 * @brief Classification of a per-file failure.
 */
enum class FailureKind : uint8_t {
  None,       //< No failure
  Encoder,    //< Encoder exited non-zero or could not run
  Transfer,   //< Copy into the destination tree failed
  Canceled,   //< Work was aborted by a cancellation request
  Unexpected  //< An exception escaped a per-job unit of work
};

/**
 * @struct StageResult
 * @brief Tagged result returned (never thrown) across a stage boundary.
 * @note On success, payload holds the bytes to place at the job's
 *       destination: the staged transcode or the source file itself.
 */
struct StageResult {
  JobRecord *job = nullptr;
  fs::path payload;
  FailureKind failure = FailureKind::None;
  std::string detail;

  bool ok() const { return failure == FailureKind::None; }

  static StageResult success(JobRecord *job, fs::path payload) {
    StageResult r;
    r.job = job;
    r.payload = std::move(payload);
    return r;
  }

  static StageResult fail(JobRecord *job, FailureKind kind,
                          std::string detail) {
    StageResult r;
    r.job = job;
    r.failure = kind;
    r.detail = std::move(detail);
    return r;
  }
};

/**
 * @enum RunStatus
 * @brief Terminal state of a run. Values double as process exit codes.
 */
enum class RunStatus : int {
  Finished = 0,           //< Every stale file was produced
  FinishedWithErrors = 1, //< Some per-file failures were recorded
  SetupError = 2,         //< Fatal configuration or path error
  Canceled = 130          //< External interrupt (failures may co-exist)
};

/**
 * @struct RunReport
 * @brief Counters and failure list produced by one run.
 */
struct RunReport {
  RunStatus status = RunStatus::Finished;
  size_t total = 0;      //< Job records scanned
  size_t up_to_date = 0; //< Jobs skipped as not stale
  size_t transcoded = 0; //< Jobs transcoded and transferred
  size_t copied = 0;     //< Jobs copied verbatim
  size_t deleted = 0;    //< Extraneous destination files removed
  std::vector<std::string> failures; //< Source paths of failed jobs
  double elapsed_sec = 0;
};

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T operator++() { return ++value; }
  T operator++(int) { return value++; }
  PaddedAtomic &operator+=(T v) {
    value += v;
    return *this;
  }
};

} // namespace transync

#endif // TRANSYNC_TYPES_HPP
