/**
 * @file test_common.hpp
 * @brief Minimal test harness, scratch directories and in-process fakes
 */

#ifndef TRANSYNC_TEST_COMMON_HPP
#define TRANSYNC_TEST_COMMON_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "transync/cancellation.hpp"
#include "transync/copier.hpp"
#include "transync/fingerprint.hpp"
#include "transync/transcoder.hpp"
#include "transync/types.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                         \
  do {                                                                         \
    printf("  %-44s", #name);                                                  \
    fflush(stdout);                                                            \
    try {                                                                      \
      test_##name();                                                           \
      printf(" OK\n");                                                         \
      tests_passed++;                                                          \
    } catch (const std::exception &e) {                                        \
      printf(" FAIL: %s\n", e.what());                                         \
      tests_failed++;                                                          \
    }                                                                          \
  } while (0)

#define ASSERT(cond)                                                           \
  do {                                                                         \
    if (!(cond)) {                                                             \
      throw std::runtime_error("Assertion failed: " #cond);                    \
    }                                                                          \
  } while (0)

#define ASSERT_EQ(a, b)                                                        \
  do {                                                                         \
    if (!((a) == (b))) {                                                       \
      throw std::runtime_error("Assertion failed: " #a " == " #b);             \
    }                                                                          \
  } while (0)

#define ASSERT_NE(a, b)                                                        \
  do {                                                                         \
    if ((a) == (b)) {                                                          \
      throw std::runtime_error("Assertion failed: " #a " != " #b);             \
    }                                                                          \
  } while (0)

#define ASSERT_THROWS(expr, exc_type)                                          \
  do {                                                                         \
    bool caught = false;                                                       \
    try {                                                                      \
      expr;                                                                    \
    } catch (const exc_type &) {                                               \
      caught = true;                                                           \
    }                                                                          \
    if (!caught) {                                                             \
      throw std::runtime_error("Expected " #exc_type " from " #expr);          \
    }                                                                          \
  } while (0)

#define TEST_SUMMARY()                                                         \
  do {                                                                         \
    if (tests_failed > 0) {                                                    \
      printf("\n%d tests passed, %d FAILED\n", tests_passed, tests_failed);    \
    } else {                                                                   \
      printf("\n%d tests passed\n", tests_passed);                             \
    }                                                                          \
  } while (0)

namespace transync_test {

namespace fs = std::filesystem;
using namespace transync;

// **---- Scratch files ----**

/// Private directory under /tmp, removed with everything in it
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "transync-test-XXXXXX").string();
    if (!::mkdtemp(tmpl.data()))
      throw std::runtime_error("mkdtemp failed");
    path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const fs::path &rel) const { return path_ / rel; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  if (!out)
    throw std::runtime_error("cannot write " + path.string());
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot read " + path.string());
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

/// Move a file's mtime forward so it compares newer than anything written now
inline void touch_future(const fs::path &path, int seconds = 60) {
  fs::last_write_time(path, fs::file_time_type::clock::now() +
                                std::chrono::seconds(seconds));
}

/// Relative path -> content of every regular file under `root`
inline std::map<std::string, std::string> snapshot(const fs::path &root) {
  std::map<std::string, std::string> files;
  std::error_code ec;
  if (!fs::exists(root, ec))
    return files;
  for (const auto &entry : fs::recursive_directory_iterator(root)) {
    if (entry.is_regular_file())
      files[entry.path().lexically_relative(root).string()] =
          read_file(entry.path());
  }
  return files;
}

inline size_t count_entries(const fs::path &root) {
  size_t n = 0;
  for (auto it = fs::directory_iterator(root); it != fs::directory_iterator();
       ++it)
    ++n;
  return n;
}

// **---- Fakes ----**

constexpr const char *FAKE_TAG_PREFIX = "FINGERPRINT=";

/// Reads the fingerprint from the first line of the file
class FakeTagReader : public TagReader {
public:
  std::optional<std::string>
  read_fingerprint(const fs::path &path) const override {
    ++reads;
    std::ifstream in(path, std::ios::binary);
    std::string line;
    if (!in || !std::getline(in, line))
      return std::nullopt;
    std::string prefix = FAKE_TAG_PREFIX;
    if (line.compare(0, prefix.size(), prefix) != 0 ||
        line.size() == prefix.size())
      return std::nullopt;
    return line.substr(prefix.size());
  }

  mutable std::atomic<int> reads{0};
};

/**
 * Writes "FINGERPRINT=<hex>" (checksum mode) then "DATA=" plus the source
 * bytes. Fails every job whose relative path is in `fail`. With
 * `cancel_after` set, requests `cancel_token` when that many calls started.
 */
class FakeTranscoder : public Transcoder {
public:
  StageResult transcode(const JobRecord &job, const fs::path &output,
                        const CancellationToken &) override {
    int call = ++calls;
    {
      std::lock_guard<std::mutex> lock(mutex);
      seen.insert(job.relative_path.string());
    }

    if (cancel_token && call >= cancel_after) {
      cancel_token->request();
      return StageResult::fail(nullptr, FailureKind::Canceled, "canceled");
    }
    if (fail.count(job.relative_path.string()))
      return StageResult::fail(nullptr, FailureKind::Encoder,
                               "exit code 1: fake encoder failure");

    std::string body;
    if (job.source_fingerprint)
      body += FAKE_TAG_PREFIX + *job.source_fingerprint + "\n";
    body += "DATA=" + read_file(job.source_path);
    write_file(output, body);
    return StageResult::success(nullptr, output);
  }

  std::atomic<int> calls{0};
  std::set<std::string> fail;
  CancellationToken *cancel_token = nullptr;
  int cancel_after = 1;
  std::mutex mutex;
  std::set<std::string> seen;
};

/**
 * Leaves a half-written temp next to the destination, then cancels,
 * as a real copy would when interrupted mid-write.
 */
class CancelingCopier : public Copier {
public:
  explicit CancelingCopier(CancellationToken &token) : token_(token) {}

  StageResult copy(const fs::path &, const fs::path &to,
                   InFlightFile &in_flight,
                   const CancellationToken &) override {
    temp = to.parent_path() / ("." + to.filename().string() + ".partial");
    write_file(temp, "half");
    in_flight.track(temp);
    token_.request();
    return StageResult::fail(nullptr, FailureKind::Canceled, "canceled");
  }

  std::string name() const override { return "canceling"; }

  fs::path temp;

private:
  CancellationToken &token_;
};

} // namespace transync_test

#endif // TRANSYNC_TEST_COMMON_HPP
