/**
 * @file test_copier.cpp
 * @brief Tests for atomic copies, in-flight tracking and staging cleanup
 */

#include <string>
#include <vector>

#include <sys/stat.h>

#include "test_common.hpp"
#include "transync/copier.hpp"
#include "transync/logging.hpp"
#include "transync/staging.hpp"

using namespace transync_test;

namespace {

Logger quiet_logger(Verbosity::Quiet);

/// Entries in `dir` other than `keep`
std::vector<std::string> leftovers(const fs::path &dir, const std::string &keep) {
  std::vector<std::string> out;
  for (const auto &entry : fs::directory_iterator(dir)) {
    std::string name = entry.path().filename().string();
    if (name != keep)
      out.push_back(name);
  }
  return out;
}

} // anonymous namespace

// **---- PlainCopier ----**

TEST(plain_copy_places_file_atomically) {
  TempDir dir;
  write_file(dir / "src/a.txt", "payload");
  fs::create_directories(dir / "dst");
  ::chmod((dir / "src/a.txt").c_str(), 0640);

  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  StageResult r = copier.copy(dir / "src/a.txt", dir / "dst/a.txt", in_flight,
                              token);
  ASSERT(r.ok());
  ASSERT_EQ(read_file(dir / "dst/a.txt"), "payload");
  ASSERT(!in_flight.path().has_value());
  ASSERT(leftovers(dir / "dst", "a.txt").empty());

  auto perms = fs::status(dir / "dst/a.txt").permissions();
  ASSERT((perms & fs::perms::others_read) == fs::perms::none);
  ASSERT((perms & fs::perms::owner_read) != fs::perms::none);
}

TEST(plain_copy_overwrites_existing) {
  TempDir dir;
  write_file(dir / "a.txt", "new");
  write_file(dir / "out/a.txt", "old contents");

  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  ASSERT(copier.copy(dir / "a.txt", dir / "out/a.txt", in_flight, token).ok());
  ASSERT_EQ(read_file(dir / "out/a.txt"), "new");
}

TEST(plain_copy_of_empty_file) {
  TempDir dir;
  write_file(dir / "empty", "");
  fs::create_directories(dir / "out");

  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  ASSERT(copier.copy(dir / "empty", dir / "out/empty", in_flight, token).ok());
  ASSERT_EQ(fs::file_size(dir / "out/empty"), 0u);
}

TEST(missing_source_is_transfer_failure) {
  TempDir dir;
  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  StageResult r = copier.copy(dir / "nope", dir / "out", in_flight, token);
  ASSERT_EQ(r.failure, FailureKind::Transfer);
  ASSERT(!fs::exists(dir / "out"));
}

TEST(missing_parent_is_transfer_failure) {
  TempDir dir;
  write_file(dir / "a.txt", "x");
  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  StageResult r =
      copier.copy(dir / "a.txt", dir / "no/such/dir/a.txt", in_flight, token);
  ASSERT_EQ(r.failure, FailureKind::Transfer);
  ASSERT(!in_flight.path().has_value());
}

TEST(canceled_copy_leaves_temp_tracked) {
  TempDir dir;
  write_file(dir / "big.bin", std::string(3 << 20, 'x'));
  fs::create_directories(dir / "out");

  PlainCopier copier;
  InFlightFile in_flight;
  CancellationToken token;
  token.request();
  StageResult r = copier.copy(dir / "big.bin", dir / "out/big.bin", in_flight,
                              token);
  ASSERT_EQ(r.failure, FailureKind::Canceled);
  ASSERT(!fs::exists(dir / "out/big.bin"));
  ASSERT(in_flight.path().has_value());
  ASSERT(fs::exists(*in_flight.path()));

  ASSERT(in_flight.discard());
  ASSERT(fs::is_empty(dir / "out"));
}

// **---- InFlightFile ----**

TEST(in_flight_file_removed_on_destruction) {
  TempDir dir;
  write_file(dir / "partial", "half");
  {
    InFlightFile in_flight;
    in_flight.track(dir / "partial");
  }
  ASSERT(!fs::exists(dir / "partial"));
}

TEST(committed_file_is_kept) {
  TempDir dir;
  write_file(dir / "done", "full");
  {
    InFlightFile in_flight;
    in_flight.track(dir / "done");
    in_flight.commit();
    ASSERT(!in_flight.discard());
  }
  ASSERT(fs::exists(dir / "done"));
}

// **---- make_copier ----**

TEST(unknown_utility_falls_back_to_plain_copy) {
  auto copier = make_copier("transync-no-such-copier", quiet_logger);
  ASSERT_EQ(copier->name(), "plain copy");
  ASSERT_EQ(make_copier("", quiet_logger)->name(), "plain copy");

  auto sh = make_copier("sh", quiet_logger);
  ASSERT_EQ(sh->name(), "rsync");
}

TEST(rsync_transfers_even_when_size_and_mtime_match) {
  RsyncCopier rsync("rsync", quiet_logger);
  std::string cmd = rsync.build_command("/src/a b.mp3", "/dst/a b.mp3");
  ASSERT(cmd.find("--ignore-times") != std::string::npos);
  ASSERT(cmd.find("--times") != std::string::npos);
  ASSERT(cmd.find("'/src/a b.mp3'") != std::string::npos);
  ASSERT(cmd.find("'/dst/a b.mp3'") != std::string::npos);
}

// **---- StagingDirectory ----**

TEST(staging_directory_is_private_and_removed) {
  TempDir parent;
  fs::path path;
  {
    StagingDirectory staging(parent.path());
    path = staging.path();
    ASSERT(fs::is_directory(path));
    ASSERT_EQ(path.parent_path(), parent.path());
    ASSERT(path.filename().string().rfind("transync-", 0) == 0);

    fs::path staged = staging.staged_path_for("Artist/Song.flac", "mp3");
    ASSERT_EQ(staged, path / "Artist/Song.flac.mp3");
    write_file(staged, "encoded");
  }
  ASSERT(!fs::exists(path));
}

TEST(staged_paths_keep_source_extension) {
  TempDir parent;
  StagingDirectory staging(parent.path());
  fs::path flac = staging.staged_path_for("a.flac", "mp3");
  fs::path wav = staging.staged_path_for("a.wav", "mp3");
  ASSERT_NE(flac, wav);
  ASSERT_EQ(flac.extension(), ".mp3");
}

TEST(staging_remove_is_idempotent) {
  TempDir parent;
  StagingDirectory staging(parent.path());
  write_file(staging.path() / "a/b.mp3", "x");
  ASSERT(staging.remove());
  ASSERT(staging.remove());
  ASSERT(!fs::exists(staging.path()));
}

TEST(staging_in_missing_parent_throws) {
  TempDir parent;
  ASSERT_THROWS(StagingDirectory(parent / "absent"), std::system_error);
}

int main() {
  printf("transync copier tests\n");

  RUN_TEST(plain_copy_places_file_atomically);
  RUN_TEST(plain_copy_overwrites_existing);
  RUN_TEST(plain_copy_of_empty_file);
  RUN_TEST(missing_source_is_transfer_failure);
  RUN_TEST(missing_parent_is_transfer_failure);
  RUN_TEST(canceled_copy_leaves_temp_tracked);
  RUN_TEST(in_flight_file_removed_on_destruction);
  RUN_TEST(committed_file_is_kept);
  RUN_TEST(unknown_utility_falls_back_to_plain_copy);
  RUN_TEST(rsync_transfers_even_when_size_and_mtime_match);
  RUN_TEST(staging_directory_is_private_and_removed);
  RUN_TEST(staged_paths_keep_source_extension);
  RUN_TEST(staging_remove_is_idempotent);
  RUN_TEST(staging_in_missing_parent_throws);

  TEST_SUMMARY();
  return tests_failed > 0 ? 1 : 0;
}
