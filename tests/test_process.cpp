/**
 * @file test_process.cpp
 * @brief Tests for the shell runner and the FFmpeg command wrapper
 */

#include <chrono>
#include <string>
#include <thread>

#include <sys/stat.h>

#include "test_common.hpp"
#include "transync/logging.hpp"
#include "transync/process.hpp"
#include "transync/system.hpp"
#include "transync/transcoder.hpp"

using namespace transync_test;

namespace {

Logger quiet_logger(Verbosity::Quiet);

/// Stand-in encoder: touches its last argument (the output), or fails
fs::path write_script(const TempDir &dir, const std::string &name,
                      const std::string &body) {
  fs::path path = dir / name;
  write_file(path, "#!/bin/sh\n" + body + "\n");
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
  return path;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// **---- run_shell_command ----**

TEST(captures_output_and_exit_code) {
  CancellationToken token;
  ProcessResult ok = run_shell_command("echo hello", token);
  ASSERT(ok.ok());
  ASSERT_EQ(ok.exit_code, 0);
  ASSERT_EQ(ok.output, "hello\n");

  ProcessResult bad = run_shell_command("echo oops >&2; exit 3", token);
  ASSERT(!bad.ok());
  ASSERT_EQ(bad.exit_code, 3);
  ASSERT_EQ(bad.describe(), "exit code 3: oops");
}

TEST(child_reads_empty_stdin) {
  CancellationToken token;
  ProcessResult r = run_shell_command("cat", token);
  ASSERT(r.ok());
  ASSERT(r.output.empty());
}

TEST(quoted_arguments_survive_the_shell) {
  CancellationToken token;
  std::string tricky = "it's a \"file\" $HOME `x`";
  ProcessResult r =
      run_shell_command("printf %s " + shell_quote(tricky), token);
  ASSERT(r.ok());
  ASSERT_EQ(r.output, tricky);
}

TEST(long_output_is_truncated_to_tail) {
  CancellationToken token;
  ProcessResult r = run_shell_command(
      "i=0; while [ $i -lt 4000 ]; do echo line$i; i=$((i+1)); done", token);
  ASSERT(r.ok());
  ASSERT(r.output.size() <= 16 * 1024);
  ASSERT(contains(r.output, "line3999"));
}

TEST(cancellation_kills_process_group) {
  CancellationToken token;
  std::thread canceler([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    token.request();
  });

  auto start = std::chrono::steady_clock::now();
  ProcessResult r = run_shell_command("sleep 30 & sleep 30; wait", token);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceler.join();

  ASSERT(r.canceled);
  ASSERT(!r.ok());
  ASSERT(elapsed < std::chrono::seconds(10));
  ASSERT_EQ(r.describe(), "canceled");
}

TEST(signal_exit_is_reported) {
  CancellationToken token;
  ProcessResult r = run_shell_command("kill -9 $$", token);
  ASSERT(!r.ok());
  ASSERT_EQ(r.term_signal, 9);
  ASSERT(contains(r.describe(), "signal 9"));
}

// **---- System helpers ----**

TEST(find_executable_searches_path) {
  auto sh = find_executable("sh");
  ASSERT(sh.has_value());
  ASSERT(fs::path(*sh).is_absolute());
  ASSERT(!find_executable("transync-no-such-tool").has_value());
  ASSERT(find_executable("/bin/sh").has_value());
}

TEST(cpu_limit_is_clamped) {
  int cpus = detect_cpu_limit();
  ASSERT(cpus >= 1);
  ASSERT(cpus <= 64);
}

// **---- FFmpegTranscoder ----**

TEST(default_options_table) {
  ASSERT(contains(default_encoder_options("mp3"), "libmp3lame"));
  ASSERT(contains(default_encoder_options("ogg"), "libvorbis"));
  ASSERT(contains(default_encoder_options("aac"), "-vn "));
  ASSERT(contains(default_encoder_options("m4a"), "aac -b:a 192k"));
  ASSERT_EQ(default_encoder_options("mp4"), default_encoder_options("m4a"));
  ASSERT(contains(default_encoder_options("opus"), "libopus"));
  ASSERT(default_encoder_options("xyz").empty());
}

TEST(command_embeds_fingerprint_and_options) {
  FFmpegTranscoder transcoder("ffmpeg", quiet_logger);
  JobRecord job;
  job.source_path = "/music/My Song.flac";
  job.needs_transcode = true;
  job.source_fingerprint = std::string("abcd");

  std::string cmd = transcoder.build_command(job, "/stage/My Song.m4a");
  ASSERT(contains(cmd, "-i '/music/My Song.flac'"));
  ASSERT(contains(cmd, "-map_metadata 0"));
  ASSERT(contains(cmd, default_encoder_options("m4a")));
  ASSERT(contains(cmd, "-movflags use_metadata_tags"));
  ASSERT(!contains(cmd, "-write_id3v2"));
  ASSERT(contains(cmd, "-metadata 'transync_fingerprint=abcd'"));
  ASSERT(cmd.size() > 20 &&
         cmd.compare(cmd.size() - 20, 20, "'/stage/My Song.m4a'") == 0);

  cmd = transcoder.build_command(job, "/stage/My Song.aac");
  ASSERT(contains(cmd, "-vn -codec:a aac"));
  ASSERT(contains(cmd, "-write_id3v2 1"));
  ASSERT(!contains(cmd, "-movflags"));
  ASSERT(contains(cmd, "-metadata 'transync_fingerprint=abcd'"));

  job.encoder_options = std::string("-b:a 64k");
  job.checksum_mode = false;
  cmd = transcoder.build_command(job, "/stage/My Song.mp3");
  ASSERT(contains(cmd, " -b:a 64k "));
  ASSERT(!contains(cmd, "libmp3lame"));
  ASSERT(!contains(cmd, "transync_fingerprint"));
  ASSERT(!contains(cmd, "-movflags"));

  job.encoder_options.reset();
  cmd = transcoder.build_command(job, "/stage/My Song.aac");
  ASSERT(!contains(cmd, "-write_id3v2"));
}

TEST(successful_encoder_produces_output) {
  TempDir dir;
  fs::path enc = write_script(dir, "enc", "for a; do last=\"$a\"; done; "
                                          "echo encoded > \"$last\"");
  write_file(dir / "in.flac", "x");
  JobRecord job;
  job.source_path = dir / "in.flac";

  FFmpegTranscoder transcoder(enc.string(), quiet_logger);
  CancellationToken token;
  StageResult r = transcoder.transcode(job, dir / "out.mp3", token);
  ASSERT(r.ok());
  ASSERT_EQ(r.payload, dir / "out.mp3");
  ASSERT_EQ(read_file(dir / "out.mp3"), "encoded\n");
}

TEST(failing_encoder_leaves_no_output) {
  TempDir dir;
  fs::path enc = write_script(dir, "enc", "for a; do last=\"$a\"; done; "
                                          "echo partial > \"$last\"; "
                                          "echo 'Invalid data' >&2; exit 1");
  write_file(dir / "in.flac", "x");
  JobRecord job;
  job.source_path = dir / "in.flac";

  FFmpegTranscoder transcoder(enc.string(), quiet_logger);
  CancellationToken token;
  StageResult r = transcoder.transcode(job, dir / "out.mp3", token);
  ASSERT_EQ(r.failure, FailureKind::Encoder);
  ASSERT(contains(r.detail, "Invalid data"));
  ASSERT(!fs::exists(dir / "out.mp3"));
}

TEST(missing_encoder_is_an_encoder_failure) {
  TempDir dir;
  JobRecord job;
  job.source_path = dir / "in.flac";
  FFmpegTranscoder transcoder((dir / "no-encoder").string(), quiet_logger);
  CancellationToken token;
  StageResult r = transcoder.transcode(job, dir / "out.mp3", token);
  ASSERT_EQ(r.failure, FailureKind::Encoder);
  ASSERT(contains(r.detail, "exit code 127"));
}

int main() {
  printf("transync process tests\n");

  RUN_TEST(captures_output_and_exit_code);
  RUN_TEST(child_reads_empty_stdin);
  RUN_TEST(quoted_arguments_survive_the_shell);
  RUN_TEST(long_output_is_truncated_to_tail);
  RUN_TEST(cancellation_kills_process_group);
  RUN_TEST(signal_exit_is_reported);
  RUN_TEST(find_executable_searches_path);
  RUN_TEST(cpu_limit_is_clamped);
  RUN_TEST(default_options_table);
  RUN_TEST(command_embeds_fingerprint_and_options);
  RUN_TEST(successful_encoder_produces_output);
  RUN_TEST(failing_encoder_leaves_no_output);
  RUN_TEST(missing_encoder_is_an_encoder_failure);

  TEST_SUMMARY();
  return tests_failed > 0 ? 1 : 0;
}
