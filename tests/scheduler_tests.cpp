// End-to-end scheduler tests: local backend, fake encoder (run via CTest).
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "vconv/committer.hpp"
#include "vconv/fingerprint.hpp"
#include "vconv/local_backend.hpp"
#include "vconv/processed_store.hpp"
#include "vconv/scheduler.hpp"

using namespace vconv;
using namespace vconv_test;

namespace {

/// Local filesystem presented as a remote backend with a size limit
class StagingBackend : public LocalBackend {
public:
  explicit StagingBackend(std::uint64_t limit) : limit_(limit) {}

  std::string describe() const override { return "staging-test"; }
  bool is_remote() const override { return true; }
  std::uint64_t max_transfer_bytes() const override { return limit_; }

  bool fetch(const std::string &path, const std::string &local_path,
             const AbortCheck &should_abort, std::string &err) override {
    fetched.push_back(path);
    return LocalBackend::fetch(path, local_path, should_abort, err);
  }

  std::vector<std::string> fetched;

private:
  std::uint64_t limit_;
};

/// Local backend whose atomic finalize always fails
class FailingRenameBackend : public LocalBackend {
public:
  bool rename(const std::string &, const std::string &,
              std::string &err) override {
    err = "simulated rename failure";
    return false;
  }
};

/// Uploads always go through the chunked copy, as across filesystems
class CopyingBackend : public LocalBackend {
public:
  bool put(const std::string &local_path, const std::string &path,
           const AbortCheck &should_abort, std::string &err) override {
    return copy_file_durable(local_path, path, should_abort, err);
  }
};

/// Raises a stop flag from inside the scan, as a signal arriving mid-cycle
class StopDuringListBackend : public LocalBackend {
public:
  explicit StopDuringListBackend(std::atomic<bool> &flag) : flag_(flag) {}

  bool list(const std::string &dir, std::vector<FileEntry> &out,
            std::string &err) override {
    flag_.store(true);
    return LocalBackend::list(dir, out, err);
  }

private:
  std::atomic<bool> &flag_;
};

/// Remote-style backend whose download only ends when it is aborted
class StalledFetchBackend : public LocalBackend {
public:
  explicit StalledFetchBackend(std::string marker)
      : marker_(std::move(marker)) {}

  bool is_remote() const override { return true; }

  bool fetch(const std::string &, const std::string &local_path,
             const AbortCheck &should_abort, std::string &err) override {
    write_file(local_path, "first chunk");
    write_file(marker_, "");
    const auto give_up = std::chrono::steady_clock::now() +
                         std::chrono::seconds(60);
    while (std::chrono::steady_clock::now() < give_up) {
      if (should_abort && should_abort()) {
        ::unlink(local_path.c_str());
        err = TRANSFER_CANCELLED;
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    err = "download never aborted";
    return false;
  }

private:
  std::string marker_;
};

bool wait_for_file(const std::string &path, std::chrono::seconds limit) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < until) {
    if (fs::exists(path))
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return false;
}

size_t count_entries(const std::string &dir) {
  if (!fs::exists(dir))
    return 0;
  size_t n = 0;
  for (const auto &entry : fs::directory_iterator(dir)) {
    (void)entry;
    ++n;
  }
  return n;
}

// **---- Discovery to commit ----**

void test_converts_new_file(TestContext &t) {
  TempDir tmp("sched-a");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "original bytes");
  age_file(source, 120);
  const std::int64_t source_mtime = mtime_of(source);

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  t.check(scheduler.start(err), "scheduler starts: " + err);

  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();

  const std::string output = s.roots.front() + "/a.m4v";
  t.check(report.discovered == 1 && report.dispatched == 1,
          "one candidate discovered and dispatched");
  t.check(fs::exists(output), "converted sibling exists");
  t.check(read_file(output) == "converted:" + source,
          "sibling holds the encoder output");
  t.check(fs::exists(source), "original kept");
  t.check(!fs::exists(output + PARTIAL_SUFFIX), "no partial file left");
  t.check(store.size() == 1, "exactly one fingerprint recorded");
  t.check(store.contains(fingerprint_of(source)),
          "recorded fingerprint belongs to the source path");
  t.check(mtime_of(output) == source_mtime, "output takes the source mtime");
  t.check(count_entries(s.work_dir) == 0, "work directory left empty");
  t.check(scheduler.claims().size() == 0, "claim released after commit");

  ProcessedStore reloaded(s.state_dir);
  t.check(reloaded.load() == 1, "fingerprint is durable on disk");

  const SchedulerTotals totals = scheduler.totals();
  t.check(totals.committed == 1 && totals.failed == 0,
          "totals count one commit");
}

void test_existing_output_is_never_dispatched(TestContext &t) {
  TempDir tmp("sched-b");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  write_file(s.roots.front() + "/b.mp4", "source");
  write_file(s.roots.front() + "/b.m4v", "converted earlier");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(report.output_exists == 1, "existing sibling detected");
  t.check(report.dispatched == 0, "nothing dispatched");
  t.check(encoder_invocations(tmp.path()) == 0, "encoder never ran");
  t.check(read_file(s.roots.front() + "/b.m4v") == "converted earlier",
          "existing output untouched");
  t.check(store.size() == 0, "nothing recorded");
}

void test_oversized_remote_file_is_not_downloaded(TestContext &t) {
  TempDir tmp("sched-c");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  const std::string big = s.roots.front() + "/big.mp4";
  const std::string small = s.roots.front() + "/small.mp4";
  write_file(big, std::string(100, 'x'));
  write_file(small, "tiny");

  StagingBackend backend(16);
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(report.too_large == 1, "oversized candidate skipped");
  t.check(backend.fetched.size() == 1 && backend.fetched.front() == small,
          "only the small file was downloaded");
  t.check(!fs::exists(s.roots.front() + "/big.m4v"), "big file not converted");
  t.check(fs::exists(s.roots.front() + "/small.m4v"),
          "small file converted through the staging path");
  t.check(count_entries(s.work_dir) == 0, "staged files removed");
}

void test_dry_run_mutates_nothing(TestContext &t) {
  TempDir tmp("sched-d");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.dry_run = true;
  s.keep_original = false;
  for (const char *name : {"one.mp4", "two.mkv", "three.mp4"})
    write_file(s.roots.front() + "/" + name, "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load(false);
  Scheduler scheduler(s, backend, store);
  std::string err;
  t.check(scheduler.start(err), "dry-run start succeeds");

  CycleReport report = scheduler.run_cycle();
  t.check(report.discovered == 3, "three candidates discovered");
  t.check(report.pending == 3, "three candidates pending");
  t.check(report.pending_paths.size() == 3, "pending paths listed");
  t.check(report.dispatched == 0, "nothing dispatched in dry-run");
  t.check(report.pending_by_root[s.roots.front()] == 3,
          "pending counted per root");
  t.check(count_entries(s.roots.front()) == 3, "root directory unchanged");
  t.check(!fs::exists(s.work_dir), "work directory not created");
  t.check(count_entries(s.state_dir) == 0, "state file not written");
  t.check(encoder_invocations(tmp.path()) == 0, "encoder never ran");
  t.check(scheduler.claims().size() == 0, "nothing claimed");
}

// **---- Properties ----**

void test_second_cycle_is_idempotent(TestContext &t) {
  TempDir tmp("sched-idem");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  write_file(s.roots.front() + "/a.mp4", "x");
  write_file(s.roots.front() + "/sub/b.mkv", "y");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  /// max_jobs is 1: the second file waits for a later cycle
  scheduler.run_cycle();
  scheduler.wait_idle();
  scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(store.size() == 2, "both files converted over two cycles");

  const CycleReport again = scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(again.dispatched == 0, "third cycle dispatches nothing");
  t.check(again.already_processed == 2, "both recognised as processed");
  t.check(encoder_invocations(tmp.path()) == 2, "encoder ran once per file");
}

void test_concurrent_cycles_never_double_dispatch(TestContext &t) {
  TempDir tmp("sched-claims");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.max_jobs = 4;
  const int files = 12;
  for (int i = 0; i < files; ++i)
    write_file(s.roots.front() + "/clip" + std::to_string(i) + ".mp4", "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  for (int round = 0; round < 4; ++round) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i)
      threads.emplace_back([&scheduler] { scheduler.run_cycle(); });
    for (auto &th : threads)
      th.join();
  }
  scheduler.wait_idle();
  while (store.size() < static_cast<size_t>(files)) {
    const CycleReport r = scheduler.run_cycle();
    scheduler.wait_idle();
    if (r.dispatched == 0)
      break;
  }

  t.check(store.size() == static_cast<size_t>(files), "every file converted");
  t.check(encoder_invocations(tmp.path()) == files,
          "encoder ran exactly once per file, got " +
              std::to_string(encoder_invocations(tmp.path())));
}

void test_in_place_edit_is_not_reprocessed(TestContext &t) {
  TempDir tmp("sched-inplace");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "first version");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);
  scheduler.run_cycle();
  scheduler.wait_idle();

  /// Identity is the path: new content under the same name stays processed
  fs::remove(s.roots.front() + "/a.m4v");
  write_file(source, "completely different content");
  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(report.already_processed == 1, "edited file still processed");
  t.check(report.dispatched == 0, "edited file not dispatched");
  t.check(encoder_invocations(tmp.path()) == 1, "encoder ran only once");
}

void test_persist_failure_keeps_source(TestContext &t) {
  TempDir tmp("sched-persist");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.keep_original = false;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  fs::remove_all(s.state_dir);
  scheduler.run_cycle();
  scheduler.wait_idle();

  t.check(fs::exists(s.roots.front() + "/a.m4v"),
          "output was finalized before the persist attempt");
  t.check(fs::exists(source), "source kept when the record failed");
  t.check(!store.contains(fingerprint_of(source)), "fingerprint not recorded");
  t.check(scheduler.totals().failed == 1, "job counted as failed");
  t.check(scheduler.failure_count(fingerprint_of(source)) == 1,
          "failure tracked for the fingerprint");
}

void test_finalize_failure_leaves_no_output(TestContext &t) {
  TempDir tmp("sched-rename");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.keep_original = false;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  FailingRenameBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);
  scheduler.run_cycle();
  scheduler.wait_idle();

  const std::string output = s.roots.front() + "/a.m4v";
  t.check(!fs::exists(output), "no output at the final name");
  t.check(!fs::exists(output + PARTIAL_SUFFIX), "partial upload discarded");
  t.check(fs::exists(source), "source kept");
  t.check(store.size() == 0, "nothing recorded");
  t.check(count_entries(s.work_dir) == 1,
          "only the encoder log is kept for the failed job");
}

void test_encoder_failures_are_tracked(TestContext &t) {
  TempDir tmp("sched-fail");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::FailsExit);
  Settings s = base_settings(tmp, encoder);
  s.failure_threshold = 2;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  for (int i = 0; i < 3; ++i) {
    scheduler.run_cycle();
    scheduler.wait_idle();
  }
  t.check(scheduler.failure_count(fingerprint_of(source)) == 3,
          "each cycle retries and counts the failure");
  t.check(store.size() == 0, "failed file never recorded");
  t.check(!fs::exists(s.roots.front() + "/a.m4v"), "no output produced");
  t.check(scheduler.claims().size() == 0, "claim released after failure");
}

void test_too_young_file_waits(TestContext &t) {
  TempDir tmp("sched-young");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.min_file_age_sec = 3600;
  write_file(s.roots.front() + "/fresh.mp4", "x");
  write_file(s.roots.front() + "/settled.mp4", "x");
  age_file(s.roots.front() + "/settled.mp4", 7200);

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);
  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(report.too_young == 1, "recently modified file deferred");
  t.check(fs::exists(s.roots.front() + "/settled.m4v"),
          "settled file converted");
  t.check(!fs::exists(s.roots.front() + "/fresh.m4v"),
          "fresh file left alone");
}

void test_original_removed_when_not_kept(TestContext &t) {
  TempDir tmp("sched-remove");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.keep_original = false;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);
  scheduler.run_cycle();
  scheduler.wait_idle();
  t.check(fs::exists(s.roots.front() + "/a.m4v"), "output committed");
  t.check(!fs::exists(source), "original removed after commit");
  t.check(store.contains(fingerprint_of(source)), "fingerprint recorded");
}

void test_stop_abandons_running_job(TestContext &t) {
  TempDir tmp("sched-stop");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Hangs);
  Settings s = base_settings(tmp, encoder);
  s.shutdown_grace_sec = 0;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");
  write_file(s.roots.front() + "/b.mp4", "y");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  const CycleReport report = scheduler.run_cycle();
  t.check(report.dispatched == 1 && report.deferred == 1,
          "one job dispatched, one deferred for capacity");
  t.check(wait_for_file(tmp.sub("started"), std::chrono::seconds(10)),
          "encoder started");

  scheduler.stop();
  const SchedulerTotals totals = scheduler.totals();
  t.check(totals.abandoned == 1, "running job abandoned");
  t.check(totals.committed == 0, "nothing committed");
  t.check(store.size() == 0, "abandoned job not recorded");
  t.check(fs::exists(source), "source untouched");
  t.check(!fs::exists(s.roots.front() + "/a.m4v"), "no output committed");
  t.check(scheduler.claims().size() == 0, "claims released");
  t.check(scheduler.run_cycle().skipped, "no cycle runs after stop");
}

void test_job_finishing_within_grace_is_committed(TestContext &t) {
  TempDir tmp("sched-grace");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Slow);
  Settings s = base_settings(tmp, encoder);
  s.shutdown_grace_sec = 30;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  LocalBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  scheduler.run_cycle();
  t.check(wait_for_file(tmp.sub("started"), std::chrono::seconds(10)),
          "encoder started before the stop");
  scheduler.stop();

  const SchedulerTotals totals = scheduler.totals();
  t.check(totals.committed == 1, "job inside the grace period committed");
  t.check(totals.abandoned == 0, "nothing abandoned");
  t.check(store.contains(fingerprint_of(source)), "fingerprint recorded");
  t.check(read_file(s.roots.front() + "/a.m4v") == "converted:" + source,
          "output finalized");
}

void test_stop_signal_halts_dispatch_mid_cycle(TestContext &t) {
  TempDir tmp("sched-signal");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.max_jobs = 3;
  for (const char *name : {"a.mp4", "b.mp4", "c.mp4"})
    write_file(s.roots.front() + "/" + name, "x");

  std::atomic<bool> stop_flag{false};
  StopDuringListBackend backend(stop_flag);
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  /// Returns on its own: the flag is raised during the first scan
  scheduler.run(stop_flag);
  t.check(scheduler.stopping(), "signal started the shutdown");
  scheduler.stop();

  const SchedulerTotals totals = scheduler.totals();
  t.check(totals.dispatched == 0,
          "nothing dispatched after the signal, got " +
              std::to_string(totals.dispatched));
  t.check(encoder_invocations(tmp.path()) == 0, "encoder never ran");
  t.check(store.size() == 0, "nothing recorded");
  t.check(scheduler.claims().size() == 0, "nothing left claimed");
}

void test_stop_cancels_stalled_download(TestContext &t) {
  TempDir tmp("sched-fetch-stop");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.shutdown_grace_sec = 0;
  const std::string source = s.roots.front() + "/a.mp4";
  write_file(source, "x");

  StalledFetchBackend backend(tmp.sub("downloading"));
  ProcessedStore store(s.state_dir);
  store.load();
  Scheduler scheduler(s, backend, store);
  std::string err;
  scheduler.start(err);

  scheduler.run_cycle();
  t.check(wait_for_file(tmp.sub("downloading"), std::chrono::seconds(10)),
          "download started");

  const auto before = std::chrono::steady_clock::now();
  scheduler.stop();
  const auto waited = std::chrono::steady_clock::now() - before;
  t.check(waited < std::chrono::seconds(5),
          "stop does not wait for the download to finish");

  const SchedulerTotals totals = scheduler.totals();
  t.check(totals.abandoned == 1, "download abandoned");
  t.check(totals.failed == 0, "abandonment is not a failure");
  t.check(encoder_invocations(tmp.path()) == 0, "encoder never ran");
  t.check(count_entries(s.work_dir) == 0, "staged download removed");
  t.check(store.size() == 0, "nothing recorded");
  t.check(fs::exists(source), "source untouched");
}

void test_restart_after_lost_record_keeps_output(TestContext &t) {
  TempDir tmp("sched-restart");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  s.keep_original = false;
  const std::string source = s.roots.front() + "/a.mp4";
  const std::string output = s.roots.front() + "/a.m4v";
  write_file(source, "x");

  LocalBackend backend;
  {
    /// Output finalized, then the record is lost as if the process died
    ProcessedStore store(s.state_dir);
    store.load();
    Scheduler scheduler(s, backend, store);
    std::string err;
    scheduler.start(err);
    fs::remove_all(s.state_dir);
    scheduler.run_cycle();
    scheduler.wait_idle();
    scheduler.stop();
  }
  fs::create_directories(s.state_dir);
  const std::string finalized = read_file(output);

  ProcessedStore store(s.state_dir);
  t.check(store.load() == 0, "restarted store has no record");
  Scheduler scheduler(s, backend, store);
  std::string err;
  t.check(scheduler.start(err), "restarted scheduler starts: " + err);
  const CycleReport report = scheduler.run_cycle();
  scheduler.wait_idle();

  t.check(report.output_exists == 1, "existing output recognised on restart");
  t.check(report.dispatched == 0, "source not converted again");
  t.check(encoder_invocations(tmp.path()) == 1, "encoder ran only once");
  t.check(read_file(output) == finalized && !finalized.empty(),
          "output survives the restart intact");
  t.check(fs::exists(source), "source kept while unrecorded");
  t.check(store.size() == 0, "fingerprint never recorded without its run");
}

void test_cancelled_upload_is_abandoned(TestContext &t) {
  TempDir tmp("sched-put-abort");
  const auto encoder = make_fake_encoder(tmp.path(), FakeEncoder::Succeeds);
  Settings s = base_settings(tmp, encoder);
  fs::create_directories(s.work_dir);

  Job job;
  job.candidate.path = s.roots.front() + "/a.mp4";
  job.fingerprint = fingerprint_of(job.candidate.path);
  job.destination = s.roots.front() + "/a.m4v";
  job.staged_output = s.work_dir + "/out.m4v";
  write_file(job.candidate.path, "x");
  write_file(job.staged_output, std::string(2 * TRANSFER_CHUNK_SIZE, 'o'));

  CopyingBackend backend;
  ProcessedStore store(s.state_dir);
  store.load();
  Committer committer(backend, store, s);
  const JobResult result = committer.commit(job, [] { return true; });

  t.check(result.outcome == JobOutcome::Abandoned,
          "cancelled upload abandons the job");
  t.check(result.error == ErrorKind::None, "abandonment carries no error");
  t.check(!fs::exists(job.destination), "nothing at the destination");
  t.check(!fs::exists(job.destination + PARTIAL_SUFFIX), "no partial left");
  t.check(store.size() == 0, "abandoned upload not recorded");
  t.check(fs::exists(job.candidate.path), "source untouched");
}

void test_local_copy_stops_when_aborted(TestContext &t) {
  TempDir tmp("sched-copy-abort");
  write_file(tmp.sub("src.bin"), std::string(4 * TRANSFER_CHUNK_SIZE, 'z'));

  std::string err;
  int polls = 0;
  const bool copied = copy_file_durable(
      tmp.sub("src.bin"), tmp.sub("dst.bin"),
      [&polls] { return ++polls > 2; }, err);
  t.check(!copied, "copy stops once aborted");
  t.check_contains(err, TRANSFER_CANCELLED, "abort reported as cancellation");
  t.check(!fs::exists(tmp.sub("dst.bin")), "partial copy removed");

  err.clear();
  t.check(copy_file_durable(tmp.sub("src.bin"), tmp.sub("full.bin"), nullptr,
                            err),
          "copy without an abort check completes: " + err);
  t.check(read_file(tmp.sub("full.bin")) == read_file(tmp.sub("src.bin")),
          "copy is complete");
}

} // namespace

int main() {
  TestContext t;
  test_converts_new_file(t);
  test_existing_output_is_never_dispatched(t);
  test_oversized_remote_file_is_not_downloaded(t);
  test_dry_run_mutates_nothing(t);
  test_second_cycle_is_idempotent(t);
  test_concurrent_cycles_never_double_dispatch(t);
  test_in_place_edit_is_not_reprocessed(t);
  test_persist_failure_keeps_source(t);
  test_finalize_failure_leaves_no_output(t);
  test_encoder_failures_are_tracked(t);
  test_too_young_file_waits(t);
  test_original_removed_when_not_kept(t);
  test_stop_abandons_running_job(t);
  test_job_finishing_within_grace_is_committed(t);
  test_stop_signal_halts_dispatch_mid_cycle(t);
  test_stop_cancels_stalled_download(t);
  test_restart_after_lost_record_keeps_output(t);
  test_cancelled_upload_is_abandoned(t);
  test_local_copy_stops_when_aborted(t);
  return t.finish("vconv_scheduler_tests");
}
