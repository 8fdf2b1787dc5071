// Fingerprint, ProcessedStore and ClaimTable tests (run via CTest).
#include "test_support.hpp"

#include <string>
#include <thread>
#include <vector>

#include "vconv/claim_table.hpp"
#include "vconv/fingerprint.hpp"
#include "vconv/processed_store.hpp"
#include "vconv/types.hpp"

using namespace vconv;
using namespace vconv_test;

namespace {

const std::string FP_A(64, 'a');
const std::string FP_B(64, 'b');

void test_terminal_state_names(TestContext &t) {
  t.check(std::string(to_string(JobState::Committed)) == "committed",
          "committed state named");
  t.check(std::string(to_string(JobState::Failed)) == "failed",
          "failed state named");
  t.check(std::string(to_string(JobOutcome::Abandoned)) == "abandoned",
          "abandoned outcome named");
  t.check(std::string(to_string(ErrorKind::Commit)) == "CommitError",
          "commit error named");
}

void test_fingerprint_known_digest(TestContext &t) {
  t.check(fingerprint_of("abc") ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
          "fingerprint should be the SHA-256 of the path");
}

void test_fingerprint_format_and_determinism(TestContext &t) {
  const std::string fp = fingerprint_of("/videos/a.mp4");
  t.check(fp.size() == FINGERPRINT_LENGTH, "fingerprint has 64 characters");
  t.check(is_valid_fingerprint(fp), "fingerprint is lowercase hex");
  t.check(fingerprint_of("/videos/a.mp4") == fp,
          "fingerprint is deterministic");
  t.check(fingerprint_of("/videos/b.mp4") != fp,
          "different paths have different fingerprints");
}

void test_fingerprint_normalizes_path(TestContext &t) {
  const std::string fp = fingerprint_of("/videos/a.mp4");
  t.check(fingerprint_of("/videos/./a.mp4") == fp, "'.' segments ignored");
  t.check(fingerprint_of("/videos//a.mp4") == fp, "doubled slashes ignored");
  t.check(fingerprint_of("/videos/sub/../a.mp4") == fp,
          "lexical '..' collapsed");
  t.check(canonical_path("/videos/") == "/videos", "trailing slash stripped");
  t.check(canonical_path("/") == "/", "root stays root");
}

void test_valid_fingerprint_rules(TestContext &t) {
  t.check(is_valid_fingerprint(FP_A), "64 hex chars are valid");
  t.check(!is_valid_fingerprint(std::string(63, 'a')), "short is invalid");
  t.check(!is_valid_fingerprint(std::string(64, 'A')), "uppercase is invalid");
  t.check(!is_valid_fingerprint(std::string(64, 'g')), "non-hex is invalid");
}

void test_store_missing_file(TestContext &t) {
  TempDir tmp("store-missing");
  ProcessedStore store(tmp.path());
  t.check(store.load() == 0, "missing state file loads as empty");
  t.check(store.size() == 0, "store is empty");
}

void test_store_record_persists(TestContext &t) {
  TempDir tmp("store-record");
  {
    ProcessedStore store(tmp.path());
    store.load();
    std::string err;
    t.check(store.record(FP_B, err), "record should succeed: " + err);
    t.check(store.record(FP_A, err), "second record should succeed: " + err);
    t.check(store.record(FP_A, err), "recording twice is a no-op");
    t.check(store.size() == 2, "store holds two fingerprints");
  }

  const std::string text = read_file(tmp.path() + "/" + STATE_FILE_NAME);
  t.check(text.find(FP_A) < text.find(FP_B),
          "state file is sorted (got '" + text + "')");

  ProcessedStore reloaded(tmp.path());
  t.check(reloaded.load() == 2, "reload sees both fingerprints");
  t.check(reloaded.contains(FP_A) && reloaded.contains(FP_B),
          "reloaded store contains the recorded fingerprints");
}

void test_store_rejects_malformed(TestContext &t) {
  TempDir tmp("store-malformed");
  ProcessedStore store(tmp.path());
  store.load();
  std::string err;
  t.check(!store.record("not-a-fingerprint", err),
          "malformed fingerprint is refused");
  t.check(!err.empty(), "refusal carries a message");
  t.check(store.size() == 0, "nothing was recorded");
}

void test_store_drops_invalid_entries(TestContext &t) {
  TempDir tmp("store-invalid");
  write_file(tmp.path() + "/" + STATE_FILE_NAME,
             "[\"" + FP_A + "\", 42, \"short\", \"" + FP_B + "\"]");
  ProcessedStore store(tmp.path());
  t.check(store.load() == 2, "only valid fingerprints are loaded");
  t.check(!fs::exists(tmp.path() + "/processed.json.corrupt"),
          "a file with bad entries is not treated as corrupt");
}

void test_store_moves_corrupt_file(TestContext &t) {
  TempDir tmp("store-corrupt");
  const std::string path = tmp.path() + "/" + STATE_FILE_NAME;
  write_file(path, "{ this is not json");
  ProcessedStore store(tmp.path());
  t.check(store.load() == 0, "corrupt file loads as empty");
  t.check(fs::exists(path + ".corrupt"), "corrupt file is moved aside");
  t.check(!fs::exists(path), "original corrupt file is gone");

  write_file(path, "{\"not\": \"an array\"}");
  ProcessedStore object_store(tmp.path());
  t.check(object_store.load() == 0, "JSON object loads as empty");
}

void test_store_keeps_corrupt_file_when_asked(TestContext &t) {
  TempDir tmp("store-corrupt-keep");
  const std::string path = tmp.path() + "/" + STATE_FILE_NAME;
  write_file(path, "garbage");
  ProcessedStore store(tmp.path());
  store.load(false);
  t.check(fs::exists(path), "corrupt file left in place");
  t.check(!fs::exists(path + ".corrupt"), "no .corrupt file created");
}

void test_store_rollback_on_persist_failure(TestContext &t) {
  TempDir tmp("store-rollback");
  const std::string state_dir = tmp.sub("state");
  fs::create_directories(state_dir);
  ProcessedStore store(state_dir);
  store.load();
  std::string err;
  t.check(store.record(FP_A, err), "first record succeeds");

  fs::remove_all(state_dir);
  err.clear();
  t.check(!store.record(FP_B, err), "record fails when the directory is gone");
  t.check(!err.empty(), "failure carries a message");
  t.check(!store.contains(FP_B), "failed record is not kept in memory");
  t.check(store.contains(FP_A), "earlier record survives");
}

void test_store_snapshot_is_stable(TestContext &t) {
  TempDir tmp("store-snapshot");
  ProcessedStore store(tmp.path());
  store.load();
  ProcessedStore::Snapshot before = store.snapshot();
  std::string err;
  store.record(FP_A, err);
  t.check(before->empty(), "snapshot does not see later records");
  t.check(store.snapshot()->count(FP_A) == 1, "new snapshot sees the record");
}

void test_store_reset(TestContext &t) {
  TempDir tmp("store-reset");
  ProcessedStore store(tmp.path());
  store.load();
  std::string err;
  store.record(FP_A, err);
  t.check(store.reset(err), "reset succeeds: " + err);
  t.check(store.size() == 0, "reset empties memory");
  ProcessedStore reloaded(tmp.path());
  t.check(reloaded.load() == 0, "reset empties the state file");
}

void test_store_concurrent_records(TestContext &t) {
  TempDir tmp("store-concurrent");
  ProcessedStore store(tmp.path());
  store.load();
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&store, i] {
      std::string err;
      store.record(fingerprint_of("/videos/" + std::to_string(i) + ".mp4"),
                   err);
    });
  }
  for (auto &th : threads)
    th.join();
  ProcessedStore reloaded(tmp.path());
  t.check(reloaded.load() == 8, "every concurrent record reaches disk");
}

void test_claim_table_exclusive(TestContext &t) {
  ClaimTable claims;
  t.check(claims.try_claim(FP_A), "first claim succeeds");
  t.check(!claims.try_claim(FP_A), "second claim of the same key fails");
  t.check(claims.contains(FP_A), "claim is visible");
  claims.release(FP_A);
  t.check(!claims.contains(FP_A), "release drops the claim");
  claims.release(FP_A);
  t.check(claims.try_claim(FP_A), "released key can be claimed again");

  {
    ClaimGuard guard(claims, FP_A);
  }
  t.check(claims.size() == 0, "ClaimGuard releases on scope exit");
}

} // namespace

int main() {
  TestContext t;
  test_terminal_state_names(t);
  test_fingerprint_known_digest(t);
  test_fingerprint_format_and_determinism(t);
  test_fingerprint_normalizes_path(t);
  test_valid_fingerprint_rules(t);
  test_store_missing_file(t);
  test_store_record_persists(t);
  test_store_rejects_malformed(t);
  test_store_drops_invalid_entries(t);
  test_store_moves_corrupt_file(t);
  test_store_keeps_corrupt_file_when_asked(t);
  test_store_rollback_on_persist_failure(t);
  test_store_snapshot_is_stable(t);
  test_store_reset(t);
  test_store_concurrent_records(t);
  test_claim_table_exclusive(t);
  return t.finish("vconv_store_tests");
}
