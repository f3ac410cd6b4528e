#include "test_common.h"

#include "warden/audit_log.h"
#include "warden/disclosure.h"
#include "warden/ids.h"
#include "warden/job_state.h"

#include <filesystem>
#include <string>
#include <thread>

using namespace warden;
namespace fs = std::filesystem;

int main() {
    const fs::path root = fresh_dir("warden_test_disclosure");
    AuditLog audit(root / "audit" / "audit.jsonl");
    RecordStore<Job> jobs(root / "store", false, &audit);
    JobStateMachine sm(&jobs, &audit, "do", 3, 1);
    DisclosureGate gate(&sm, &jobs, &audit, root / "shared", "do");

    const Actor owner = Actor::owner("do");
    const Actor ds = Actor::requester("ds");
    const Actor other = Actor::requester("eve");

    auto make = [&](const std::string& name, JobStatus st, const fs::path& results) {
        Job j;
        j.name = name;
        j.dataset_id = new_record_id();
        j.dataset_name = "wine";
        j.user_code_id = new_record_id();
        j.requester = "ds";
        j.status = st;
        if (st == JobStatus::FAILED) j.failure = FailureKind::EXECUTION_FAILURE;
        j.results_dir = results.string();
        return jobs.create(j);
    };

    const fs::path results = root / "results" / "job1";
    const std::string binary("\x00\x01\xff" "abc", 6);
    write_text(results / "output" / "output.txt", "ABC");
    write_text(results / "output" / "nested" / "stats.bin", binary);
    write_text(results / "logs" / "stdout.log", "hello\n");
    write_text(results / "logs" / "stderr.log", "");
    write_text(root / "private" / "secret.csv", "do not leak");
    fs::create_symlink(root / "private" / "secret.csv", results / "output" / "leak.csv");

    Job job = make("job1", JobStatus::PENDING_OUTPUT_REVIEW, results);

    // Review is owner-only and leaves visibility alone.
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.review_results(job, ds); }, "requester cannot review");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.review_results(job, Actor::owner("mallory")); },
                       "foreign owner id cannot review");
    JobResults reviewed = gate.review_results(job, owner);
    expect_eq_ll((long long)reviewed.outputs.size(), 2, "two regular output files, symlink skipped");
    expect_eq_str(reviewed.outputs["output.txt"], "ABC", "output bytes");
    expect_eq_str(reviewed.outputs["nested/stats.bin"], binary, "binary output bytes");
    expect_eq_str(reviewed.stdout_text, "hello\n", "stdout in review");
    expect_true(jobs.read(job.hdr.id).status == JobStatus::PENDING_OUTPUT_REVIEW, "review does not change status");

    // Nothing reaches the requester before sharing.
    expect_throws_kind(ErrorKind::DISCLOSURE, [&] { gate.get_results(job, ds); }, "get before share");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.get_results(job, other); }, "other requester");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.get_results(job, owner); }, "owner role is not the requester");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.share_results(job, ds); }, "requester cannot share");
    expect_true(!fs::exists(root / "shared" / job.hdr.id), "nothing published by failed share");

    // Share publishes a copy and moves the job to OutputShared.
    Job shared = gate.share_results(job, owner);
    expect_true(shared.status == JobStatus::OUTPUT_SHARED, "shared status");
    expect_eq_str(shared.output_path, (root / "shared" / job.hdr.id).string(), "output_path recorded");
    expect_true(fs::is_regular_file(fs::path(shared.output_path) / "output" / "output.txt"), "output copied");
    expect_true(fs::is_regular_file(fs::path(shared.output_path) / "logs" / "stdout.log"), "logs copied");
    expect_true(!fs::exists(fs::path(shared.output_path) / "output" / "leak.csv"), "symlink not published");

    // Idempotent.
    Job again = gate.share_results(job, owner);
    expect_eq_ll(again.hdr.version, shared.hdr.version, "second share is a no-op");

    // The requester now sees exactly what the owner reviewed.
    write_text(results / "output" / "output.txt", "changed after share");
    JobResults got = gate.get_results(job, ds);
    expect_true(got.outputs == reviewed.outputs, "get_results byte-identical to review_results");
    expect_eq_str(got.stdout_text, reviewed.stdout_text, "stdout identical");
    expect_true(got.job.status == JobStatus::OUTPUT_SHARED, "snapshot is current");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { gate.get_results(job, other); }, "still requester-only");

    // Status gating for review and share.
    {
        Job cr = make("job-cr", JobStatus::CODE_REVIEW, "");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { gate.review_results(cr, owner); }, "no results in CodeReview");

        const fs::path fres = root / "results" / "job-failed";
        write_text(fres / "output" / "partial.txt", "half");
        write_text(fres / "logs" / "stderr.log", "Traceback\n");
        Job failed = make("job-failed", JobStatus::FAILED, fres);
        JobResults fr = gate.review_results(failed, owner);
        expect_eq_str(fr.stderr_text, "Traceback\n", "owner reviews a failed run");
        expect_throws_kind(ErrorKind::INVALID_TRANSITION, [&] { gate.share_results(failed, owner); },
                           "failed runs cannot be shared");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { gate.get_results(failed, ds); }, "failed run stays hidden");

        Job norun = make("job-norun", JobStatus::PENDING_OUTPUT_REVIEW, root / "results" / "missing");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { gate.review_results(norun, owner); }, "missing results dir");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { gate.share_results(norun, owner); }, "nothing to share");
        expect_true(jobs.read(norun.hdr.id).status == JobStatus::PENDING_OUTPUT_REVIEW, "failed share leaves status");
    }

    // Two owners sharing the same job at once both see it shared and the
    // published copy survives.
    {
        const fs::path cres = root / "results" / "job-race";
        write_text(cres / "output" / "result.txt", "42");
        write_text(cres / "logs" / "stdout.log", "ok\n");
        for (int round = 0; round < 5; round++) {
            Job race = make("job-race-" + std::to_string(round), JobStatus::PENDING_OUTPUT_REVIEW, cres);
            DisclosureGate second(&sm, &jobs, &audit, root / "shared", "do");
            Job ra, rb;
            std::string ea, eb;
            std::thread ta([&] {
                try { ra = gate.share_results(race, owner); } catch (const Error& e) { ea = e.what(); }
            });
            std::thread tb([&] {
                try { rb = second.share_results(race, owner); } catch (const Error& e) { eb = e.what(); }
            });
            ta.join();
            tb.join();
            expect_true(ea.empty(), "first sharer succeeds: " + ea);
            expect_true(eb.empty(), "second sharer succeeds: " + eb);
            expect_true(ra.status == JobStatus::OUTPUT_SHARED, "first sharer sees OutputShared");
            expect_true(rb.status == JobStatus::OUTPUT_SHARED, "second sharer sees OutputShared");
            expect_eq_ll(ra.hdr.version, rb.hdr.version, "one transition for both sharers");
            const fs::path published = root / "shared" / race.hdr.id;
            expect_eq_str(ra.output_path, published.string(), "output_path");
            expect_eq_str(read_text(published / "output" / "result.txt"), "42", "published copy survives");
            JobResults rr = gate.get_results(race, ds);
            expect_eq_str(rr.outputs["result.txt"], "42", "requester reads the shared copy");
        }
    }

    // Per-file read cap.
    {
        DisclosureGate small(&sm, &jobs, &audit, root / "shared_small", "do", 2);
        const fs::path r2 = root / "results" / "job-big";
        write_text(r2 / "output" / "big.txt", "0123456789");
        Job big = make("job-big", JobStatus::PENDING_OUTPUT_REVIEW, r2);
        JobResults br = small.review_results(big, owner);
        expect_eq_str(br.outputs["big.txt"], "01", "file cut at the cap");
        expect_eq_ll((long long)br.truncated.size(), 1, "truncation reported");
    }

    expect_true(audit.verify_chain().empty(), "audit chain intact");

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_disclosure: ALL PASSED" << std::endl;
    return 0;
}
