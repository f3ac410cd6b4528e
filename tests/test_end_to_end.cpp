#include "test_common.h"

#include "warden/confine.h"
#include "warden/service.h"

#include <filesystem>
#include <string>
#include <vector>

using namespace warden;
namespace fs = std::filesystem;

int main() {
    const fs::path base = fresh_dir("warden_test_e2e");
    const fs::path root = base / "site";
    const fs::path priv = base / "data" / "private";
    const fs::path mock = base / "data" / "mock";
    write_text(priv / "wine.csv", "cultivar,alcohol\nA,13.2\nB,12.1\nC,13.9\n");
    write_text(mock / "wine.csv", "cultivar,alcohol\nA,1.0\n");
    write_text(base / "data" / "README.md", "# Wine\nThree cultivars.\n");

    const fs::path ds_home = base / "ds";
    write_text(ds_home / "analysis.sh",
               "printf ABC > \"$OUTPUT_DIR/output.txt\"\n"
               "tail -n +2 \"$DATA_DIR/wine.csv\" | wc -l | tr -d ' ' > \"$OUTPUT_DIR/rows.txt\"\n"
               "echo analysed\n");
    write_text(ds_home / "broken.sh", "echo 'KeyError: alcohol' >&2\nexit 1\n");
    write_text(ds_home / "project" / "main.sh", ". \"$CODE_DIR/lib/helpers.sh\"\nhelper > \"$OUTPUT_DIR/h.txt\"\n");
    write_text(ds_home / "project" / "lib" / "helpers.sh", "helper() { echo from-helper; }\n");

    Datasite site(test_settings(root));
    const Actor owner = Actor::owner("do@example.org");
    const Actor ds = Actor::requester("ds@example.org");
    const Actor eve = Actor::requester("eve@example.org");

    // Dataset registration.
    DatasetSpec wine;
    wine.name = "wine";
    wine.path = priv;
    wine.mock_path = mock;
    wine.summary = "wine cultivars";
    wine.description_path = base / "data" / "README.md";
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.create_dataset(ds, wine); }, "requester cannot create");
    Dataset d = site.create_dataset(owner, wine);
    expect_eq_str(d.private_path, fs::canonical(priv).string(), "private path recorded, not copied");
    expect_true(fs::exists(priv / "wine.csv"), "private data left in place");
    expect_throws_kind(ErrorKind::ALREADY_EXISTS, [&] { site.create_dataset(owner, wine); }, "duplicate dataset");
    expect_eq_str(site.get_dataset("wine").hdr.id, d.hdr.id, "lookup by name");
    expect_eq_str(site.get_dataset(d.hdr.id).name, "wine", "lookup by id");
    expect_throws_kind(ErrorKind::NOT_FOUND, [&] { site.get_dataset("beer"); }, "unknown dataset");

    {
        DatasetSpec bad = wine;
        bad.name = "wine-json";
        write_text(base / "data" / "mock_json" / "wine.json", "[]");
        bad.mock_path = base / "data" / "mock_json";
        expect_throws_kind(ErrorKind::VALIDATION, [&] { site.create_dataset(owner, bad); }, "extension mismatch");
        bad.mock_path = priv;
        expect_throws_kind(ErrorKind::VALIDATION, [&] { site.create_dataset(owner, bad); }, "same path twice");
        bad.mock_path = mock;
        bad.description_path = ds_home / "analysis.sh";
        expect_throws_kind(ErrorKind::VALIDATION, [&] { site.create_dataset(owner, bad); }, "readme must be markdown");
        expect_eq_ll((long long)site.list_datasets().size(), 1, "failed creates leave nothing behind");
    }

    // Submission by the requester.
    JobSpec spec;
    spec.code_path = ds_home / "analysis.sh";
    spec.dataset_name = "wine";
    spec.name = "wine-rows";
    spec.description = "count cultivar rows";
    spec.tags = {"wine", "eda"};
    Job job = site.submit_job(ds, spec);
    expect_true(job.status == JobStatus::CODE_REVIEW, "new job awaits code review");
    expect_eq_str(job.requester, "ds@example.org", "requester recorded");
    expect_eq_str(job.dataset_name, "wine", "dataset name denormalized");
    UserCode uc = site.get_user_code(job.user_code_id);
    expect_eq_str(uc.entrypoint, "analysis.sh", "single-file entrypoint");
    expect_true(fs::is_regular_file(fs::path(uc.code_dir) / "analysis.sh"), "code copied into the store");
    expect_eq_ll((long long)uc.digest.size(), 64, "code digest");
    expect_throws_kind(ErrorKind::ALREADY_EXISTS, [&] { site.submit_job(ds, spec); }, "job name taken");
    {
        JobSpec nods = spec;
        nods.name = "";
        nods.dataset_name = "beer";
        expect_throws_kind(ErrorKind::NOT_FOUND, [&] { site.submit_job(ds, nods); }, "unknown dataset");
    }

    // Nothing runs before approval.
    expect_throws_kind(ErrorKind::INVALID_TRANSITION, [&] { site.run(owner, "wine-rows"); }, "run before approval");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.approve(ds, "wine-rows"); }, "requester cannot approve");
    job = site.approve(owner, "wine-rows");
    expect_true(job.status == JobStatus::QUEUED, "approved job queued");

    // Run against the private data.
    job = site.run(owner, "wine-rows");
    expect_true(job.status == JobStatus::PENDING_OUTPUT_REVIEW, "successful run awaits output review");
    expect_eq_ll(job.exit_code, 0, "exit code recorded");
    expect_throws_kind(ErrorKind::DISCLOSURE, [&] { site.get_results(ds, "wine-rows"); }, "results hidden before share");

    JobResults reviewed = site.review_results(owner, "wine-rows");
    expect_eq_str(reviewed.outputs["output.txt"], "ABC", "owner sees output");
    expect_eq_str(reviewed.outputs["rows.txt"], "3\n", "computed on private data");
    expect_eq_str(reviewed.stdout_text, "analysed\n", "stdout reviewed");

    job = site.share_results(owner, "wine-rows");
    expect_true(job.status == JobStatus::OUTPUT_SHARED, "shared");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.get_results(eve, "wine-rows"); }, "other requester blocked");
    JobResults got = site.get_results(ds, "wine-rows");
    expect_eq_str(got.outputs["output.txt"], "ABC", "requester receives the shared output");
    expect_true(got.outputs == reviewed.outputs, "requester sees what the owner reviewed");
    expect_throws_kind(ErrorKind::INVALID_TRANSITION, [&] { site.retry(owner, "wine-rows"); }, "shared job is terminal");

    // Mock runs never touch the job's status.
    {
        ExecutionReport rep = site.run_mock(ds, "wine-rows", base / "mock_out");
        expect_true(rep.ok(), "mock run ok");
        expect_eq_str(read_text(rep.output_dir / "rows.txt"), "1\n", "mock run reads mock data");
        expect_true(site.get_job("wine-rows").status == JobStatus::OUTPUT_SHARED, "status unchanged by mock run");
        expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.run_mock(eve, "wine-rows"); }, "foreign mock run");
    }

    // Failure, retry and close.
    {
        JobSpec b = spec;
        b.code_path = ds_home / "broken.sh";
        b.name = "broken";
        site.submit_job(ds, b);
        site.approve(owner, "broken");
        Job f = site.run(owner, "broken");
        expect_true(f.status == JobStatus::FAILED, "nonzero exit fails the job");
        expect_true(f.failure == FailureKind::EXECUTION_FAILURE, "failure kind recorded");
        expect_eq_ll(f.exit_code, 1, "exit code on failure");
        expect_true(f.failure_message.find("KeyError") != std::string::npos, "stderr tail in message: " + f.failure_message);
        expect_eq_str(site.review_results(owner, "broken").stderr_text, "KeyError: alcohol\n", "owner reviews the failure");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { site.get_results(ds, "broken"); }, "failure output stays private");

        f = site.retry(owner, "broken");
        expect_true(f.status == JobStatus::QUEUED, "retry requeues");
        expect_eq_ll(f.retry_count, 1, "retry counted");
        f = site.run(owner, "broken");
        expect_true(f.status == JobStatus::FAILED, "fails again");
        f = site.close(owner, "broken");
        expect_true(f.is_terminal(), "closed failure is terminal");
        expect_throws_kind(ErrorKind::INVALID_TRANSITION, [&] { site.retry(owner, "broken"); }, "closed job cannot retry");
    }

    // Rejection paths.
    {
        JobSpec r = spec;
        r.name = "rejected";
        site.submit_job(ds, r);
        Job j = site.reject(owner, "rejected", "uses forbidden columns");
        expect_true(j.status == JobStatus::REJECTED, "code rejected");

        r.name = "output-rejected";
        site.submit_job(ds, r);
        site.approve(owner, "output-rejected");
        site.run(owner, "output-rejected");
        j = site.reject_output(owner, "output-rejected", "too revealing");
        expect_true(j.status == JobStatus::FAILED, "rejected output fails the job");
        expect_throws_kind(ErrorKind::DISCLOSURE, [&] { site.get_results(ds, "output-rejected"); }, "rejected output hidden");
    }

    // Folder submissions with a declared entrypoint.
    {
        JobSpec f = spec;
        f.code_path = ds_home / "project";
        f.name = "folder-job";
        expect_throws_kind(ErrorKind::VALIDATION, [&] { site.submit_job(ds, f); }, "folder needs an entrypoint");
        f.entrypoint = "../analysis.sh";
        expect_throws_kind(ErrorKind::VALIDATION, [&] { site.submit_job(ds, f); }, "entrypoint outside the folder");
        f.entrypoint = "main.sh";
        Job j = site.submit_job(ds, f);
        expect_eq_ll((long long)site.get_user_code(j.user_code_id).files.size(), 2, "whole folder copied");
        site.approve(owner, "folder-job");
        j = site.run(owner, "folder-job");
        expect_true(j.status == JobStatus::PENDING_OUTPUT_REVIEW, "folder job ran: " + j.failure_message);
        expect_eq_str(site.review_results(owner, "folder-job").outputs["h.txt"], "from-helper\n", "helper sourced");
    }

    // Batch execution drains the queue.
    {
        for (const char* n : {"batch-1", "batch-2", "batch-3"}) {
            JobSpec b = spec;
            b.name = n;
            site.submit_job(ds, b);
            site.approve(owner, n);
        }
        JobListOptions q;
        q.status = JobStatus::QUEUED;
        expect_eq_ll((long long)site.list_jobs(q).size(), 3, "three queued");
        expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.serve(ds, 2); }, "requester cannot serve");
        expect_eq_ll((long long)site.serve(owner, 2), 3, "serve hands out every queued job");
        expect_eq_ll((long long)site.list_jobs(q).size(), 0, "queue drained");
        q.status = JobStatus::PENDING_OUTPUT_REVIEW;
        expect_eq_ll((long long)site.list_jobs(q).size(), 4, "batch jobs plus the folder job await review");
    }

    // Listing and search.
    {
        JobListOptions all;
        auto jobs = site.list_jobs(all);
        expect_eq_ll((long long)jobs.size(), 8, "all jobs listed");
        for (size_t i = 1; i < jobs.size(); i++) {
            expect_true(jobs[i - 1].hdr.created_at >= jobs[i].hdr.created_at, "newest first by default");
        }
        all.limit = 2;
        expect_eq_ll((long long)site.list_jobs(all).size(), 2, "limit");
        expect_eq_ll((long long)site.search_jobs("BATCH").size(), 3, "case-insensitive search");
        expect_eq_ll((long long)site.search_jobs("cultivar rows").size(), 8, "description search");
    }

    // Dataset names resolve within the site's owner.
    {
        const fs::path shared_root = base / "site_two_owners";
        Settings sa = test_settings(shared_root);
        sa.owner = "alice@example.org";
        Settings sb = test_settings(shared_root);
        sb.owner = "bob@example.org";
        Datasite alice(sa);
        Datasite bob(sb);
        Dataset da = alice.create_dataset(Actor::owner("alice@example.org"), wine);
        Dataset db = bob.create_dataset(Actor::owner("bob@example.org"), wine);
        expect_true(da.hdr.id != db.hdr.id, "same name under two owners");
        expect_eq_str(alice.get_dataset("wine").hdr.id, da.hdr.id, "alice resolves their own wine");
        expect_eq_str(bob.get_dataset("wine").hdr.id, db.hdr.id, "bob resolves their own wine");
        expect_eq_str(alice.get_dataset("wine").owner, "alice@example.org", "owner recorded");

        Settings sn = test_settings(shared_root);
        sn.owner = "";
        Datasite anyone(sn);
        expect_throws_kind(ErrorKind::VALIDATION, [&] { anyone.get_dataset("wine"); }, "unscoped name is ambiguous");
        expect_eq_str(anyone.get_dataset(db.hdr.id).owner, "bob@example.org", "id lookup still works");
    }

    // Without namespaces the local provider refuses private data unless the
    // owner opted in; the job stays Queued.
    if (!confinement_available()) {
        Settings s = test_settings(base / "site_strict");
        s.allow_unconfined = false;
        Datasite strict(s);
        strict.create_dataset(owner, wine);
        JobSpec t = spec;
        t.name = "strict";
        strict.submit_job(ds, t);
        strict.approve(owner, "strict");
        expect_throws_kind(ErrorKind::VALIDATION, [&] { strict.run(owner, "strict"); }, "unconfined private run refused");
        expect_true(strict.get_job("strict").status == JobStatus::QUEUED, "refused job stays queued");
        expect_true(strict.run_mock(ds, "strict").ok(), "mock run still allowed");
    }

    // Timeouts are reported distinctly.
    {
        Settings s = test_settings(base / "site_timeout");
        s.exec_timeout_sec = 1;
        Datasite slow(s);
        slow.create_dataset(owner, wine);
        write_text(ds_home / "slow.sh", "exec sleep 30\n");
        JobSpec t = spec;
        t.code_path = ds_home / "slow.sh";
        t.name = "slow";
        slow.submit_job(ds, t);
        slow.approve(owner, "slow");
        Job j = slow.run(owner, "slow");
        expect_true(j.status == JobStatus::FAILED, "timed out job failed");
        expect_true(j.failure == FailureKind::EXECUTION_TIMEOUT, "timeout failure kind");
        expect_true(slow.audit().verify_chain().empty(), "timeout site audit intact");
    }

    // Dataset removal drops only the record.
    expect_true(!site.remove_dataset(owner, "beer"), "unknown dataset not removed");
    expect_throws_kind(ErrorKind::AUTHORIZATION, [&] { site.remove_dataset(ds, "wine"); }, "requester cannot delete");
    expect_true(site.remove_dataset(owner, "wine"), "dataset removed");
    expect_throws_kind(ErrorKind::NOT_FOUND, [&] { site.get_dataset("wine"); }, "removed dataset gone");
    expect_true(fs::exists(priv / "wine.csv"), "owner data untouched by removal");

    expect_true(site.audit().verify_chain().empty(), "audit chain verifies after the whole flow");

    std::error_code ec;
    fs::remove_all(base, ec);
    std::cerr << "test_end_to_end: ALL PASSED" << std::endl;
    return 0;
}
