#include "runner_utils.h"

#include "warden/serialization.h"
#include "warden/service.h"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace warden {

static int job_usage() {
    std::cerr << "usage: warden_cli job submit <code_path> --dataset NAME [--entrypoint FILE] [--name N]\n"
                 "                             [--description T] [--tag T]... [--readme FILE.md]\n"
                 "       warden_cli job list [--status S] [--limit N] [--order-by FIELD] [--asc]\n"
                 "       warden_cli job search <term>\n"
                 "       warden_cli job get|approve|run|retry|close <job>\n"
                 "       warden_cli job reject|reject-output <job> [--reason R]\n"
                 "       warden_cli job mock <job> [--out DIR]\n"
                 "  common: [--as owner|requester] [--id ID]\n";
    return 2;
}

static json_object* jobs_to_json(const std::vector<Job>& jobs) {
    json_object* arr = json_object_new_array();
    for (const auto& j : jobs) json_object_array_add(arr, job_to_json(j));
    return arr;
}

int cmd_job(int argc, char** argv) {
    if (argc < 3) return job_usage();
    const std::string sub = argv[2];
    const auto pos = positionals(argc, argv, 3);

    return run_guarded("job", [&]() -> int {
        Settings s = cli_settings();
        Actor actor;
        std::string err;
        if (!parse_actor(argc, argv, s, &actor, &err)) {
            std::cerr << "[warden] " << err << "\n";
            return 2;
        }
        Datasite site(s);

        if (sub == "submit") {
            if (pos.size() != 1) return job_usage();
            JobSpec spec;
            spec.code_path = pos[0];
            spec.dataset_name = arg_value(argc, argv, 3, "--dataset");
            if (spec.dataset_name.empty()) return job_usage();
            spec.entrypoint = arg_value(argc, argv, 3, "--entrypoint");
            spec.name = arg_value(argc, argv, 3, "--name");
            spec.description = arg_value(argc, argv, 3, "--description");
            spec.readme_path = arg_value(argc, argv, 3, "--readme");
            for (int i = 3; i + 1 < argc; i++) {
                if (std::strcmp(argv[i], "--tag") == 0) spec.tags.push_back(argv[++i]);
            }
            print_json(job_to_json(site.submit_job(actor, spec)));
            return 0;
        }
        if (sub == "list") {
            JobListOptions opts;
            const std::string st = arg_value(argc, argv, 3, "--status");
            if (!st.empty()) {
                opts.status = job_status_from_str(st);
                if (!opts.status) {
                    std::cerr << "[warden] unknown status '" << st << "'\n";
                    return 2;
                }
            }
            opts.limit = (size_t)std::strtoull(arg_value(argc, argv, 3, "--limit", "0").c_str(), nullptr, 10);
            opts.order_by = arg_value(argc, argv, 3, "--order-by", "created_at");
            opts.sort_order = has_flag(argc, argv, 3, "--asc") ? SortOrder::ASC : SortOrder::DESC;
            print_json(jobs_to_json(site.list_jobs(opts)));
            return 0;
        }
        if (sub == "search") {
            if (pos.size() != 1) return job_usage();
            print_json(jobs_to_json(site.search_jobs(pos[0])));
            return 0;
        }

        if (pos.size() != 1) return job_usage();
        const std::string& job = pos[0];
        const std::string reason = arg_value(argc, argv, 3, "--reason");

        if (sub == "get") {
            print_json(job_to_json(site.get_job(job)));
            return 0;
        }
        if (sub == "mock") {
            ExecutionReport rep = site.run_mock(actor, job, arg_value(argc, argv, 3, "--out"));
            std::cout << "mock run ok: " << rep.output_dir.string() << "\n";
            for (const auto& a : rep.artifacts) std::cout << "  " << a << "\n";
            return 0;
        }

        Job out;
        if (sub == "approve") out = site.approve(actor, job);
        else if (sub == "reject") out = site.reject(actor, job, reason);
        else if (sub == "run") out = site.run(actor, job);
        else if (sub == "retry") out = site.retry(actor, job);
        else if (sub == "close") out = site.close(actor, job);
        else if (sub == "reject-output") out = site.reject_output(actor, job, reason);
        else return job_usage();

        print_json(job_to_json(out));
        // A run that ended in Failed is an operation error for scripting.
        return (sub == "run" && out.status == JobStatus::FAILED) ? 1 : 0;
    });
}

} // namespace warden
