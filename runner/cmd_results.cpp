#include "runner_utils.h"

#include "warden/serialization.h"
#include "warden/service.h"

#include <iostream>

namespace warden {

static int results_usage() {
    std::cerr << "usage: warden_cli results review|share|get <job> [--as owner|requester] [--id ID]\n";
    return 2;
}

int cmd_results(int argc, char** argv) {
    if (argc < 3) return results_usage();
    const std::string sub = argv[2];
    const auto pos = positionals(argc, argv, 3);
    if (pos.size() != 1) return results_usage();

    return run_guarded("results", [&]() -> int {
        Settings s = cli_settings();
        Actor actor;
        std::string err;
        if (!parse_actor(argc, argv, s, &actor, &err)) {
            std::cerr << "[warden] " << err << "\n";
            return 2;
        }
        Datasite site(s);

        if (sub == "review") {
            print_json(results_to_json(site.review_results(actor, pos[0])));
            return 0;
        }
        if (sub == "share") {
            print_json(job_to_json(site.share_results(actor, pos[0])));
            return 0;
        }
        if (sub == "get") {
            print_json(results_to_json(site.get_results(actor, pos[0])));
            return 0;
        }
        return results_usage();
    });
}

} // namespace warden
