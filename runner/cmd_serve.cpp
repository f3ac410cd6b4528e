#include "runner_utils.h"

#include "warden/service.h"

#include <csignal>
#include <cstdlib>
#include <iostream>

namespace warden {

int cmd_serve(int argc, char** argv) {
    // Job output goes to files; a closed stdout must not kill the owner's process.
    ::signal(SIGPIPE, SIG_IGN);

    return run_guarded("serve", [&]() -> int {
        Settings s = cli_settings();
        int workers = s.workers;
        for (int i = 2; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--workers" && i + 1 < argc) {
                workers = std::atoi(argv[++i]);
                if (workers < 1) workers = 1;
                if (workers > 64) workers = 64;
            }
        }
        Actor actor;
        std::string err;
        if (!parse_actor(argc, argv, s, &actor, &err)) {
            std::cerr << "[warden] " << err << "\n";
            return 2;
        }
        Datasite site(s);
        std::cerr << "[warden] serve root=" << s.root << " workers=" << workers
                  << " isolation=" << s.isolation << " profile=" << profile_name(detect_profile()) << "\n";
        const size_t n = site.serve(actor, workers);
        std::cerr << "[warden] serve: drained " << n << " queued jobs\n";
        return 0;
    });
}

} // namespace warden
