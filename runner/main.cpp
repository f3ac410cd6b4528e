#include "runner_utils.h"

#include "warden/audit_log.h"
#include "warden/config.h"

#include <iostream>
#include <string>

using namespace warden;

// Recomputes the audit hash chain of the datasite.
// Usage: warden_cli audit verify
static int cmd_audit(int argc, char** argv) {
    if (argc < 3 || std::string(argv[2]) != "verify") {
        std::cerr << "usage: warden_cli audit verify\n";
        return 2;
    }
    return run_guarded("audit", [&]() -> int {
        Settings s = cli_settings();
        AuditLog audit(s.root / "audit" / "audit.jsonl");
        std::string err = audit.verify_chain();
        if (!err.empty()) {
            std::cout << "audit chain BROKEN: " << err << "\n";
            return 1;
        }
        std::cout << "audit chain OK (" << audit.last_hash() << ")\n";
        return 0;
    });
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "warden_cli <dataset|job|results|serve|audit> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "dataset") return cmd_dataset(argc, argv);
    if (cmd == "job") return cmd_job(argc, argv);
    if (cmd == "results") return cmd_results(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "audit") return cmd_audit(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
