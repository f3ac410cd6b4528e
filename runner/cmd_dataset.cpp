#include "runner_utils.h"

#include "warden/proc.h"
#include "warden/serialization.h"
#include "warden/service.h"

#include <cstdlib>
#include <iostream>

namespace warden {

static int dataset_usage() {
    std::cerr << "usage: warden_cli dataset create <name> --path DIR --mock DIR [--summary S] [--readme FILE.md]\n"
                 "                                [--runtime \"CMD ...\"] [--mount DIR]\n"
                 "       warden_cli dataset list [--limit N] [--order-by FIELD] [--asc]\n"
                 "       warden_cli dataset get <name|id>\n"
                 "       warden_cli dataset delete <name|id>\n"
                 "  common: [--as owner|requester] [--id ID]\n";
    return 2;
}

int cmd_dataset(int argc, char** argv) {
    if (argc < 3) return dataset_usage();
    const std::string sub = argv[2];
    const auto pos = positionals(argc, argv, 3);

    return run_guarded("dataset", [&]() -> int {
        Settings s = cli_settings();
        Actor actor;
        std::string err;
        if (!parse_actor(argc, argv, s, &actor, &err)) {
            std::cerr << "[warden] " << err << "\n";
            return 2;
        }
        Datasite site(s);

        if (sub == "create") {
            if (pos.size() != 1) return dataset_usage();
            DatasetSpec spec;
            spec.name = pos[0];
            spec.path = arg_value(argc, argv, 3, "--path");
            spec.mock_path = arg_value(argc, argv, 3, "--mock");
            spec.summary = arg_value(argc, argv, 3, "--summary");
            spec.description_path = arg_value(argc, argv, 3, "--readme");
            if (spec.path.empty() || spec.mock_path.empty()) return dataset_usage();
            const std::string runtime = arg_value(argc, argv, 3, "--runtime");
            if (!runtime.empty()) {
                RuntimeSpec rt;
                rt.cmd = split_argv_quoted(runtime);
                rt.mount_dir = arg_value(argc, argv, 3, "--mount");
                spec.runtime = rt;
            }
            print_json(dataset_to_json(site.create_dataset(actor, spec)));
            return 0;
        }
        if (sub == "list") {
            Query q;
            q.limit = (size_t)std::strtoull(arg_value(argc, argv, 3, "--limit", "0").c_str(), nullptr, 10);
            q.order_by = arg_value(argc, argv, 3, "--order-by", "created_at");
            q.sort_order = has_flag(argc, argv, 3, "--asc") ? SortOrder::ASC : SortOrder::DESC;
            json_object* arr = json_object_new_array();
            for (const auto& d : site.list_datasets(q)) json_object_array_add(arr, dataset_to_json(d));
            print_json(arr);
            return 0;
        }
        if (sub == "get") {
            if (pos.size() != 1) return dataset_usage();
            print_json(dataset_to_json(site.get_dataset(pos[0])));
            return 0;
        }
        if (sub == "delete") {
            if (pos.size() != 1) return dataset_usage();
            if (!site.remove_dataset(actor, pos[0])) {
                std::cerr << "[warden] dataset " << pos[0] << " not found\n";
                return 1;
            }
            std::cout << "deleted " << pos[0] << "\n";
            return 0;
        }
        return dataset_usage();
    });
}

} // namespace warden
