#pragma once

#include "warden/config.h"
#include "warden/disclosure.h"
#include "warden/errors.h"
#include "warden/types.h"

#include <json-c/json.h>

#include <functional>
#include <string>
#include <vector>

namespace warden {

// ---- Subcommands ----

int cmd_dataset(int argc, char** argv);
int cmd_job(int argc, char** argv);
int cmd_results(int argc, char** argv);
int cmd_serve(int argc, char** argv);

// ---- Shared CLI helpers ----

// Profile defaults applied, then WARDEN_* settings loaded.
Settings cli_settings();

// Identity for this invocation: --as owner|requester and --id X.
// Owner defaults to WARDEN_OWNER; a requester must name itself.
// Returns false (with *err) on a usage problem.
bool parse_actor(int argc, char** argv, const Settings& s, Actor* out, std::string* err);

// Value following `flag` anywhere in argv[from..], or defv.
std::string arg_value(int argc, char** argv, int from, const char* flag, const std::string& defv = "");
bool has_flag(int argc, char** argv, int from, const char* flag);

// Positional arguments from argv[from..], skipping "--flag value" pairs.
std::vector<std::string> positionals(int argc, char** argv, int from);

// Prints and releases obj.
void print_json(json_object* obj);

json_object* results_to_json(const JobResults& r);

// Runs fn, mapping warden::Error to exit code 1 with a one-line diagnostic.
int run_guarded(const char* cmd, const std::function<int()>& fn);

} // namespace warden
