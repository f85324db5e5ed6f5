#include "Admission.h"
#include "CleanupScheduler.h"
#include "Config.h"
#include "ConfigParser.h"
#include "DockerDriver.h"
#include "LabController.h"
#include "LabRegistry.h"
#include "Logger.h"
#include "NetworkManager.h"
#include "Reconciler.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

// Everything a command handler may need, wired once per invocation.
struct Services {
    Config config;
    std::unique_ptr<Logger> logger;
    std::unique_ptr<DockerDriver> driver;
    std::unique_ptr<LabRegistry> registry;
    std::unique_ptr<NetworkManager> network;
    std::unique_ptr<Reconciler> reconciler;
    std::unique_ptr<LabController> controller;
    std::unique_ptr<Admission::VerifiedStore> verified;
    std::unique_ptr<Admission::PermissionChecker> permission;
    std::unique_ptr<Admission::InputSanitizer> sanitizer;
    std::unique_ptr<Admission::RateLimiter> rate_limiter;
};

static std::atomic<bool> g_stop_requested{false};

static void handle_signal(int) {
    g_stop_requested.store(true);
}

// Forward declarations for command handlers
static int emit(const OpResult& result);
static int emit_usage_error(const std::string& usage);
static void print_usage(const char* prog_name);
static bool load_config(const std::string& config_path, Config& config);
static std::unique_ptr<Services> build_services(const Config& config, bool verbose);
static int handle_request_command(Services& s, const std::vector<std::string>& args);
static int handle_check_access_command(Services& s, const std::vector<std::string>& args);
static int handle_sanitize_command(Services& s, const std::vector<std::string>& args);
static int handle_rate_limit_command(Services& s, const std::vector<std::string>& args);
static int handle_verify_member_command(Services& s, const std::vector<std::string>& args);
static int handle_log_event_command(Services& s, const std::vector<std::string>& args);
static int handle_watch_command(Services& s, const std::vector<std::string>& args);

int main(int argc, char* argv[]) {
    std::string config_path;
    if (const char* env_path = std::getenv("LABCTL_CONFIG")) {
        config_path = env_path;
    }
    bool verbose = false;

    // Global options come before the command
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[i];
    std::vector<std::string> args(argv + i + 1, argv + argc);

    Config config;
    if (!load_config(config_path, config)) {
        return emit(OpResult::fail(ErrorKind::ValidationError, "Invalid configuration"));
    }

    try {
        auto services = build_services(config, verbose);
        Services& s = *services;
        LabController& labs = *s.controller;

        if (command == "create" || command == "start") {
            if (args.size() != 2) return emit_usage_error("create <owner> <lab_type>");
            return emit(labs.create_lab(args[0], args[1]));
        } else if (command == "stop") {
            if (args.size() != 2) return emit_usage_error("stop <owner> <lab_type|lab_name>");
            return emit(labs.stop_lab(args[0], args[1]));
        } else if (command == "delete" || command == "rm") {
            if (args.size() != 2) return emit_usage_error("delete <owner> <lab_type|lab_name>");
            return emit(labs.delete_lab(args[0], args[1]));
        } else if (command == "status") {
            if (args.size() != 1) return emit_usage_error("status <owner>");
            return emit(labs.status(args[0]));
        } else if (command == "list") {
            return emit(labs.list_labs());
        } else if (command == "force-cleanup") {
            if (args.size() != 1) return emit_usage_error("force-cleanup <owner>");
            return emit(labs.force_cleanup(args[0]));
        } else if (command == "auto-cleanup") {
            return emit(labs.auto_cleanup());
        } else if (command == "server-stats") {
            return emit(labs.server_stats());
        } else if (command == "request") {
            return handle_request_command(s, args);
        } else if (command == "check-access") {
            return handle_check_access_command(s, args);
        } else if (command == "sanitize") {
            return handle_sanitize_command(s, args);
        } else if (command == "rate-limit") {
            return handle_rate_limit_command(s, args);
        } else if (command == "verify-member") {
            return handle_verify_member_command(s, args);
        } else if (command == "log-event") {
            return handle_log_event_command(s, args);
        } else if (command == "watch") {
            return handle_watch_command(s, args);
        }

        std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
        print_usage(argv[0]);
        return emit(OpResult::fail(ErrorKind::ValidationError, "Unknown action: " + command));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << command << " failed: " << e.what() << std::endl;
        return emit(OpResult::fail(ErrorKind::RuntimeFailure, "Internal error. Contact admin."));
    }
}

static int emit(const OpResult& result) {
    std::cout << result.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    return result.success ? 0 : 1;
}

static int emit_usage_error(const std::string& usage) {
    return emit(OpResult::fail(ErrorKind::ValidationError, "Usage: " + usage));
}

static bool load_config(const std::string& config_path, Config& config) {
    config = default_config();

    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Error: Config file does not exist: " << config_path << std::endl;
            return false;
        }
        if (!ConfigParser::parse_json(std::filesystem::absolute(config_path).string(), config)) {
            return false;
        }
    }

    ConfigParser::apply_env(config);
    return ConfigParser::validate(config);
}

static std::unique_ptr<Services> build_services(const Config& config, bool verbose) {
    auto s = std::make_unique<Services>();
    s->config = config;
    auto lock_timeout = std::chrono::milliseconds(config.timeouts.store_lock * 1000);

    s->logger = std::make_unique<Logger>(config.logs_dir);
    s->logger->set_verbose(verbose);
    Logger& logger = *s->logger;

    s->driver = std::make_unique<DockerDriver>(config, logger);
    s->registry = std::make_unique<LabRegistry>(config.registry_path(), logger, lock_timeout);
    s->network = std::make_unique<NetworkManager>(config.network, *s->driver, logger);
    s->reconciler = std::make_unique<Reconciler>(*s->driver, *s->registry, logger);
    s->controller = std::make_unique<LabController>(config, *s->registry, *s->driver, *s->network,
                                                    *s->reconciler, logger);

    s->verified = std::make_unique<Admission::VerifiedStore>(config.verified_path(), logger,
                                                             wall_clock_seconds, lock_timeout);
    s->permission = std::make_unique<Admission::PermissionChecker>(config.access, *s->verified, logger);
    s->sanitizer = std::make_unique<Admission::InputSanitizer>(logger);
    s->rate_limiter = std::make_unique<Admission::RateLimiter>(config.rate_limit, config.rate_limit_path(),
                                                               logger, wall_clock_seconds, lock_timeout);
    return s;
}

// ============================================================================
// ADMITTED REQUESTS
// ============================================================================

static int handle_request_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() < 4 || args.size() > 5) {
        return emit_usage_error("request <create|stop|delete|status|list> <identity> <numeric_id> <roles_csv> [argument]");
    }

    const std::string& action = args[0];
    const bool needs_argument = action == "create" || action == "stop" || action == "delete";
    if (!needs_argument && action != "status" && action != "list") {
        return emit(OpResult::fail(ErrorKind::ValidationError, "Unknown action: " + action));
    }
    if (needs_argument && args.size() != 5) {
        return emit(OpResult::fail(ErrorKind::ValidationError, "Please specify a lab type"));
    }

    Admission::Request request;
    request.identity = args[1];
    request.numeric_id = args[2];
    request.roles = Admission::split_roles(args[3]);
    if (args.size() == 5) {
        request.argument = args[4];
    }

    Admission::AdmissionPipeline pipeline(*s.permission, *s.sanitizer, *s.rate_limiter);
    Admission::Verdict verdict = pipeline.admit(request);
    if (!verdict.admitted) {
        return emit(verdict.rejection);
    }

    LabController& labs = *s.controller;
    OpResult result;
    if (action == "create") {
        result = labs.create_lab(request.identity, verdict.cleaned_argument);
    } else if (action == "stop") {
        result = labs.stop_lab(request.identity, verdict.cleaned_argument);
    } else if (action == "delete") {
        result = labs.delete_lab(request.identity, verdict.cleaned_argument);
    } else if (action == "status") {
        result = labs.status(request.identity);
    } else {
        result = labs.list_labs();
    }

    if (verdict.warning) {
        result.payload["warning"] = *verdict.warning;
    }
    return emit(result);
}

// ============================================================================
// ADMISSION STAGES, INDIVIDUALLY
// ============================================================================

static int handle_check_access_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 3) return emit_usage_error("check-access <identity> <numeric_id> <roles_csv>");

    Admission::AccessDecision d = s.permission->check(args[0], args[1], Admission::split_roles(args[2]));
    if (!d.allowed) {
        return emit(OpResult::fail(ErrorKind::PermissionDenied, d.message, {{"allowed", false}, {"reason", d.reason}}));
    }
    json payload = {{"allowed", true}};
    if (d.superuser) payload["admin"] = true;
    return emit(OpResult::ok(payload));
}

static int handle_sanitize_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 1) return emit_usage_error("sanitize <input>");

    Admission::SanitizeResult r = s.sanitizer->sanitize(args[0]);
    if (!r.valid) {
        return emit(OpResult::fail(ErrorKind::ValidationError, r.reason, {{"valid", false}}));
    }
    return emit(OpResult::ok({{"valid", true}, {"cleaned", r.cleaned}}));
}

static int handle_rate_limit_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 1) return emit_usage_error("rate-limit <identity>");

    Admission::RateDecision d = s.rate_limiter->check(args[0]);
    if (!d.allowed || d.store_status != StoreStatus::Ok) {
        OpResult rejected = Admission::rate_limit_rejection(d);
        rejected.payload["allowed"] = false;
        return emit(rejected);
    }
    json payload = {{"allowed", true}};
    if (d.warning) payload["warning"] = *d.warning;
    return emit(OpResult::ok(payload));
}

static int handle_verify_member_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) return emit_usage_error("verify-member <identity> <numeric_id> [grantor]");

    std::string grantor = args.size() == 3 ? args[2] : "officer";
    StoreStatus st = s.verified->grant(args[0], args[1], grantor);
    if (st != StoreStatus::Ok) {
        s.logger->error("verify-member", std::string("could not persist grant: ") + store_status_name(st));
        return emit(OpResult::fail(st == StoreStatus::LockTimeout ? ErrorKind::Timeout : ErrorKind::PersistenceCorrupt,
                                   "Could not save the verification. Try again."));
    }
    s.logger->audit(Logger::Level::Info, "MEMBER_VERIFIED", args[0], "ID: " + args[1] + " - By: " + grantor);
    return emit(OpResult::ok({{"message", args[0] + " has been verified for CTF labs."}}));
}

static int handle_log_event_command(Services& s, const std::vector<std::string>& args) {
    if (args.size() != 3) return emit_usage_error("log-event <type> <identity> <details>");
    s.logger->audit(Logger::Level::Info, args[0], args[1], args[2]);
    return emit(OpResult::ok());
}

// ============================================================================
// SCHEDULER
// ============================================================================

static int handle_watch_command(Services& s, const std::vector<std::string>& args) {
    int interval = 300;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--interval" && i + 1 < args.size()) {
            try {
                int val = std::stoi(args[++i]);
                if (val >= 1 && val <= 86400) {
                    interval = val;
                } else {
                    std::cerr << "Warning: Interval out of range (1-86400 s), using " << interval << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Warning: Invalid interval value" << std::endl;
            }
        } else {
            return emit_usage_error("watch [--interval <seconds>]");
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cerr << "[Main] Auto-cleanup every " << interval << "s. Ctrl-C to stop." << std::endl;
    CleanupScheduler scheduler(*s.controller, *s.logger, std::chrono::seconds(interval));
    int sweeps = scheduler.run_until(g_stop_requested);
    return emit(OpResult::ok({{"sweeps", sweeps}}));
}

static void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [--config <path>] [--verbose] <command> [args]" << std::endl;
    std::cerr << "Lab commands:" << std::endl;
    std::cerr << "  create <owner> <lab_type>          Start a new lab instance." << std::endl;
    std::cerr << "  stop <owner> <lab_type|name>       Stop a running lab (keeps its record)." << std::endl;
    std::cerr << "  delete <owner> <lab_type|name>     Stop if needed and remove a lab." << std::endl;
    std::cerr << "  status <owner>                     Running labs with remaining time." << std::endl;
    std::cerr << "  list                               Available lab types." << std::endl;
    std::cerr << "Officer commands:" << std::endl;
    std::cerr << "  force-cleanup <owner>              Remove every lab of a user." << std::endl;
    std::cerr << "  auto-cleanup                       Expire old labs and purge stale records." << std::endl;
    std::cerr << "  server-stats                       Capacity and host resource summary." << std::endl;
    std::cerr << "  verify-member <identity> <id> [by] Grant lab access without a role." << std::endl;
    std::cerr << "  watch [--interval <seconds>]       Run auto-cleanup periodically." << std::endl;
    std::cerr << "Admission:" << std::endl;
    std::cerr << "  request <action> <identity> <id> <roles_csv> [arg]" << std::endl;
    std::cerr << "                                     Permission, sanitize and rate-limit, then run action." << std::endl;
    std::cerr << "  check-access <identity> <id> <roles_csv>" << std::endl;
    std::cerr << "  sanitize <input>" << std::endl;
    std::cerr << "  rate-limit <identity>" << std::endl;
    std::cerr << "  log-event <type> <identity> <details>" << std::endl;
    std::cerr << "\nEnvironment:" << std::endl;
    std::cerr << "  LABCTL_CONFIG, LABCTL_DATA_DIR, LABCTL_LOGS_DIR, LABCTL_MAX_LABS_PER_USER," << std::endl;
    std::cerr << "  LABCTL_MAX_TOTAL_LABS, LABCTL_TTL_HOURS, LABCTL_RATE_SOFT|WARN|HARD" << std::endl;
}
