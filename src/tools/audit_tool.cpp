/*
 * memguard-audit - inspect a memguard audit log
 * 
 * Usage:
 *   ./memguard-audit [options] verify [audit.log]
 *   ./memguard-audit [options] show [audit.log] [--min-severity N] [--type T]
 * 
 * Without an explicit path the log named by security.audit_log_path in the
 * config file (or MEMGUARD_SECURITY_AUDIT_LOG_PATH) is used.
 */

#include <memguard/core/config.hpp>
#include <memguard/core/logger.hpp>
#include <memguard/core/utils.hpp>
#include <memguard/security/audit_log.hpp>

#include <iostream>
#include <cstring>
#include <cstdlib>

namespace memguard {

static const char* APP_VERSION = "0.1.0";
static const char* APP_NAME = "memguard-audit";

static void print_usage(const char* prog) {
    std::cout << APP_NAME << " - inspect a memguard security audit log\n\n"
              << "Usage: " << prog << " [options] <command> [audit.log]\n\n"
              << "Commands:\n"
              << "  verify               Check sequence numbers and the hash chain\n"
              << "  show                 Print events, oldest first\n\n"
              << "Options:\n"
              << "  -c, --config FILE    Read log_level and security.audit_log_path\n"
              << "  --min-severity N     show: only events with severity >= N (1-5)\n"
              << "  --type T             show: only events of type T (e.g. access_denied)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n\n"
              << "Example:\n"
              << "  " << prog << " show /var/log/memguard/audit.log --min-severity 4\n";
}

static int run_verify(const std::string& path) {
    std::string error;
    if (!AuditLog::verify_file(path, error)) {
        std::cout << path << ": FAILED (" << error << ")\n";
        return 2;
    }
    std::cout << path << ": OK\n";
    return 0;
}

static int run_show(const std::string& path, int min_severity,
                    bool filter_type, SecurityEventType type) {
    std::vector<SecurityEvent> events;
    std::string error;
    if (!AuditLog::load_file(path, events, error)) {
        LOG_ERROR("%s: %s", path.c_str(), error.c_str());
        return 1;
    }
    
    size_t shown = 0;
    for (size_t i = 0; i < events.size(); ++i) {
        const SecurityEvent& e = events[i];
        if (e.severity < min_severity) continue;
        if (filter_type && e.type != type) continue;
        
        std::cout << "#" << e.sequence << " "
                  << format_timestamp_ms(e.timestamp_ms) << " "
                  << "sev=" << e.severity << " "
                  << event_type_to_string(e.type) << " "
                  << "agent=" << e.agent_id << " "
                  << "session=" << e.session_id << " "
                  << e.details.dump() << "\n";
        shown++;
    }
    std::cout << shown << " of " << events.size() << " events\n";
    return 0;
}

static int run(int argc, char* argv[]) {
    const char* config_file = NULL;
    std::string command;
    std::string path;
    int min_severity = 1;
    bool filter_type = false;
    SecurityEventType type = SecurityEventType::ACCESS_GRANTED;
    
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << APP_NAME << " v" << APP_VERSION << "\n";
            return 0;
        }
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_file = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--min-severity") == 0 && i + 1 < argc) {
            min_severity = clamp(std::atoi(argv[++i]), 1, 5);
            continue;
        }
        if (strcmp(argv[i], "--type") == 0 && i + 1 < argc) {
            const char* name = argv[++i];
            if (!parse_event_type(name, type)) {
                std::cerr << "Unknown event type: " << name << "\n";
                return 1;
            }
            filter_type = true;
            continue;
        }
        if (command.empty()) {
            command = argv[i];
        } else if (path.empty()) {
            path = argv[i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    
    Config config;
    if (config_file && !config.load_file(config_file)) {
        LOG_WARN("Failed to load config from %s, using defaults", config_file);
    }
    config.apply_log_level();
    
    if (path.empty()) {
        path = config.get_string("security.audit_log_path");
    }
    if (command.empty() || path.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    
    if (command == "verify") {
        return run_verify(path);
    }
    if (command == "show") {
        return run_show(path, min_severity, filter_type, type);
    }
    
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}

} // namespace memguard

int main(int argc, char* argv[]) {
    return memguard::run(argc, argv);
}
