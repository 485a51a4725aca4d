#include "net/curl_etag_probe.hpp"
#include "net/curl_transfer_engine.hpp"
#include "sync/json_file_registry.hpp"
#include "sync/progress_sinks.hpp"
#include "sync/sync_orchestrator.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/reposync/reposync.conf";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-r <registry.json>] [--add-repo <name>=<uri>] [--progress-file <path>] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config           Config file (default %s)\n"
        "  -r, --registry         Registry file, overrides RegistryPath\n"
        "  -a, --add-repo         Register a repository before syncing (repeatable)\n"
        "  -p, --progress-file    Also write progress as JSON to this file\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, kDefaultConfigPath);
}

bool SplitRepoArg(const char *arg, std::pair<std::string, std::string> &out) {
    const char *eq = std::strchr(arg, '=');
    if (!eq || eq == arg || *(eq + 1) == '\0')
        return false;
    out.first.assign(arg, eq);
    out.second.assign(eq + 1);
    return true;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool config_from_cli = false;
    std::string registry_cli;
    std::string progress_file_cli;
    std::vector<std::pair<std::string, std::string>> add_repos;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"registry", required_argument, nullptr, 'r'},
        {"add-repo", required_argument, nullptr, 'a'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:r:a:p:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                config_from_cli = true;
                break;

            case 'r':
                registry_cli = optarg;
                break;

            case 'a': {
                std::pair<std::string, std::string> repo;
                if (!SplitRepoArg(optarg, repo)) {
                    std::fprintf(stderr, "Invalid --add-repo (expected name=uri): %s\n", optarg);
                    return 2;
                }
                add_repos.push_back(std::move(repo));
                break;
            }

            case 'p':
                progress_file_cli = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    reposync::config::SyncConfigFromFile cfg;
    const bool cfg_ok = cfg.LoadFile(config_path);

    if (!cfg_ok && (config_from_cli || registry_cli.empty())) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
        return 1;
    } else if (!cfg_ok) {
        std::fprintf(stderr, "WARN: cannot load config: %s (continuing due to -r)\n", config_path.c_str());
    }

    reposync::LogLevel level = reposync::LogLevel::Info;
    if (!reposync::config::ResolveLogLevel(cfg, verbose, level))
        std::fprintf(stderr, "WARN: unknown LogLevel '%s', using info\n", cfg.log_level.c_str());
    reposync::Logger::Instance().SetLevel(level);

    const std::string registry_path = registry_cli.empty() ? cfg.registry_path : registry_cli;
    if (registry_path.empty()) {
        std::fprintf(stderr, "ERROR: no registry path (set RegistryPath or use -r)\n");
        return 1;
    }

    reposync::JsonFileRegistry registry;
    if (auto r = reposync::JsonFileRegistry::Load(registry_path, registry); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    for (const auto &[name, uri] : add_repos) {
        if (auto r = registry.AddRepository(name, uri); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        LogInfo("Repository %s -> %s registered", name.c_str(), uri.c_str());
    }

    reposync::CurlTransferEngine::Options transfer_opt;
    reposync::CurlETagProbe::Options probe_opt;
    if (cfg.max_concurrent_downloads)
        transfer_opt.max_concurrent = static_cast<std::size_t>(*cfg.max_concurrent_downloads);
    if (cfg.connect_timeout_sec) {
        transfer_opt.connect_timeout_sec = static_cast<long>(*cfg.connect_timeout_sec);
        probe_opt.connect_timeout_sec = static_cast<long>(*cfg.connect_timeout_sec);
    }
    if (cfg.transfer_timeout_sec)
        transfer_opt.transfer_timeout_sec = static_cast<long>(*cfg.transfer_timeout_sec);
    if (!cfg.user_agent.empty()) {
        transfer_opt.user_agent = cfg.user_agent;
        probe_opt.user_agent = cfg.user_agent;
    }

    reposync::CurlTransferEngine transfer(transfer_opt);
    reposync::CurlETagProbe probe(probe_opt);

    reposync::SyncOrchestrator::Options sync_opt;
    if (!cfg.download_dir.empty())
        sync_opt.download_dir = cfg.download_dir;
    if (cfg.max_entry_bytes)
        sync_opt.entry.max_entry_bytes = *cfg.max_entry_bytes;

    reposync::ConsoleReporter console(cfg.progress.value_or(true));
    const std::string progress_file = progress_file_cli.empty() ? cfg.progress_file : progress_file_cli;
    std::unique_ptr<reposync::FileProgressReporter> file_reporter;
    std::unique_ptr<reposync::TeeReporter> tee;
    reposync::IReporter *reporter = &console;
    if (!progress_file.empty()) {
        file_reporter = std::make_unique<reposync::FileProgressReporter>(progress_file);
        tee = std::make_unique<reposync::TeeReporter>(console, *file_reporter);
        reporter = tee.get();
    }

    reposync::SyncOrchestrator orchestrator(registry, transfer, probe, *reporter, sync_opt);
    const auto outcome = orchestrator.Run();
    switch (outcome) {
        case reposync::SyncOutcome::Updated:
            std::printf("Updated %zu modules from %zu repositories\n",
                        registry.Available().size(), registry.Repositories().size());
            return 0;
        case reposync::SyncOutcome::NoChanges:
            std::printf("Repositories already up to date\n");
            return 0;
        case reposync::SyncOutcome::Failed:
            std::fprintf(stderr, "ERROR: %s\n", orchestrator.LastFailure().msg.c_str());
            return 1;
    }
    return 1;
}
