// applications/tempo_report/main.cpp
#include "tempo/core/event_loop.hpp"
#include "tempo/core/profile_stack.hpp"
#include "tempo/core/throttle.hpp"
#include "tempo/host/filesystem.hpp"
#include "tempo/host/git_info.hpp"
#include "tempo/host/notifier.hpp"
#include "tempo/host/profile_report.hpp"
#include "tempo/host/uri_opener.hpp"
#include "tempo/host/zmq_notifier.hpp"
#include "tempo/utils/config.hpp"
#include "tempo/utils/dump.hpp"
#include "tempo/utils/logger.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using tempo::utils::Logger;
namespace keys = tempo::utils::config_keys;

// Usage: tempo_report [config file] [uri to open]
int main(int argc, char** argv) {
    try {
        auto config = tempo::utils::Config::instance();
        std::string config_file = argc > 1 ? argv[1] : "tempo.conf";
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        Logger::set_level(tempo::utils::parse_level(config->get(keys::LOG_LEVEL, "info")));

        auto clock = std::make_shared<tempo::core::SteadyClock>();
        tempo::core::EventLoop loop(clock);
        tempo::core::ProfileStack profile(clock, config->get(keys::PROFILE_ROOT_NAME, "session"));

        tempo::host::NotifierPtr notifier;
        std::string endpoint = config->get(keys::NOTIFY_ENDPOINT, "");
        if (endpoint.empty()) {
            notifier = std::make_shared<tempo::host::LogNotifier>();
        } else {
            notifier = std::make_shared<tempo::host::ZmqNotifier>(endpoint);
        }

        std::string scan_path = config->get(keys::SCAN_PATH, ".");
        auto cooldown = std::chrono::milliseconds(config->get<long>(keys::THROTTLE_COOLDOWN_MS, 100));

        // Progress updates are throttled so a large tree does not flood the UI
        size_t scanned = 0;
        auto report_progress = tempo::core::make_throttle(loop, cooldown, [&]() {
            tempo::host::info(*notifier, "Scanned " + std::to_string(scanned) + " entries");
        });

        tempo::utils::Value summary = tempo::utils::Value::table();
        {
            tempo::core::ProfileScope scope(profile, "scan " + scan_path);
            size_t files = 0;
            size_t directories = 0;
            for (const auto& entry : tempo::host::scandir(scan_path)) {
                ++scanned;
                if (entry.type == tempo::host::EntryType::DIRECTORY) {
                    ++directories;
                    tempo::core::ProfileScope nested(profile, entry.name);
                    scanned += tempo::host::scandir(entry.path).size();
                } else if (entry.type == tempo::host::EntryType::REGULAR_FILE) {
                    ++files;
                }
                report_progress();
                loop.run_once();
            }
            summary.set("path", scan_path);
            summary.set("files", static_cast<double>(files));
            summary.set("directories", static_cast<double>(directories));
            summary.set("entries", static_cast<double>(scanned));
        }

        {
            tempo::core::ProfileScope scope(profile, "git");
            if (auto git = tempo::host::git_info(scan_path)) {
                summary.set("branch", git->branch);
                summary.set("hash", git->hash);
            } else {
                summary.set("branch", false);
            }
        }

        if (argc > 2) {
            tempo::core::ProfileScope scope(profile, "open");
            tempo::host::UriOpener opener(notifier, [](const std::string& path) {
                Logger::info() << "Viewing " << path << Logger::endl;
            });
            summary.set("opened", opener.open(argv[2]));
        }

        // Let the trailing progress update land before the summary
        loop.run();

        tempo::host::info(*notifier, tempo::utils::dump(summary));
        tempo::host::show_profile(profile, *notifier);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
