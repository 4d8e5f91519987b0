#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "install_service.hpp"
#include "installed_db.hpp"
#include "localization.hpp"
#include "manifest.hpp"
#include "matcher.hpp"
#include "selector.hpp"
#include "transfer.hpp"
#include "unlocker.hpp"
#include "utils.hpp"
#include "cxxopts.hpp"

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

// The production collaborators, wired once per invocation.
struct DefaultCollaborators {
    explicit DefaultCollaborators(const std::filesystem::path& installed_db) : installed(installed_db) {}

    ArchitectureInstallerSelector selector;
    FileTransferService transfer;
    InstalledDatabase installed;
    FolderUnlocker unlocker;
    NameRecordMatcher matcher;
    PosixProcessController processes;
    LogEventSink events;
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.uninstall_desc") << std::endl;
}

void report_installer_failure(const InstallerException& e) {
    log_error(e.what());
    if (!e.reason().empty()) {
        log_error(string_format("error.installer_reason", e.reason()));
    }
    if (e.log_file()) {
        log_error(string_format("error.installer_log", e.log_file()->string()));
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();
        CurlGlobal curl;

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("i,interactivity", get_string("help.interactivity"), cxxopts::value<std::string>()->default_value("passive"))
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("arch", get_string("help.target_arch"), cxxopts::value<std::string>())
            ("adapters", get_string("help.adapters"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("targets", "", cxxopts::value<std::vector<std::string>>());
        options.parse_positional({"command", "targets"});

        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            print_usage(options);
            return 0;
        }
        if (!args.count("command") || !args.count("targets")) {
            print_usage(options);
            return 1;
        }

        if (args.count("root")) set_root_path(args["root"].as<std::string>());
        if (args.count("arch")) set_architecture(args["arch"].as<std::string>());
        const InteractivityLevel interactivity = parse_interactivity(args["interactivity"].as<std::string>());

        init_filesystem();
        TmpDirManager tmp_dir;

        AdapterRegistry install_adapters = default_install_adapters();
        AdapterRegistry uninstall_adapters = default_uninstall_adapters();
        load_adapter_config(ADAPTERS_CONF, install_adapters, uninstall_adapters);
        if (args.count("adapters")) {
            load_adapter_config(args["adapters"].as<std::string>(), install_adapters, uninstall_adapters);
        }

        DefaultCollaborators collaborators(INSTALLED_DB);
        InstallService service({
            .selector = collaborators.selector,
            .transfer = collaborators.transfer,
            .prior_installations = collaborators.installed,
            .unlocker = collaborators.unlocker,
            .installed_records = collaborators.installed,
            .matcher = collaborators.matcher,
            .processes = collaborators.processes,
            .events = collaborators.events,
            .install_adapters = install_adapters,
            .uninstall_adapters = uninstall_adapters,
        });

        const std::map<std::string, std::function<void(const std::string&)>> commands = {
            {"install", [&](const std::string& manifest_path) {
                service.install(parse_manifest(manifest_path), {.interactivity = interactivity});
            }},
            {"uninstall", [&](const std::string& package_id) {
                service.uninstall({.package_id = package_id, .interactivity = interactivity});
            }},
        };

        auto command = commands.find(args["command"].as<std::string>());
        if (command == commands.end()) {
            print_usage(options);
            return 1;
        }
        // Stops at the first failing target.
        for (const auto& target : args["targets"].as<std::vector<std::string>>()) {
            command->second(target);
        }
    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const InstallerException& e) {
        report_installer_failure(e);
        return 1;
    } catch (const SetupctlException& e) {
        log_error(string_format("error.setupctl_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
