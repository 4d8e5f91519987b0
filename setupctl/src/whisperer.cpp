#include "whisperer.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> expand(const std::optional<std::string>& tmpl, const AdapterContext& context) {
    if (!tmpl) return std::nullopt;
    std::string result = replace_all(*tmpl, "{installer}", context.installer_path.string());
    return replace_all(std::move(result), "{key}", context.uninstall_key);
}

const std::map<int, std::string> MSI_EXIT_CODES = {
    {1601, "The Windows Installer service could not be accessed"},
    {1602, "User cancelled installation"},
    {1603, "Fatal error during installation"},
    {1618, "Another installation is already in progress"},
    {1619, "This installation package could not be opened"},
    {1620, "This installation package could not be opened, contact the application vendor"},
    {1625, "This installation is forbidden by system policy"},
    {1638, "Another version of this product is already installed"},
    {1639, "Invalid command line argument"},
    {3010, "A restart is required to complete the install"},
};

const std::map<int, std::string> NSIS_EXIT_CODES = {
    {1, "Installation aborted by user"},
    {2, "Installation aborted by script"},
};

const std::map<int, std::string> INNO_EXIT_CODES = {
    {1, "Setup failed to initialize"},
    {2, "User clicked Cancel in the wizard before the actual installation started"},
    {3, "A fatal error occurred while preparing to move to the next installation phase"},
    {4, "A fatal error occurred during the actual installation process"},
    {5, "User clicked Cancel during the actual installation process"},
    {6, "Setup process was forcefully terminated by the debugger"},
    {7, "The Preparing to Install step determined that Setup cannot proceed with installation"},
    {8, "The Preparing to Install step determined that Setup cannot proceed and the system needs to be restarted"},
};

} // anonymous namespace

InitializedAdapter initialize_adapter(const InstallerAdapter& adapter, const AdapterContext& context) {
    InitializedAdapter initialized;
    initialized.adapter = adapter;
    initialized.adapter.silent_args = expand(adapter.silent_args, context);
    initialized.adapter.interactive_args = expand(adapter.interactive_args, context);
    initialized.adapter.passive_args = expand(adapter.passive_args, context);
    initialized.adapter.log_args = expand(adapter.log_args, context);
    initialized.adapter.executable = *expand(adapter.executable, context);
    initialized.process_path = initialized.adapter.executable;

    if (initialized.process_path.empty()) {
        throw SetupctlException(string_format("error.adapter_no_executable", adapter.install_method));
    }
    return initialized;
}

void AdapterRegistry::add(InstallerAdapter adapter) {
    if (adapter.install_method.empty()) {
        throw SetupctlException(get_string("error.adapter_empty_method"));
    }
    if (adapters_.contains(adapter.install_method)) {
        throw SetupctlException(string_format("error.adapter_duplicate", adapter.install_method));
    }
    std::string key = adapter.install_method;
    adapters_.emplace(std::move(key), std::move(adapter));
}

const InstallerAdapter* AdapterRegistry::try_find(std::string_view install_method) const {
    auto it = adapters_.find(install_method);
    return it == adapters_.end() ? nullptr : &it->second;
}

const InstallerAdapter& AdapterRegistry::find(std::string_view install_method) const {
    if (const auto* adapter = try_find(install_method)) {
        return *adapter;
    }
    throw AdapterNotFoundException(std::string(install_method),
                                   string_format("error.adapter_not_found", std::string(install_method)));
}

std::vector<std::string> AdapterRegistry::install_methods() const {
    std::vector<std::string> methods;
    methods.reserve(adapters_.size());
    for (const auto& [method, adapter] : adapters_) {
        methods.push_back(method);
    }
    return methods;
}

AdapterRegistry default_install_adapters() {
    AdapterRegistry registry;

    registry.add({
        .install_method = "msi",
        .executable = "msiexec",
        .silent_args = R"(/i "{installer}" /qn /norestart)",
        .interactive_args = R"(/i "{installer}")",
        .passive_args = R"(/i "{installer}" /qb /norestart)",
        .log_args = "/L*V {path}",
        .exit_codes = MSI_EXIT_CODES,
    });

    registry.add({
        .install_method = "nsis",
        .silent_args = "/S",
        .interactive_args = "",
        .exit_codes = NSIS_EXIT_CODES,
    });

    registry.add({
        .install_method = "inno",
        .silent_args = "/VERYSILENT /SUPPRESSMSGBOXES /NORESTART /SP-",
        .interactive_args = "/SP-",
        .passive_args = "/SILENT /SUPPRESSMSGBOXES /NORESTART /SP-",
        .log_args = "/LOG={path}",
        .exit_codes = INNO_EXIT_CODES,
    });

    registry.add({
        .install_method = "squirrel",
        .silent_args = "--silent",
        .interactive_args = "",
    });

    // Custom executables: every argument comes from the package manifest.
    registry.add({
        .install_method = "exe",
    });

    return registry;
}

AdapterRegistry default_uninstall_adapters() {
    AdapterRegistry registry;

    registry.add({
        .install_method = "msi",
        .executable = "msiexec",
        .silent_args = "/x {key} /qn /norestart",
        .interactive_args = "/x {key}",
        .passive_args = "/x {key} /qb /norestart",
        .log_args = "/L*V {path}",
        .exit_codes = MSI_EXIT_CODES,
    });

    registry.add({
        .install_method = "nsis",
        .executable = "{key}",
        .silent_args = "/S",
        .interactive_args = "",
        .exit_codes = NSIS_EXIT_CODES,
    });

    registry.add({
        .install_method = "inno",
        .executable = "{key}",
        .silent_args = "/VERYSILENT /SUPPRESSMSGBOXES /NORESTART",
        .interactive_args = "",
        .passive_args = "/SILENT /SUPPRESSMSGBOXES /NORESTART",
        .log_args = "/LOG={path}",
        .exit_codes = INNO_EXIT_CODES,
    });

    registry.add({
        .install_method = "exe",
        .executable = "{key}",
    });

    return registry;
}

void load_adapter_config(const fs::path& path, AdapterRegistry& install, AdapterRegistry& uninstall) {
    if (!fs::exists(path)) return;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw SetupctlException(string_format("error.open_file_failed", path.string()));
    }

    std::optional<InstallerAdapter> current;
    AdapterRegistry* target = nullptr;

    auto flush = [&]() {
        if (current) {
            target->add(std::move(*current));
            current.reset();
        }
    };

    std::string raw;
    size_t line_number = 0;
    while (std::getline(file, raw)) {
        ++line_number;
        const std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            flush();
            std::string section = to_lower(trim(line.substr(1, line.size() - 2)));
            target = &install;
            if (section.starts_with("uninstall.")) {
                section = section.substr(10);
                target = &uninstall;
            }
            current = InstallerAdapter{.install_method = section};
            continue;
        }

        const auto pos = line.find('=');
        if (!current || pos == std::string::npos) {
            throw SetupctlException(string_format("error.adapter_config_bad_line", path.string(), line_number));
        }

        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));

        if (key == "executable") current->executable = value;
        else if (key == "silent") current->silent_args = value;
        else if (key == "interactive") current->interactive_args = value;
        else if (key == "passive") current->passive_args = value;
        else if (key == "log") current->log_args = value;
        else if (key.starts_with("exit.")) {
            const std::string code_text = key.substr(5);
            int code = 0;
            auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
            if (ec != std::errc() || ptr != code_text.data() + code_text.size()) {
                throw SetupctlException(string_format("error.adapter_config_bad_line", path.string(), line_number));
            }
            current->exit_codes[code] = value;
        } else {
            throw SetupctlException(string_format("error.adapter_config_bad_line", path.string(), line_number));
        }
    }
    flush();
}
