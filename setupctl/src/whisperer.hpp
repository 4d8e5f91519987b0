#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Per-technology installer description ("whisperer").
// Templates may contain {installer} and {key}, expanded by initialize_adapter(),
// and the log template carries {path}, expanded by the argument builder.
struct InstallerAdapter {
    std::string install_method;
    std::string executable = "{installer}";
    std::optional<std::string> silent_args;
    std::optional<std::string> interactive_args;
    std::optional<std::string> passive_args;
    std::optional<std::string> log_args;
    std::map<int, std::string> exit_codes;
};

struct AdapterContext {
    std::filesystem::path installer_path;
    std::string uninstall_key;
};

// An adapter bound to one run.
struct InitializedAdapter {
    InstallerAdapter adapter;
    std::filesystem::path process_path;
};

InitializedAdapter initialize_adapter(const InstallerAdapter& adapter, const AdapterContext& context);

class AdapterRegistry {
public:
    // Throws SetupctlException if the install method is already claimed.
    void add(InstallerAdapter adapter);

    // Throws AdapterNotFoundException.
    const InstallerAdapter& find(std::string_view install_method) const;
    const InstallerAdapter* try_find(std::string_view install_method) const;

    std::vector<std::string> install_methods() const;
    size_t size() const { return adapters_.size(); }

private:
    std::map<std::string, InstallerAdapter, std::less<>> adapters_;
};

AdapterRegistry default_install_adapters();
AdapterRegistry default_uninstall_adapters();

// Registers adapters described in an INI file: [tag] sections go to the
// install registry, [uninstall.tag] sections to the uninstall registry.
void load_adapter_config(const std::filesystem::path& path, AdapterRegistry& install, AdapterRegistry& uninstall);
