#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <ctime>

#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = SETUPCTL_CONF_DIR;
fs::path STATE_DIR = SETUPCTL_STATE_DIR;
fs::path LOG_DIR = SETUPCTL_LOG_DIR;
fs::path L10N_DIR = SETUPCTL_L10N_DIR;

// Derived paths
fs::path ADAPTERS_CONF = fs::path(SETUPCTL_CONF_DIR) / "adapters.conf";
fs::path INSTALLED_DB = fs::path(SETUPCTL_STATE_DIR) / "installed.db";

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(SETUPCTL_CONF_DIR);
    STATE_DIR = rebase(SETUPCTL_STATE_DIR);
    LOG_DIR = rebase(SETUPCTL_LOG_DIR);

    ADAPTERS_CONF = CONFIG_DIR / "adapters.conf";
    INSTALLED_DB = STATE_DIR / "installed.db";
}

fs::path get_tmp_dir() {
    static const fs::path tmp_dir = fs::path("/tmp") / ("setupctl_" + std::to_string(getpid()));
    return tmp_dir;
}

void init_filesystem() {
    ensure_dir_exists(CONFIG_DIR);
    ensure_dir_exists(STATE_DIR);
    ensure_dir_exists(LOG_DIR);
    ensure_file_exists(INSTALLED_DB);
}

static std::string g_architecture_override;

void set_architecture(const std::string& arch) {
    g_architecture_override = arch;
}

std::string get_architecture() {
    if (!g_architecture_override.empty()) {
        return g_architecture_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw SetupctlException(get_string("error.get_arch_failed"));
    }
    const std::string arch(buf.machine);
    if (arch == "x86_64") return "x64";
    if (arch == "aarch64") return "arm64";
    if (arch == "i386" || arch == "i686") return "x86";
    throw SetupctlException(string_format("error.unsupported_arch", arch));
}

std::string log_file_stem(std::string_view package_id) {
    std::string stem;
    stem.reserve(package_id.size());
    for (unsigned char c : package_id) {
        const bool safe = std::isalnum(c) || c == '.' || c == '_' || c == '-';
        stem += safe ? static_cast<char>(c) : '_';
    }
    // "." and ".." would name a directory, not a file.
    if (stem.find_first_not_of('.') == std::string::npos) {
        return "unknown";
    }
    return stem;
}

fs::path get_installer_log_file(const std::string& package_id) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local_tm);

    return LOG_DIR / fmt::format("{}_{}.log", log_file_stem(package_id), stamp);
}
