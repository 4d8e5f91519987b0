#include "unlocker.hpp"

#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

void FolderUnlocker::unlock(const fs::path& path, const std::string& install_method) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log_warning(string_format("warning.unlock_missing", path.string()));
        return;
    }

    log_info(string_format("info.unlocking", path.string(), install_method));

    auto make_writable = [](const fs::path& p) {
        std::error_code perm_ec;
        if (fs::is_symlink(p, perm_ec)) return;
        fs::permissions(p, fs::perms::owner_write, fs::perm_options::add, perm_ec);
        if (perm_ec) {
            log_warning(string_format("warning.unlock_failed", p.string(), perm_ec.message()));
        }
    };

    make_writable(path);
    if (!fs::is_directory(path, ec)) return;

    for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        make_writable(it->path());
    }
    if (ec) {
        log_warning(string_format("warning.unlock_failed", path.string(), ec.message()));
    }
}
