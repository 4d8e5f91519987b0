#include "transfer.hpp"

#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string file_name_of(const std::string& location) {
    std::string name = location.substr(0, location.find_first_of("?#"));
    if (auto pos = name.find_last_of('/'); pos != std::string::npos) {
        name = name.substr(pos + 1);
    }
    return name.empty() ? "installer" : name;
}

} // anonymous namespace

bool is_remote_location(const std::string& location) {
    const std::string lower = to_lower(location);
    return lower.starts_with("http://") || lower.starts_with("https://") || lower.starts_with("ftp://");
}

fs::path FileTransferService::fetch(const std::string& location, const fs::path& destination_dir,
                                    const std::string& expected_sha256) {
    ensure_dir_exists(destination_dir);
    const fs::path destination = destination_dir / file_name_of(location);

    if (is_remote_location(location)) {
        log_info(string_format("info.downloading_installer", location));
        download_with_retries(location, destination, {.max_retries = max_retries_});
    } else {
        fs::path source = location;
        if (location.starts_with("file://")) {
            source = location.substr(7);
        }
        if (!fs::is_regular_file(source)) {
            throw TransferException(string_format("error.installer_not_found", source.string()));
        }
        std::error_code ec;
        // Already in place: copying a file onto itself fails.
        std::error_code same_ec;
        const bool in_place = fs::exists(destination, same_ec) && fs::equivalent(source, destination, same_ec);
        if (!in_place) {
            fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throw TransferException(string_format("error.copy_failed", source.string(), destination.string()) + ": " + ec.message());
        }
    }

    if (expected_sha256.empty()) {
        log_warning(string_format("warning.no_hash", location));
    } else {
        log_info(get_string("info.verifying_hash"));
        const std::string actual = calculate_sha256(destination);
        if (!sha256_matches(actual, expected_sha256)) {
            std::error_code ec;
            fs::remove(destination, ec);
            throw TransferException(string_format("error.hash_mismatch", location, expected_sha256, actual));
        }
    }

    std::error_code ec;
    fs::permissions(destination, fs::perms::owner_exec, fs::perm_options::add, ec);
    if (ec) {
        log_warning(string_format("warning.chmod_failed", destination.string(), ec.message()));
    }
    return destination;
}
