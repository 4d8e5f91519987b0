#include "manifest.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Strictly parses Tab-separated line: key\tvalue
std::optional<std::pair<std::string, std::string>> parse_tab_line(const std::string& line) {
    if (line.empty()) return std::nullopt;
    if (const auto pos = line.find('\t'); pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        if (!val.empty() && val.back() == '\r') val.pop_back();
        return std::make_pair(std::move(key), std::move(val));
    }
    return std::nullopt;
}

InstallerDescriptor parse_installer(const std::string& value) {
    InstallerDescriptor installer;
    std::istringstream fields(value);
    std::getline(fields, installer.location, '\t');
    std::getline(fields, installer.sha256, '\t');
    std::getline(fields, installer.architecture, '\t');
    installer.sha256 = to_lower(trim(installer.sha256));
    installer.architecture = to_lower(trim(installer.architecture));
    return installer;
}

} // anonymous namespace

PackageManifest parse_manifest(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SetupctlException(string_format("error.open_file_failed", path.string()));
    }

    PackageManifest manifest;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (trim(line).empty() || line[0] == '#') continue;

        auto entry = parse_tab_line(line);
        if (!entry) {
            throw SetupctlException(string_format("error.manifest_bad_line", path.string(), line_number));
        }
        auto& [key, value] = *entry;

        if (key == "id") manifest.id = trim(value);
        else if (key == "name") manifest.name = trim(value);
        else if (key == "version") manifest.version = trim(value);
        else if (key == "install_method") manifest.install_method = to_lower(trim(value));
        else if (key == "installer") manifest.installers.push_back(parse_installer(value));
        else if (key == "args.silent") manifest.args.silent = value;
        else if (key == "args.interactive") manifest.args.interactive = value;
        else if (key == "args.passive") manifest.args.passive = value;
        else if (key == "args.log") manifest.args.log = value;
        else log_warning(string_format("warning.manifest_unknown_key", key, path.string()));
    }

    if (manifest.id.empty()) {
        throw SetupctlException(string_format("error.manifest_missing_field", path.string(), "id"));
    }
    if (manifest.install_method.empty()) {
        throw SetupctlException(string_format("error.manifest_missing_field", path.string(), "install_method"));
    }
    if (manifest.installers.empty()) {
        throw SetupctlException(string_format("error.manifest_missing_field", path.string(), "installer"));
    }
    if (manifest.name.empty()) {
        manifest.name = manifest.id;
    }
    return manifest;
}
