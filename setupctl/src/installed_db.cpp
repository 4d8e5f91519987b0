#include "installed_db.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

InstalledDatabase::InstalledDatabase(fs::path path) : path_(std::move(path)) {}

std::vector<InstalledDatabase::Row> InstalledDatabase::read_rows() const {
    std::vector<Row> rows;
    if (!fs::exists(path_)) {
        return rows;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw SetupctlException(string_format("error.open_file_failed", path_.string()));
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        const std::vector<std::string> fields = split_fields(line, '\t');
        if (fields.size() < 7) {
            log_warning(string_format("warning.installed_db_bad_line", path_.string(), line_number));
            continue;
        }

        Row row;
        row.record.id = fields[0];
        row.record.package_id = fields[1];
        row.record.install_method = to_lower(fields[2]);
        row.record.display_name = fields[3];
        row.record.display_version = fields[4];
        if (!fields[5].empty()) {
            row.record.installation_path = fs::path(fields[5]);
        }
        row.key = fields[6];
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<InstalledRecord> InstalledDatabase::records() {
    std::vector<InstalledRecord> result;
    for (auto& row : read_rows()) {
        result.push_back(std::move(row.record));
    }
    return result;
}

std::string InstalledDatabase::key(const std::string& record_id) {
    for (auto& row : read_rows()) {
        if (row.record.id == record_id) {
            if (row.key.empty()) {
                throw SetupctlException(string_format("error.record_no_key", record_id));
            }
            return row.key;
        }
    }
    throw SetupctlException(string_format("error.record_not_found", record_id));
}

std::vector<PriorInstallation> InstalledDatabase::updates_for(const std::string& package_id) {
    std::vector<PriorInstallation> result;
    for (const auto& row : read_rows()) {
        if (row.record.package_id == package_id) {
            result.push_back({row.record.installation_path});
        }
    }
    return result;
}
