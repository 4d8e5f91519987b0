#pragma once

#include "collaborators.hpp"

#include <filesystem>

// Tab-separated installed-record file, one record per line:
// record id, package id, install method, display name, display version,
// installation path, uninstall key.
class InstalledDatabase : public InstalledRecordSource, public PriorInstallationLookup {
public:
    explicit InstalledDatabase(std::filesystem::path path);

    std::vector<InstalledRecord> records() override;
    std::string key(const std::string& record_id) override;
    std::vector<PriorInstallation> updates_for(const std::string& package_id) override;

private:
    struct Row {
        InstalledRecord record;
        std::string key;
    };

    std::vector<Row> read_rows() const;

    std::filesystem::path path_;
};
