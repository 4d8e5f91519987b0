#pragma once

#include "manifest.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct InstalledRecord {
    std::string id;
    std::string package_id;
    std::string install_method;
    std::string display_name;
    std::string display_version;
    std::optional<std::filesystem::path> installation_path;
};

struct PriorInstallation {
    std::optional<std::filesystem::path> installation_path;
};

class InstallerSelector {
public:
    virtual ~InstallerSelector() = default;
    // Deterministic for the same candidate set.
    virtual const InstallerDescriptor& best_installer(const std::vector<InstallerDescriptor>& candidates) = 0;
};

class TransferService {
public:
    virtual ~TransferService() = default;
    // Never returns a path whose hash failed verification.
    virtual std::filesystem::path fetch(const std::string& location, const std::filesystem::path& destination_dir,
                                        const std::string& expected_sha256) = 0;
};

class PriorInstallationLookup {
public:
    virtual ~PriorInstallationLookup() = default;
    virtual std::vector<PriorInstallation> updates_for(const std::string& package_id) = 0;
};

class Unlocker {
public:
    virtual ~Unlocker() = default;
    // Idempotent.
    virtual void unlock(const std::filesystem::path& path, const std::string& install_method) = 0;
};

class InstalledRecordSource {
public:
    virtual ~InstalledRecordSource() = default;
    virtual std::vector<InstalledRecord> records() = 0;
    virtual std::string key(const std::string& record_id) = 0;
};

class RecordMatcher {
public:
    virtual ~RecordMatcher() = default;
    virtual std::vector<InstalledRecord> match_for(const std::vector<InstalledRecord>& records,
                                                   const std::string& target_id) = 0;
};
