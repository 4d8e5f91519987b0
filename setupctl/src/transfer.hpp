#pragma once

#include "collaborators.hpp"

// Downloads remote installers with libcurl, copies local ones, and verifies
// the SHA-256 when the manifest declares one.
class FileTransferService : public TransferService {
public:
    explicit FileTransferService(int max_retries = 5) : max_retries_(max_retries) {}

    std::filesystem::path fetch(const std::string& location, const std::filesystem::path& destination_dir,
                                const std::string& expected_sha256) override;

private:
    int max_retries_;
};

bool is_remote_location(const std::string& location);
