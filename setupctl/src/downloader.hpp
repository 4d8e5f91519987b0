#pragma once

#include <filesystem>
#include <string>

struct DownloadOptions {
    int max_retries = 5;
    long connect_timeout_seconds = 30;
    bool show_progress = true;
};

// Fetches url into output_path. The data lands in "<output_path>.part" and is
// renamed into place only after a complete, successful transfer.
void download_file(const std::string& url, const std::filesystem::path& output_path, const DownloadOptions& options = {});

// Retries with a growing pause between attempts; rethrows the last TransferException.
void download_with_retries(const std::string& url, const std::filesystem::path& output_path, const DownloadOptions& options = {});

// Process-wide libcurl initialization, held for the lifetime of main().
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};
