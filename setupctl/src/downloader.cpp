#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

namespace {

struct TransferState {
    std::ofstream* out;
    std::string label;
};

size_t write_chunk(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t bytes = size * nmemb;
    state->out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return state->out->good() ? bytes : 0;
}

int report_progress(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (dltotal <= 0) {
        return 0;
    }
    auto* state = static_cast<TransferState*>(userdata);
    log_progress(state->label, static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0);
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

fs::path partial_path(const fs::path& output_path) {
    fs::path partial = output_path;
    partial += ".part";
    return partial;
}

} // anonymous namespace

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw TransferException(get_string("error.curl_init_failed"));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

void download_file(const std::string& url, const fs::path& output_path, const DownloadOptions& options) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransferException(string_format("error.download_failed", url));
    }

    const fs::path partial = partial_path(output_path);
    CURLcode res;
    long http_status = 0;
    {
        std::ofstream ofile(partial, std::ios::binary | std::ios::trunc);
        if (!ofile) {
            throw TransferException(string_format("error.create_file_failed", partial.string()));
        }

        TransferState state{&ofile, string_format("info.downloading", output_path.filename().string())};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "setupctl/" SETUPCTL_VERSION);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_chunk);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, options.show_progress ? 0L : 1L);
        if (options.show_progress) {
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, report_progress);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
        }

        res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
        if (options.show_progress && isatty(STDOUT_FILENO)) {
            std::cout << std::endl;
        }
    }

    std::error_code ec;
    if (res != CURLE_OK) {
        fs::remove(partial, ec);
        throw TransferException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
    // Servers that answer an installer URL with an error page must not pass as a download.
    if (http_status >= 400) {
        fs::remove(partial, ec);
        throw TransferException(string_format("error.http_status", url, http_status));
    }

    fs::rename(partial, output_path, ec);
    if (ec) {
        throw TransferException(string_format("error.copy_failed", partial.string(), output_path.string()) + ": " + ec.message());
    }
}

void download_with_retries(const std::string& url, const fs::path& output_path, const DownloadOptions& options) {
    const int attempts = options.max_retries > 0 ? options.max_retries : 1;
    for (int attempt = 1; ; ++attempt) {
        try {
            download_file(url, output_path, options);
            return;
        } catch (const TransferException& e) {
            if (attempt >= attempts) {
                throw;
            }
            log_warning(string_format("warning.download_retry", e.what(), attempt, attempts));
            std::this_thread::sleep_for(std::chrono::seconds(attempt));
        }
    }
}
