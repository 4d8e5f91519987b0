#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Incremental SHA-256 over OpenSSL EVP.
class Sha256Digest {
public:
    Sha256Digest();

    void update(const void* data, size_t size);
    // Lowercase hex. The digest cannot be updated afterwards.
    std::string hex_digest();

private:
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx_;
};

// Throws SetupctlException if the file cannot be read.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Compares against a declared digest, ignoring case and surrounding blanks.
bool sha256_matches(std::string_view actual, std::string_view declared);
