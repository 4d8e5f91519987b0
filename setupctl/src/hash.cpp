#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>

namespace {

void check_evp(int rc, const char* stage) {
    if (rc != 1) {
        throw SetupctlException(string_format("error.digest_failed", stage));
    }
}

} // anonymous namespace

Sha256Digest::Sha256Digest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw SetupctlException(string_format("error.digest_failed", "EVP_MD_CTX_new"));
    }
    check_evp(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "EVP_DigestInit_ex");
}

void Sha256Digest::update(const void* data, size_t size) {
    check_evp(EVP_DigestUpdate(ctx_.get(), data, size), "EVP_DigestUpdate");
}

std::string Sha256Digest::hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    check_evp(EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len), "EVP_DigestFinal_ex");

    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += digits[hash[i] >> 4];
        hex += digits[hash[i] & 0x0f];
    }
    return hex;
}

std::string calculate_sha256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw SetupctlException(string_format("error.open_file_failed", file_path.string()));
    }

    Sha256Digest digest;
    char buffer[64 * 1024];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        digest.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw SetupctlException(string_format("error.read_file_failed", file_path.string()));
    }
    return digest.hex_digest();
}

bool sha256_matches(std::string_view actual, std::string_view declared) {
    return to_lower(trim(actual)) == to_lower(trim(declared));
}
