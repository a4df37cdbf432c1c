#include "fcat/ingest/fingerprint.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <vector>

namespace fcat::ingest {
namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_context() {
    return DigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
}

std::string to_hex(const unsigned char* bytes, unsigned int length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kDigits[bytes[i] >> 4]);
        hex.push_back(kDigits[bytes[i] & 0x0f]);
    }
    return hex;
}

Result<std::string> finish(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return Err<std::string>(Error::fingerprint("EVP_DigestFinal_ex failed"));
    }
    return Ok(to_hex(digest.data(), length));
}

} // namespace

Sha256Fingerprinter::Sha256Fingerprinter(std::size_t buffer_size)
    : buffer_size_(std::max<std::size_t>(buffer_size, 4096)) {}

Result<std::string> Sha256Fingerprinter::fingerprint(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(Error::fingerprint("Cannot open " + path.string()));
    }

    auto ctx = make_context();
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(Error::fingerprint("Cannot initialise SHA-256 context"));
    }

    std::vector<char> buffer(buffer_size_);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), count) != 1) {
            return Err<std::string>(Error::fingerprint("EVP_DigestUpdate failed for " + path.string()));
        }
    }
    if (input.bad()) {
        return Err<std::string>(Error::fingerprint("Read error on " + path.string()));
    }

    return finish(ctx.get());
}

Result<std::string> Sha256Fingerprinter::digest(const std::string& data) {
    auto ctx = make_context();
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(Error::fingerprint("Cannot initialise SHA-256 context"));
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Err<std::string>(Error::fingerprint("EVP_DigestUpdate failed"));
    }
    return finish(ctx.get());
}

} // namespace fcat::ingest
