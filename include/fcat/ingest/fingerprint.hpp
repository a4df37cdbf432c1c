#pragma once

#include "fcat/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace fcat::ingest {

/**
 * @brief Content digest of a file
 *
 * Implementations must be safe to call from several threads at once.
 * Failures are reported as ErrorKind::Fingerprint.
 */
class Fingerprinter {
public:
    virtual ~Fingerprinter() = default;

    virtual Result<std::string> fingerprint(const std::filesystem::path& path) const = 0;
};

/**
 * @brief SHA-256 over the file bytes, lowercase hex (64 characters)
 *
 * Streams the file through OpenSSL's EVP interface with a fixed-size
 * buffer, so memory use does not depend on file size.
 */
class Sha256Fingerprinter : public Fingerprinter {
public:
    explicit Sha256Fingerprinter(std::size_t buffer_size = 64 * 1024);

    Result<std::string> fingerprint(const std::filesystem::path& path) const override;

    /// SHA-256 of an in-memory buffer, same encoding as fingerprint().
    static Result<std::string> digest(const std::string& data);

private:
    std::size_t buffer_size_;
};

} // namespace fcat::ingest
