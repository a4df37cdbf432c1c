#pragma once

/**
 * @file error.hpp
 * @brief Error value carried by every fallible fcat operation
 *
 * ERROR CLASSES:
 * - Filesystem / Fingerprint: scoped to one file, never abort a pass
 * - Store: aborts and rolls back the current write phase only
 * - Validation: returned before any catalog mutation happens
 * - NotFound: the addressed case, source or entry does not exist
 * - Config: rejected configuration file or value
 */

#include <string>

namespace fcat {

enum class ErrorKind {
    Filesystem,
    Fingerprint,
    Store,
    Validation,
    NotFound,
    Config
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Fingerprint: return "fingerprint";
        case ErrorKind::Store: return "store";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Store;
    std::string message;

    static Error filesystem(std::string msg) { return Error{ErrorKind::Filesystem, std::move(msg)}; }
    static Error fingerprint(std::string msg) { return Error{ErrorKind::Fingerprint, std::move(msg)}; }
    static Error store(std::string msg) { return Error{ErrorKind::Store, std::move(msg)}; }
    static Error validation(std::string msg) { return Error{ErrorKind::Validation, std::move(msg)}; }
    static Error not_found(std::string msg) { return Error{ErrorKind::NotFound, std::move(msg)}; }
    static Error config(std::string msg) { return Error{ErrorKind::Config, std::move(msg)}; }

    std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

} // namespace fcat
