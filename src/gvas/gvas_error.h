/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>

namespace palsav::gvas {
enum class ErrorKind {
    MalformedEnvelope,
    Decompression,
    MalformedTree,
    SubRecord,
    InvalidTree,
};

const char* error_kind_name(ErrorKind kind);

class SaveError : public std::runtime_error {
   public:
    SaveError(ErrorKind kind, const std::string& message, std::string path = {})
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    ErrorKind kind() const { return kind_; }
    // Dotted property path the failure was raised under, empty when not known.
    const std::string& path() const { return path_; }

   private:
    ErrorKind kind_;
    std::string path_;
};
}  // namespace palsav::gvas
