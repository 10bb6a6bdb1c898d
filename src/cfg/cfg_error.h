/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace nxcfg::cfg {
enum class ErrorKind {
    TruncatedInput,
    UnknownTypeTag,
    MalformedEntryName,
    PayloadLengthMismatch,
    InternalRenderError,
    InvalidHeader,
    InvalidArgument,
};

std::string_view error_kind_name(ErrorKind kind);

class CfgError : public std::runtime_error {
   public:
    CfgError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), _kind(kind) {}

    ErrorKind kind() const { return _kind; }

   private:
    ErrorKind _kind;
};
}  // namespace nxcfg::cfg
