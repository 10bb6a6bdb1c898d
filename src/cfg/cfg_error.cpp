/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_error.h"

namespace nxcfg::cfg {
std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TruncatedInput:
            return "TruncatedInput";
        case ErrorKind::UnknownTypeTag:
            return "UnknownTypeTag";
        case ErrorKind::MalformedEntryName:
            return "MalformedEntryName";
        case ErrorKind::PayloadLengthMismatch:
            return "PayloadLengthMismatch";
        case ErrorKind::InternalRenderError:
            return "InternalRenderError";
        case ErrorKind::InvalidHeader:
            return "InvalidHeader";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}
}  // namespace nxcfg::cfg
