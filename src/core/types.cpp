// DIRGATE - Core Types Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/core/types.h"

namespace dirgate {

const char* OperationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::List: return "list";
        case OperationKind::Search: return "search";
        case OperationKind::Upload: return "upload";
        case OperationKind::Download: return "download";
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
    }
    return "unknown";
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AccessDenied: return "AccessDenied";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace dirgate
