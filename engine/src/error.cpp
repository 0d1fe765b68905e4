#include "branch_engine/error.hpp"

namespace branch {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDocument: return "invalid_document";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::DuplicateId: return "duplicate_id";
        case ErrorKind::InvalidRole: return "invalid_role";
        case ErrorKind::InvalidOperation: return "invalid_operation";
        case ErrorKind::OutOfRange: return "out_of_range";
        case ErrorKind::WriteError: return "write_error";
        case ErrorKind::AccessDenied: return "access_denied";
        case ErrorKind::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

BranchError::BranchError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace branch
