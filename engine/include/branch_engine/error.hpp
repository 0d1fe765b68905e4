#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace branch {

enum class ErrorKind {
    InvalidDocument,
    NotFound,
    DuplicateId,
    InvalidRole,
    InvalidOperation,
    OutOfRange,
    WriteError,
    AccessDenied,
    InvalidConfig
};

// Stable snake_case name, used as the error_code in rendered responses.
const char* error_kind_name(ErrorKind kind);

class BranchError : public std::runtime_error {
public:
    BranchError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

template <typename... T>
[[noreturn]] void raise(ErrorKind kind, fmt::format_string<T...> fmt, T&&... args) {
    throw BranchError(kind, fmt::format(fmt, std::forward<T>(args)...));
}

} // namespace branch
