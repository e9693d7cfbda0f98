#pragma once

#include <string>

namespace dexcup::core::model {

enum class ErrorKind {
    None,
    InvalidInput,
    IllegalState,
    Storage
};

struct TournamentError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
};

const char* ErrorKindName(ErrorKind kind);

// Fills |error| when present and returns false so callers can `return Fail(...)`.
bool Fail(TournamentError* error, ErrorKind kind, std::string message);

}  // namespace dexcup::core::model
