#include "dexcup/core/model/TournamentError.h"

namespace dexcup::core::model {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InvalidInput:
            return "invalid_input";
        case ErrorKind::IllegalState:
            return "illegal_state";
        case ErrorKind::Storage:
            return "storage";
    }
    return "unknown";
}

bool Fail(TournamentError* error, ErrorKind kind, std::string message) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
    }
    return false;
}

}  // namespace dexcup::core::model
