#include "dexcup/core/model/Outcome.h"

namespace dexcup::core::model {

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Win:
            return "win";
        case Outcome::Loss:
            return "loss";
        case Outcome::Draw:
            return "draw";
    }
    return "unknown";
}

std::optional<Outcome> ParseOutcome(const std::string& value, TournamentError* error) {
    if (value == "win") {
        return Outcome::Win;
    }
    if (value == "loss") {
        return Outcome::Loss;
    }
    if (value == "draw") {
        return Outcome::Draw;
    }
    Fail(error, ErrorKind::InvalidInput, "Invalid outcome: " + value + ". Must be 'win', 'loss', or 'draw'");
    return std::nullopt;
}

std::optional<MatchResult> MatchResult::Make(Outcome outcome,
                                             std::optional<CompetitorId> winner,
                                             TournamentError* error) {
    if (outcome == Outcome::Draw && winner.has_value()) {
        Fail(error, ErrorKind::InvalidInput, "Winner must be null for draw outcomes");
        return std::nullopt;
    }
    if (outcome != Outcome::Draw && !winner.has_value()) {
        Fail(error, ErrorKind::InvalidInput, "Winner cannot be null for win/loss outcomes");
        return std::nullopt;
    }
    return MatchResult(outcome, std::move(winner));
}

}  // namespace dexcup::core::model
