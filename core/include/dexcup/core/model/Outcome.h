#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <string>

namespace dexcup::core::model {

enum class Outcome {
    Win,
    Loss,
    Draw
};

const char* OutcomeName(Outcome outcome);
std::optional<Outcome> ParseOutcome(const std::string& value, TournamentError* error = nullptr);

// A decided qualification result. A draw never has a winner, a win or loss always has one.
class MatchResult {
public:
    static std::optional<MatchResult> Make(Outcome outcome,
                                           std::optional<CompetitorId> winner,
                                           TournamentError* error = nullptr);

    Outcome outcome() const { return outcome_; }
    const std::optional<CompetitorId>& winner() const { return winner_; }
    bool IsDraw() const { return outcome_ == Outcome::Draw; }

private:
    MatchResult(Outcome outcome, std::optional<CompetitorId> winner)
        : outcome_(outcome), winner_(std::move(winner)) {}

    Outcome outcome_;
    std::optional<CompetitorId> winner_;
};

}  // namespace dexcup::core::model
