#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/Outcome.h"
#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <string>

namespace dexcup::core::model {

// Persisted form of a decided qualification match.
struct StoredMatch {
    CompetitorId participant1;
    CompetitorId participant2;
    int round = 0;
    Outcome outcome = Outcome::Draw;
    std::optional<CompetitorId> winner;
};

class Match {
public:
    Match(CompetitorId participant1, std::optional<CompetitorId> participant2, int round)
        : participant1_(std::move(participant1)), participant2_(std::move(participant2)), round_(round) {}

    const CompetitorId& participant1() const { return participant1_; }
    const std::optional<CompetitorId>& participant2() const { return participant2_; }
    int round() const { return round_; }
    bool is_bye() const { return !participant2_.has_value(); }

    const std::optional<MatchResult>& result() const { return result_; }
    bool IsComplete() const { return result_.has_value(); }

    // Write-once. The winner, when present, must be one of the two participants.
    bool RecordResult(const MatchResult& result, TournamentError* error);

    // Null until a result is recorded.
    const CompetitorId* Loser() const;

    std::string ToString() const;

private:
    CompetitorId participant1_;
    std::optional<CompetitorId> participant2_;
    int round_ = 0;
    std::optional<MatchResult> result_;
};

}  // namespace dexcup::core::model
