#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <vector>

namespace dexcup::core::bracket {

struct KnockoutMatch {
    model::CompetitorId participant1;
    model::CompetitorId participant2;
    int round = 1;
    std::optional<model::CompetitorId> winner;
};

// Seeded knockout for a power-of-two field: round 1 pairs 1vN, 2vN-1, ... (for eight
// entrants in bracket order 1v8, 4v5, 3v6, 2v7); later rounds pair adjacent winners.
class SingleEliminationBracket {
public:
    static std::optional<SingleEliminationBracket> Create(const std::vector<model::CompetitorId>& seeds,
                                                          model::TournamentError* error = nullptr);

    const std::vector<KnockoutMatch>& CurrentRoundMatches() const;
    const std::vector<std::vector<KnockoutMatch>>& rounds() const { return rounds_; }
    int current_round() const { return current_round_index_ + 1; }

    bool RecordWinner(size_t match_index, const model::CompetitorId& winner, model::TournamentError* error);
    bool AdvanceRound(model::TournamentError* error);

    bool IsComplete() const { return winner_.has_value(); }
    const std::optional<model::CompetitorId>& Winner() const { return winner_; }

private:
    SingleEliminationBracket() = default;

    std::vector<std::vector<KnockoutMatch>> rounds_;
    int current_round_index_ = 0;
    std::optional<model::CompetitorId> winner_;
};

}  // namespace dexcup::core::bracket
