#pragma once

#include "dexcup/core/bracket/DoubleEliminationBracket.h"
#include "dexcup/core/bracket/SingleEliminationBracket.h"
#include "dexcup/core/model/Participant.h"
#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <vector>

namespace dexcup::core::seeding {

// Cuts Swiss standings down to a seeded playoff field.
class PlayoffSeeding {
public:
    // Score desc, id asc. Standings entries missing from |pool| become fresh placeholder participants.
    static std::vector<model::Participant> SeedTopN(const std::vector<model::Participant>& pool,
                                                    const model::ScoreMap& standings,
                                                    int top_n);

    static std::vector<model::CompetitorId> SeedIds(const std::vector<model::Participant>& seeded);

    static std::optional<bracket::SingleEliminationBracket> CreateSingleElimination(
        const std::vector<model::Participant>& pool,
        const model::ScoreMap& standings,
        int top_n,
        model::TournamentError* error);

    static bool CreateDoubleElimination(const std::vector<model::Participant>& pool,
                                        const model::ScoreMap& standings,
                                        int top_n,
                                        bracket::Bracket& bracket,
                                        model::TournamentError* error);
};

}  // namespace dexcup::core::seeding
