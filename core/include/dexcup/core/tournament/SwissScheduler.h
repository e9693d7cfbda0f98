#pragma once

#include "dexcup/core/model/Match.h"
#include "dexcup/core/model/Outcome.h"
#include "dexcup/core/model/Participant.h"
#include "dexcup/core/model/TournamentError.h"
#include "dexcup/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace dexcup::core::tournament {

class SwissScheduler {
public:
    static constexpr int kMinRounds = 3;
    static constexpr int kMaxRounds = 8;

    // Greedy Swiss pairing. With standings, participants are ordered by score desc then id asc
    // and each one takes the closest-scored unpaired opponent it has not met; ties go to the
    // first candidate in that order. A participant with no eligible opponent gets a bye.
    static bool GeneratePairings(const std::vector<model::CompetitorId>& participants,
                                 const std::vector<Matchup>& previous_matchups,
                                 const model::ScoreMap& standings,
                                 std::vector<Pairing>& pairings,
                                 model::TournamentError* error);

    // 0 rounds for a single participant, otherwise ceil(log2(n)) clamped to [3, 8].
    static bool CalculateTotalRounds(int participant_count, int& rounds, model::TournamentError* error);

    static std::vector<StandingEntry> SortStandingsByTieBreaker(const model::ScoreMap& standings,
                                                                const std::vector<model::CompetitorId>& participants);

    static int GetScoreForResult(model::Outcome outcome);
    static bool GetScoreForResult(const std::string& outcome, int& score, model::TournamentError* error);

    // Recomputes scores from stored results: a win credits participant1, a draw credits both.
    static model::ScoreMap CalculateStandings(const std::vector<model::CompetitorId>& participants,
                                              const std::vector<model::StoredMatch>& results);
};

}  // namespace dexcup::core::tournament
