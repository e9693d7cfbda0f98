#pragma once

#include "dexcup/core/bracket/DoubleEliminationBracket.h"
#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/Match.h"
#include "dexcup/core/model/Outcome.h"
#include "dexcup/core/model/Tournament.h"
#include "dexcup/core/model/TournamentError.h"
#include "dexcup/core/persist/ITournamentRepository.h"
#include "dexcup/core/tournament/TournamentTypes.h"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dexcup::core::api {

struct ManagerOptions {
    size_t max_log_lines = 2000;
    bool echo_stderr = true;
    // Seed the playoff as soon as the last Swiss round closes, when the field is large enough.
    bool auto_initialize_bracket = true;
};

struct StandingRow {
    model::CompetitorId participant;
    int score = 0;
    int wins = 0;
    int losses = 0;
    int draws = 0;
};

using LogFn = std::function<void(const std::string& line)>;

// Orchestrates a tournament through the repository: Swiss rounds first, then the
// double-elimination playoff. Every call loads fresh state; nothing is cached between calls.
class TournamentManager {
public:
    static constexpr int kPlayoffEntrants = bracket::DoubleEliminationBracket::kEntrants;

    explicit TournamentManager(persist::ITournamentRepository& repository,
                               ManagerOptions options = {},
                               LogFn log_fn = {});

    std::optional<model::Tournament> createTournament(const std::vector<model::CompetitorId>& participants,
                                                      const std::string& owner_email,
                                                      model::TournamentError* error);
    std::optional<model::Tournament> getTournament(const model::TournamentId& id,
                                                   model::TournamentError* error) const;
    bool getUserTournaments(const std::string& owner_email,
                            std::vector<model::Tournament>& tournaments,
                            model::TournamentError* error) const;

    bool getCurrentRoundPairings(const model::TournamentId& id,
                                 std::vector<tournament::Pairing>& pairings,
                                 model::TournamentError* error) const;
    bool recordMatchResult(const model::TournamentId& id,
                           const model::CompetitorId& participant1,
                           const model::CompetitorId& participant2,
                           model::Outcome outcome,
                           const std::optional<model::CompetitorId>& winner,
                           model::TournamentError* error);
    bool recordBye(const model::TournamentId& id,
                   const model::CompetitorId& participant,
                   model::TournamentError* error);
    bool isCurrentRoundComplete(const model::TournamentId& id, bool& complete, model::TournamentError* error) const;
    bool advanceToNextRound(const model::TournamentId& id, model::TournamentError* error);

    bool initializeBracket(const model::TournamentId& id, model::TournamentError* error);
    bool getBracket(const model::TournamentId& id,
                    std::optional<bracket::Bracket>& bracket,
                    model::TournamentError* error) const;
    bool recordBracketMatchResult(const model::TournamentId& id,
                                  const std::string& match_id,
                                  const model::CompetitorId& winner,
                                  model::TournamentError* error);
    bool getNextBracketMatch(const model::TournamentId& id,
                             std::optional<bracket::BracketMatch>& match,
                             model::TournamentError* error) const;
    bool isBracketComplete(const model::TournamentId& id, bool& complete, model::TournamentError* error) const;

    bool getCurrentStandings(const model::TournamentId& id,
                             std::vector<StandingRow>& rows,
                             model::TournamentError* error) const;
    bool getFinalStandings(const model::TournamentId& id,
                           std::vector<StandingRow>& rows,
                           model::TournamentError* error) const;
    // Tie-break order (score desc, id asc); this is the playoff seeding order.
    bool getSeededStandings(const model::TournamentId& id,
                            std::vector<StandingRow>& rows,
                            model::TournamentError* error) const;

    bool deleteTournament(const model::TournamentId& id, model::TournamentError* error);

    std::string getLastLogLines(int n) const;

private:
    bool RoundPairings(const model::Tournament& tournament,
                       std::vector<tournament::Pairing>& pairings,
                       model::TournamentError* error) const;
    bool LoadCurrentRoundMatches(const model::Tournament& tournament,
                                 std::vector<model::StoredMatch>& matches,
                                 model::TournamentError* error) const;
    void AppendLogLine(const std::string& line);

    persist::ITournamentRepository& repository_;
    ManagerOptions options_;
    LogFn log_fn_;

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_{};
};

}  // namespace dexcup::core::api
