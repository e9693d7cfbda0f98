#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/TournamentError.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dexcup::core::bracket {

enum class Ladder {
    Winner,
    Loser,
    GrandFinal
};

const char* LadderName(Ladder ladder);

struct BracketMatch {
    std::string id;
    Ladder ladder = Ladder::Winner;
    int round = 1;
    std::optional<model::CompetitorId> slot1;
    std::optional<model::CompetitorId> slot2;
    std::optional<model::CompetitorId> winner;

    bool IsReady() const { return slot1 && slot2 && !winner; }
    bool IsDecided() const { return winner.has_value(); }
    bool HasOpenSlot() const { return !slot1 || !slot2; }
    bool Contains(const model::CompetitorId& id) const {
        return (slot1 && *slot1 == id) || (slot2 && *slot2 == id);
    }
};

// Matches are owned by |matches|; the round lists only hold ids in creation order.
struct Bracket {
    std::map<std::string, BracketMatch> matches;
    std::vector<std::vector<std::string>> winner_rounds;
    std::vector<std::vector<std::string>> loser_rounds;
    std::string grand_final_id;
};

class DoubleEliminationBracket {
public:
    static constexpr int kEntrants = 16;
    static constexpr int kWinnerRounds = 4;
    static constexpr int kLoserRounds = 5;
    static constexpr const char* kGrandFinalId = "gf_1";

    static std::string MatchIdFor(Ladder ladder, int round, int sequence);

    // |seeds| ordered best to worst; seed i meets seed 15 - i in winner round 1.
    static bool CreateBracket(const std::vector<model::CompetitorId>& seeds,
                              Bracket& bracket,
                              model::TournamentError* error);

    // The next undecided match: winner rounds first, then loser rounds, then the grand final.
    static std::vector<BracketMatch> GetMatchesReadyForVoting(const Bracket& bracket);

    // Pure: |updated| receives the advanced bracket, |bracket| is never touched. On failure
    // |updated| is left as it was.
    static bool RecordMatchResult(const Bracket& bracket,
                                  const std::string& match_id,
                                  const model::CompetitorId& winner,
                                  Bracket& updated,
                                  model::TournamentError* error);

    static bool IsBracketComplete(const Bracket& bracket);
    static const BracketMatch* FindMatch(const Bracket& bracket, const std::string& match_id);
    static std::optional<model::CompetitorId> Champion(const Bracket& bracket);
};

}  // namespace dexcup::core::bracket
