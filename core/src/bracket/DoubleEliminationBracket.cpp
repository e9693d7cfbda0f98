#include "dexcup/core/bracket/DoubleEliminationBracket.h"

#include <set>
#include <sstream>

namespace dexcup::core::bracket {

namespace {

using model::CompetitorId;
using model::ErrorKind;

std::vector<std::vector<std::string>>* RoundsFor(Bracket& bracket, Ladder ladder) {
    switch (ladder) {
        case Ladder::Winner:
            return &bracket.winner_rounds;
        case Ladder::Loser:
            return &bracket.loser_rounds;
        case Ladder::GrandFinal:
            return nullptr;
    }
    return nullptr;
}

const BracketMatch* FirstUndecided(const Bracket& bracket, const std::vector<std::vector<std::string>>& rounds) {
    for (const auto& round : rounds) {
        for (const auto& id : round) {
            const auto it = bracket.matches.find(id);
            if (it != bracket.matches.end() && !it->second.IsDecided()) {
                return &it->second;
            }
        }
    }
    return nullptr;
}

const BracketMatch* NextMatch(const Bracket& bracket) {
    if (const auto* match = FirstUndecided(bracket, bracket.winner_rounds)) {
        return match;
    }
    if (const auto* match = FirstUndecided(bracket, bracket.loser_rounds)) {
        return match;
    }
    const auto it = bracket.matches.find(bracket.grand_final_id);
    if (it != bracket.matches.end() && !it->second.IsDecided() && (it->second.slot1 || it->second.slot2)) {
        return &it->second;
    }
    return nullptr;
}

// Fills the first undecided match of the round that still has an open slot, otherwise opens
// a new match with the entrant in slot 1.
bool PlaceEntrant(Bracket& bracket, Ladder ladder, int round, const CompetitorId& entrant, model::TournamentError* error) {
    auto* rounds = RoundsFor(bracket, ladder);
    if (rounds == nullptr || round < 1 || round > static_cast<int>(rounds->size())) {
        std::ostringstream out;
        out << "Bracket has no " << LadderName(ladder) << " round " << round;
        return model::Fail(error, ErrorKind::IllegalState, out.str());
    }

    auto& ids = (*rounds)[static_cast<size_t>(round - 1)];
    for (const auto& id : ids) {
        auto it = bracket.matches.find(id);
        if (it == bracket.matches.end()) {
            return model::Fail(error, ErrorKind::IllegalState, "Bracket round references unknown match " + id);
        }
        auto& match = it->second;
        if (match.IsDecided()) {
            continue;
        }
        if (!match.slot1) {
            match.slot1 = entrant;
            return true;
        }
        if (!match.slot2) {
            match.slot2 = entrant;
            return true;
        }
    }

    BracketMatch match;
    match.id = DoubleEliminationBracket::MatchIdFor(ladder, round, static_cast<int>(ids.size()) + 1);
    match.ladder = ladder;
    match.round = round;
    match.slot1 = entrant;
    ids.push_back(match.id);
    bracket.matches.emplace(match.id, std::move(match));
    return true;
}

}  // namespace

const char* LadderName(Ladder ladder) {
    switch (ladder) {
        case Ladder::Winner:
            return "winner";
        case Ladder::Loser:
            return "loser";
        case Ladder::GrandFinal:
            return "grand_finals";
    }
    return "unknown";
}

std::string DoubleEliminationBracket::MatchIdFor(Ladder ladder, int round, int sequence) {
    std::ostringstream out;
    switch (ladder) {
        case Ladder::Winner:
            out << 'w' << round << '_' << sequence;
            break;
        case Ladder::Loser:
            out << 'l' << round << '_' << sequence;
            break;
        case Ladder::GrandFinal:
            out << "gf_" << sequence;
            break;
    }
    return out.str();
}

bool DoubleEliminationBracket::CreateBracket(const std::vector<CompetitorId>& seeds,
                                             Bracket& bracket,
                                             model::TournamentError* error) {
    if (static_cast<int>(seeds.size()) != kEntrants) {
        std::ostringstream out;
        out << "Bracket requires exactly " << kEntrants << " participants, got " << seeds.size();
        return model::Fail(error, ErrorKind::InvalidInput, out.str());
    }
    std::set<CompetitorId> unique(seeds.begin(), seeds.end());
    if (unique.size() != seeds.size()) {
        return model::Fail(error, ErrorKind::InvalidInput, "Bracket participants must be unique");
    }

    Bracket created;
    created.winner_rounds.resize(kWinnerRounds);
    created.loser_rounds.resize(kLoserRounds);

    for (int i = 0; i < kEntrants / 2; ++i) {
        BracketMatch match;
        match.id = MatchIdFor(Ladder::Winner, 1, i + 1);
        match.ladder = Ladder::Winner;
        match.round = 1;
        match.slot1 = seeds[static_cast<size_t>(i)];
        match.slot2 = seeds[static_cast<size_t>(kEntrants - 1 - i)];
        created.winner_rounds[0].push_back(match.id);
        created.matches.emplace(match.id, std::move(match));
    }

    BracketMatch grand_final;
    grand_final.id = kGrandFinalId;
    grand_final.ladder = Ladder::GrandFinal;
    grand_final.round = 1;
    created.grand_final_id = grand_final.id;
    created.matches.emplace(grand_final.id, std::move(grand_final));

    bracket = std::move(created);
    return true;
}

std::vector<BracketMatch> DoubleEliminationBracket::GetMatchesReadyForVoting(const Bracket& bracket) {
    std::vector<BracketMatch> ready;
    if (const auto* match = NextMatch(bracket)) {
        ready.push_back(*match);
    }
    return ready;
}

bool DoubleEliminationBracket::RecordMatchResult(const Bracket& bracket,
                                                 const std::string& match_id,
                                                 const CompetitorId& winner,
                                                 Bracket& updated,
                                                 model::TournamentError* error) {
    const auto* current = FindMatch(bracket, match_id);
    if (current == nullptr) {
        return model::Fail(error, ErrorKind::InvalidInput, "Match not found: " + match_id);
    }
    if (current->IsDecided()) {
        return model::Fail(error, ErrorKind::InvalidInput, "Match already decided: " + match_id);
    }
    if (!current->Contains(winner)) {
        return model::Fail(error, ErrorKind::InvalidInput, "Winner must be one of the match participants");
    }
    // A lone entrant only walks over once nothing else can still feed the match.
    if (current->HasOpenSlot() && NextMatch(bracket) != current) {
        return model::Fail(error, ErrorKind::InvalidInput, "Match is still waiting for an opponent: " + match_id);
    }

    Bracket next = bracket;
    auto& match = next.matches.at(match_id);
    match.winner = winner;

    std::optional<CompetitorId> loser;
    if (match.slot1 && *match.slot1 != winner) {
        loser = match.slot1;
    } else if (match.slot2 && *match.slot2 != winner) {
        loser = match.slot2;
    }

    const Ladder ladder = match.ladder;
    const int round = match.round;
    if (ladder == Ladder::Winner) {
        if (round < kWinnerRounds) {
            if (!PlaceEntrant(next, Ladder::Winner, round + 1, winner, error)) {
                return false;
            }
            if (loser && !PlaceEntrant(next, Ladder::Loser, round, *loser, error)) {
                return false;
            }
        } else {
            auto it = next.matches.find(next.grand_final_id);
            if (it == next.matches.end()) {
                return model::Fail(error, ErrorKind::IllegalState, "Bracket has no grand final");
            }
            it->second.slot1 = winner;
        }
    } else if (ladder == Ladder::Loser) {
        if (round < kLoserRounds) {
            if (!PlaceEntrant(next, Ladder::Loser, round + 1, winner, error)) {
                return false;
            }
        } else {
            auto it = next.matches.find(next.grand_final_id);
            if (it == next.matches.end()) {
                return model::Fail(error, ErrorKind::IllegalState, "Bracket has no grand final");
            }
            it->second.slot2 = winner;
        }
    }

    updated = std::move(next);
    return true;
}

bool DoubleEliminationBracket::IsBracketComplete(const Bracket& bracket) {
    const auto* grand_final = FindMatch(bracket, bracket.grand_final_id);
    return grand_final != nullptr && grand_final->IsDecided();
}

const BracketMatch* DoubleEliminationBracket::FindMatch(const Bracket& bracket, const std::string& match_id) {
    const auto it = bracket.matches.find(match_id);
    return it == bracket.matches.end() ? nullptr : &it->second;
}

std::optional<CompetitorId> DoubleEliminationBracket::Champion(const Bracket& bracket) {
    const auto* grand_final = FindMatch(bracket, bracket.grand_final_id);
    if (grand_final == nullptr) {
        return std::nullopt;
    }
    return grand_final->winner;
}

}  // namespace dexcup::core::bracket
