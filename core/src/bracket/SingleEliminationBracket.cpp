#include "dexcup/core/bracket/SingleEliminationBracket.h"

#include <set>
#include <sstream>

namespace dexcup::core::bracket {

namespace {

using model::CompetitorId;
using model::ErrorKind;

bool IsPowerOfTwo(size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

std::vector<KnockoutMatch> PairAdjacent(const std::vector<CompetitorId>& entrants, int round) {
    std::vector<KnockoutMatch> matches;
    matches.reserve(entrants.size() / 2);
    for (size_t i = 0; i + 1 < entrants.size(); i += 2) {
        matches.push_back({entrants[i], entrants[i + 1], round, std::nullopt});
    }
    return matches;
}

}  // namespace

std::optional<SingleEliminationBracket> SingleEliminationBracket::Create(const std::vector<CompetitorId>& seeds,
                                                                         model::TournamentError* error) {
    if (seeds.size() < 2) {
        model::Fail(error, ErrorKind::InvalidInput, "Bracket requires at least 2 participants");
        return std::nullopt;
    }
    if (!IsPowerOfTwo(seeds.size())) {
        std::ostringstream out;
        out << "Bracket size must be a power of two, got " << seeds.size();
        model::Fail(error, ErrorKind::InvalidInput, out.str());
        return std::nullopt;
    }
    if (std::set<CompetitorId>(seeds.begin(), seeds.end()).size() != seeds.size()) {
        model::Fail(error, ErrorKind::InvalidInput, "Bracket participants must be unique");
        return std::nullopt;
    }

    std::vector<KnockoutMatch> first_round;
    size_t left = 0;
    size_t right = seeds.size() - 1;
    while (left < right) {
        first_round.push_back({seeds[left], seeds[right], 1, std::nullopt});
        ++left;
        --right;
    }
    if (seeds.size() == 8) {
        first_round = {first_round[0], first_round[3], first_round[2], first_round[1]};
    }

    SingleEliminationBracket bracket;
    bracket.rounds_.push_back(std::move(first_round));
    return bracket;
}

const std::vector<KnockoutMatch>& SingleEliminationBracket::CurrentRoundMatches() const {
    return rounds_[static_cast<size_t>(current_round_index_)];
}

bool SingleEliminationBracket::RecordWinner(size_t match_index,
                                            const CompetitorId& winner,
                                            model::TournamentError* error) {
    if (IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Bracket is already complete");
    }
    auto& matches = rounds_[static_cast<size_t>(current_round_index_)];
    if (match_index >= matches.size()) {
        return model::Fail(error, ErrorKind::InvalidInput, "Match index out of range");
    }
    auto& match = matches[match_index];
    if (match.winner) {
        return model::Fail(error, ErrorKind::InvalidInput, "Match already decided");
    }
    if (winner != match.participant1 && winner != match.participant2) {
        return model::Fail(error, ErrorKind::InvalidInput, "Winner must be one of the match participants");
    }
    match.winner = winner;
    return true;
}

bool SingleEliminationBracket::AdvanceRound(model::TournamentError* error) {
    if (IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Bracket is already complete");
    }
    std::vector<CompetitorId> winners;
    for (const auto& match : CurrentRoundMatches()) {
        if (!match.winner) {
            return model::Fail(error, ErrorKind::IllegalState, "Cannot advance: not all matches are complete");
        }
        winners.push_back(*match.winner);
    }

    if (winners.size() == 1) {
        winner_ = winners.front();
        return true;
    }
    rounds_.push_back(PairAdjacent(winners, current_round_index_ + 2));
    current_round_index_ += 1;
    return true;
}

}  // namespace dexcup::core::bracket
