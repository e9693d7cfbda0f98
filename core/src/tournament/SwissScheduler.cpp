#include "dexcup/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <unordered_set>

namespace dexcup::core::tournament {

namespace {

using model::CompetitorId;

std::string PairKey(const CompetitorId& a, const CompetitorId& b) {
    const auto& low = std::min(a.str(), b.str());
    const auto& high = std::max(a.str(), b.str());
    return low + ":" + high;
}

int ScoreOf(const model::ScoreMap& standings, const CompetitorId& id) {
    const auto it = standings.find(id);
    return it == standings.end() ? 0 : it->second;
}

std::vector<CompetitorId> SortByStandings(std::vector<CompetitorId> participants,
                                          const model::ScoreMap& standings) {
    std::sort(participants.begin(), participants.end(), [&standings](const auto& a, const auto& b) {
        const int score_a = ScoreOf(standings, a);
        const int score_b = ScoreOf(standings, b);
        if (score_a != score_b) {
            return score_a > score_b;
        }
        return a < b;
    });
    return participants;
}

int FindBestOpponent(const std::vector<CompetitorId>& participants,
                     const std::vector<bool>& used,
                     size_t participant_index,
                     const std::unordered_set<std::string>& pairings_played,
                     const model::ScoreMap& standings) {
    const auto& participant = participants[participant_index];
    const int participant_score = ScoreOf(standings, participant);
    int best_index = -1;
    int best_difference = INT_MAX;

    for (size_t i = participant_index + 1; i < participants.size(); ++i) {
        if (used[i]) {
            continue;
        }
        const auto& opponent = participants[i];
        if (pairings_played.count(PairKey(participant, opponent)) != 0) {
            continue;
        }
        const int difference = std::abs(participant_score - ScoreOf(standings, opponent));
        if (difference < best_difference) {
            best_difference = difference;
            best_index = static_cast<int>(i);
        }
    }
    return best_index;
}

}  // namespace

bool SwissScheduler::GeneratePairings(const std::vector<CompetitorId>& participants,
                                      const std::vector<Matchup>& previous_matchups,
                                      const model::ScoreMap& standings,
                                      std::vector<Pairing>& pairings,
                                      model::TournamentError* error) {
    if (participants.empty()) {
        return model::Fail(error,
                           model::ErrorKind::InvalidInput,
                           "Cannot generate pairings for empty participants list");
    }

    std::vector<Pairing> result;
    if (participants.size() == 1) {
        result.push_back({participants.front(), std::nullopt});
        pairings = std::move(result);
        return true;
    }

    const auto ordered = standings.empty() ? participants : SortByStandings(participants, standings);

    std::unordered_set<std::string> pairings_played;
    for (const auto& matchup : previous_matchups) {
        pairings_played.insert(PairKey(matchup.first, matchup.second));
    }

    const size_t count = ordered.size();
    const size_t target_pairings = (count + 1) / 2;
    std::vector<bool> used(count, false);
    result.reserve(target_pairings);

    for (size_t i = 0; i < count && result.size() < target_pairings; ++i) {
        if (used[i]) {
            continue;
        }
        used[i] = true;

        const int opponent_index = FindBestOpponent(ordered, used, i, pairings_played, standings);
        if (opponent_index >= 0) {
            used[static_cast<size_t>(opponent_index)] = true;
            result.push_back({ordered[i], ordered[static_cast<size_t>(opponent_index)]});
        } else {
            result.push_back({ordered[i], std::nullopt});
        }
    }

    pairings = std::move(result);
    return true;
}

bool SwissScheduler::CalculateTotalRounds(int participant_count, int& rounds, model::TournamentError* error) {
    if (participant_count <= 0) {
        return model::Fail(error, model::ErrorKind::InvalidInput, "Participant count must be positive");
    }
    if (participant_count == 1) {
        rounds = 0;
        return true;
    }

    int log_rounds = 0;
    while ((1LL << log_rounds) < static_cast<long long>(participant_count)) {
        ++log_rounds;
    }
    rounds = std::max(kMinRounds, std::min(kMaxRounds, log_rounds));
    return true;
}

std::vector<StandingEntry> SwissScheduler::SortStandingsByTieBreaker(
    const model::ScoreMap& standings,
    const std::vector<CompetitorId>& participants) {
    std::vector<StandingEntry> sorted;
    sorted.reserve(standings.size());
    for (const auto& [id, score] : standings) {
        if (std::find(participants.begin(), participants.end(), id) != participants.end()) {
            sorted.push_back({id, score});
        }
    }

    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.participant < b.participant;
    });
    return sorted;
}

int SwissScheduler::GetScoreForResult(model::Outcome outcome) {
    switch (outcome) {
        case model::Outcome::Win:
            return model::Participant::kWinPoints;
        case model::Outcome::Loss:
            return model::Participant::kLossPoints;
        case model::Outcome::Draw:
            return model::Participant::kDrawPoints;
    }
    return 0;
}

bool SwissScheduler::GetScoreForResult(const std::string& outcome, int& score, model::TournamentError* error) {
    const auto parsed = model::ParseOutcome(outcome, error);
    if (!parsed) {
        return false;
    }
    score = GetScoreForResult(*parsed);
    return true;
}

model::ScoreMap SwissScheduler::CalculateStandings(const std::vector<CompetitorId>& participants,
                                                   const std::vector<model::StoredMatch>& results) {
    model::ScoreMap standings;
    for (const auto& participant : participants) {
        standings[participant] = 0;
    }

    for (const auto& match : results) {
        switch (match.outcome) {
            case model::Outcome::Win:
                standings[match.participant1] += model::Participant::kWinPoints;
                break;
            case model::Outcome::Loss:
                break;
            case model::Outcome::Draw:
                standings[match.participant1] += model::Participant::kDrawPoints;
                standings[match.participant2] += model::Participant::kDrawPoints;
                break;
        }
    }
    return standings;
}

}  // namespace dexcup::core::tournament
