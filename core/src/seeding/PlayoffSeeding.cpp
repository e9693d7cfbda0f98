#include "dexcup/core/seeding/PlayoffSeeding.h"

#include <algorithm>
#include <sstream>

namespace dexcup::core::seeding {

using model::CompetitorId;
using model::ErrorKind;
using model::Participant;

std::vector<Participant> PlayoffSeeding::SeedTopN(const std::vector<Participant>& pool,
                                                  const model::ScoreMap& standings,
                                                  int top_n) {
    std::vector<std::pair<CompetitorId, int>> ranked(standings.begin(), standings.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    const size_t limit = std::min(ranked.size(), static_cast<size_t>(std::max(0, top_n)));
    std::vector<Participant> seeded;
    seeded.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        const auto& id = ranked[i].first;
        const auto it = std::find_if(pool.begin(), pool.end(), [&id](const auto& p) { return p.id() == id; });
        if (it != pool.end()) {
            seeded.push_back(*it);
        } else {
            seeded.emplace_back(id);
        }
    }
    return seeded;
}

std::vector<CompetitorId> PlayoffSeeding::SeedIds(const std::vector<Participant>& seeded) {
    std::vector<CompetitorId> ids;
    ids.reserve(seeded.size());
    for (const auto& participant : seeded) {
        ids.push_back(participant.id());
    }
    return ids;
}

std::optional<bracket::SingleEliminationBracket> PlayoffSeeding::CreateSingleElimination(
    const std::vector<Participant>& pool,
    const model::ScoreMap& standings,
    int top_n,
    model::TournamentError* error) {
    if (top_n < 2) {
        model::Fail(error, ErrorKind::InvalidInput, "topN must be at least 2");
        return std::nullopt;
    }
    return bracket::SingleEliminationBracket::Create(SeedIds(SeedTopN(pool, standings, top_n)), error);
}

bool PlayoffSeeding::CreateDoubleElimination(const std::vector<Participant>& pool,
                                             const model::ScoreMap& standings,
                                             int top_n,
                                             bracket::Bracket& bracket,
                                             model::TournamentError* error) {
    if (top_n != bracket::DoubleEliminationBracket::kEntrants) {
        std::ostringstream out;
        out << "Double elimination supports exactly " << bracket::DoubleEliminationBracket::kEntrants
            << " entrants, got topN " << top_n;
        return model::Fail(error, ErrorKind::InvalidInput, out.str());
    }
    return bracket::DoubleEliminationBracket::CreateBracket(SeedIds(SeedTopN(pool, standings, top_n)),
                                                            bracket,
                                                            error);
}

}  // namespace dexcup::core::seeding
