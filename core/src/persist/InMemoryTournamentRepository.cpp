#include "dexcup/core/persist/InMemoryTournamentRepository.h"

#include <sstream>

namespace dexcup::core::persist {

using model::ErrorKind;

namespace {

bool NotFound(model::TournamentError* error, const model::TournamentId& id) {
    return model::Fail(error, ErrorKind::IllegalState, "Tournament not found: " + id.str());
}

bool RevisionConflict(model::TournamentError* error, const model::Tournament& tournament, int stored_revision) {
    std::ostringstream out;
    out << "Revision conflict for tournament " << tournament.id().str() << ": stored " << stored_revision
        << ", saving " << tournament.revision();
    return model::Fail(error, ErrorKind::IllegalState, out.str());
}

void PutMatch(std::vector<model::StoredMatch>& matches, model::StoredMatch stored) {
    for (auto& existing : matches) {
        if (existing.round == stored.round && existing.participant1 == stored.participant1 &&
            existing.participant2 == stored.participant2) {
            existing = std::move(stored);
            return;
        }
    }
    matches.push_back(std::move(stored));
}

}  // namespace

bool InMemoryTournamentRepository::Save(const model::Tournament& tournament, model::TournamentError* error) {
    auto it = records_.find(tournament.id().str());
    const int stored_revision = it == records_.end() ? 0 : it->second.tournament.revision();
    if (stored_revision != tournament.revision()) {
        return RevisionConflict(error, tournament, stored_revision);
    }

    model::Tournament saved = tournament;
    saved.set_revision(stored_revision + 1);
    if (it == records_.end()) {
        records_.emplace(tournament.id().str(), Record{std::move(saved), {}, std::nullopt});
    } else {
        it->second.tournament = std::move(saved);
    }
    return true;
}

bool InMemoryTournamentRepository::FindById(const model::TournamentId& id,
                                            std::optional<model::Tournament>& tournament,
                                            model::TournamentError*) const {
    const auto it = records_.find(id.str());
    if (it == records_.end()) {
        tournament.reset();
    } else {
        tournament = it->second.tournament;
    }
    return true;
}

bool InMemoryTournamentRepository::FindByOwnerEmail(const std::string& owner_email,
                                                    std::vector<model::Tournament>& tournaments,
                                                    model::TournamentError*) const {
    tournaments.clear();
    for (const auto& [key, record] : records_) {
        if (record.tournament.owner_email() == owner_email) {
            tournaments.push_back(record.tournament);
        }
    }
    return true;
}

bool InMemoryTournamentRepository::FindAll(std::vector<model::Tournament>& tournaments,
                                           model::TournamentError*) const {
    tournaments.clear();
    for (const auto& [key, record] : records_) {
        tournaments.push_back(record.tournament);
    }
    return true;
}

bool InMemoryTournamentRepository::Exists(const model::TournamentId& id) const {
    return records_.count(id.str()) != 0;
}

bool InMemoryTournamentRepository::Delete(const model::TournamentId& id, model::TournamentError* error) {
    if (records_.erase(id.str()) == 0) {
        return NotFound(error, id);
    }
    return true;
}

bool InMemoryTournamentRepository::SaveMatch(const model::TournamentId& id,
                                             int round,
                                             const model::CompetitorId& participant1,
                                             const model::CompetitorId& participant2,
                                             model::Outcome outcome,
                                             const std::optional<model::CompetitorId>& winner,
                                             model::TournamentError* error) {
    auto it = records_.find(id.str());
    if (it == records_.end()) {
        return NotFound(error, id);
    }
    PutMatch(it->second.matches, model::StoredMatch{participant1, participant2, round, outcome, winner});
    return true;
}

bool InMemoryTournamentRepository::LoadMatches(const model::TournamentId& id,
                                               std::vector<model::StoredMatch>& matches,
                                               model::TournamentError* error) const {
    const auto it = records_.find(id.str());
    if (it == records_.end()) {
        return NotFound(error, id);
    }
    matches = it->second.matches;
    return true;
}

bool InMemoryTournamentRepository::SaveResult(const model::Tournament& tournament,
                                              const model::StoredMatch& match,
                                              model::TournamentError* error) {
    auto it = records_.find(tournament.id().str());
    if (it == records_.end()) {
        return NotFound(error, tournament.id());
    }
    const int stored_revision = it->second.tournament.revision();
    if (stored_revision != tournament.revision()) {
        return RevisionConflict(error, tournament, stored_revision);
    }

    model::Tournament saved = tournament;
    saved.set_revision(stored_revision + 1);
    it->second.tournament = std::move(saved);
    PutMatch(it->second.matches, match);
    return true;
}

bool InMemoryTournamentRepository::SaveBracketData(const model::TournamentId& id,
                                                   const nlohmann::json& bracket,
                                                   model::TournamentError* error) {
    auto it = records_.find(id.str());
    if (it == records_.end()) {
        return NotFound(error, id);
    }
    it->second.bracket = bracket;
    return true;
}

bool InMemoryTournamentRepository::LoadBracketData(const model::TournamentId& id,
                                                   std::optional<nlohmann::json>& bracket,
                                                   model::TournamentError*) const {
    const auto it = records_.find(id.str());
    if (it == records_.end() || !it->second.bracket) {
        bracket.reset();
    } else {
        bracket = it->second.bracket;
    }
    return true;
}

}  // namespace dexcup::core::persist
