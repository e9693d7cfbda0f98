#pragma once

#include "dexcup/core/persist/ITournamentRepository.h"

#include <map>

namespace dexcup::core::persist {

class InMemoryTournamentRepository final : public ITournamentRepository {
public:
    bool Save(const model::Tournament& tournament, model::TournamentError* error) override;
    bool FindById(const model::TournamentId& id,
                  std::optional<model::Tournament>& tournament,
                  model::TournamentError* error) const override;
    bool FindByOwnerEmail(const std::string& owner_email,
                          std::vector<model::Tournament>& tournaments,
                          model::TournamentError* error) const override;
    bool FindAll(std::vector<model::Tournament>& tournaments, model::TournamentError* error) const override;
    bool Exists(const model::TournamentId& id) const override;
    bool Delete(const model::TournamentId& id, model::TournamentError* error) override;

    bool SaveMatch(const model::TournamentId& id,
                   int round,
                   const model::CompetitorId& participant1,
                   const model::CompetitorId& participant2,
                   model::Outcome outcome,
                   const std::optional<model::CompetitorId>& winner,
                   model::TournamentError* error) override;
    bool LoadMatches(const model::TournamentId& id,
                     std::vector<model::StoredMatch>& matches,
                     model::TournamentError* error) const override;
    bool SaveResult(const model::Tournament& tournament,
                    const model::StoredMatch& match,
                    model::TournamentError* error) override;

    bool SaveBracketData(const model::TournamentId& id,
                         const nlohmann::json& bracket,
                         model::TournamentError* error) override;
    bool LoadBracketData(const model::TournamentId& id,
                         std::optional<nlohmann::json>& bracket,
                         model::TournamentError* error) const override;

private:
    struct Record {
        model::Tournament tournament;
        std::vector<model::StoredMatch> matches;
        std::optional<nlohmann::json> bracket;
    };

    std::map<std::string, Record> records_;
};

}  // namespace dexcup::core::persist
