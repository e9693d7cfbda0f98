#pragma once

#include "dexcup/core/persist/ITournamentRepository.h"

#include <string>

namespace dexcup::core::persist {

// Stores each tournament as "<directory>/<id>.json". Every write replaces the whole
// document through AtomicFileWriter, so a crash leaves either the old or the new file.
class JsonFileTournamentRepository final : public ITournamentRepository {
public:
    static constexpr int kFormatVersion = 1;

    explicit JsonFileTournamentRepository(std::string directory);

    const std::string& directory() const { return directory_; }

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
    std::string PathFor(const model::TournamentId& id) const;
    bool ReadDocument(const std::string& path, nlohmann::json& root, model::TournamentError* error) const;
    bool LoadExisting(const model::TournamentId& id, nlohmann::json& root, model::TournamentError* error) const;
    bool WriteDocument(const model::TournamentId& id, const nlohmann::json& root, model::TournamentError* error);
    bool ListAll(std::vector<model::Tournament>& tournaments, model::TournamentError* error) const;

    std::string directory_;
};

}  // namespace dexcup::core::persist
