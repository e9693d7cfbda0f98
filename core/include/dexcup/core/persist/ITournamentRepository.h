#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/Match.h"
#include "dexcup/core/model/Outcome.h"
#include "dexcup/core/model/Tournament.h"
#include "dexcup/core/model/TournamentError.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dexcup::core::persist {

// Storage contract for tournaments, their qualification matches and the serialized bracket.
// Save() is a compare-and-swap on Tournament::revision(): it succeeds only when the stored
// revision still equals the one the caller loaded (0 for a new tournament), and stores
// revision + 1. Lookups report absence through the optional, failures through |error|.
class ITournamentRepository {
public:
    virtual ~ITournamentRepository() = default;

    virtual bool Save(const model::Tournament& tournament, model::TournamentError* error) = 0;
    virtual bool FindById(const model::TournamentId& id,
                          std::optional<model::Tournament>& tournament,
                          model::TournamentError* error) const = 0;
    virtual bool FindByOwnerEmail(const std::string& owner_email,
                                  std::vector<model::Tournament>& tournaments,
                                  model::TournamentError* error) const = 0;
    virtual bool FindAll(std::vector<model::Tournament>& tournaments, model::TournamentError* error) const = 0;
    virtual bool Exists(const model::TournamentId& id) const = 0;
    virtual bool Delete(const model::TournamentId& id, model::TournamentError* error) = 0;

    // Replaces an existing record for the same round and participant order.
    virtual bool SaveMatch(const model::TournamentId& id,
                           int round,
                           const model::CompetitorId& participant1,
                           const model::CompetitorId& participant2,
                           model::Outcome outcome,
                           const std::optional<model::CompetitorId>& winner,
                           model::TournamentError* error) = 0;
    virtual bool LoadMatches(const model::TournamentId& id,
                             std::vector<model::StoredMatch>& matches,
                             model::TournamentError* error) const = 0;

    // Save() and SaveMatch() as one write: either both the tournament and the match are
    // stored, or neither is. The tournament must already exist.
    virtual bool SaveResult(const model::Tournament& tournament,
                            const model::StoredMatch& match,
                            model::TournamentError* error) = 0;

    virtual bool SaveBracketData(const model::TournamentId& id,
                                 const nlohmann::json& bracket,
                                 model::TournamentError* error) = 0;
    virtual bool LoadBracketData(const model::TournamentId& id,
                                 std::optional<nlohmann::json>& bracket,
                                 model::TournamentError* error) const = 0;
};

}  // namespace dexcup::core::persist
