#pragma once

#include "dexcup/core/bracket/DoubleEliminationBracket.h"
#include "dexcup/core/model/TournamentError.h"

#include <nlohmann/json.hpp>

namespace dexcup::core::bracket {

// Storage form: {"winner_bracket": {"round1": [...], ...}, "loser_bracket": {...},
// "grand_finals": [...]}, competitors reduced to their canonical strings.
class BracketCodec {
public:
    static nlohmann::json ToJson(const Bracket& bracket);
    static nlohmann::json MatchToJson(const BracketMatch& match);

    // Any structural problem is reported as an illegal-state "corrupted bracket" error.
    static bool FromJson(const nlohmann::json& node, Bracket& bracket, model::TournamentError* error);
};

}  // namespace dexcup::core::bracket
