#pragma once

#include "dexcup/core/model/Identifiers.h"

#include <optional>
#include <utility>

namespace dexcup::core::tournament {

// One pairing of a round. A missing second member is a bye.
struct Pairing {
    model::CompetitorId first;
    std::optional<model::CompetitorId> second;

    bool is_bye() const { return !second.has_value(); }
};

using Matchup = std::pair<model::CompetitorId, model::CompetitorId>;

struct StandingEntry {
    model::CompetitorId participant;
    int score = 0;
};

}  // namespace dexcup::core::tournament
