#pragma once

#include "dexcup/core/api/TournamentManager.h"
#include "dexcup/core/bracket/DoubleEliminationBracket.h"
#include "dexcup/core/model/Tournament.h"

#include <optional>
#include <string>
#include <vector>

namespace dexcup::core::exporter {

// Rows are written in the order given; rank is the 1-based position.
bool WriteStandingsCsv(const std::string& path,
                       const std::vector<api::StandingRow>& standings,
                       std::string* error = nullptr);

bool WriteSummaryJson(const std::string& path,
                      const model::Tournament& tournament,
                      const std::vector<api::StandingRow>& seeded_standings,
                      const std::optional<bracket::Bracket>& bracket,
                      std::string* error = nullptr);

// "swiss", "awaiting_playoff", "playoff" or "complete".
std::string TournamentStatus(const model::Tournament& tournament, const std::optional<bracket::Bracket>& bracket);

}  // namespace dexcup::core::exporter
