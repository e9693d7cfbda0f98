#include "dexcup/core/export/ExportWriter.h"

#include "dexcup/core/bracket/BracketCodec.h"
#include "dexcup/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace dexcup::core::exporter {

std::string TournamentStatus(const model::Tournament& tournament, const std::optional<bracket::Bracket>& bracket) {
    if (!tournament.IsComplete()) {
        return "swiss";
    }
    if (!bracket) {
        return tournament.participant_count() < api::TournamentManager::kPlayoffEntrants ? "complete"
                                                                                         : "awaiting_playoff";
    }
    return bracket::DoubleEliminationBracket::IsBracketComplete(*bracket) ? "complete" : "playoff";
}

bool WriteStandingsCsv(const std::string& path, const std::vector<api::StandingRow>& standings, std::string* error) {
    std::ostringstream output;
    output << "rank,participant,score,games,wins,draws,losses\n";
    int rank = 1;
    for (const auto& row : standings) {
        output << rank++ << ','
               << row.participant.str() << ','
               << row.score << ','
               << row.wins + row.draws + row.losses << ','
               << row.wins << ','
               << row.draws << ','
               << row.losses
               << "\n";
    }
    return util::AtomicFileWriter::Write(path, output.str(), error);
}

bool WriteSummaryJson(const std::string& path,
                      const model::Tournament& tournament,
                      const std::vector<api::StandingRow>& seeded_standings,
                      const std::optional<bracket::Bracket>& bracket,
                      std::string* error) {
    nlohmann::json summary;
    summary["tournament"] = tournament.id().str();
    summary["owner_email"] = tournament.owner_email();
    summary["status"] = TournamentStatus(tournament, bracket);
    summary["current_round"] = tournament.current_round();
    summary["total_rounds"] = tournament.total_rounds();
    summary["participants"] = tournament.participant_count();

    summary["standings"] = nlohmann::json::array();
    int rank = 1;
    for (const auto& row : seeded_standings) {
        summary["standings"].push_back({
            {"rank", rank++},
            {"participant", row.participant.str()},
            {"score", row.score},
            {"w", row.wins},
            {"d", row.draws},
            {"l", row.losses},
        });
    }

    if (bracket) {
        const auto next = bracket::DoubleEliminationBracket::GetMatchesReadyForVoting(*bracket);
        const auto champion = bracket::DoubleEliminationBracket::Champion(*bracket);
        summary["playoff"] = {
            {"next_match", next.empty() ? nlohmann::json(nullptr) : bracket::BracketCodec::MatchToJson(next.front())},
            {"champion", champion ? nlohmann::json(champion->str()) : nlohmann::json(nullptr)},
        };
    } else {
        summary["playoff"] = nullptr;
    }
    return util::AtomicFileWriter::Write(path, summary.dump(2), error);
}

}  // namespace dexcup::core::exporter
