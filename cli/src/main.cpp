#include "dexcup/core/api/DexcupConfig.h"
#include "dexcup/core/api/TournamentManager.h"
#include "dexcup/core/bracket/BracketCodec.h"
#include "dexcup/core/bracket/SingleEliminationBracket.h"
#include "dexcup/core/export/ExportWriter.h"
#include "dexcup/core/persist/InMemoryTournamentRepository.h"
#include "dexcup/core/persist/JsonFileTournamentRepository.h"
#include "dexcup/core/seeding/PlayoffSeeding.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using dexcup::core::api::DexcupConfig;
using dexcup::core::api::StandingRow;
using dexcup::core::api::TournamentManager;
using dexcup::core::model::CompetitorId;
using dexcup::core::model::TournamentError;
using dexcup::core::model::TournamentId;

using Args = std::vector<std::string>;

struct Command {
    std::string usage;
    size_t min_args = 0;
    std::function<int(TournamentManager&, const DexcupConfig&, const Args&)> run;
};

int Fail(const TournamentError& error) {
    std::cerr << "[dexcupcli] " << dexcup::core::model::ErrorKindName(error.kind) << ": " << error.message << '\n';
    return 1;
}

int Print(const nlohmann::json& value) {
    std::cout << value.dump(2) << '\n';
    return 0;
}

nlohmann::json TournamentJson(const dexcup::core::model::Tournament& tournament) {
    nlohmann::json node = {
        {"id", tournament.id().str()},
        {"owner_email", tournament.owner_email()},
        {"current_round", tournament.current_round()},
        {"total_rounds", tournament.total_rounds()},
        {"complete", tournament.IsComplete()},
        {"participants", nlohmann::json::array()},
    };
    for (const auto& participant : tournament.participants()) {
        node["participants"].push_back(participant.id().str());
    }
    return node;
}

// Display order for the standings commands: score desc, wins desc, losses asc.
std::vector<StandingRow> Ranked(std::vector<StandingRow> rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const StandingRow& a, const StandingRow& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.wins != b.wins) {
            return a.wins > b.wins;
        }
        return a.losses < b.losses;
    });
    return rows;
}

nlohmann::json StandingsJson(const std::vector<StandingRow>& rows) {
    nlohmann::json node = nlohmann::json::array();
    for (const auto& row : rows) {
        node.push_back({
            {"participant", row.participant.str()},
            {"score", row.score},
            {"wins", row.wins},
            {"losses", row.losses},
            {"draws", row.draws},
        });
    }
    return node;
}

nlohmann::json KnockoutJson(const dexcup::core::bracket::SingleEliminationBracket& knockout) {
    nlohmann::json node = {{"current_round", knockout.current_round()}, {"rounds", nlohmann::json::array()}};
    for (const auto& round : knockout.rounds()) {
        nlohmann::json matches = nlohmann::json::array();
        for (const auto& match : round) {
            matches.push_back({
                {"participant1", match.participant1.str()},
                {"participant2", match.participant2.str()},
                {"winner", match.winner ? nlohmann::json(match.winner->str()) : nlohmann::json(nullptr)},
            });
        }
        node["rounds"].push_back(std::move(matches));
    }
    const auto winner = knockout.Winner();
    node["winner"] = winner ? nlohmann::json(winner->str()) : nlohmann::json(nullptr);
    return node;
}

std::optional<CompetitorId> ParseCompetitor(const std::string& value, TournamentError& error) {
    return CompetitorId::FromString(value, &error);
}

std::optional<TournamentId> TournamentArg(const Args& args, TournamentError& error) {
    return TournamentId::FromString(args.at(0), &error);
}

int RunCreate(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    std::vector<CompetitorId> participants;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto id = ParseCompetitor(args[i], error);
        if (!id) {
            return Fail(error);
        }
        participants.push_back(*id);
    }
    const auto tournament = manager.createTournament(participants, args.at(0), &error);
    if (!tournament) {
        return Fail(error);
    }
    return Print(TournamentJson(*tournament));
}

int RunList(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    std::vector<dexcup::core::model::Tournament> tournaments;
    if (!manager.getUserTournaments(args.at(0), tournaments, &error)) {
        return Fail(error);
    }
    nlohmann::json node = nlohmann::json::array();
    for (const auto& tournament : tournaments) {
        node.push_back(TournamentJson(tournament));
    }
    return Print(node);
}

int RunShow(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    if (!id) {
        return Fail(error);
    }
    const auto tournament = manager.getTournament(*id, &error);
    if (!tournament) {
        return Fail(error);
    }
    return Print(TournamentJson(*tournament));
}

int RunPairings(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::vector<dexcup::core::tournament::Pairing> pairings;
    if (!id || !manager.getCurrentRoundPairings(*id, pairings, &error)) {
        return Fail(error);
    }
    nlohmann::json node = nlohmann::json::array();
    for (const auto& pairing : pairings) {
        nlohmann::json entry = nlohmann::json::array({pairing.first.str()});
        if (pairing.second) {
            entry.push_back(pairing.second->str());
        }
        node.push_back(std::move(entry));
    }
    return Print(node);
}

int RunRecord(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    if (!id) {
        return Fail(error);
    }
    const auto p1 = ParseCompetitor(args.at(1), error);
    const auto p2 = p1 ? ParseCompetitor(args.at(2), error) : std::nullopt;
    const auto outcome = p2 ? dexcup::core::model::ParseOutcome(args.at(3), &error) : std::nullopt;
    if (!p1 || !p2 || !outcome) {
        return Fail(error);
    }
    std::optional<CompetitorId> winner;
    if (args.size() > 4) {
        winner = ParseCompetitor(args.at(4), error);
        if (!winner) {
            return Fail(error);
        }
    }
    if (!manager.recordMatchResult(*id, *p1, *p2, *outcome, winner, &error)) {
        return Fail(error);
    }
    return Print({{"recorded", true}});
}

int RunBye(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    const auto participant = id ? ParseCompetitor(args.at(1), error) : std::nullopt;
    if (!participant || !manager.recordBye(*id, *participant, &error)) {
        return Fail(error);
    }
    return Print({{"recorded", true}});
}

int RunAdvance(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    if (!id || !manager.advanceToNextRound(*id, &error)) {
        return Fail(error);
    }
    const auto tournament = manager.getTournament(*id, &error);
    if (!tournament) {
        return Fail(error);
    }
    return Print(TournamentJson(*tournament));
}

int RunStandings(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::vector<StandingRow> rows;
    if (!id || !manager.getCurrentStandings(*id, rows, &error)) {
        return Fail(error);
    }
    return Print(StandingsJson(Ranked(std::move(rows))));
}

int RunFinal(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::vector<StandingRow> rows;
    if (!id || !manager.getFinalStandings(*id, rows, &error)) {
        return Fail(error);
    }
    return Print(StandingsJson(Ranked(std::move(rows))));
}

int RunBracketInit(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::optional<dexcup::core::bracket::Bracket> bracket;
    if (!id || !manager.initializeBracket(*id, &error) || !manager.getBracket(*id, bracket, &error)) {
        return Fail(error);
    }
    return Print(bracket ? dexcup::core::bracket::BracketCodec::ToJson(*bracket) : nlohmann::json(nullptr));
}

int RunBracket(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::optional<dexcup::core::bracket::Bracket> bracket;
    if (!id || !manager.getBracket(*id, bracket, &error)) {
        return Fail(error);
    }
    return Print(bracket ? dexcup::core::bracket::BracketCodec::ToJson(*bracket) : nlohmann::json(nullptr));
}

int RunBracketNext(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    std::optional<dexcup::core::bracket::BracketMatch> match;
    if (!id || !manager.getNextBracketMatch(*id, match, &error)) {
        return Fail(error);
    }
    return Print(match ? dexcup::core::bracket::BracketCodec::MatchToJson(*match) : nlohmann::json(nullptr));
}

int RunBracketRecord(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    const auto winner = id ? ParseCompetitor(args.at(2), error) : std::nullopt;
    if (!winner || !manager.recordBracketMatchResult(*id, args.at(1), *winner, &error)) {
        return Fail(error);
    }
    bool complete = false;
    if (!manager.isBracketComplete(*id, complete, &error)) {
        return Fail(error);
    }
    return Print({{"recorded", true}, {"bracket_complete", complete}});
}

// Previews a single-elimination cut of the current standings at format.playoff_cutoff.
int RunKnockout(TournamentManager& manager, const DexcupConfig& config, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    const auto tournament = id ? manager.getTournament(*id, &error) : std::nullopt;
    if (!tournament) {
        return Fail(error);
    }
    const auto knockout = dexcup::core::seeding::PlayoffSeeding::CreateSingleElimination(
        tournament->participants(), tournament->Scores(), config.format.playoff_cutoff, &error);
    if (!knockout) {
        return Fail(error);
    }
    return Print(KnockoutJson(*knockout));
}

int RunExport(TournamentManager& manager, const DexcupConfig& config, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    const auto tournament = id ? manager.getTournament(*id, &error) : std::nullopt;
    std::vector<StandingRow> rows;
    std::optional<dexcup::core::bracket::Bracket> bracket;
    if (!tournament || !manager.getSeededStandings(*id, rows, &error) || !manager.getBracket(*id, bracket, &error)) {
        return Fail(error);
    }

    const std::filesystem::path directory = args.size() > 1 ? std::filesystem::path(args.at(1)) : "";
    const auto place = [&directory](const std::string& configured) {
        return directory.empty() ? configured
                                 : (directory / std::filesystem::path(configured).filename()).string();
    };
    const auto csv_path = place(config.output.standings_csv);
    const auto summary_path = place(config.output.summary_json);

    std::string write_error;
    if (!dexcup::core::exporter::WriteStandingsCsv(csv_path, rows, &write_error) ||
        !dexcup::core::exporter::WriteSummaryJson(summary_path, *tournament, rows, bracket, &write_error)) {
        std::cerr << "[dexcupcli] Export failed: " << write_error << '\n';
        return 1;
    }
    return Print({{"standings_csv", csv_path}, {"summary_json", summary_path}});
}

int RunDelete(TournamentManager& manager, const DexcupConfig&, const Args& args) {
    TournamentError error;
    const auto id = TournamentArg(args, error);
    if (!id || !manager.deleteTournament(*id, &error)) {
        return Fail(error);
    }
    return Print({{"deleted", id->str()}});
}

// Plays a whole tournament where the lexicographically smaller id always wins.
int RunDemo(TournamentManager& manager, const DexcupConfig& config, const Args& args) {
    TournamentError error;
    std::vector<CompetitorId> participants;
    for (const auto& value : args) {
        const auto id = ParseCompetitor(value, error);
        if (!id) {
            return Fail(error);
        }
        participants.push_back(*id);
    }
    const auto created = manager.createTournament(participants, "demo@dexcup.local", &error);
    if (!created) {
        return Fail(error);
    }
    const auto& id = created->id();

    for (;;) {
        auto tournament = manager.getTournament(id, &error);
        if (!tournament) {
            return Fail(error);
        }
        if (tournament->IsComplete()) {
            break;
        }
        std::vector<dexcup::core::tournament::Pairing> pairings;
        if (!manager.getCurrentRoundPairings(id, pairings, &error)) {
            return Fail(error);
        }
        for (const auto& pairing : pairings) {
            const bool played = pairing.is_bye()
                                    ? manager.recordBye(id, pairing.first, &error)
                                    : manager.recordMatchResult(id,
                                                                pairing.first,
                                                                *pairing.second,
                                                                dexcup::core::model::Outcome::Win,
                                                                std::min(pairing.first, *pairing.second),
                                                                &error);
            if (!played) {
                return Fail(error);
            }
        }
        if (!manager.advanceToNextRound(id, &error)) {
            return Fail(error);
        }
    }

    std::vector<StandingRow> rows;
    if (!manager.getSeededStandings(id, rows, &error)) {
        return Fail(error);
    }
    nlohmann::json result = {{"tournament", id.str()}, {"standings", StandingsJson(rows)}};

    if (config.format.playoff == "double-elimination") {
        std::optional<dexcup::core::bracket::BracketMatch> next;
        while (manager.getNextBracketMatch(id, next, &error) && next) {
            const CompetitorId winner = next->slot1 && next->slot2 ? std::min(*next->slot1, *next->slot2)
                                                            : (next->slot1 ? *next->slot1 : *next->slot2);
            if (!manager.recordBracketMatchResult(id, next->id, winner, &error)) {
                return Fail(error);
            }
        }
        if (!error.ok()) {
            return Fail(error);
        }
        std::optional<dexcup::core::bracket::Bracket> bracket;
        if (!manager.getBracket(id, bracket, &error)) {
            return Fail(error);
        }
        const auto champion = bracket ? dexcup::core::bracket::DoubleEliminationBracket::Champion(*bracket)
                                      : std::nullopt;
        result["champion"] = champion ? nlohmann::json(champion->str()) : nlohmann::json(nullptr);
    } else if (config.format.playoff == "single-elimination" &&
               created->participant_count() >= config.format.playoff_cutoff) {
        const auto tournament = manager.getTournament(id, &error);
        auto knockout = tournament ? dexcup::core::seeding::PlayoffSeeding::CreateSingleElimination(
                                         tournament->participants(),
                                         tournament->Scores(),
                                         config.format.playoff_cutoff,
                                         &error)
                                   : std::nullopt;
        if (!knockout) {
            return Fail(error);
        }
        while (!knockout->IsComplete()) {
            const auto matches = knockout->CurrentRoundMatches();
            for (size_t i = 0; i < matches.size(); ++i) {
                const auto winner = std::min(matches[i].participant1, matches[i].participant2);
                if (!knockout->RecordWinner(i, winner, &error)) {
                    return Fail(error);
                }
            }
            if (!knockout->AdvanceRound(&error)) {
                return Fail(error);
            }
        }
        result["knockout"] = KnockoutJson(*knockout);
        const auto winner = knockout->Winner();
        result["champion"] = winner ? nlohmann::json(winner->str()) : nlohmann::json(nullptr);
    }
    return Print(result);
}

const std::map<std::string, Command>& Commands() {
    static const std::map<std::string, Command> commands = {
        {"create", {"create <email> <participant>...", 2, RunCreate}},
        {"list", {"list <email>", 1, RunList}},
        {"show", {"show <tournament>", 1, RunShow}},
        {"pairings", {"pairings <tournament>", 1, RunPairings}},
        {"record", {"record <tournament> <p1> <p2> <win|loss|draw> [winner]", 4, RunRecord}},
        {"bye", {"bye <tournament> <participant>", 2, RunBye}},
        {"advance", {"advance <tournament>", 1, RunAdvance}},
        {"standings", {"standings <tournament>", 1, RunStandings}},
        {"final", {"final <tournament>", 1, RunFinal}},
        {"bracket-init", {"bracket-init <tournament>", 1, RunBracketInit}},
        {"bracket", {"bracket <tournament>", 1, RunBracket}},
        {"bracket-next", {"bracket-next <tournament>", 1, RunBracketNext}},
        {"bracket-record", {"bracket-record <tournament> <match> <winner>", 3, RunBracketRecord}},
        {"knockout", {"knockout <tournament>", 1, RunKnockout}},
        {"export", {"export <tournament> [directory]", 1, RunExport}},
        {"delete", {"delete <tournament>", 1, RunDelete}},
        {"demo", {"demo <participant>...", 1, RunDemo}},
    };
    return commands;
}

void PrintUsage() {
    std::cerr << "Usage: dexcupcli <config.json> <command> [args]" << '\n';
    for (const auto& [name, command] : Commands()) {
        std::cerr << "  " << command.usage << '\n';
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }

    const std::string config_path = argv[1];
    const std::string command_name = argv[2];
    const Args args(argv + 3, argv + argc);

    const auto& commands = Commands();
    const auto command = commands.find(command_name);
    if (command == commands.end()) {
        std::cerr << "[dexcupcli] Unknown command: " << command_name << '\n';
        PrintUsage();
        return 1;
    }
    if (args.size() < command->second.min_args) {
        std::cerr << "Usage: dexcupcli <config.json> " << command->second.usage << '\n';
        return 1;
    }

    DexcupConfig config;
    std::string config_error;
    if (!DexcupConfig::LoadFromFile(config_path, config, &config_error)) {
        std::cerr << "[dexcupcli] " << config_error << '\n';
        return 1;
    }

    std::unique_ptr<dexcup::core::persist::ITournamentRepository> repository;
    if (config.storage.type == "json_dir") {
        repository = std::make_unique<dexcup::core::persist::JsonFileTournamentRepository>(config.storage.directory);
    } else {
        repository = std::make_unique<dexcup::core::persist::InMemoryTournamentRepository>();
    }

    dexcup::core::api::ManagerOptions options;
    options.max_log_lines = static_cast<size_t>(config.logging.max_log_lines);
    options.echo_stderr = config.logging.echo_stderr;
    options.auto_initialize_bracket = config.format.playoff == "double-elimination";

    TournamentManager manager(*repository, options);
    return command->second.run(manager, config, args);
}
