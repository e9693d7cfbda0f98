#include "dexcup/core/persist/JsonFileTournamentRepository.h"

#include "dexcup/core/util/AtomicFileWriter.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dexcup::core::persist {

using model::ErrorKind;

namespace {

bool Corrupted(model::TournamentError* error, const std::string& path, const std::string& detail) {
    return model::Fail(error, ErrorKind::IllegalState, "Corrupted tournament file " + path + ": " + detail);
}

nlohmann::json OptionalIdToJson(const std::optional<model::CompetitorId>& id) {
    return id ? nlohmann::json(id->str()) : nlohmann::json(nullptr);
}

std::vector<std::string> ByeIds(const model::Tournament& tournament) {
    std::vector<std::string> ids;
    for (const auto& bye : tournament.round_byes()) {
        ids.push_back(bye.str());
    }
    return ids;
}

nlohmann::json TournamentToJson(const model::Tournament& tournament) {
    return {
        {"id", tournament.id().str()},
        {"owner_email", tournament.owner_email()},
        {"total_rounds", tournament.total_rounds()},
        {"current_round", tournament.current_round()},
        {"revision", tournament.revision()},
        {"round_byes", ByeIds(tournament)},
    };
}

nlohmann::json ParticipantsToJson(const model::Tournament& tournament) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& participant : tournament.participants()) {
        rows.push_back({
            {"id", participant.id().str()},
            {"score", participant.score()},
            {"wins", participant.wins()},
            {"losses", participant.losses()},
            {"draws", participant.draws()},
        });
    }
    return rows;
}

nlohmann::json StoredMatchToJson(const model::StoredMatch& match) {
    return {
        {"round", match.round},
        {"participant1", match.participant1.str()},
        {"participant2", match.participant2.str()},
        {"outcome", model::OutcomeName(match.outcome)},
        {"winner", OptionalIdToJson(match.winner)},
    };
}

std::optional<model::Tournament> TournamentFromJson(const nlohmann::json& root,
                                                    const std::string& path,
                                                    model::TournamentError* error) {
    if (!root.is_object() || !root.contains("tournament") || !root.at("tournament").is_object()) {
        Corrupted(error, path, "missing tournament section");
        return std::nullopt;
    }
    const auto& node = root.at("tournament");

    model::TournamentError inner;
    const auto id = model::TournamentId::FromString(node.value("id", ""), &inner);
    if (!id) {
        Corrupted(error, path, inner.message);
        return std::nullopt;
    }

    std::vector<model::Participant> participants;
    if (root.contains("participants")) {
        if (!root.at("participants").is_array()) {
            Corrupted(error, path, "participants must be an array");
            return std::nullopt;
        }
        for (const auto& row : root.at("participants")) {
            if (!row.is_object()) {
                Corrupted(error, path, "participant rows must be objects");
                return std::nullopt;
            }
            const auto competitor = model::CompetitorId::FromString(row.value("id", ""), &inner);
            if (!competitor) {
                Corrupted(error, path, inner.message);
                return std::nullopt;
            }
            auto participant = model::Participant::Restore(*competitor,
                                                           row.value("wins", 0),
                                                           row.value("losses", 0),
                                                           row.value("draws", 0),
                                                           row.value("score", 0),
                                                           &inner);
            if (!participant) {
                Corrupted(error, path, inner.message);
                return std::nullopt;
            }
            participants.push_back(std::move(*participant));
        }
    }

    std::vector<model::CompetitorId> round_byes;
    if (node.contains("round_byes")) {
        for (const auto& value : node.at("round_byes")) {
            const auto bye = model::CompetitorId::FromString(value.get<std::string>(), &inner);
            if (!bye) {
                Corrupted(error, path, inner.message);
                return std::nullopt;
            }
            round_byes.push_back(*bye);
        }
    }

    auto tournament = model::Tournament::Restore(*id,
                                                 node.value("owner_email", ""),
                                                 std::move(participants),
                                                 node.value("total_rounds", 0),
                                                 node.value("current_round", 0),
                                                 node.value("revision", 0),
                                                 std::move(round_byes),
                                                 &inner);
    if (!tournament) {
        Corrupted(error, path, inner.message);
        return std::nullopt;
    }
    return tournament;
}

std::optional<model::StoredMatch> StoredMatchFromJson(const nlohmann::json& node,
                                                     const std::string& path,
                                                     model::TournamentError* error) {
    if (!node.is_object()) {
        Corrupted(error, path, "match rows must be objects");
        return std::nullopt;
    }
    model::TournamentError inner;
    const auto p1 = model::CompetitorId::FromString(node.value("participant1", ""), &inner);
    const auto p2 = p1 ? model::CompetitorId::FromString(node.value("participant2", ""), &inner) : std::nullopt;
    const auto outcome = p2 ? model::ParseOutcome(node.value("outcome", ""), &inner) : std::nullopt;
    if (!p1 || !p2 || !outcome) {
        Corrupted(error, path, inner.message);
        return std::nullopt;
    }

    std::optional<model::CompetitorId> winner;
    if (node.contains("winner") && !node.at("winner").is_null()) {
        if (!node.at("winner").is_string()) {
            Corrupted(error, path, "match winner must be a string");
            return std::nullopt;
        }
        winner = model::CompetitorId::FromString(node.at("winner").get<std::string>(), &inner);
        if (!winner) {
            Corrupted(error, path, inner.message);
            return std::nullopt;
        }
    }
    return model::StoredMatch{*p1, *p2, node.value("round", 0), *outcome, winner};
}

bool RevisionConflict(model::TournamentError* error, const model::Tournament& tournament, int stored_revision) {
    std::ostringstream out;
    out << "Revision conflict for tournament " << tournament.id().str() << ": stored " << stored_revision
        << ", saving " << tournament.revision();
    return model::Fail(error, ErrorKind::IllegalState, out.str());
}

bool StoredRevision(const nlohmann::json& root,
                    const std::string& path,
                    int& revision,
                    model::TournamentError* error) {
    if (!root.is_object() || !root.contains("tournament") || !root.at("tournament").is_object()) {
        return Corrupted(error, path, "missing tournament section");
    }
    const auto stored = root.at("tournament").value("revision", nlohmann::json(0));
    if (!stored.is_number_integer()) {
        return Corrupted(error, path, "revision must be an integer");
    }
    revision = stored.get<int>();
    return true;
}

// Overwrites the tournament and participant sections; matches and bracket are kept.
void PutTournament(nlohmann::json& root, const model::Tournament& tournament, int stored_revision) {
    root["version"] = JsonFileTournamentRepository::kFormatVersion;
    root["tournament"] = TournamentToJson(tournament);
    root["tournament"]["revision"] = stored_revision + 1;
    root["participants"] = ParticipantsToJson(tournament);
    if (!root.contains("matches")) {
        root["matches"] = nlohmann::json::array();
    }
    if (!root.contains("bracket")) {
        root["bracket"] = nullptr;
    }
}

// Replaces the row with the same round and participant order, or appends one.
bool PutMatchRow(nlohmann::json& root,
                 const model::StoredMatch& match,
                 const std::string& path,
                 model::TournamentError* error) {
    if (!root.contains("matches") || !root.at("matches").is_array()) {
        root["matches"] = nlohmann::json::array();
    }
    const auto row = StoredMatchToJson(match);
    for (auto& existing : root["matches"]) {
        if (!existing.is_object()) {
            return Corrupted(error, path, "match rows must be objects");
        }
        if (existing.value("round", nlohmann::json()) == match.round &&
            existing.value("participant1", nlohmann::json()) == match.participant1.str() &&
            existing.value("participant2", nlohmann::json()) == match.participant2.str()) {
            existing = row;
            return true;
        }
    }
    root["matches"].push_back(row);
    return true;
}

// Field type mismatches surface as nlohmann exceptions; report them as corruption.
template <typename Decode>
auto Guarded(const std::string& path, model::TournamentError* error, Decode decode) -> decltype(decode()) {
    try {
        return decode();
    } catch (const nlohmann::json::exception& ex) {
        Corrupted(error, path, ex.what());
        return std::nullopt;
    }
}

}  // namespace

JsonFileTournamentRepository::JsonFileTournamentRepository(std::string directory)
    : directory_(std::move(directory)) {}

std::string JsonFileTournamentRepository::PathFor(const model::TournamentId& id) const {
    return (std::filesystem::path(directory_) / (id.str() + ".json")).string();
}

bool JsonFileTournamentRepository::ReadDocument(const std::string& path,
                                                nlohmann::json& root,
                                                model::TournamentError* error) const {
    std::ifstream input(path);
    if (!input) {
        return model::Fail(error, ErrorKind::Storage, "Failed to open tournament file: " + path);
    }
    try {
        input >> root;
    } catch (const std::exception& ex) {
        return model::Fail(error, ErrorKind::Storage, "Failed to parse tournament file " + path + ": " + ex.what());
    }
    return true;
}

bool JsonFileTournamentRepository::LoadExisting(const model::TournamentId& id,
                                                nlohmann::json& root,
                                                model::TournamentError* error) const {
    const auto path = PathFor(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return model::Fail(error, ErrorKind::IllegalState, "Tournament not found: " + id.str());
    }
    return ReadDocument(path, root, error);
}

bool JsonFileTournamentRepository::WriteDocument(const model::TournamentId& id,
                                                 const nlohmann::json& root,
                                                 model::TournamentError* error) {
    std::string write_error;
    if (!util::AtomicFileWriter::Write(PathFor(id), root.dump(2), &write_error)) {
        return model::Fail(error, ErrorKind::Storage, write_error);
    }
    return true;
}

bool JsonFileTournamentRepository::Save(const model::Tournament& tournament, model::TournamentError* error) {
    const auto path = PathFor(tournament.id());
    nlohmann::json root = nlohmann::json::object();
    int stored_revision = 0;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (!ReadDocument(path, root, error) || !StoredRevision(root, path, stored_revision, error)) {
            return false;
        }
    }
    if (stored_revision != tournament.revision()) {
        return RevisionConflict(error, tournament, stored_revision);
    }

    PutTournament(root, tournament, stored_revision);
    return WriteDocument(tournament.id(), root, error);
}

bool JsonFileTournamentRepository::FindById(const model::TournamentId& id,
                                            std::optional<model::Tournament>& tournament,
                                            model::TournamentError* error) const {
    tournament.reset();
    const auto path = PathFor(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }
    nlohmann::json root;
    if (!ReadDocument(path, root, error)) {
        return false;
    }
    tournament = Guarded(path, error, [&] { return TournamentFromJson(root, path, error); });
    return tournament.has_value();
}

bool JsonFileTournamentRepository::ListAll(std::vector<model::Tournament>& tournaments,
                                           model::TournamentError* error) const {
    tournaments.clear();
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return true;
    }

    std::vector<std::string> paths;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".json") {
            paths.push_back(it->path().string());
        }
    }
    if (ec) {
        return model::Fail(error, ErrorKind::Storage, "Failed to list " + directory_ + ": " + ec.message());
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        nlohmann::json root;
        if (!ReadDocument(path, root, error)) {
            return false;
        }
        auto tournament = Guarded(path, error, [&] { return TournamentFromJson(root, path, error); });
        if (!tournament) {
            return false;
        }
        tournaments.push_back(std::move(*tournament));
    }
    return true;
}

bool JsonFileTournamentRepository::FindByOwnerEmail(const std::string& owner_email,
                                                    std::vector<model::Tournament>& tournaments,
                                                    model::TournamentError* error) const {
    std::vector<model::Tournament> all;
    if (!ListAll(all, error)) {
        return false;
    }
    tournaments.clear();
    for (auto& tournament : all) {
        if (tournament.owner_email() == owner_email) {
            tournaments.push_back(std::move(tournament));
        }
    }
    return true;
}

bool JsonFileTournamentRepository::FindAll(std::vector<model::Tournament>& tournaments,
                                           model::TournamentError* error) const {
    return ListAll(tournaments, error);
}

bool JsonFileTournamentRepository::Exists(const model::TournamentId& id) const {
    std::error_code ec;
    return std::filesystem::exists(PathFor(id), ec);
}

bool JsonFileTournamentRepository::Delete(const model::TournamentId& id, model::TournamentError* error) {
    std::error_code ec;
    if (!std::filesystem::remove(PathFor(id), ec)) {
        if (ec) {
            return model::Fail(error, ErrorKind::Storage, "Failed to delete " + PathFor(id) + ": " + ec.message());
        }
        return model::Fail(error, ErrorKind::IllegalState, "Tournament not found: " + id.str());
    }
    return true;
}

bool JsonFileTournamentRepository::SaveMatch(const model::TournamentId& id,
                                             int round,
                                             const model::CompetitorId& participant1,
                                             const model::CompetitorId& participant2,
                                             model::Outcome outcome,
                                             const std::optional<model::CompetitorId>& winner,
                                             model::TournamentError* error) {
    nlohmann::json root;
    if (!LoadExisting(id, root, error)) {
        return false;
    }
    if (!PutMatchRow(root,
                     model::StoredMatch{participant1, participant2, round, outcome, winner},
                     PathFor(id),
                     error)) {
        return false;
    }
    return WriteDocument(id, root, error);
}

bool JsonFileTournamentRepository::LoadMatches(const model::TournamentId& id,
                                               std::vector<model::StoredMatch>& matches,
                                               model::TournamentError* error) const {
    nlohmann::json root;
    if (!LoadExisting(id, root, error)) {
        return false;
    }
    matches.clear();
    if (!root.contains("matches")) {
        return true;
    }
    const auto path = PathFor(id);
    if (!root.at("matches").is_array()) {
        return Corrupted(error, path, "matches must be an array");
    }
    for (const auto& node : root.at("matches")) {
        auto match = Guarded(path, error, [&] { return StoredMatchFromJson(node, path, error); });
        if (!match) {
            return false;
        }
        matches.push_back(std::move(*match));
    }
    return true;
}

bool JsonFileTournamentRepository::SaveResult(const model::Tournament& tournament,
                                              const model::StoredMatch& match,
                                              model::TournamentError* error) {
    const auto path = PathFor(tournament.id());
    nlohmann::json root;
    int stored_revision = 0;
    if (!LoadExisting(tournament.id(), root, error) || !StoredRevision(root, path, stored_revision, error)) {
        return false;
    }
    if (stored_revision != tournament.revision()) {
        return RevisionConflict(error, tournament, stored_revision);
    }

    PutTournament(root, tournament, stored_revision);
    if (!PutMatchRow(root, match, path, error)) {
        return false;
    }
    return WriteDocument(tournament.id(), root, error);
}

bool JsonFileTournamentRepository::SaveBracketData(const model::TournamentId& id,
                                                   const nlohmann::json& bracket,
                                                   model::TournamentError* error) {
    nlohmann::json root;
    if (!LoadExisting(id, root, error)) {
        return false;
    }
    root["bracket"] = bracket;
    return WriteDocument(id, root, error);
}

bool JsonFileTournamentRepository::LoadBracketData(const model::TournamentId& id,
                                                   std::optional<nlohmann::json>& bracket,
                                                   model::TournamentError* error) const {
    bracket.reset();
    nlohmann::json root;
    if (!LoadExisting(id, root, error)) {
        return false;
    }
    if (root.contains("bracket") && !root.at("bracket").is_null()) {
        bracket = root.at("bracket");
    }
    return true;
}

}  // namespace dexcup::core::persist
