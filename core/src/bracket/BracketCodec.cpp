#include "dexcup/core/bracket/BracketCodec.h"

#include <sstream>

namespace dexcup::core::bracket {

namespace {

using model::CompetitorId;
using model::ErrorKind;

constexpr const char* kWinnerKey = "winner_bracket";
constexpr const char* kLoserKey = "loser_bracket";
constexpr const char* kGrandFinalKey = "grand_finals";

std::string RoundKey(int round) {
    return "round" + std::to_string(round);
}

nlohmann::json SlotToJson(const std::optional<CompetitorId>& slot) {
    if (!slot) {
        return nullptr;
    }
    return slot->str();
}

bool Corrupted(model::TournamentError* error, const std::string& detail) {
    return model::Fail(error, ErrorKind::IllegalState, "Corrupted bracket data: " + detail);
}

bool ReadSlot(const nlohmann::json& node,
              const char* key,
              std::optional<CompetitorId>& slot,
              model::TournamentError* error) {
    slot.reset();
    if (!node.contains(key) || node.at(key).is_null()) {
        return true;
    }
    if (!node.at(key).is_string()) {
        return Corrupted(error, std::string("field '") + key + "' is not a string");
    }
    model::TournamentError parse_error;
    slot = CompetitorId::FromString(node.at(key).get<std::string>(), &parse_error);
    if (!slot) {
        return Corrupted(error, parse_error.message);
    }
    return true;
}

bool ReadMatch(const nlohmann::json& node,
               Ladder ladder,
               int round,
               BracketMatch& match,
               model::TournamentError* error) {
    if (!node.is_object()) {
        return Corrupted(error, "match entry is not an object");
    }
    match.id = node.value("id", "");
    if (match.id.empty()) {
        return Corrupted(error, "match without id");
    }
    match.ladder = ladder;
    match.round = node.value("round", round);
    if (match.round != round) {
        return Corrupted(error, "match " + match.id + " is stored under the wrong round");
    }
    if (!ReadSlot(node, "participant1", match.slot1, error) ||
        !ReadSlot(node, "participant2", match.slot2, error) ||
        !ReadSlot(node, "winner", match.winner, error)) {
        return false;
    }
    if (match.winner && !match.Contains(*match.winner)) {
        return Corrupted(error, "winner of " + match.id + " is not one of its participants");
    }
    return true;
}

bool ReadLadder(const nlohmann::json& root,
                const char* key,
                Ladder ladder,
                int round_count,
                Bracket& bracket,
                model::TournamentError* error) {
    auto& rounds = ladder == Ladder::Winner ? bracket.winner_rounds : bracket.loser_rounds;
    rounds.assign(static_cast<size_t>(round_count), {});
    if (!root.contains(key)) {
        return true;
    }
    const auto& ladder_node = root.at(key);
    if (!ladder_node.is_object()) {
        return Corrupted(error, std::string(key) + " is not an object");
    }
    for (int round = 1; round <= round_count; ++round) {
        const auto round_key = RoundKey(round);
        if (!ladder_node.contains(round_key)) {
            continue;
        }
        const auto& matches = ladder_node.at(round_key);
        if (!matches.is_array()) {
            return Corrupted(error, std::string(key) + "." + round_key + " is not an array");
        }
        for (const auto& entry : matches) {
            BracketMatch match;
            if (!ReadMatch(entry, ladder, round, match, error)) {
                return false;
            }
            if (bracket.matches.count(match.id) != 0) {
                return Corrupted(error, "duplicate match id " + match.id);
            }
            rounds[static_cast<size_t>(round - 1)].push_back(match.id);
            bracket.matches.emplace(match.id, std::move(match));
        }
    }
    return true;
}

}  // namespace

nlohmann::json BracketCodec::MatchToJson(const BracketMatch& match) {
    return {
        {"id", match.id},
        {"round", match.round},
        {"participant1", SlotToJson(match.slot1)},
        {"participant2", SlotToJson(match.slot2)},
        {"winner", SlotToJson(match.winner)},
    };
}

nlohmann::json BracketCodec::ToJson(const Bracket& bracket) {
    nlohmann::json root;
    const auto write_ladder = [&bracket](const std::vector<std::vector<std::string>>& rounds) {
        nlohmann::json ladder = nlohmann::json::object();
        for (size_t i = 0; i < rounds.size(); ++i) {
            auto& list = ladder[RoundKey(static_cast<int>(i + 1))];
            list = nlohmann::json::array();
            for (const auto& id : rounds[i]) {
                const auto it = bracket.matches.find(id);
                if (it != bracket.matches.end()) {
                    list.push_back(MatchToJson(it->second));
                }
            }
        }
        return ladder;
    };

    root[kWinnerKey] = write_ladder(bracket.winner_rounds);
    root[kLoserKey] = write_ladder(bracket.loser_rounds);
    root[kGrandFinalKey] = nlohmann::json::array();
    const auto it = bracket.matches.find(bracket.grand_final_id);
    if (it != bracket.matches.end()) {
        root[kGrandFinalKey].push_back(MatchToJson(it->second));
    }
    return root;
}

bool BracketCodec::FromJson(const nlohmann::json& node, Bracket& bracket, model::TournamentError* error) {
    if (!node.is_object()) {
        return Corrupted(error, "root is not an object");
    }

    Bracket decoded;
    try {
        if (!ReadLadder(node, kWinnerKey, Ladder::Winner, DoubleEliminationBracket::kWinnerRounds, decoded, error) ||
            !ReadLadder(node, kLoserKey, Ladder::Loser, DoubleEliminationBracket::kLoserRounds, decoded, error)) {
            return false;
        }

        BracketMatch grand_final;
        grand_final.id = DoubleEliminationBracket::kGrandFinalId;
        grand_final.ladder = Ladder::GrandFinal;
        if (node.contains(kGrandFinalKey)) {
            const auto& finals = node.at(kGrandFinalKey);
            if (!finals.is_array() || finals.size() > 1) {
                return Corrupted(error, "grand_finals must hold at most one match");
            }
            if (!finals.empty() && !ReadMatch(finals.front(), Ladder::GrandFinal, 1, grand_final, error)) {
                return false;
            }
        }
        if (decoded.matches.count(grand_final.id) != 0) {
            return Corrupted(error, "duplicate match id " + grand_final.id);
        }
        decoded.grand_final_id = grand_final.id;
        decoded.matches.emplace(grand_final.id, std::move(grand_final));
    } catch (const std::exception& ex) {
        return Corrupted(error, ex.what());
    }

    bracket = std::move(decoded);
    return true;
}

}  // namespace dexcup::core::bracket
