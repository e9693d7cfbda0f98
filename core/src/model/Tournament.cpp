#include "dexcup/core/model/Tournament.h"

#include <algorithm>
#include <set>
#include <sstream>

namespace dexcup::core::model {

namespace {

bool HasDuplicates(const std::vector<Participant>& participants) {
    std::set<CompetitorId> seen;
    for (const auto& participant : participants) {
        if (!seen.insert(participant.id()).second) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<Tournament> Tournament::Create(TournamentId id,
                                             std::string owner_email,
                                             std::vector<Participant> participants,
                                             int total_rounds,
                                             TournamentError* error) {
    if (participants.empty()) {
        Fail(error, ErrorKind::InvalidInput, "Tournament must have at least one participant");
        return std::nullopt;
    }
    if (HasDuplicates(participants)) {
        Fail(error, ErrorKind::InvalidInput, "Tournament participants must be unique");
        return std::nullopt;
    }
    if (total_rounds < 0) {
        Fail(error, ErrorKind::InvalidInput, "Total rounds cannot be negative");
        return std::nullopt;
    }
    return Tournament(std::move(id), std::move(owner_email), std::move(participants), total_rounds);
}

std::optional<Tournament> Tournament::Restore(TournamentId id,
                                              std::string owner_email,
                                              std::vector<Participant> participants,
                                              int total_rounds,
                                              int current_round,
                                              int revision,
                                              std::vector<CompetitorId> round_byes,
                                              TournamentError* error) {
    const std::string label = id.str();
    auto tournament = Create(std::move(id), std::move(owner_email), std::move(participants), total_rounds, error);
    if (!tournament) {
        if (error) {
            error->kind = ErrorKind::IllegalState;
            error->message = "Stored tournament " + label + " is corrupted: " + error->message;
        }
        return std::nullopt;
    }
    if (current_round < 0 || current_round > total_rounds || revision < 0) {
        std::ostringstream out;
        out << "Stored tournament " << label << " is corrupted: round " << current_round << " of "
            << total_rounds << ", revision " << revision;
        Fail(error, ErrorKind::IllegalState, out.str());
        return std::nullopt;
    }
    std::set<CompetitorId> byes;
    for (const auto& bye : round_byes) {
        if (tournament->FindParticipant(bye) == nullptr || !byes.insert(bye).second) {
            Fail(error, ErrorKind::IllegalState, "Stored tournament " + label + " is corrupted: bad bye " + bye.str());
            return std::nullopt;
        }
    }
    tournament->current_round_ = current_round;
    tournament->revision_ = revision;
    tournament->round_byes_ = std::move(round_byes);
    return tournament;
}

bool Tournament::AdvanceRound(TournamentError* error) {
    if (IsComplete()) {
        return Fail(error, ErrorKind::IllegalState, "Cannot advance round: tournament is already complete");
    }
    current_round_ += 1;
    round_byes_.clear();
    return true;
}

bool Tournament::AwardBye(const CompetitorId& id, TournamentError* error) {
    auto* participant = FindParticipant(id);
    if (participant == nullptr) {
        return Fail(error, ErrorKind::InvalidInput, "Participant not found in tournament: " + id.str());
    }
    if (std::find(round_byes_.begin(), round_byes_.end(), id) != round_byes_.end()) {
        return Fail(error, ErrorKind::InvalidInput, "Participant already has a bye this round: " + id.str());
    }
    participant->AddWin();
    round_byes_.push_back(id);
    return true;
}

Participant* Tournament::FindParticipant(const CompetitorId& id) {
    for (auto& participant : participants_) {
        if (participant.id() == id) {
            return &participant;
        }
    }
    return nullptr;
}

const Participant* Tournament::FindParticipant(const CompetitorId& id) const {
    for (const auto& participant : participants_) {
        if (participant.id() == id) {
            return &participant;
        }
    }
    return nullptr;
}

std::vector<CompetitorId> Tournament::ParticipantIds() const {
    std::vector<CompetitorId> ids;
    ids.reserve(participants_.size());
    for (const auto& participant : participants_) {
        ids.push_back(participant.id());
    }
    return ids;
}

ScoreMap Tournament::Scores() const {
    ScoreMap scores;
    for (const auto& participant : participants_) {
        scores.emplace(participant.id(), participant.score());
    }
    return scores;
}

std::string Tournament::ToString() const {
    std::ostringstream out;
    out << "Tournament " << id_.str() << " (" << owner_email_ << ") - Round " << current_round_ << '/'
        << total_rounds_ << " - " << participants_.size() << " participants - "
        << (IsComplete() ? "Complete" : "In Progress");
    return out.str();
}

}  // namespace dexcup::core::model
