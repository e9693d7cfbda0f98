#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/Participant.h"
#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <string>
#include <vector>

namespace dexcup::core::model {

class Tournament {
public:
    static std::optional<Tournament> Create(TournamentId id,
                                            std::string owner_email,
                                            std::vector<Participant> participants,
                                            int total_rounds,
                                            TournamentError* error = nullptr);

    // Rebuilds a stored tournament, checking round bounds and participant uniqueness.
    static std::optional<Tournament> Restore(TournamentId id,
                                             std::string owner_email,
                                             std::vector<Participant> participants,
                                             int total_rounds,
                                             int current_round,
                                             int revision,
                                             std::vector<CompetitorId> round_byes,
                                             TournamentError* error = nullptr);

    const TournamentId& id() const { return id_; }
    const std::string& owner_email() const { return owner_email_; }
    const std::vector<Participant>& participants() const { return participants_; }
    int participant_count() const { return static_cast<int>(participants_.size()); }
    int current_round() const { return current_round_; }
    int total_rounds() const { return total_rounds_; }

    // Incremented by the repository on every successful save.
    int revision() const { return revision_; }
    void set_revision(int revision) { revision_ = revision; }

    bool IsComplete() const { return current_round_ >= total_rounds_; }
    // Clears the bye list of the round being closed.
    bool AdvanceRound(TournamentError* error);

    // Participants credited with a bye in the current round.
    const std::vector<CompetitorId>& round_byes() const { return round_byes_; }
    // Credits a win; at most one bye per participant per round.
    bool AwardBye(const CompetitorId& id, TournamentError* error);

    Participant* FindParticipant(const CompetitorId& id);
    const Participant* FindParticipant(const CompetitorId& id) const;

    std::vector<CompetitorId> ParticipantIds() const;
    ScoreMap Scores() const;

    std::string ToString() const;

private:
    Tournament(TournamentId id, std::string owner_email, std::vector<Participant> participants, int total_rounds)
        : id_(std::move(id)),
          owner_email_(std::move(owner_email)),
          participants_(std::move(participants)),
          total_rounds_(total_rounds) {}

    TournamentId id_;
    std::string owner_email_;
    std::vector<Participant> participants_;
    int current_round_ = 0;
    int total_rounds_ = 0;
    int revision_ = 0;
    std::vector<CompetitorId> round_byes_;
};

}  // namespace dexcup::core::model
