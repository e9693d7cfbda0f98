#pragma once

#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/TournamentError.h"

#include <map>
#include <optional>
#include <string>

namespace dexcup::core::model {

using ScoreMap = std::map<CompetitorId, int>;

class Participant {
public:
    static constexpr int kWinPoints = 3;
    static constexpr int kDrawPoints = 1;
    static constexpr int kLossPoints = 0;

    explicit Participant(CompetitorId id) : id_(std::move(id)) {}

    // Rebuilds a participant from stored counters; rejects rows that break the score invariant.
    static std::optional<Participant> Restore(CompetitorId id,
                                              int wins,
                                              int losses,
                                              int draws,
                                              int score,
                                              TournamentError* error = nullptr);

    const CompetitorId& id() const { return id_; }
    int score() const { return score_; }
    int wins() const { return wins_; }
    int losses() const { return losses_; }
    int draws() const { return draws_; }
    int games() const { return wins_ + losses_ + draws_; }

    void AddWin();
    void AddLoss();
    void AddDraw();

    std::string ToString() const;

private:
    CompetitorId id_;
    int score_ = 0;
    int wins_ = 0;
    int losses_ = 0;
    int draws_ = 0;
};

}  // namespace dexcup::core::model
