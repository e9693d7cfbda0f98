#include "dexcup/core/model/Participant.h"

#include <sstream>

namespace dexcup::core::model {

std::optional<Participant> Participant::Restore(CompetitorId id,
                                                int wins,
                                                int losses,
                                                int draws,
                                                int score,
                                                TournamentError* error) {
    if (wins < 0 || losses < 0 || draws < 0) {
        Fail(error, ErrorKind::IllegalState, "Stored counters cannot be negative for " + id.str());
        return std::nullopt;
    }
    const long long expected = static_cast<long long>(wins) * kWinPoints +
                               static_cast<long long>(draws) * kDrawPoints +
                               static_cast<long long>(losses) * kLossPoints;
    if (score != expected) {
        std::ostringstream out;
        out << "Score invariant violated for " << id.str() << ": expected " << expected << ", got " << score;
        Fail(error, ErrorKind::IllegalState, out.str());
        return std::nullopt;
    }

    Participant participant(std::move(id));
    participant.wins_ = wins;
    participant.losses_ = losses;
    participant.draws_ = draws;
    participant.score_ = score;
    return participant;
}

void Participant::AddWin() {
    wins_ += 1;
    score_ += kWinPoints;
}

void Participant::AddLoss() {
    losses_ += 1;
    score_ += kLossPoints;
}

void Participant::AddDraw() {
    draws_ += 1;
    score_ += kDrawPoints;
}

std::string Participant::ToString() const {
    std::ostringstream out;
    out << id_.str() << " (Score: " << score_ << ", W:" << wins_ << " L:" << losses_ << " D:" << draws_ << ')';
    return out.str();
}

}  // namespace dexcup::core::model
