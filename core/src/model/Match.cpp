#include "dexcup/core/model/Match.h"

#include <sstream>

namespace dexcup::core::model {

bool Match::RecordResult(const MatchResult& result, TournamentError* error) {
    if (IsComplete()) {
        return Fail(error, ErrorKind::InvalidInput, "Cannot record result for completed match: " + ToString());
    }
    if (is_bye()) {
        return Fail(error, ErrorKind::InvalidInput, "A bye has no opponent to record a result against");
    }
    if (participant1_ == *participant2_) {
        return Fail(error, ErrorKind::InvalidInput, "Participants cannot be the same: " + participant1_.str());
    }
    if (!result.IsDraw()) {
        const auto& winner = *result.winner();
        if (winner != participant1_ && winner != *participant2_) {
            return Fail(error, ErrorKind::InvalidInput, "Winner must be one of the match participants");
        }
    }
    result_ = result;
    return true;
}

const CompetitorId* Match::Loser() const {
    if (!result_ || result_->IsDraw() || is_bye()) {
        return nullptr;
    }
    return *result_->winner() == participant1_ ? &*participant2_ : &participant1_;
}

std::string Match::ToString() const {
    std::ostringstream out;
    out << "Round " << round_ << ": " << participant1_.str() << " vs "
        << (participant2_ ? participant2_->str() : std::string("(bye)"));
    if (result_) {
        out << " - " << OutcomeName(result_->outcome());
        if (result_->winner()) {
            out << " (" << result_->winner()->str() << ')';
        }
    }
    return out.str();
}

}  // namespace dexcup::core::model
