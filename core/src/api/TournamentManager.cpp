#include "dexcup/core/api/TournamentManager.h"

#include "dexcup/core/bracket/BracketCodec.h"
#include "dexcup/core/seeding/PlayoffSeeding.h"
#include "dexcup/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace dexcup::core::api {

using model::CompetitorId;
using model::ErrorKind;
using model::TournamentError;

namespace {

// Order-independent key for an unordered pair.
std::string MatchupKey(const CompetitorId& a, const CompetitorId& b) {
    return a < b ? a.str() + ":" + b.str() : b.str() + ":" + a.str();
}

StandingRow ToRow(const model::Participant& participant) {
    return StandingRow{participant.id(),
                       participant.score(),
                       participant.wins(),
                       participant.losses(),
                       participant.draws()};
}

bool DecodeBracket(const nlohmann::json& node, std::optional<bracket::Bracket>& out, TournamentError* error) {
    bracket::Bracket decoded;
    if (!bracket::BracketCodec::FromJson(node, decoded, error)) {
        return false;
    }
    out = std::move(decoded);
    return true;
}

}  // namespace

TournamentManager::TournamentManager(persist::ITournamentRepository& repository, ManagerOptions options, LogFn log_fn)
    : repository_(repository), options_(options), log_fn_(std::move(log_fn)) {}

std::optional<model::Tournament> TournamentManager::createTournament(const std::vector<CompetitorId>& participants,
                                                                     const std::string& owner_email,
                                                                     TournamentError* error) {
    if (participants.empty()) {
        model::Fail(error, ErrorKind::InvalidInput, "Tournament must have at least one participant");
        return std::nullopt;
    }

    int total_rounds = 0;
    if (!tournament::SwissScheduler::CalculateTotalRounds(static_cast<int>(participants.size()), total_rounds, error)) {
        return std::nullopt;
    }

    auto id = model::TournamentId::Generate();
    while (repository_.Exists(id)) {
        id = model::TournamentId::Generate();
    }

    std::vector<model::Participant> entrants;
    entrants.reserve(participants.size());
    for (const auto& participant : participants) {
        entrants.emplace_back(participant);
    }

    auto created = model::Tournament::Create(id, owner_email, std::move(entrants), total_rounds, error);
    if (!created) {
        return std::nullopt;
    }
    if (!repository_.Save(*created, error)) {
        return std::nullopt;
    }
    created->set_revision(created->revision() + 1);

    std::ostringstream line;
    line << "Created tournament " << id.str() << " for " << owner_email << " with " << participants.size()
         << " participants, " << total_rounds << " rounds";
    AppendLogLine(line.str());
    return created;
}

std::optional<model::Tournament> TournamentManager::getTournament(const model::TournamentId& id,
                                                                  TournamentError* error) const {
    std::optional<model::Tournament> tournament;
    if (!repository_.FindById(id, tournament, error)) {
        return std::nullopt;
    }
    if (!tournament) {
        model::Fail(error, ErrorKind::IllegalState, "Tournament not found: " + id.str());
    }
    return tournament;
}

bool TournamentManager::getUserTournaments(const std::string& owner_email,
                                           std::vector<model::Tournament>& tournaments,
                                           TournamentError* error) const {
    return repository_.FindByOwnerEmail(owner_email, tournaments, error);
}

bool TournamentManager::LoadCurrentRoundMatches(const model::Tournament& tournament,
                                                std::vector<model::StoredMatch>& matches,
                                                TournamentError* error) const {
    std::vector<model::StoredMatch> all;
    if (!repository_.LoadMatches(tournament.id(), all, error)) {
        return false;
    }
    matches.clear();
    for (auto& match : all) {
        if (match.round == tournament.current_round()) {
            matches.push_back(std::move(match));
        }
    }
    return true;
}

// Pairs the round as it stood when it opened: earlier rounds are the history, and results
// or byes already recorded in this round are taken back out of the scores.
bool TournamentManager::RoundPairings(const model::Tournament& tournament,
                                      std::vector<tournament::Pairing>& pairings,
                                      TournamentError* error) const {
    std::vector<model::StoredMatch> matches;
    if (!repository_.LoadMatches(tournament.id(), matches, error)) {
        return false;
    }

    auto scores = tournament.Scores();
    std::vector<tournament::Matchup> previous;
    for (const auto& match : matches) {
        if (match.round < tournament.current_round()) {
            previous.emplace_back(match.participant1, match.participant2);
            continue;
        }
        if (match.round != tournament.current_round()) {
            continue;
        }
        if (match.outcome == model::Outcome::Draw) {
            scores[match.participant1] -= model::Participant::kDrawPoints;
            scores[match.participant2] -= model::Participant::kDrawPoints;
        } else if (match.winner) {
            scores[*match.winner] -= model::Participant::kWinPoints;
        }
    }
    for (const auto& bye : tournament.round_byes()) {
        scores[bye] -= model::Participant::kWinPoints;
    }

    return tournament::SwissScheduler::GeneratePairings(tournament.ParticipantIds(), previous, scores, pairings, error);
}

bool TournamentManager::getCurrentRoundPairings(const model::TournamentId& id,
                                                std::vector<tournament::Pairing>& pairings,
                                                TournamentError* error) const {
    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (tournament->IsComplete()) {
        pairings.clear();
        return true;
    }
    return RoundPairings(*tournament, pairings, error);
}

bool TournamentManager::recordMatchResult(const model::TournamentId& id,
                                          const CompetitorId& participant1,
                                          const CompetitorId& participant2,
                                          model::Outcome outcome,
                                          const std::optional<CompetitorId>& winner,
                                          TournamentError* error) {
    auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }

    auto* p1 = tournament->FindParticipant(participant1);
    auto* p2 = tournament->FindParticipant(participant2);
    if (p1 == nullptr || p2 == nullptr) {
        return model::Fail(error,
                           ErrorKind::InvalidInput,
                           "One or both participants not found in tournament: " + participant1.str() + ", " +
                               participant2.str());
    }

    const auto result = model::MatchResult::Make(outcome, winner, error);
    if (!result) {
        return false;
    }
    model::Match match(participant1, participant2, tournament->current_round());
    if (!match.RecordResult(*result, error)) {
        return false;
    }

    if (tournament->IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Cannot record result: tournament is already complete");
    }

    std::vector<model::StoredMatch> round_matches;
    if (!LoadCurrentRoundMatches(*tournament, round_matches, error)) {
        return false;
    }
    const auto key = MatchupKey(participant1, participant2);
    for (const auto& stored : round_matches) {
        if (MatchupKey(stored.participant1, stored.participant2) == key) {
            std::ostringstream out;
            out << "Result already recorded in round " << tournament->current_round() << " for " << key;
            return model::Fail(error, ErrorKind::InvalidInput, out.str());
        }
    }

    if (result->IsDraw()) {
        p1->AddDraw();
        p2->AddDraw();
    } else if (*result->winner() == participant1) {
        p1->AddWin();
        p2->AddLoss();
    } else {
        p2->AddWin();
        p1->AddLoss();
    }

    const model::StoredMatch stored{participant1, participant2, tournament->current_round(), outcome, winner};
    if (!repository_.SaveResult(*tournament, stored, error)) {
        return false;
    }

    AppendLogLine("Recorded " + match.ToString() + " in " + id.str());
    return true;
}

bool TournamentManager::recordBye(const model::TournamentId& id,
                                  const CompetitorId& participant,
                                  TournamentError* error) {
    auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (tournament->FindParticipant(participant) != nullptr && tournament->IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Cannot record bye: tournament is already complete");
    }
    if (!tournament->AwardBye(participant, error)) {
        return false;
    }
    if (!repository_.Save(*tournament, error)) {
        return false;
    }

    std::ostringstream line;
    line << "Bye for " << participant.str() << " in round " << tournament->current_round() << " of " << id.str();
    AppendLogLine(line.str());
    return true;
}

bool TournamentManager::isCurrentRoundComplete(const model::TournamentId& id,
                                               bool& complete,
                                               TournamentError* error) const {
    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (tournament->IsComplete()) {
        complete = true;
        return true;
    }

    std::vector<tournament::Pairing> pairings;
    if (!RoundPairings(*tournament, pairings, error)) {
        return false;
    }
    std::vector<model::StoredMatch> round_matches;
    if (!LoadCurrentRoundMatches(*tournament, round_matches, error)) {
        return false;
    }

    std::vector<std::string> recorded;
    recorded.reserve(round_matches.size());
    for (const auto& match : round_matches) {
        recorded.push_back(MatchupKey(match.participant1, match.participant2));
    }

    complete = std::all_of(pairings.begin(), pairings.end(), [&recorded](const tournament::Pairing& pairing) {
        if (pairing.is_bye()) {
            return true;
        }
        const auto key = MatchupKey(pairing.first, *pairing.second);
        return std::find(recorded.begin(), recorded.end(), key) != recorded.end();
    });
    return true;
}

bool TournamentManager::advanceToNextRound(const model::TournamentId& id, TournamentError* error) {
    auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (tournament->IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Cannot advance round: tournament is already complete");
    }

    bool round_complete = false;
    if (!isCurrentRoundComplete(id, round_complete, error)) {
        return false;
    }
    if (!round_complete) {
        return model::Fail(error,
                           ErrorKind::IllegalState,
                           "Cannot advance round: not all matches in current round are complete");
    }

    if (!tournament->AdvanceRound(error)) {
        return false;
    }
    if (!repository_.Save(*tournament, error)) {
        return false;
    }

    std::ostringstream line;
    line << "Advanced " << id.str() << " to round " << tournament->current_round() << '/'
         << tournament->total_rounds();
    AppendLogLine(line.str());

    if (!tournament->IsComplete()) {
        return true;
    }
    AppendLogLine("Swiss rounds complete for " + id.str());
    if (!options_.auto_initialize_bracket || tournament->participant_count() < kPlayoffEntrants) {
        return true;
    }
    return initializeBracket(id, error);
}

bool TournamentManager::initializeBracket(const model::TournamentId& id, TournamentError* error) {
    std::optional<nlohmann::json> existing;
    if (!repository_.LoadBracketData(id, existing, error)) {
        return false;
    }
    if (existing) {
        return true;
    }

    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (!tournament->IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Cannot initialize bracket: Swiss rounds not complete");
    }
    if (tournament->participant_count() < kPlayoffEntrants) {
        std::ostringstream out;
        out << "Cannot initialize bracket: Need at least " << kPlayoffEntrants << " participants, have "
            << tournament->participant_count();
        return model::Fail(error, ErrorKind::IllegalState, out.str());
    }

    bracket::Bracket created;
    if (!seeding::PlayoffSeeding::CreateDoubleElimination(tournament->participants(),
                                                          tournament->Scores(),
                                                          kPlayoffEntrants,
                                                          created,
                                                          error)) {
        return false;
    }
    if (!repository_.SaveBracketData(id, bracket::BracketCodec::ToJson(created), error)) {
        return false;
    }

    const auto& opener = created.matches.at(created.winner_rounds.front().front());
    AppendLogLine("Bracket initialized for " + id.str() + ", top seed " + opener.slot1->str());
    return true;
}

bool TournamentManager::getBracket(const model::TournamentId& id,
                                   std::optional<bracket::Bracket>& bracket,
                                   TournamentError* error) const {
    bracket.reset();
    std::optional<nlohmann::json> stored;
    if (!repository_.LoadBracketData(id, stored, error)) {
        return false;
    }
    if (!stored) {
        return true;
    }
    return DecodeBracket(*stored, bracket, error);
}

bool TournamentManager::recordBracketMatchResult(const model::TournamentId& id,
                                                 const std::string& match_id,
                                                 const CompetitorId& winner,
                                                 TournamentError* error) {
    std::optional<bracket::Bracket> current;
    if (!getBracket(id, current, error)) {
        return false;
    }
    if (!current) {
        return model::Fail(error, ErrorKind::IllegalState, "Bracket not initialized for tournament " + id.str());
    }

    bracket::Bracket updated;
    if (!bracket::DoubleEliminationBracket::RecordMatchResult(*current, match_id, winner, updated, error)) {
        return false;
    }
    if (!repository_.SaveBracketData(id, bracket::BracketCodec::ToJson(updated), error)) {
        return false;
    }

    AppendLogLine("Bracket " + id.str() + ": " + match_id + " won by " + winner.str());
    if (const auto champion = bracket::DoubleEliminationBracket::Champion(updated)) {
        AppendLogLine("Champion of " + id.str() + ": " + champion->str());
    }
    return true;
}

bool TournamentManager::getNextBracketMatch(const model::TournamentId& id,
                                            std::optional<bracket::BracketMatch>& match,
                                            TournamentError* error) const {
    match.reset();
    std::optional<bracket::Bracket> current;
    if (!getBracket(id, current, error)) {
        return false;
    }
    if (!current) {
        return true;
    }
    const auto ready = bracket::DoubleEliminationBracket::GetMatchesReadyForVoting(*current);
    if (!ready.empty()) {
        match = ready.front();
    }
    return true;
}

bool TournamentManager::isBracketComplete(const model::TournamentId& id,
                                          bool& complete,
                                          TournamentError* error) const {
    std::optional<bracket::Bracket> current;
    if (!getBracket(id, current, error)) {
        return false;
    }
    complete = current && bracket::DoubleEliminationBracket::IsBracketComplete(*current);
    return true;
}

bool TournamentManager::getCurrentStandings(const model::TournamentId& id,
                                            std::vector<StandingRow>& rows,
                                            TournamentError* error) const {
    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    rows.clear();
    for (const auto& participant : tournament->participants()) {
        rows.push_back(ToRow(participant));
    }
    return true;
}

bool TournamentManager::getFinalStandings(const model::TournamentId& id,
                                          std::vector<StandingRow>& rows,
                                          TournamentError* error) const {
    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    if (!tournament->IsComplete()) {
        return model::Fail(error, ErrorKind::IllegalState, "Tournament is not complete yet");
    }
    return getCurrentStandings(id, rows, error);
}

bool TournamentManager::getSeededStandings(const model::TournamentId& id,
                                           std::vector<StandingRow>& rows,
                                           TournamentError* error) const {
    const auto tournament = getTournament(id, error);
    if (!tournament) {
        return false;
    }
    rows.clear();
    const auto sorted =
        tournament::SwissScheduler::SortStandingsByTieBreaker(tournament->Scores(), tournament->ParticipantIds());
    for (const auto& entry : sorted) {
        if (const auto* participant = tournament->FindParticipant(entry.participant)) {
            rows.push_back(ToRow(*participant));
        }
    }
    return true;
}

bool TournamentManager::deleteTournament(const model::TournamentId& id, TournamentError* error) {
    if (!repository_.Exists(id)) {
        return model::Fail(error, ErrorKind::IllegalState, "Tournament not found: " + id.str());
    }
    if (!repository_.Delete(id, error)) {
        return false;
    }
    AppendLogLine("Deleted tournament " + id.str());
    return true;
}

std::string TournamentManager::getLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

void TournamentManager::AppendLogLine(const std::string& message) {
    const std::string line = "[dexcup] " + message;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (options_.max_log_lines > 0 && log_lines_.size() >= options_.max_log_lines) {
            log_lines_.pop_front();
        }
        log_lines_.push_back(line);
    }
    if (options_.echo_stderr) {
        std::cerr << line << '\n';
    }
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace dexcup::core::api
