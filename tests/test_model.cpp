#include "dexcup/core/model/Identifiers.h"
#include "dexcup/core/model/Match.h"
#include "dexcup/core/model/Outcome.h"
#include "dexcup/core/model/Participant.h"
#include "dexcup/core/model/Tournament.h"

#include <gtest/gtest.h>

#include <climits>

using namespace dexcup::core::model;

namespace {

CompetitorId Id(const std::string& value) {
    return *CompetitorId::FromString(value);
}

}  // namespace

TEST(CompetitorIdTest, NormalizesCaseAndWhitespace) {
    const auto id = CompetitorId::FromString("  Pikachu ");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), "pikachu");
    EXPECT_EQ(*id, Id("PIKACHU"));
}

TEST(CompetitorIdTest, RejectsBadValues) {
    TournamentError error;
    EXPECT_FALSE(CompetitorId::FromString("   ", &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    error = {};
    EXPECT_FALSE(CompetitorId::FromString("mr.mime", &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    EXPECT_FALSE(CompetitorId::FromString(std::string(51, 'a')).has_value());
    EXPECT_TRUE(CompetitorId::FromString(std::string(50, 'a')).has_value());
    EXPECT_TRUE(CompetitorId::FromString("ho-oh_2").has_value());
}

TEST(TournamentIdTest, ValidatesLengthAndGeneratesPrefixedIds) {
    EXPECT_FALSE(TournamentId::FromString("ab").has_value());
    EXPECT_TRUE(TournamentId::FromString("abc").has_value());
    EXPECT_FALSE(TournamentId::FromString(std::string(101, 'x')).has_value());
    EXPECT_FALSE(TournamentId::FromString("../etc").has_value());

    const auto generated = TournamentId::Generate();
    EXPECT_EQ(generated.str().rfind("tournament-", 0), 0u);
    EXPECT_TRUE(TournamentId::FromString(generated.str()).has_value());
}

TEST(OutcomeTest, ParsesKnownNamesOnly) {
    EXPECT_EQ(ParseOutcome("win"), Outcome::Win);
    EXPECT_EQ(ParseOutcome("loss"), Outcome::Loss);
    EXPECT_EQ(ParseOutcome("draw"), Outcome::Draw);

    TournamentError error;
    EXPECT_FALSE(ParseOutcome("forfeit", &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_NE(error.message.find("forfeit"), std::string::npos);
}

TEST(MatchResultTest, DrawNeverHasWinnerAndDecisionAlwaysDoes) {
    TournamentError error;
    EXPECT_FALSE(MatchResult::Make(Outcome::Draw, Id("a"), &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    error = {};
    EXPECT_FALSE(MatchResult::Make(Outcome::Win, std::nullopt, &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    const auto draw = MatchResult::Make(Outcome::Draw, std::nullopt);
    ASSERT_TRUE(draw.has_value());
    EXPECT_TRUE(draw->IsDraw());
}

TEST(ParticipantTest, ScoreTracksCounters) {
    Participant participant(Id("eevee"));
    participant.AddWin();
    participant.AddDraw();
    participant.AddLoss();
    EXPECT_EQ(participant.score(), 4);
    EXPECT_EQ(participant.games(), 3);
    EXPECT_EQ(participant.score(), participant.wins() * 3 + participant.draws());
}

TEST(ParticipantTest, RestoreRejectsBrokenInvariant) {
    TournamentError error;
    EXPECT_FALSE(Participant::Restore(Id("eevee"), 1, 0, 0, 2, &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::IllegalState);
    EXPECT_FALSE(Participant::Restore(Id("eevee"), -1, 0, 0, -3).has_value());

    const auto restored = Participant::Restore(Id("eevee"), 2, 1, 1, 7);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->score(), 7);
}

TEST(ParticipantTest, RestoreRejectsCountersPastIntRange) {
    TournamentError error;
    EXPECT_FALSE(Participant::Restore(Id("eevee"), INT_MAX, 0, 0, 1, &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::IllegalState);
    EXPECT_FALSE(Participant::Restore(Id("eevee"), INT_MAX / 3 + 1, 0, 2, INT_MAX).has_value());
}

TEST(MatchTest, ResultIsWriteOnce) {
    Match match(Id("a"), Id("b"), 1);
    const auto win = *MatchResult::Make(Outcome::Win, Id("a"));
    ASSERT_TRUE(match.RecordResult(win, nullptr));
    ASSERT_NE(match.Loser(), nullptr);
    EXPECT_EQ(*match.Loser(), Id("b"));

    TournamentError error;
    EXPECT_FALSE(match.RecordResult(*MatchResult::Make(Outcome::Draw, std::nullopt), &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(match.result()->outcome(), Outcome::Win);
}

TEST(MatchTest, RejectsOutsiderWinnerAndByeResult) {
    TournamentError error;
    Match match(Id("a"), Id("b"), 1);
    EXPECT_FALSE(match.RecordResult(*MatchResult::Make(Outcome::Win, Id("c")), &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_FALSE(match.IsComplete());

    Match bye(Id("a"), std::nullopt, 1);
    EXPECT_TRUE(bye.is_bye());
    EXPECT_FALSE(bye.RecordResult(*MatchResult::Make(Outcome::Draw, std::nullopt), nullptr));
}

TEST(TournamentTest, CreateRejectsEmptyAndDuplicateFields) {
    TournamentError error;
    const auto id = *TournamentId::FromString("cup-1");
    EXPECT_FALSE(Tournament::Create(id, "owner@example.com", {}, 3, &error).has_value());
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    std::vector<Participant> duplicated{Participant(Id("a")), Participant(Id("A "))};
    EXPECT_FALSE(Tournament::Create(id, "owner@example.com", duplicated, 3).has_value());
}

TEST(TournamentTest, AdvanceStopsAtTotalRounds) {
    auto tournament =
        *Tournament::Create(*TournamentId::FromString("cup-1"), "o@x", {Participant(Id("a")), Participant(Id("b"))}, 3);
    EXPECT_EQ(tournament.current_round(), 0);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(tournament.AdvanceRound(nullptr));
    }
    EXPECT_TRUE(tournament.IsComplete());

    TournamentError error;
    EXPECT_FALSE(tournament.AdvanceRound(&error));
    EXPECT_EQ(error.kind, ErrorKind::IllegalState);
    EXPECT_EQ(tournament.current_round(), 3);
}

TEST(TournamentTest, ByesAreOncePerRoundAndClearOnAdvance) {
    auto tournament =
        *Tournament::Create(*TournamentId::FromString("cup-1"), "o@x", {Participant(Id("a")), Participant(Id("b"))}, 3);
    ASSERT_TRUE(tournament.AwardBye(Id("a"), nullptr));
    EXPECT_EQ(tournament.FindParticipant(Id("a"))->score(), 3);

    TournamentError error;
    EXPECT_FALSE(tournament.AwardBye(Id("a"), &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_FALSE(tournament.AwardBye(Id("zzz"), nullptr));

    ASSERT_TRUE(tournament.AdvanceRound(nullptr));
    EXPECT_TRUE(tournament.round_byes().empty());
    EXPECT_TRUE(tournament.AwardBye(Id("a"), nullptr));
}

