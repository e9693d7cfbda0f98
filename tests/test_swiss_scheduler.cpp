#include "dexcup/core/tournament/SwissScheduler.h"

#include <gtest/gtest.h>

#include <set>

using dexcup::core::model::CompetitorId;
using dexcup::core::model::ErrorKind;
using dexcup::core::model::Outcome;
using dexcup::core::model::ScoreMap;
using dexcup::core::model::StoredMatch;
using dexcup::core::model::TournamentError;
using dexcup::core::tournament::Matchup;
using dexcup::core::tournament::Pairing;
using dexcup::core::tournament::SwissScheduler;

namespace {

CompetitorId Id(const std::string& value) {
    return *CompetitorId::FromString(value);
}

std::vector<CompetitorId> Ids(const std::vector<std::string>& values) {
    std::vector<CompetitorId> ids;
    for (const auto& value : values) {
        ids.push_back(Id(value));
    }
    return ids;
}

std::vector<Pairing> Pair(const std::vector<CompetitorId>& participants,
                          const std::vector<Matchup>& previous = {},
                          const ScoreMap& standings = {}) {
    std::vector<Pairing> pairings;
    EXPECT_TRUE(SwissScheduler::GeneratePairings(participants, previous, standings, pairings, nullptr));
    return pairings;
}

}  // namespace

TEST(SwissSchedulerTest, EmptyFieldIsInvalid) {
    TournamentError error;
    std::vector<Pairing> pairings;
    EXPECT_FALSE(SwissScheduler::GeneratePairings({}, {}, {}, pairings, &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
}

TEST(SwissSchedulerTest, SingleParticipantGetsBye) {
    const auto pairings = Pair(Ids({"solo"}));
    ASSERT_EQ(pairings.size(), 1u);
    EXPECT_TRUE(pairings[0].is_bye());
    EXPECT_EQ(pairings[0].first, Id("solo"));
}

TEST(SwissSchedulerTest, FirstRoundWithoutStandingsKeepsListOrder) {
    const auto pairings = Pair(Ids({"d", "c", "b", "a"}));
    ASSERT_EQ(pairings.size(), 2u);
    EXPECT_EQ(pairings[0].first, Id("d"));
    EXPECT_EQ(*pairings[0].second, Id("c"));
    EXPECT_EQ(pairings[1].first, Id("b"));
    EXPECT_EQ(*pairings[1].second, Id("a"));
}

TEST(SwissSchedulerTest, ScoreOrderingAndClosestOpponent) {
    ScoreMap standings{{Id("a"), 0}, {Id("b"), 6}, {Id("c"), 3}, {Id("d"), 6}};
    const auto pairings = Pair(Ids({"a", "b", "c", "d"}), {}, standings);
    ASSERT_EQ(pairings.size(), 2u);
    EXPECT_EQ(pairings[0].first, Id("b"));
    EXPECT_EQ(*pairings[0].second, Id("d"));
    EXPECT_EQ(pairings[1].first, Id("c"));
    EXPECT_EQ(*pairings[1].second, Id("a"));
}

TEST(SwissSchedulerTest, AvoidsRematches) {
    const std::vector<Matchup> previous{{Id("a"), Id("b")}};
    const auto pairings = Pair(Ids({"a", "b", "c", "d"}), previous);
    ASSERT_EQ(pairings.size(), 2u);
    EXPECT_EQ(pairings[0].first, Id("a"));
    EXPECT_EQ(*pairings[0].second, Id("c"));
    EXPECT_EQ(pairings[1].first, Id("b"));
    EXPECT_EQ(*pairings[1].second, Id("d"));
}

TEST(SwissSchedulerTest, RematchInEitherOrderIsSkipped) {
    const std::vector<Matchup> previous{{Id("b"), Id("a")}};
    const auto pairings = Pair(Ids({"a", "b"}), previous);
    ASSERT_EQ(pairings.size(), 1u);
    EXPECT_TRUE(pairings[0].is_bye());
    EXPECT_EQ(pairings[0].first, Id("a"));
}

TEST(SwissSchedulerTest, OddFieldGivesOneBye) {
    const auto pairings = Pair(Ids({"a", "b", "c"}));
    ASSERT_EQ(pairings.size(), 2u);
    EXPECT_FALSE(pairings[0].is_bye());
    EXPECT_TRUE(pairings[1].is_bye());
    EXPECT_EQ(pairings[1].first, Id("c"));
}

TEST(SwissSchedulerTest, NobodyAppearsTwiceInARound) {
    std::vector<std::string> names;
    for (int i = 0; i < 13; ++i) {
        names.push_back("mon" + std::to_string(i));
    }
    ScoreMap standings;
    for (int i = 0; i < 13; ++i) {
        standings[Id(names[static_cast<size_t>(i)])] = (i % 4) * 3;
    }
    const auto pairings = Pair(Ids(names), {{Id("mon0"), Id("mon4")}, {Id("mon1"), Id("mon5")}}, standings);

    std::set<CompetitorId> seen;
    for (const auto& pairing : pairings) {
        EXPECT_TRUE(seen.insert(pairing.first).second);
        if (pairing.second) {
            EXPECT_TRUE(seen.insert(*pairing.second).second);
        }
    }
    EXPECT_LE(pairings.size(), 7u);
}

TEST(SwissSchedulerTest, TotalRounds) {
    int rounds = -1;
    TournamentError error;
    EXPECT_FALSE(SwissScheduler::CalculateTotalRounds(0, rounds, &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);

    const std::vector<std::pair<int, int>> expected{
        {1, 0}, {2, 3}, {8, 3}, {9, 4}, {16, 4}, {17, 5}, {100, 7}, {256, 8}, {1000, 8}};
    for (const auto& [participants, total] : expected) {
        ASSERT_TRUE(SwissScheduler::CalculateTotalRounds(participants, rounds, nullptr));
        EXPECT_EQ(rounds, total) << participants << " participants";
    }
}

TEST(SwissSchedulerTest, TieBreakerIsScoreThenId) {
    ScoreMap standings{{Id("zubat"), 6}, {Id("abra"), 3}, {Id("bulbasaur"), 6}, {Id("ghost"), 9}};
    const auto sorted = SwissScheduler::SortStandingsByTieBreaker(standings, Ids({"zubat", "abra", "bulbasaur"}));
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].participant, Id("bulbasaur"));
    EXPECT_EQ(sorted[1].participant, Id("zubat"));
    EXPECT_EQ(sorted[2].participant, Id("abra"));
    EXPECT_EQ(sorted[2].score, 3);
}

TEST(SwissSchedulerTest, ScoreForResult) {
    EXPECT_EQ(SwissScheduler::GetScoreForResult(Outcome::Win), 3);
    EXPECT_EQ(SwissScheduler::GetScoreForResult(Outcome::Loss), 0);
    EXPECT_EQ(SwissScheduler::GetScoreForResult(Outcome::Draw), 1);

    int score = 0;
    TournamentError error;
    EXPECT_TRUE(SwissScheduler::GetScoreForResult("draw", score, nullptr));
    EXPECT_EQ(score, 1);
    EXPECT_FALSE(SwissScheduler::GetScoreForResult("walkover", score, &error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
}

TEST(SwissSchedulerTest, CalculateStandingsFromResults) {
    const std::vector<StoredMatch> results{
        {Id("a"), Id("b"), 1, Outcome::Win, Id("a")},
        {Id("c"), Id("d"), 1, Outcome::Draw, std::nullopt},
        {Id("b"), Id("d"), 2, Outcome::Loss, Id("d")},
    };
    const auto standings = SwissScheduler::CalculateStandings(Ids({"a", "b", "c", "d"}), results);
    EXPECT_EQ(standings.at(Id("a")), 3);
    EXPECT_EQ(standings.at(Id("b")), 0);
    EXPECT_EQ(standings.at(Id("c")), 1);
    EXPECT_EQ(standings.at(Id("d")), 1);
}
