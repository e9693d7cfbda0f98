#include "dexcup/core/export/ExportWriter.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using dexcup::core::api::StandingRow;
using dexcup::core::bracket::Bracket;
using dexcup::core::bracket::DoubleEliminationBracket;
using dexcup::core::model::CompetitorId;
using dexcup::core::model::Participant;
using dexcup::core::model::Tournament;
using dexcup::core::model::TournamentId;
namespace exporter = dexcup::core::exporter;

namespace {

CompetitorId Seed(int number) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "s%02d", number);
    return *CompetitorId::FromString(buffer);
}

Tournament Field(int count, int total_rounds) {
    std::vector<Participant> participants;
    for (int i = 1; i <= count; ++i) {
        participants.emplace_back(Seed(i));
    }
    return *Tournament::Create(*TournamentId::FromString("export-cup"), "prof@oak.lab", participants, total_rounds);
}

Tournament Finished(int count) {
    auto tournament = Field(count, 1);
    EXPECT_TRUE(tournament.AdvanceRound(nullptr));
    return tournament;
}

Bracket Created() {
    std::vector<CompetitorId> seeds;
    for (int i = 1; i <= 16; ++i) {
        seeds.push_back(Seed(i));
    }
    Bracket bracket;
    EXPECT_TRUE(DoubleEliminationBracket::CreateBracket(seeds, bracket, nullptr));
    return bracket;
}

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

class ExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        directory_ = std::filesystem::temp_directory_path() / (std::string("dexcup_export_") + info->name());
        std::filesystem::remove_all(directory_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    std::filesystem::path directory_;
};

}  // namespace

TEST(ExportStatusTest, FollowsPhase) {
    EXPECT_EQ(exporter::TournamentStatus(Field(16, 4), std::nullopt), "swiss");
    EXPECT_EQ(exporter::TournamentStatus(Finished(4), std::nullopt), "complete");
    EXPECT_EQ(exporter::TournamentStatus(Finished(16), std::nullopt), "awaiting_playoff");
    EXPECT_EQ(exporter::TournamentStatus(Finished(16), Created()), "playoff");
}

TEST_F(ExportTest, StandingsCsvRanksRowsInOrder) {
    const std::vector<StandingRow> rows{{Seed(2), 7, 2, 0, 1}, {Seed(1), 3, 1, 2, 0}};
    const auto path = directory_ / "standings.csv";
    std::string error;
    ASSERT_TRUE(exporter::WriteStandingsCsv(path.string(), rows, &error)) << error;

    EXPECT_EQ(Slurp(path),
              "rank,participant,score,games,wins,draws,losses\n"
              "1,s02,7,3,2,1,0\n"
              "2,s01,3,3,1,0,2\n");
}

TEST_F(ExportTest, SummaryCarriesStandingsAndPlayoff) {
    const auto path = directory_ / "out" / "summary.json";
    const std::vector<StandingRow> rows{{Seed(1), 3, 1, 0, 0}};
    ASSERT_TRUE(exporter::WriteSummaryJson(path.string(), Finished(16), rows, Created()));

    std::ifstream in(path);
    const auto summary = nlohmann::json::parse(in);
    EXPECT_EQ(summary["tournament"], "export-cup");
    EXPECT_EQ(summary["status"], "playoff");
    EXPECT_EQ(summary["participants"], 16);
    ASSERT_EQ(summary["standings"].size(), 1u);
    EXPECT_EQ(summary["standings"][0]["rank"], 1);
    EXPECT_EQ(summary["standings"][0]["w"], 1);
    EXPECT_EQ(summary["playoff"]["next_match"]["id"], "w1_1");
    EXPECT_TRUE(summary["playoff"]["champion"].is_null());
}

TEST_F(ExportTest, SummaryWithoutBracketHasNullPlayoff) {
    const auto path = directory_ / "summary.json";
    ASSERT_TRUE(exporter::WriteSummaryJson(path.string(), Field(3, 3), {}, std::nullopt));

    std::ifstream in(path);
    const auto summary = nlohmann::json::parse(in);
    EXPECT_EQ(summary["status"], "swiss");
    EXPECT_TRUE(summary["standings"].empty());
    EXPECT_TRUE(summary["playoff"].is_null());
}
