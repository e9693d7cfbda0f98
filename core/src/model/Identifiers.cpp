#include "dexcup/core/model/Identifiers.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <string_view>

namespace dexcup::core::model {

namespace {

std::string Trim(std::string_view value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

bool IsIdentifierChar(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_';
}

bool HasOnlyIdentifierChars(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) { return IsIdentifierChar(ch); });
}

}  // namespace

std::optional<CompetitorId> CompetitorId::FromString(const std::string& value, TournamentError* error) {
    std::string normalised = Trim(value);
    std::transform(normalised.begin(), normalised.end(), normalised.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalised.empty()) {
        Fail(error, ErrorKind::InvalidInput, "Competitor identifier cannot be empty");
        return std::nullopt;
    }
    if (!HasOnlyIdentifierChars(normalised)) {
        Fail(error,
             ErrorKind::InvalidInput,
             "Competitor identifier must contain only letters, digits, hyphens and underscores. Got: " + value);
        return std::nullopt;
    }
    if (normalised.size() > kMaxLength) {
        Fail(error, ErrorKind::InvalidInput, "Competitor identifier cannot exceed 50 characters. Got: " + value);
        return std::nullopt;
    }
    return CompetitorId(std::move(normalised));
}

std::optional<TournamentId> TournamentId::FromString(const std::string& value, TournamentError* error) {
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        Fail(error, ErrorKind::InvalidInput, "Tournament identifier cannot be empty");
        return std::nullopt;
    }
    if (!HasOnlyIdentifierChars(trimmed)) {
        Fail(error,
             ErrorKind::InvalidInput,
             "Tournament identifier must contain only letters, digits, hyphens and underscores. Got: " + value);
        return std::nullopt;
    }
    if (trimmed.size() < kMinLength || trimmed.size() > kMaxLength) {
        Fail(error, ErrorKind::InvalidInput, "Tournament identifier must be 3 to 100 characters. Got: " + value);
        return std::nullopt;
    }
    return TournamentId(std::move(trimmed));
}

TournamentId TournamentId::Generate() {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    std::random_device device;
    std::mt19937 rng(device());
    std::uniform_int_distribution<unsigned int> dist;

    std::ostringstream out;
    out << "tournament-" << seconds << '-' << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return TournamentId(out.str());
}

}  // namespace dexcup::core::model
