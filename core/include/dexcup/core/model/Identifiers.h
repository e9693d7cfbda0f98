#pragma once

#include "dexcup/core/model/TournamentError.h"

#include <optional>
#include <string>

namespace dexcup::core::model {

// Creature identifier used for participants, winners and bracket slots.
// Values are trimmed and lower-cased; "Pikachu " and "pikachu" are the same competitor.
class CompetitorId {
public:
    static constexpr size_t kMaxLength = 50;

    static std::optional<CompetitorId> FromString(const std::string& value,
                                                  TournamentError* error = nullptr);

    const std::string& str() const { return value_; }

    bool operator==(const CompetitorId& other) const { return value_ == other.value_; }
    bool operator!=(const CompetitorId& other) const { return value_ != other.value_; }
    bool operator<(const CompetitorId& other) const { return value_ < other.value_; }

private:
    explicit CompetitorId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

class TournamentId {
public:
    static constexpr size_t kMinLength = 3;
    static constexpr size_t kMaxLength = 100;

    static std::optional<TournamentId> FromString(const std::string& value,
                                                  TournamentError* error = nullptr);
    static TournamentId Generate();

    const std::string& str() const { return value_; }

    bool operator==(const TournamentId& other) const { return value_ == other.value_; }
    bool operator!=(const TournamentId& other) const { return value_ != other.value_; }
    bool operator<(const TournamentId& other) const { return value_ < other.value_; }

private:
    explicit TournamentId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

}  // namespace dexcup::core::model
