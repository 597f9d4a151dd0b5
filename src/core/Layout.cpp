//
// Layout.cpp
//

#include "Layout.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <fmt/format.h>

#include "Exception.hpp"

namespace nertz::core
{
    namespace
    {
        inline auto Round4(double const v) -> double
        {
            return std::round(v * 10000.0) / 10000.0;
        }

        inline auto Rounded(Point const p) -> Point
        {
            return Point{Round4(p.x), Round4(p.y)};
        }
    }

    Layout::Layout(uint32_t const player_count, uint64_t const seed, Logger& log) :
        log_(log),
        rng_{seed}
    {
        InitPlayerPositions(player_count);
    }

    auto Layout::InitPlayerPositions(uint32_t const player_count) -> void
    {
        players_.clear();
        if (player_count == 0) return;

        double const angle_increment = 2.0 * std::numbers::pi / static_cast<double>(player_count);
        for (uint32_t i{}; i < player_count; ++i)
        {
            double const angle = static_cast<double>(i) * angle_increment;
            players_.push_back(Point{
                constants::TableCentre + constants::PlayerRadius * std::cos(angle),
                constants::TableCentre + constants::PlayerRadius * std::sin(angle)});
        }
    }

    auto Layout::DistanceBetween(Point const p, Point const q) noexcept -> double
    {
        return std::hypot(p.x - q.x, p.y - q.y);
    }

    auto Layout::PlaceFoundation(FoundationId const& id) -> Point
    {
        Point candidate{constants::TableCentre, constants::TableCentre};

        for (size_t attempt{}; attempt < constants::FoundationMaxAttempts; ++attempt)
        {
            double const radius = constants::FoundationBaseJitter
                                + static_cast<double>(attempt) * constants::FoundationJitterStep;
            std::uniform_real_distribution<double> jitter{-radius, radius};

            candidate.x = std::clamp(constants::TableCentre + jitter(rng_), 0.0, 1.0);
            candidate.y = std::clamp(constants::TableCentre + jitter(rng_), 0.0, 1.0);

            // a re-placed id does not repel its own old position
            bool const too_close = std::ranges::any_of(foundations_, [&](auto const& entry)
            {
                return entry.first != id
                    && DistanceBetween(candidate, entry.second) < constants::FoundationMinSpacing;
            });

            if (!too_close)
            {
                log_.Debug("Placed {} after {} tries", id, attempt);
                foundations_[id] = candidate;
                return Rounded(candidate);
            }
        }

        log_.Warning("Could not place {} without overlap after {} tries", id, constants::FoundationMaxAttempts);
        foundations_[id] = candidate;
        return Rounded(candidate);
    }

    auto Layout::EnsureFoundation(FoundationId const& id) -> Point
    {
        if (auto const it = foundations_.find(id); it != foundations_.end())
        {
            return Rounded(it->second);
        }
        return PlaceFoundation(id);
    }

    auto Layout::PlayerPosition(PlyrIdxT const seat) const -> Point
    {
        if (seat >= players_.size())
            NTZ_THROW(error::Code::State, fmt::format("No layout position for player {}", static_cast<int>(seat)));
        return Rounded(players_[seat]);
    }

    auto Layout::FoundationPosition(FoundationId const& id) const -> Point
    {
        auto const it = foundations_.find(id);
        if (it == foundations_.end())
            NTZ_THROW(error::Code::InvalidPile, fmt::format("Invalid pile '{}': no layout position", id));
        return Rounded(it->second);
    }

    auto Layout::HasFoundation(FoundationId const& id) const -> bool
    {
        return foundations_.contains(id);
    }
}
