//
// Layout.hpp: player and foundation positions on the table
//

#ifndef NERTZSIM_LAYOUT_HPP
#define NERTZSIM_LAYOUT_HPP

#include <map>
#include <random>
#include <vector>

#include "Types.hpp"
#include "Logger.hpp"

namespace nertz::core::constants
{
    inline constexpr double TableCentre = 0.5;
    inline constexpr double PlayerRadius = 0.48;
    inline constexpr double FoundationMinSpacing = 0.1;
    inline constexpr double FoundationBaseJitter = 0.05;
    inline constexpr double FoundationJitterStep = 0.01;
    inline constexpr size_t FoundationMaxAttempts = 100;
}

namespace nertz::core::debug {struct Inspector;}
namespace nertz::core
{
    // Spatial model of the table in the unit square. Players sit on a circle
    // around (0.5, 0.5); foundations are jittered around the centre.
    // Reported positions are rounded to 4 decimals.
    class Layout
    {
    public:
        Layout(uint32_t player_count, uint64_t seed, Logger& log);

        static auto DistanceBetween(Point p, Point q) noexcept -> double;

        // Rejection-samples a position and stores it, overwriting any previous
        // position for the same id. Call once per foundation.
        auto PlaceFoundation(FoundationId const& id) -> Point;

        // Places on first call, afterwards returns the stored position untouched.
        auto EnsureFoundation(FoundationId const& id) -> Point;

        auto PlayerPosition(PlyrIdxT seat) const -> Point;
        //throws InvalidPileError for an unknown id
        auto FoundationPosition(FoundationId const& id) const -> Point;
        auto HasFoundation(FoundationId const& id) const -> bool;

        auto PlayerCount() const noexcept -> size_t { return players_.size(); }
        auto FoundationPositions() const noexcept -> std::map<FoundationId, Point> const& { return foundations_; }

        friend struct debug::Inspector;

    private:
        auto InitPlayerPositions(uint32_t player_count) -> void;

    private:
        Logger& log_;
        std::mt19937_64 rng_;
        std::vector<Point> players_;
        std::map<FoundationId, Point> foundations_;
    };
}

#endif //NERTZSIM_LAYOUT_HPP
