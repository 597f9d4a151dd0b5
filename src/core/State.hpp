//
// State.hpp
//

#ifndef NERTZSIM_STATE_HPP
#define NERTZSIM_STATE_HPP

#include <array>
#include <vector>

#include "Types.hpp"
#include "Move.hpp"
#include "ConflictResolver.hpp"

namespace nertz::core
{
    struct PlayerView
    {
        PlyrIdxT seat{};
        Point position{};

        CardWP nertz_top;
        size_t nertz_count{};
        CardWP stream_top;
        size_t stream_count{};
        size_t deck_count{};
        // bottom -> top
        std::array<std::vector<CardWP>, constants::RiverSlots> river{};
        size_t lake_count{};
        int score{};
    };

    struct FoundationView
    {
        FoundationId id;
        PlyrIdxT owner{};
        Suit suit{};
        CardWP top;
        size_t size{};
        Point position{};
    };

    // Immutable snapshot exposed to the visualization layer (non-owning)
    struct GameSnapshot
    {
        uint32_t turn{};
        bool started{false};
        bool game_over{false};
        std::vector<PlayerView> players;
        std::vector<FoundationView> foundations;
    };

    // What happened during one PlayTurn.
    struct TurnReport
    {
        uint32_t turn{};
        std::vector<Move> chosen;   // one per player that had a legal move
        std::vector<Move> executed; // in execution order
        std::vector<ConflictRecord> conflicts;
    };

} // namespace nertz::core

#endif //NERTZSIM_STATE_HPP
