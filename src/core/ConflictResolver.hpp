//
// ConflictResolver.hpp: one winner per contested foundation
//

#ifndef NERTZSIM_CONFLICTRESOLVER_HPP
#define NERTZSIM_CONFLICTRESOLVER_HPP

#include <vector>

#include "Types.hpp"
#include "Move.hpp"
#include "Logger.hpp"

namespace nertz::core
{
    struct ConflictRecord
    {
        FoundationId foundation;
        PlyrIdxT winner{};
        double winning_priority{};
        size_t discarded{};
    };

    struct Resolution
    {
        // non-conflicting moves in input order, then one winner per contested
        // foundation in order of first appearance
        std::vector<Move> executable;
        std::vector<ConflictRecord> conflicts;
    };

    // Only foundation extensions can collide; an Ace always opens a fresh
    // foundation and passes through.
    class ConflictResolver
    {
    public:
        explicit ConflictResolver(Logger& log);

        auto Resolve(std::vector<Move> const& chosen) const -> Resolution;

        // Higher priority, then shorter distance, then lower player index.
        static auto Outranks(Move const& a, Move const& b) noexcept -> bool;

    private:
        Logger& log_;
    };
}

#endif //NERTZSIM_CONFLICTRESOLVER_HPP
