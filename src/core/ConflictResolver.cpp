//
// ConflictResolver.cpp
//

#include "ConflictResolver.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "Exception.hpp"

namespace nertz::core
{
    ConflictResolver::ConflictResolver(Logger& log) :
        log_(log)
    {
    }

    auto ConflictResolver::Outranks(Move const& a, Move const& b) noexcept -> bool
    {
        if (a.Priority() != b.Priority()) return a.Priority() > b.Priority();
        if (a.Distance() != b.Distance()) return a.Distance() < b.Distance();
        return a.Player() < b.Player();
    }

    auto ConflictResolver::Resolve(std::vector<Move> const& chosen) const -> Resolution
    {
        Resolution out{};
        std::vector<std::pair<FoundationId, std::vector<Move>>> groups;
        std::map<FoundationId, size_t> group_idx;

        for (Move const& move : chosen)
        {
            if (move.Destination() != PileKind::Foundation || move.OpensFoundation())
            {
                out.executable.push_back(move);
                continue;
            }

            NTZ_ASSERT(move.FoundationTarget().has_value(), "Foundation move without a target id");
            FoundationId const& id = *move.FoundationTarget();

            auto const [it, inserted] = group_idx.try_emplace(id, groups.size());
            if (inserted) groups.emplace_back(id, std::vector<Move>{});
            groups[it->second].second.push_back(move);
        }

        for (auto& [id, moves] : groups)
        {
            if (moves.size() == 1)
            {
                out.executable.push_back(std::move(moves.front()));
                continue;
            }

            std::ranges::stable_sort(moves, &ConflictResolver::Outranks);
            Move const& best = moves.front();

            out.conflicts.push_back(ConflictRecord{
                .foundation = id,
                .winner = best.Player(),
                .winning_priority = best.Priority(),
                .discarded = moves.size() - 1
            });
            log_.Info("Conflict on foundation {}. Executed move by Player {} with priority {:.2f}. {} other move(s) discarded.",
                      id, static_cast<int>(best.Player()), best.Priority(), moves.size() - 1);

            out.executable.push_back(best);
        }

        return out;
    }
}
