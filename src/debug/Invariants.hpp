//
// Invariants.hpp
//

#ifndef NERTZSIM_INVARIANTS_HPP
#define NERTZSIM_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

#include <fmt/format.h>
#include <optional>
#include <ranges>
#include <span>
#include <unordered_set>
#include <vector>

namespace nertz::core::debug
{
    // A second layer of checks run after every turn in tests. Throws AssertionError
    // on the first broken invariant.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if NTZ_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Foundations: Ace first, one suit, each card the successor of the one below
    for (auto const& [id, cards] : s.foundations)
    {
        NTZ_ASSERT(!cards.empty(), fmt::format("{} is empty", id));
        NTZ_ASSERT(cards.front()->rank == Rank::Ace, fmt::format("{} does not start with an ace", id));
        for (size_t i{1}; i < cards.size(); ++i)
        {
            std::optional<Rank> const wanted = NextRank(cards[i - 1]->rank);
            NTZ_ASSERT(cards[i]->suit == cards.front()->suit, fmt::format("{} mixes suits", id));
            NTZ_ASSERT(wanted && *wanted == cards[i]->rank, fmt::format("{} skips a rank at {}", id, i));
        }
    }

    // 2) No card object held by two piles, anywhere
    std::unordered_set<Card const*> seen;
    seen.reserve(static_cast<size_t>(s.n_players) * constants::CardsPerDeck);
    auto push_unique = [&](Card const* p)
    {
        NTZ_ASSERT(p != nullptr, "Null card in a pile");
        bool const inserted = seen.insert(p).second;
        NTZ_ASSERT(inserted, fmt::format("Duplicate card object across piles: {}", util::ToString(*p)));
    };

    // 3) Per player: private piles + that player's foundation cards are exactly 52 distinct faces
    std::vector<util::CardUniqueChecker> per_player(s.n_players);
    auto count = [&](Card const* p)
    {
        push_unique(p);
        NTZ_ASSERT(p->owner < s.n_players, "Card owned by an unknown player");
        per_player[p->owner].Add(*p);
    };

    for (size_t seat{}; seat < s.players.size(); ++seat)
    {
        Inspector::PlayerCards const& pc = s.players[seat];
        auto own = [&](Card const* p)
        {
            NTZ_ASSERT(p->owner == seat, fmt::format("Player {} holds a card of player {}", seat,
                                                     static_cast<int>(p->owner)));
            count(p);
        };
        for (Card const* p : pc.deck) own(p);
        for (Card const* p : pc.stream) own(p);
        for (Card const* p : pc.nertz) own(p);
        for (auto const& slot : pc.river) for (Card const* p : slot) own(p);

        // lake is a record only: live cards this player placed
        NTZ_ASSERT(!util::any_invalid(std::span{pc.lake}), "Expired card in lake");
        for (CardWP const& w : pc.lake)
        {
            NTZ_ASSERT(w.lock()->owner == seat, "Lake records a card of another player");
        }
    }
    for (auto const& cards : s.foundations | std::views::values)
    {
        for (Card const* p : cards) count(p);
    }

    for (size_t seat{}; seat < per_player.size(); ++seat)
    {
        NTZ_ASSERT(per_player[seat].IsFullDeck(),
                   fmt::format("Player {} no longer accounts for exactly 52 distinct cards ({} seen)", seat,
                               per_player[seat].Count()));
    }
#endif // NTZ_ENABLE_TEST_HOOKS == true
    }
}
#endif //NERTZSIM_INVARIANTS_HPP
