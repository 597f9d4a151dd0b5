//
// Inspector.hpp: test-side access to private game state
//

#ifndef NERTZSIM_INSPECTOR_HPP
#define NERTZSIM_INSPECTOR_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <ranges>
#include <utility>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"
#include "../core/Exception.hpp"

namespace nertz::core::debug
{
    struct Inspector
    {
        struct PlayerCards
        {
            std::vector<Card const*> deck;
            std::vector<Card const*> stream;
            std::vector<Card const*> nertz;
            std::array<std::vector<Card const*>, constants::RiverSlots> river{};
            std::vector<CardWP> lake;
        };

        struct SnapshotAll
        {
            std::vector<PlayerCards> players;
            std::map<FoundationId, std::vector<Card const*>> foundations;
            uint8_t n_players{};
        };

        static inline auto Raw(auto const& src) -> std::vector<Card const*>
        {
            std::vector<Card const*> dst;
            dst.reserve(src.size());
            std::ranges::transform(src, std::back_inserter(dst),
                                   [](CardSP const& c) -> Card const* { return c.get(); });
            return dst;
        }

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(g.piles_.size());
            ret.players.resize(g.piles_.size());

            for (size_t i{}; i < g.piles_.size(); ++i)
            {
                PileSet const& src = g.piles_[i];
                PlayerCards& dst = ret.players[i];
                dst.deck = Raw(src.deck_);
                dst.stream = Raw(src.stream_);
                dst.nertz = Raw(src.nertz_);
                for (size_t s{}; s < constants::RiverSlots; ++s)
                {
                    dst.river[s] = Raw(src.river_[s]);
                }
                dst.lake = src.lake_;
            }

            for (auto const& [id, f] : g.foundations_)
            {
                ret.foundations.emplace(id, Raw(f.Cards()));
            }
            return ret;
        }

#if NTZ_ENABLE_TEST_HOOKS == true
        // Direct pile access for arranging synthetic scenarios in tests.
        static inline auto Piles(GameImpl& g, PlyrIdxT seat) -> PileSet& { return g.piles_.at(seat); }
        static inline auto Deck(PileSet& p) -> std::vector<CardSP>& { return p.deck_; }
        static inline auto Stream(PileSet& p) -> std::vector<CardSP>& { return p.stream_; }
        static inline auto Nertz(PileSet& p) -> std::vector<CardSP>& { return p.nertz_; }
        static inline auto River(PileSet& p, size_t slot) -> RiverSlotT& { return p.river_.at(slot); }
        static inline auto Lake(PileSet& p) -> std::vector<CardWP>& { return p.lake_; }
        static inline auto MutLayout(GameImpl& g) -> Layout& { return g.layout_; }

        // Pulls one of the player's cards out of whichever private pile holds it.
        static inline auto TakeCard(PileSet& p, Suit suit, Rank rank) -> CardSP
        {
            auto take_from = [&](auto& pile) -> CardSP
            {
                auto const it = std::ranges::find_if(pile, [&](CardSP const& c)
                {
                    return c->suit == suit && c->rank == rank;
                });
                if (it == pile.end()) return nullptr;
                CardSP card = std::move(*it);
                pile.erase(it);
                return card;
            };

            if (CardSP c = take_from(p.deck_)) return c;
            if (CardSP c = take_from(p.stream_)) return c;
            if (CardSP c = take_from(p.nertz_)) return c;
            for (auto& slot : p.river_)
            {
                if (CardSP c = take_from(slot)) return c;
            }
            NTZ_THROW(error::Code::State, "Card not in any private pile of this player");
        }

        // Moves the named card onto the top of the target pile.
        static inline auto PutOnNertz(PileSet& p, Suit suit, Rank rank) -> CardSP
        {
            CardSP c = TakeCard(p, suit, rank);
            p.nertz_.push_back(c);
            return c;
        }

        static inline auto PutOnStream(PileSet& p, Suit suit, Rank rank) -> CardSP
        {
            CardSP c = TakeCard(p, suit, rank);
            p.stream_.push_back(c);
            return c;
        }

        static inline auto PutOnRiver(PileSet& p, size_t slot, Suit suit, Rank rank) -> CardSP
        {
            CardSP c = TakeCard(p, suit, rank);
            p.river_.at(slot).push_back(c);
            return c;
        }

        // Opens seat's foundation for `suit` from that player's own Ace, as a played
        // ace would, including the layout position and the lake record.
        static inline auto OpenFoundation(GameImpl& g, PlyrIdxT seat, Suit suit) -> FoundationId
        {
            PileSet& p = g.piles_.at(seat);
            CardSP ace = TakeCard(p, suit, Rank::Ace);
            FoundationId const id = MakeFoundationId(seat, suit);
            g.layout_.EnsureFoundation(id);
            p.lake_.push_back(ace);
            if (g.foundations_.try_emplace(id, std::move(ace), seat).second)
            {
                g.opened_.push_back(id);
            }
            return id;
        }

        // Overwrites a foundation's stored position.
        static inline auto PinFoundation(GameImpl& g, FoundationId const& id, Point const at) -> void
        {
            g.layout_.foundations_[id] = at;
        }

        // Moves the whole nertz pile to the deck, which ends the game.
        static inline auto EmptyNertz(PileSet& p) -> void
        {
            for (CardSP& c : p.nertz_) p.deck_.push_back(std::move(c));
            p.nertz_.clear();
        }

        // Empties every river slot back into the deck.
        static inline auto ClearRiver(PileSet& p) -> void
        {
            for (auto& slot : p.river_)
            {
                for (CardSP& c : slot) p.deck_.push_back(std::move(c));
                slot.clear();
            }
        }
#endif
    };
}

#endif //NERTZSIM_INSPECTOR_HPP
