//
// Created by Malik T on 19/08/2025.
//

#ifndef UNOGAME_INVARIANTS_HPP
#define UNOGAME_INVARIANTS_HPP

#include "../core/Hand.hpp"
#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include <algorithm>
#include <map>
#include <tuple>
#include <vector>

namespace uno::core::debug
{
    // A second layer of checks run by the tests after every transition.
    // Violations raise AssertionError.
    inline auto CheckInvariants(Hand const& h) -> void
    {
#if UNO_ENABLE_TEST_HOOKS == false
        (void)h;
#else
    using Key = std::tuple<int, int, int>;
    auto key = [](Card const& c) -> Key
    {
        Card const bare = deck::ClearWildColor(c);
        return {static_cast<int>(bare.type),
                bare.color ? static_cast<int>(*bare.color) : -1,
                bare.number ? static_cast<int>(*bare.number) : -1};
    };

    // 1) Card conservation: hands + draw + discard is exactly the catalog
    {
        std::map<Key, int> counts;
        size_t total{};
        for (Card const& c : deck::CreateInitialDeck()) ++counts[key(c)];

        auto take = [&](Pile const& p)
        {
            for (Card const& c : p)
            {
                --counts[key(c)];
                ++total;
            }
        };
        for (Pile const& p : h.Hands()) take(p);
        take(h.DrawPile());
        take(h.DiscardPile());

        UNO_ASSERT(total == constants::DeckSize, "Materialized card count != deck size");
        UNO_ASSERT(std::ranges::all_of(counts, [](auto const& kv) { return kv.second == 0; }),
                   "Card multiset differs from the catalog");
    }

    // 2) Discard pile never empty, and its top always carries a color
    UNO_ASSERT(!h.DiscardPile().empty(), "Discard pile empty");
    UNO_ASSERT(h.TopOfDiscard().color.has_value(), "Top of discard has no color");
    UNO_ASSERT(h.TopOfDiscard().color == h.CurrentColor(), "Current color differs from the top card");

    // 3) Only the draw pile holds cards in printed form; wild cards there are colorless
    UNO_ASSERT(std::ranges::none_of(h.DrawPile(), [](Card const& c)
               {
                   return deck::IsWildCard(c) && c.color.has_value();
               }), "Colored wild card in the draw pile");

    // 4) Turn pointer absent iff the hand is over
    UNO_ASSERT(h.PlayerInTurn().has_value() != h.HasEnded(), "Player in turn disagrees with HasEnded");
    if (h.PlayerInTurn())
        UNO_ASSERT(*h.PlayerInTurn() < h.PlayerCount(), "Player in turn outside the table");

    // 5) Per-seat bookkeeping
    UNO_ASSERT(h.UnoCalls().size() == h.PlayerCount(), "UNO flags != player count");
    UNO_ASSERT(h.Hands().size() == h.PlayerCount(), "Hands != player count");
    UNO_ASSERT(h.Direction() == 1 || h.Direction() == -1, "Direction not +-1");

    // 6) The accusation window only follows a non-terminal play
    if (h.IsAccusationWindowOpen())
    {
        UNO_ASSERT(h.PreviousPlayer().has_value(), "Window open without a previous player");
        UNO_ASSERT(!h.HasEnded(), "Window open on a finished hand");
    }
#endif // UNO_ENABLE_TEST_HOOKS == true
    }
}
#endif //UNOGAME_INVARIANTS_HPP
