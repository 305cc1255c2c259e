//
// Created by Malik T on 02/10/2025.
//

#ifndef UNOGAME_DECK_HPP
#define UNOGAME_DECK_HPP

#include <functional>
#include <utility>
#include "Types.hpp"
#include "Random.hpp"

namespace uno::core::deck
{
    // The fixed 108-card catalog, in catalog order:
    // per color 0, 1,1 .. 9,9; per color Skip x2, Reverse x2, Draw x2; 4 Wild; 4 WildDraw.
    auto CreateInitialDeck() -> Pile;

    auto ShuffleDeck(Shuffler const& shuffler, Pile pile) -> Pile;

    // Top card and the rest; nullopt on an empty pile.
    auto DealCard(Pile pile) -> std::pair<std::optional<Card>, Pile>;

    // First `count` cards and the remainder. Deals fewer when the pile is shorter.
    auto DealCards(size_t count, Pile pile) -> std::pair<Pile, Pile>;

    auto FilterDeck(std::function<bool(Card const&)> const& pred, Pile const& pile) -> Pile;

    inline auto IsNumberedCard(Card const& c) -> bool
    {
        return c.type == CardType::Numbered && c.number.has_value();
    }

    inline auto IsWildCard(Card const& c) -> bool
    {
        return c.type == CardType::Wild || c.type == CardType::WildDraw;
    }

    inline auto IsColoredCard(Card const& c) -> bool
    {
        return !IsWildCard(c);
    }

    // A played wild card carries its chosen color; back in a pile it is colorless again.
    inline auto ClearWildColor(Card c) -> Card
    {
        if (IsWildCard(c)) c.color.reset();
        return c;
    }
}

#endif //UNOGAME_DECK_HPP
