//
// Created by Malik T on 02/10/2025.
//
#include "Deck.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <ranges>

namespace uno::core::deck
{
    auto CreateInitialDeck() -> Pile
    {
        constexpr std::array colors{Color::Red, Color::Yellow, Color::Green, Color::Blue};
        constexpr std::array actions{CardType::Skip, CardType::Reverse, CardType::Draw};

        Pile deck;
        deck.reserve(constants::DeckSize);

        for (Color const c : colors)
        {
            deck.push_back(Card::Numbered(c, 0));
            for (uint8_t n{1}; n <= 9; ++n)
            {
                deck.push_back(Card::Numbered(c, n));
                deck.push_back(Card::Numbered(c, n));
            }
        }
        for (Color const c : colors)
        {
            for (CardType const t : actions)
            {
                deck.push_back(Card::Action(t, c));
                deck.push_back(Card::Action(t, c));
            }
        }
        for (CardType const t : {CardType::Wild, CardType::WildDraw})
        {
            for (size_t i{}; i < 4; ++i)
            {
                deck.push_back(Card::WildCard(t));
            }
        }
        return deck;
    }

    auto ShuffleDeck(Shuffler const& shuffler, Pile pile) -> Pile
    {
        return shuffler.Shuffle(std::move(pile));
    }

    auto DealCard(Pile pile) -> std::pair<std::optional<Card>, Pile>
    {
        if (pile.empty()) return {std::nullopt, std::move(pile)};
        Card const top = pile.front();
        pile.erase(pile.begin());
        return {top, std::move(pile)};
    }

    auto DealCards(size_t const count, Pile pile) -> std::pair<Pile, Pile>
    {
        size_t const n = std::min(count, pile.size());
        auto const split = pile.begin() + static_cast<std::ptrdiff_t>(n);

        Pile dealt(pile.begin(), split);
        pile.erase(pile.begin(), split);
        return {std::move(dealt), std::move(pile)};
    }

    auto FilterDeck(std::function<bool(Card const&)> const& pred, Pile const& pile) -> Pile
    {
        Pile out;
        std::ranges::copy_if(pile, std::back_inserter(out), pred);
        return out;
    }
}
