//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_TYPES_HPP
#define UNOGAME_TYPES_HPP

#define UNO_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace uno::core::constants
{
    inline constexpr size_t DeckSize = 108;
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 10;
    inline constexpr uint8_t DefaultCardsPerPlayer = 7;
    inline constexpr uint32_t DefaultTargetScore = 500;

    inline constexpr size_t DrawPenalty = 2;
    inline constexpr size_t WildDrawPenalty = 4;
    inline constexpr size_t UnoPenalty = 4;

    // hands of this size or smaller may declare "UNO"
    inline constexpr size_t UnoCallMaxCards = 2;

    inline constexpr uint32_t WildScore = 50;
    inline constexpr uint32_t ActionScore = 20;
}
namespace uno::core
{
    enum class Color : uint8_t
    {
        Red = 0,
        Yellow,
        Green,
        Blue
    };
    inline constexpr size_t ColorCount = 4;

    enum class CardType : uint8_t
    {
        Numbered = 0,
        Skip,
        Reverse,
        Draw,
        Wild,
        WildDraw
    };

    struct Card
    {
        CardType type{CardType::Numbered};
        // absent on Wild/WildDraw until the card is played
        std::optional<Color> color{};
        // present only on Numbered
        std::optional<uint8_t> number{};

        static auto Numbered(Color c, uint8_t n) -> Card { return Card{CardType::Numbered, c, n}; }
        static auto Action(CardType t, Color c) -> Card { return Card{t, c, std::nullopt}; }
        static auto WildCard(CardType t) -> Card { return Card{t, std::nullopt, std::nullopt}; }
    };
    inline auto operator==(Card const& a, Card const& b) -> bool
    {
        return a.type == b.type && a.color == b.color && a.number == b.number;
    }

    // index 0 is the top of the pile
    using Pile = std::vector<Card>;

    using PlyrIdxT = uint8_t;

    struct Config
    {
        std::vector<std::string> players{"A", "B"};
        uint8_t  cards_per_player{constants::DefaultCardsPerPlayer};
        uint32_t target_score{constants::DefaultTargetScore};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //UNOGAME_TYPES_HPP
