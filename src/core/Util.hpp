//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_UTIL_HPP
#define UNOGAME_UTIL_HPP

#include <format>
#include <string>
#include <string_view>
#include "Types.hpp"



namespace uno::core::util
{
    inline auto to_string(Color const c) -> std::string_view
    {
        switch (c)
        {
            case Color::Red:    return "R";
            case Color::Yellow: return "Y";
            case Color::Green:  return "G";
            case Color::Blue:   return "B";
        }
        return "?";
    }

    inline auto to_string(CardType const t) -> std::string_view
    {
        switch (t)
        {
            case CardType::Numbered: return "Numbered";
            case CardType::Skip:     return "Skip";
            case CardType::Reverse:  return "Reverse";
            case CardType::Draw:     return "Draw";
            case CardType::Wild:     return "Wild";
            case CardType::WildDraw: return "WildDraw";
        }
        return "?";
    }

    // Seat reached by moving `steps` seats (negative = counter-clockwise) from `from`.
    inline auto WrapSeat(PlyrIdxT const from, int const steps, size_t const n) -> PlyrIdxT
    {
        auto const count = static_cast<int>(n);
        int const raw = (static_cast<int>(from) + steps) % count;
        return static_cast<PlyrIdxT>(raw < 0 ? raw + count : raw);
    }

    // "R5", "GS", "BR", "Y+2", "W", "W+4"; a wild that has been played shows its color: "W(R)"
    inline auto CardCode(Card const& c) -> std::string
    {
        std::string const col = c.color ? std::string(to_string(*c.color)) : std::string{};
        switch (c.type)
        {
            case CardType::Numbered: return std::format("{}{}", col, c.number.value_or(0));
            case CardType::Skip:     return col + "S";
            case CardType::Reverse:  return col + "R";
            case CardType::Draw:     return col + "+2";
            case CardType::Wild:     return c.color ? std::format("W({})", col) : std::string("W");
            case CardType::WildDraw: return c.color ? std::format("W+4({})", col) : std::string("W+4");
        }
        return "??";
    }
}

template <>
struct std::formatter<uno::core::Card> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(uno::core::Card const& c, FormatContext& ctx) const
    {
        std::string const s = uno::core::util::CardCode(c);
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //UNOGAME_UTIL_HPP
