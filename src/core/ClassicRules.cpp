//
// Created by Malik T on 15/08/2025.
//

#include "ClassicRules.hpp"

#include "Hand.hpp"
#include <algorithm>
#include <numeric>
namespace
{
    inline auto Viol(uno::core::error::RuleViolationCode code) -> uno::core::error::RuleViolation
    {
        return uno::core::error::RuleViolation{ .code = code };
    }
}

namespace uno::core
{
    static auto HoldsColor(Pile const& held, Color const c) -> bool
    {
        // wild cards in hand are colorless and never match
        return std::ranges::any_of(held, [c](Card const& h) { return h.color == c; });
    }

auto ClassicRules::Validate(Hand const& hand, size_t const card_idx) -> CheckResult
{
    using RVC = ::uno::core::error::RuleViolationCode;

    if (hand.HasEnded())
        return std::unexpected(Viol(RVC::Hand_Ended));

    PlyrIdxT const actor = *hand.PlayerInTurn();
    CheckResult res = Validate(hand.HandOf(actor), card_idx, hand.TopOfDiscard(), hand.CurrentColor());
    if (!res.has_value())
        res.error().with_actor(actor);
    return res;
}

auto ClassicRules::Validate(Pile const& held, size_t const card_idx, Card const& top, Color const current)
    -> CheckResult
{
    using RVC = ::uno::core::error::RuleViolationCode;

    if (card_idx >= held.size())
        return std::unexpected(Viol(RVC::Card_IndexOutOfRange).with_index(card_idx));

    Card const& card = held[card_idx];

    switch (card.type)
    {
    case CardType::Wild:
        return {};

    case CardType::WildDraw:
        if (HoldsColor(held, current))
            return std::unexpected(Viol(RVC::WildDraw_CurrentColorHeld)
                                   .with_index(card_idx).with_color(current));
        return {};

    case CardType::Skip:
    case CardType::Reverse:
    case CardType::Draw:
        if (top.type == card.type || card.color == current)
            return {};
        return std::unexpected(Viol(RVC::Action_NoTypeOrColorMatch)
                               .with_index(card_idx)
                               .with_card(card).with_top(top).with_color(current));

    case CardType::Numbered:
        if (card.color == current)
            return {};
        if (top.type == CardType::Numbered && top.number == card.number)
            return {};
        return std::unexpected(Viol(RVC::Numbered_NoColorOrNumberMatch)
                               .with_index(card_idx)
                               .with_card(card).with_top(top).with_color(current));
    }
    return std::unexpected(Viol(RVC::Internal_Unreachable));
}

    auto ClassicRules::CanPlay(Hand const& hand, size_t const card_idx) -> bool
    {
        return Validate(hand, card_idx).has_value();
    }

    auto ClassicRules::CardScore(Card const& c) -> uint32_t
    {
        switch (c.type)
        {
        case CardType::Wild:
        case CardType::WildDraw: return constants::WildScore;
        case CardType::Skip:
        case CardType::Reverse:
        case CardType::Draw: return constants::ActionScore;
        case CardType::Numbered: return c.number.value_or(0);
        }
        return 0;
    }

    auto ClassicRules::PileScore(Pile const& p) -> uint32_t
    {
        return std::accumulate(p.cbegin(), p.cend(), uint32_t{0},
                               [](uint32_t acc, Card const& c) { return acc + CardScore(c); });
    }
}
