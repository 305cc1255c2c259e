//
// Created by Malik T on 15/08/2025.
//

#ifndef UNOGAME_CLASSICRULES_HPP
#define UNOGAME_CLASSICRULES_HPP

#include "Types.hpp"
#include "Exception.hpp"

namespace uno::core
{
    //forward declaration
    class Hand;

    class ClassicRules final
    {
    public:
        using CheckResult = error::ValidateResult;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Only the player in turn is ever asked about.
        static auto Validate(Hand const& hand, size_t card_idx) -> CheckResult;
        // Same check against a seat's own view of the table (held cards, top, current color).
        static auto Validate(Pile const& held, size_t card_idx, Card const& top, Color current) -> CheckResult;
        static auto CanPlay(Hand const& hand, size_t card_idx) -> bool;

        static auto CardScore(Card const& c) -> uint32_t;
        static auto PileScore(Pile const& p) -> uint32_t;
    };
}

#endif //UNOGAME_CLASSICRULES_HPP
