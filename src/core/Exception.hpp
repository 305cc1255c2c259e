//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_EXCEPTION_HPP
#define UNOGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Util.hpp"

namespace uno::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        InvalidPlayerCount, // fewer than 2 or more than 10 players
        GameEnded, // action on a finished hand (also: no active player)
        CardNotFound, // card index outside the acting player's hand
        IllegalColorAssignment, // color given for a colored card, or missing for a wild card
        IllegalPlay, // card does not match the top of the discard pile
        PlayerIndexOutOfBounds, // seat index outside [0, player count)
        NotEnoughCards, // deck exhausted while dealing
        NoActiveHand, // match already over
        NotPlayersTurn, // action named a seat that is not in turn
        InvalidConfig, // unusable match configuration
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidPlayerCountError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GameEndedError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct CardNotFoundError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IllegalColorAssignmentError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IllegalPlayError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct PlayerIndexOutOfBoundsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NotEnoughCardsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NoActiveHandError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NotPlayersTurnError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::InvalidPlayerCount: throw InvalidPlayerCountError(std::move(msg), c, loc);
        case Code::GameEnded: throw GameEndedError(std::move(msg), c, loc);
        case Code::CardNotFound: throw CardNotFoundError(std::move(msg), c, loc);
        case Code::IllegalColorAssignment: throw IllegalColorAssignmentError(std::move(msg), c, loc);
        case Code::IllegalPlay: throw IllegalPlayError(std::move(msg), c, loc);
        case Code::PlayerIndexOutOfBounds: throw PlayerIndexOutOfBoundsError(std::move(msg), c, loc);
        case Code::NotEnoughCards: throw NotEnoughCardsError(std::move(msg), c, loc);
        case Code::NoActiveHand: throw NoActiveHandError(std::move(msg), c, loc);
        case Code::NotPlayersTurn: throw NotPlayersTurnError(std::move(msg), c, loc);
        case Code::InvalidConfig: throw InvalidConfigError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define UNO_THROW(code_enum, msg) ::uno::core::error::fail((code_enum), (msg))
#define UNO_ASSERT(cond, msg) do { if(!(cond)) ::uno::core::error::fail(::uno::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a card cannot be played right now; grouped by card type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Hand_Ended,
        Card_IndexOutOfRange,

        // Wild draw: may only be played without a card of the current color
        WildDraw_CurrentColorHeld,

        // Skip/Reverse/Draw
        Action_NoTypeOrColorMatch,

        // Numbered
        Numbered_NoColorOrNumberMatch,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlyrIdxT> actor{};
        std::optional<size_t> card_idx{};
        std::optional<Card> card{};
        std::optional<Card> top{};
        std::optional<Color> current_color{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_index(size_t i) -> RuleViolation&
        {
            card_idx = i;
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = c;
            return *this;
        }

        auto with_top(Card const& c) -> RuleViolation&
        {
            top = c;
            return *this;
        }

        auto with_color(Color c) -> RuleViolation&
        {
            current_color = c;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Hand_Ended: return "Hand has ended";
        case E::Card_IndexOutOfRange: return "Card index not in hand";
        case E::WildDraw_CurrentColorHeld: return "Wild draw: player holds a card of the current color";
        case E::Action_NoTypeOrColorMatch: return "Action card: neither type nor color matches";
        case E::Numbered_NoColorOrNumberMatch: return "Numbered card: neither color nor number matches";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.card_idx) s += std::format(" | idx={}", *v.card_idx);
        if (v.card) s += std::format(" | card={}", *v.card);
        if (v.top) s += std::format(" | top={}", *v.top);
        if (v.current_color) s += std::format(" | color={}", util::to_string(*v.current_color));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //UNOGAME_EXCEPTION_HPP
