//
// Created by Malik T on 06/10/2025.
//

#ifndef UNOGAME_CODEC_HPP
#define UNOGAME_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <expected>
#include <optional>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Hand.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/uno_net_generated.h"

namespace uno::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct DecodedAction
    {
        std::uint64_t msg_id{};
        uno::core::PlayerAction action{};
    };

    // Rejection as it arrives on a seat
    struct DecodedViolation
    {
        std::uint64_t msg_id{};
        std::optional<uno::core::error::Code> error{};
        std::optional<uno::core::error::RuleViolationCode> rule{};
        std::string message;
    };

    auto ToFbColor(uno::core::Color c) noexcept -> uno::gen::net::Color;
    auto ToFbCardType(uno::core::CardType t) noexcept -> uno::gen::net::CardType;

    // Wire values outside the enum yield nullopt
    auto FromFbColor(uno::gen::net::Color c) noexcept -> std::optional<uno::core::Color>;
    auto FromFbCardType(uno::gen::net::CardType t) noexcept -> std::optional<uno::core::CardType>;

    // --- Outbound (hand -> seat) ---

    auto BuildSnapshot(uno::core::Hand const& h,
                       uno::core::PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildSnapshot(uno::core::HandSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(uno::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Any other rejected action (wrong seat, stale hand, bad color...)
    auto BuildViolation(uno::core::OmegaException<uno::core::error::Code> const& e,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound (seat -> hand) ---

    auto BuildAction_Play(uno::core::PlyrIdxT actor,
                          std::size_t card_idx,
                          std::optional<uno::core::Color> color,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Draw(uno::core::PlyrIdxT actor,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_SayUno(uno::core::PlyrIdxT player,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Accuse(uno::core::PlyrIdxT accuser,
                            uno::core::PlyrIdxT accused,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction(uno::core::PlayerAction const& a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified envelope -> value) ---

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<uno::core::HandSnapshot, ParseError>;

    auto DecodeViolation(std::span<std::byte const> bytes)
        -> std::expected<DecodedViolation, ParseError>;
} // namespace uno::core::net

#endif //UNOGAME_CODEC_HPP
