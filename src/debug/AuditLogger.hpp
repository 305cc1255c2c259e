//
// Created by Malik T on 20/08/2025.
//

#ifndef UNOGAME_AUDITLOGGER_HPP
#define UNOGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/Hand.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace uno::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, players, first dealer)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Hand header (dealer, opening card, player in turn)
        auto deal(Hand const& hand) -> void;

        // Per action (before Apply): snapshot of the acting seat and the proposed action
        auto turn(HandSnapshot const& s,
                  PlyrIdxT actor,
                  PlayerAction const& a) -> void;

        // Per action outcome (after Apply)
        auto outcome(MoveOutcome m) -> void;

        // Finished hand: winner, points, what everyone was left holding
        auto hand_end(Hand const& hand) -> void;

        // Match footer (winner seat; -1 if none) and cumulative scores
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //UNOGAME_AUDITLOGGER_HPP
