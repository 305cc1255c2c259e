//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_ACTIONS_HPP
#define UNOGAME_ACTIONS_HPP

#include <variant>
#include "Types.hpp"

namespace uno::core
{
    // color is required for Wild/WildDraw and forbidden otherwise
    struct PlayAction
    {
        PlyrIdxT actor{};
        size_t card_idx{};
        std::optional<Color> color{};
    };
    struct DrawAction     { PlyrIdxT actor{}; };
    struct SayUnoAction   { PlyrIdxT player{}; };
    struct AccuseAction
    {
        PlyrIdxT accuser{};
        PlyrIdxT accused{};
    };

    using PlayerAction = std::variant<
      PlayAction, DrawAction, SayUnoAction, AccuseAction>;

    enum class MoveOutcome : uint8_t
    {
        Applied,
        HandEnded,
        GameEnded
    };
} // namespace uno::core

#endif //UNOGAME_ACTIONS_HPP
