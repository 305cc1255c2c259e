//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_PLAYER_HPP
#define UNOGAME_PLAYER_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace uno::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by whatever drives the match (local adapter, UI, remote seat).
        // The returned action is forwarded to Game::Apply, which rejects it by throwing.
        virtual PlayerAction Play(std::shared_ptr<const HandSnapshot> snapshot) = 0;
    };
}
#endif //UNOGAME_PLAYER_HPP
