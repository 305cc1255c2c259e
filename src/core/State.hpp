//
// Created by Malik T on 14/08/2025.
//

#ifndef UNOGAME_STATE_HPP
#define UNOGAME_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"



namespace uno::core
{
    // Per-seat snapshot exposed to drivers/UI/network (copies, no references into the hand)
    struct HandSnapshot
    {
        PlyrIdxT seat{};
        uint8_t n_players{};
        PlyrIdxT dealer{};
        std::optional<PlyrIdxT> player_in_turn{};
        std::optional<PlyrIdxT> previous_player{};
        int8_t direction{1};

        Card top{};
        Color current_color{};

        // for UI: reveal my hand, counts for others
        std::vector<Card> my_hand;
        std::vector<uint8_t> other_counts;
        std::vector<bool> uno_calls;

        uint8_t draw_pile_size{};
        uint8_t discard_pile_size{};
        bool accusation_window_open{false};
        bool ended{false};
    };

} // namespace uno::core

#endif //UNOGAME_STATE_HPP
