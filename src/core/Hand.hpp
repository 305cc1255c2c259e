//
// Created by Malik T on 03/10/2025.
//

#ifndef UNOGAME_HAND_HPP
#define UNOGAME_HAND_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Random.hpp"

namespace uno::core
{
    // One round of play, from the deal until a player empties their hand.
    //
    // A Hand is an immutable value: every transition is a const member returning the
    // successor state, so a transition that throws leaves the caller's Hand untouched.
    // Two actions applied to the same snapshot fork the round; callers serialize.
    class Hand
    {
    public:
        // Shuffles the full deck, deals `cards_per_player` to each seat in seat order,
        // reveals the top card (never a wild one) and resolves its effect.
        // Throws InvalidPlayerCount, PlayerIndexOutOfBounds (dealer) or NotEnoughCards.
        static auto Create(std::vector<std::string> players,
                           PlyrIdxT dealer,
                           std::shared_ptr<Shuffler const> shuffler,
                           uint8_t cards_per_player = constants::DefaultCardsPerPlayer) -> Hand;

        // Player in turn plays the card at `card_idx`; wild cards require `color`.
        // Throws GameEnded, CardNotFound, IllegalColorAssignment or IllegalPlay.
        auto Play(size_t card_idx, std::optional<Color> color = std::nullopt) const -> Hand;

        // Player in turn draws one card and keeps the turn only if it is playable.
        auto Draw() const -> Hand;

        // No-op while the player holds more than two cards.
        auto SayUno(PlyrIdxT player) const -> Hand;

        // Accused draws the penalty if CheckUnoFailure holds; otherwise returns *this.
        auto CatchUnoFailure(PlyrIdxT accuser, PlyrIdxT accused) const -> Hand;

        // Dispatches a driver action. Play/Draw must name the seat in turn (NotPlayersTurn).
        auto Apply(PlayerAction const& a) const -> Hand;

        [[nodiscard]] auto CanPlay(size_t card_idx) const -> bool;
        [[nodiscard]] auto CanPlayAny() const -> bool;
        [[nodiscard]] auto CheckUnoFailure(PlyrIdxT accuser, PlyrIdxT accused) const -> bool;
        [[nodiscard]] auto HasEnded() const -> bool;
        [[nodiscard]] auto Winner() const -> std::optional<PlyrIdxT>;
        [[nodiscard]] auto Score() const -> std::optional<uint32_t>;
        [[nodiscard]] auto TopOfDiscard() const -> Card const&;

        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<HandSnapshot const>;

        auto PlayerCount() const noexcept -> size_t { return players_.size(); }
        auto Players() const noexcept -> std::vector<std::string> const& { return players_; }
        auto Dealer() const noexcept -> PlyrIdxT { return dealer_; }
        auto PlayerInTurn() const noexcept -> std::optional<PlyrIdxT> { return player_in_turn_; }
        auto PreviousPlayer() const noexcept -> std::optional<PlyrIdxT> { return previous_player_; }
        auto Hands() const noexcept -> std::vector<Pile> const& { return hands_; }
        auto HandOf(PlyrIdxT seat) const -> Pile const&;
        auto DrawPile() const noexcept -> Pile const& { return draw_pile_; }
        auto DiscardPile() const noexcept -> Pile const& { return discard_pile_; }
        auto Direction() const noexcept -> int { return direction_; }
        auto CurrentColor() const noexcept -> Color { return current_color_; }
        auto UnoCalls() const noexcept -> std::vector<bool> const& { return uno_calls_; }
        auto IsAccusationWindowOpen() const noexcept -> bool { return accusation_window_open_; }
        auto GetShuffler() const noexcept -> std::shared_ptr<Shuffler const> const& { return shuffler_; }

    private:
        Hand() = default;

        // Mutators below are only ever called on the fresh copy a transition returns.

        // Deals `count` cards from the draw pile into `seat`, recycling the discard pile
        // when the draw pile runs dry. Returns how many cards were actually drawn.
        auto DrawInto(PlyrIdxT seat, size_t count) -> size_t;
        auto RecycleDiscard() -> void;

        auto CheckSeat(PlyrIdxT seat, char const* role) const -> void;
        auto RequireTurn(PlyrIdxT seat) const -> void;

    private:
        std::vector<std::string> players_;
        PlyrIdxT dealer_{0};
        std::optional<PlyrIdxT> player_in_turn_{};
        std::vector<Pile> hands_;            // [seat] held cards, insertion order
        Pile draw_pile_;
        Pile discard_pile_;                  // [0] is the active card
        int direction_{1};
        Color current_color_{Color::Red};
        std::vector<bool> uno_calls_;
        std::optional<PlyrIdxT> previous_player_{};
        bool accusation_window_open_{false};
        std::shared_ptr<Shuffler const> shuffler_;
    };
}
#endif //UNOGAME_HAND_HPP
