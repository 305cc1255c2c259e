//
// Created by Malik T on 15/08/2025.
//

#ifndef UNOGAME_GAME_HPP
#define UNOGAME_GAME_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Random.hpp"
#include "Hand.hpp"

namespace uno::core
{
    struct HandResult
    {
        PlyrIdxT winner{};
        uint32_t points{};
        PlyrIdxT dealer{};
    };

    // Sequences hands into a match: forwards actions to the current Hand, credits the
    // hand winner with the hand score, then either ends the match or re-deals with the
    // next dealer. Single writer: one Apply at a time.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // Null shuffler/randomizer default to Seeded*(config.seed).
        explicit GameImpl(Config const& config,
                          std::shared_ptr<Shuffler const> shuffler = nullptr,
                          std::shared_ptr<Randomizer const> randomizer = nullptr);

        // One state-machine step. Throws on a rejected action and leaves the game as it was.
        auto Apply(PlayerAction const& action) -> MoveOutcome;

        auto Play(PlyrIdxT seat, size_t card_idx, std::optional<Color> color = std::nullopt) -> MoveOutcome;
        auto Draw(PlyrIdxT seat) -> MoveOutcome;
        auto SayUno(PlyrIdxT seat) -> MoveOutcome;
        auto CatchUnoFailure(PlyrIdxT accuser, PlyrIdxT accused) -> MoveOutcome;

        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<HandSnapshot const>;

        auto PlayerCount() const noexcept -> size_t { return cfg_.players.size(); }
        auto Players() const noexcept -> std::vector<std::string> const& { return cfg_.players; }
        auto PlayerName(PlyrIdxT seat) const -> std::string const&;
        auto ScoreOf(PlyrIdxT seat) const -> uint32_t;
        auto Scores() const noexcept -> std::vector<uint32_t> const& { return scores_; }
        auto TargetScore() const noexcept -> uint32_t { return cfg_.target_score; }
        auto Dealer() const noexcept -> PlyrIdxT { return dealer_; }
        auto CurrentHand() const noexcept -> std::optional<Hand> const& { return hand_; }
        auto History() const noexcept -> std::vector<HandResult> const& { return history_; }
        auto HandsPlayed() const noexcept -> size_t { return history_.size(); }

        auto IsGameOver() const noexcept -> bool { return winner_.has_value(); }
        auto Winner() const noexcept -> std::optional<PlyrIdxT> { return winner_; }
        auto WinningPlayer() const -> std::optional<std::string>;
        // first seat holding the top score
        auto LeadingPlayer() const -> std::string const&;
        // names by descending score, ties in seat order
        auto PlayerRanking() const -> std::vector<std::string>;

        auto IsValidPlayer(size_t seat) const noexcept -> bool { return seat < PlayerCount(); }
        auto IsPlayerTurn(PlyrIdxT seat) const -> bool;

    private:
        auto DealHand(PlyrIdxT dealer) -> void;
        // Scores the finished hand and either closes the match or deals the next hand.
        auto EndHand(Hand const& finished) -> MoveOutcome;
        auto CheckSeat(PlyrIdxT seat) const -> void;

    private:
        Config cfg_;
        std::shared_ptr<Shuffler const> shuffler_;
        std::shared_ptr<Randomizer const> randomizer_;

        std::vector<uint32_t> scores_;
        PlyrIdxT dealer_{0};
        std::optional<Hand> hand_;
        std::optional<PlyrIdxT> winner_;
        std::vector<HandResult> history_;
    };
}
#endif //UNOGAME_GAME_HPP
