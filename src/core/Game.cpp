//
// Created by Malik T on 15/08/2025.
//
#include "Game.hpp"
#include <algorithm>
#include <numeric>
#include <ranges>

#include "Exception.hpp"
#include "Util.hpp"
#include <format>
#include <print>
#include <utility>

namespace uno::core
{
    static auto HandSeed(uint64_t const seed, size_t const hand_no) -> uint64_t
    {
        // splitmix64 step so consecutive hands get unrelated decks
        uint64_t z = seed + (static_cast<uint64_t>(hand_no) + 1) * 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    GameImpl::GameImpl(Config const& config,
                       std::shared_ptr<Shuffler const> shuffler,
                       std::shared_ptr<Randomizer const> randomizer) :
        cfg_(config),
        shuffler_(std::move(shuffler)),
        randomizer_(std::move(randomizer)),
        scores_(cfg_.players.size(), 0)
    {
        using error::Code;
        size_t const n = cfg_.players.size();
        if (n < constants::MinPlayers || n > constants::MaxPlayers)
            UNO_THROW(Code::InvalidPlayerCount,
                      std::format("{} players; a match needs {} to {}", n, constants::MinPlayers, constants::MaxPlayers));
        if (cfg_.target_score == 0)
            UNO_THROW(Code::InvalidConfig, "Target score must be greater than 0");

        if (!randomizer_) randomizer_ = std::make_shared<SeededRandomizer>(cfg_.seed);

        size_t const first_dealer = randomizer_->Next(n);
        UNO_ASSERT(first_dealer < n, "Randomizer returned a seat outside the table");
        DealHand(static_cast<PlyrIdxT>(first_dealer));
    }

    auto GameImpl::DealHand(PlyrIdxT const dealer) -> void
    {
        // an injected shuffler is used as-is; the default one is re-seeded per hand
        std::shared_ptr<Shuffler const> shuffler = shuffler_
            ? shuffler_
            : std::make_shared<SeededShuffler>(HandSeed(cfg_.seed, history_.size()));

        Hand fresh = Hand::Create(cfg_.players, dealer, std::move(shuffler), cfg_.cards_per_player);
        hand_ = std::move(fresh);
        dealer_ = dealer;
    }

    auto GameImpl::Apply(PlayerAction const& action) -> MoveOutcome
    {
        if (!hand_)
            UNO_THROW(error::Code::NoActiveHand, "No active hand: the match is over");

        Hand next = hand_->Apply(action);
        if (!next.HasEnded())
        {
            hand_ = std::move(next);
            return MoveOutcome::Applied;
        }
        return EndHand(next);
    }

    auto GameImpl::EndHand(Hand const& finished) -> MoveOutcome
    {
        std::optional<PlyrIdxT> const won = finished.Winner();
        std::optional<uint32_t> const points = finished.Score();
        UNO_ASSERT(won && points, "Finished hand without a winner");

        HandResult const result{ .winner = *won, .points = *points, .dealer = dealer_ };
        uint32_t const total = scores_[*won] + *points;

        std::print("[uno] hand {} won by {} (P{}) for {} points, total {}\n",
                   history_.size() + 1, cfg_.players[*won], static_cast<int>(*won), *points, total);

        if (total >= cfg_.target_score)
        {
            scores_[*won] = total;
            history_.push_back(result);
            winner_ = *won;
            hand_.reset();
            std::print("[uno] match over, winner {}\n", cfg_.players[*won]);
            return MoveOutcome::GameEnded;
        }

        // scores are committed only after the next deal succeeds
        PlyrIdxT const next_dealer = util::WrapSeat(dealer_, 1, PlayerCount());
        history_.push_back(result);
        try
        {
            DealHand(next_dealer);
        }
        catch (...)
        {
            history_.pop_back();
            throw;
        }
        scores_[*won] = total;
        return MoveOutcome::HandEnded;
    }

    auto GameImpl::Play(PlyrIdxT const seat, size_t const card_idx, std::optional<Color> const color) -> MoveOutcome
    {
        return Apply(PlayAction{ .actor = seat, .card_idx = card_idx, .color = color });
    }

    auto GameImpl::Draw(PlyrIdxT const seat) -> MoveOutcome
    {
        return Apply(DrawAction{ .actor = seat });
    }

    auto GameImpl::SayUno(PlyrIdxT const seat) -> MoveOutcome
    {
        return Apply(SayUnoAction{ .player = seat });
    }

    auto GameImpl::CatchUnoFailure(PlyrIdxT const accuser, PlyrIdxT const accused) -> MoveOutcome
    {
        return Apply(AccuseAction{ .accuser = accuser, .accused = accused });
    }

    auto GameImpl::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<HandSnapshot const>
    {
        if (!hand_)
            UNO_THROW(error::Code::NoActiveHand, "No active hand: the match is over");
        return hand_->SnapshotFor(seat);
    }

    auto GameImpl::PlayerName(PlyrIdxT const seat) const -> std::string const&
    {
        CheckSeat(seat);
        return cfg_.players[seat];
    }

    auto GameImpl::ScoreOf(PlyrIdxT const seat) const -> uint32_t
    {
        CheckSeat(seat);
        return scores_[seat];
    }

    auto GameImpl::WinningPlayer() const -> std::optional<std::string>
    {
        if (!winner_) return std::nullopt;
        return cfg_.players[*winner_];
    }

    auto GameImpl::LeadingPlayer() const -> std::string const&
    {
        auto const it = std::ranges::max_element(scores_);
        return cfg_.players[static_cast<size_t>(std::distance(scores_.cbegin(), it))];
    }

    auto GameImpl::PlayerRanking() const -> std::vector<std::string>
    {
        std::vector<size_t> seats(PlayerCount());
        std::iota(seats.begin(), seats.end(), size_t{0});
        std::ranges::stable_sort(seats, [this](size_t const a, size_t const b) { return scores_[a] > scores_[b]; });

        std::vector<std::string> names;
        names.reserve(seats.size());
        for (size_t const s : seats) names.push_back(cfg_.players[s]);
        return names;
    }

    auto GameImpl::IsPlayerTurn(PlyrIdxT const seat) const -> bool
    {
        return hand_.has_value() && hand_->PlayerInTurn() == seat;
    }

    auto GameImpl::CheckSeat(PlyrIdxT const seat) const -> void
    {
        if (!IsValidPlayer(seat))
            UNO_THROW(error::Code::PlayerIndexOutOfBounds,
                      std::format("Seat {} outside {} players", static_cast<int>(seat), PlayerCount()));
    }
}
