//
// Created by Malik T on 03/10/2025.
//
#include "Hand.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

#include "ClassicRules.hpp"
#include "Deck.hpp"
#include "Exception.hpp"
#include "Util.hpp"

namespace uno::core
{
    auto Hand::Create(std::vector<std::string> players,
                      PlyrIdxT const dealer,
                      std::shared_ptr<Shuffler const> shuffler,
                      uint8_t const cards_per_player) -> Hand
    {
        using error::Code;

        size_t const n = players.size();
        if (n < constants::MinPlayers || n > constants::MaxPlayers)
            UNO_THROW(Code::InvalidPlayerCount,
                      std::format("{} players; a hand needs {} to {}", n, constants::MinPlayers, constants::MaxPlayers));
        if (dealer >= n)
            UNO_THROW(Code::PlayerIndexOutOfBounds,
                      std::format("Dealer P{} outside {} seats", static_cast<int>(dealer), n));
        if (cards_per_player == 0)
            UNO_THROW(Code::InvalidConfig, "A hand needs at least one card per player");
        UNO_ASSERT(shuffler != nullptr, "Hand created without a shuffler");

        Hand h;
        h.players_ = std::move(players);
        h.dealer_ = dealer;
        h.shuffler_ = std::move(shuffler);

        Pile pile = deck::ShuffleDeck(*h.shuffler_, deck::CreateInitialDeck());

        //seat order, each seat takes its whole share before the next
        h.hands_.reserve(n);
        for (size_t seat{}; seat < n; ++seat)
        {
            auto [dealt, rest] = deck::DealCards(cards_per_player, std::move(pile));
            h.hands_.push_back(std::move(dealt));
            pile = std::move(rest);
        }

        auto [top, rest] = deck::DealCard(std::move(pile));
        pile = std::move(rest);

        // A hand never opens on a wild card: set it aside, reshuffle the rest and reveal again.
        // Each pass removes one card from the pile, so this ends.
        Pile set_aside;
        while (top && deck::IsWildCard(*top))
        {
            set_aside.push_back(*top);
            if (std::ranges::none_of(pile, deck::IsColoredCard))
                UNO_THROW(Code::NotEnoughCards, "Only wild cards left to reveal as the first discard");

            auto [next_top, remaining] = deck::DealCard(deck::ShuffleDeck(*h.shuffler_, std::move(pile)));
            top = next_top;
            pile = std::move(remaining);
        }

        if (!top)
            UNO_THROW(Code::NotEnoughCards,
                      std::format("Deck exhausted dealing {} cards to {} players", cards_per_player, n));
        UNO_ASSERT(top->color.has_value(), "Revealed card has no color");

        h.discard_pile_ = Pile{*top};
        h.draw_pile_ = std::move(pile);
        // set-aside wild cards go under the draw pile
        h.draw_pile_.insert(h.draw_pile_.end(), set_aside.begin(), set_aside.end());
        h.current_color_ = *top->color;
        h.direction_ = 1;
        h.uno_calls_.assign(n, false);
        h.previous_player_.reset();
        h.accusation_window_open_ = false;

        switch (top->type)
        {
        case CardType::Reverse:
            h.direction_ = -1;
            h.player_in_turn_ = util::WrapSeat(dealer, -1, n);
            break;
        case CardType::Skip:
            h.player_in_turn_ = util::WrapSeat(dealer, 2, n);
            break;
        case CardType::Draw:
            h.DrawInto(util::WrapSeat(dealer, 1, n), constants::DrawPenalty);
            h.player_in_turn_ = util::WrapSeat(dealer, 2, n);
            break;
        case CardType::Numbered:
            h.player_in_turn_ = util::WrapSeat(dealer, 1, n);
            break;
        case CardType::Wild:
        case CardType::WildDraw:
            UNO_THROW(Code::Assertion, "Hand opened on a wild card");
        }
        return h;
    }

    auto Hand::Play(size_t const card_idx, std::optional<Color> const color) const -> Hand
    {
        using error::Code;

        if (HasEnded())
            UNO_THROW(Code::GameEnded, "Cannot play: the hand has ended");

        PlyrIdxT const actor = *player_in_turn_;
        Pile const& held = hands_[actor];

        if (card_idx >= held.size())
            UNO_THROW(Code::CardNotFound,
                      std::format("P{} holds {} cards, no index {}", static_cast<int>(actor), held.size(), card_idx));

        Card const card = held[card_idx];
        bool const wild = deck::IsWildCard(card);

        if (wild && !color)
            UNO_THROW(Code::IllegalColorAssignment, std::format("{} needs a color", card));
        if (!wild && color)
            UNO_THROW(Code::IllegalColorAssignment, std::format("{} cannot be given a color", card));

        if (auto const ok = ClassicRules::Validate(*this, card_idx); !ok.has_value())
            UNO_THROW(Code::IllegalPlay, error::describe(ok.error()));

        Hand next = *this;
        Pile& hand = next.hands_[actor];
        hand.erase(hand.begin() + static_cast<std::ptrdiff_t>(card_idx));

        Card played = card;
        if (wild) played.color = color;
        next.discard_pile_.insert(next.discard_pile_.begin(), played);
        next.current_color_ = *played.color;

        size_t const n = PlayerCount();
        int const dir = direction_;
        PlyrIdxT in_turn = util::WrapSeat(actor, dir, n);

        switch (card.type)
        {
        case CardType::Numbered:
        case CardType::Wild:
            break;
        case CardType::Reverse:
            // heads-up: reverse hands the turn straight back
            if (n == 2)
            {
                in_turn = actor;
            }
            else
            {
                next.direction_ = -dir;
                in_turn = util::WrapSeat(actor, -dir, n);
            }
            break;
        case CardType::Skip:
            in_turn = util::WrapSeat(actor, 2 * dir, n);
            break;
        case CardType::Draw:
            next.DrawInto(util::WrapSeat(actor, dir, n), constants::DrawPenalty);
            in_turn = util::WrapSeat(actor, 2 * dir, n);
            break;
        case CardType::WildDraw:
            next.DrawInto(util::WrapSeat(actor, dir, n), constants::WildDrawPenalty);
            in_turn = util::WrapSeat(actor, 2 * dir, n);
            break;
        }

        next.previous_player_ = actor;

        if (next.hands_[actor].empty())
        {
            next.player_in_turn_.reset();
            next.accusation_window_open_ = false;
            for (size_t i{}; i < n; ++i)
            {
                if (i != actor) next.uno_calls_[i] = false;
            }
            return next;
        }

        next.player_in_turn_ = in_turn;
        next.accusation_window_open_ = true;
        for (size_t i{}; i < n; ++i)
        {
            if (i != actor && i != in_turn) next.uno_calls_[i] = false;
        }
        return next;
    }

    auto Hand::Draw() const -> Hand
    {
        if (HasEnded())
            UNO_THROW(error::Code::GameEnded, "Cannot draw: the hand has ended");

        PlyrIdxT const actor = *player_in_turn_;

        Hand next = *this;
        size_t const drawn = next.DrawInto(actor, 1);
        next.uno_calls_[actor] = false;
        next.accusation_window_open_ = false;

        bool const keeps_turn = drawn == 1 && ClassicRules::CanPlay(next, next.hands_[actor].size() - 1);
        if (!keeps_turn)
            next.player_in_turn_ = util::WrapSeat(actor, direction_, PlayerCount());
        return next;
    }

    auto Hand::SayUno(PlyrIdxT const player) const -> Hand
    {
        if (HasEnded())
            UNO_THROW(error::Code::GameEnded, "Cannot call UNO: the hand has ended");
        CheckSeat(player, "player");

        if (hands_[player].size() > constants::UnoCallMaxCards)
            return *this;

        Hand next = *this;
        next.uno_calls_[player] = true;
        return next;
    }

    auto Hand::CheckUnoFailure(PlyrIdxT const accuser, PlyrIdxT const accused) const -> bool
    {
        CheckSeat(accuser, "accuser");
        CheckSeat(accused, "accused");

        if (!accusation_window_open_ || previous_player_ != accused)
            return false;

        return hands_[accused].size() == 1 && !uno_calls_[accused];
    }

    auto Hand::CatchUnoFailure(PlyrIdxT const accuser, PlyrIdxT const accused) const -> Hand
    {
        if (!CheckUnoFailure(accuser, accused))
            return *this;

        Hand next = *this;
        next.DrawInto(accused, constants::UnoPenalty);
        next.accusation_window_open_ = false;
        return next;
    }

    auto Hand::Apply(PlayerAction const& a) const -> Hand
    {
        return std::visit([&]<typename T0>(T0 const& act) -> Hand
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                RequireTurn(act.actor);
                return Play(act.card_idx, act.color);
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                RequireTurn(act.actor);
                return Draw();
            }
            else if constexpr (std::is_same_v<T, SayUnoAction>)
            {
                return SayUno(act.player);
            }
            else
            {
                static_assert(std::is_same_v<T, AccuseAction>, "Unhandled PlayerAction alternative");
                return CatchUnoFailure(act.accuser, act.accused);
            }
        }, a);
    }

    auto Hand::CanPlay(size_t const card_idx) const -> bool
    {
        return ClassicRules::CanPlay(*this, card_idx);
    }

    auto Hand::CanPlayAny() const -> bool
    {
        if (HasEnded()) return false;
        size_t const held = hands_[*player_in_turn_].size();
        return std::ranges::any_of(std::views::iota(size_t{0}, held),
                                   [this](size_t const i) { return CanPlay(i); });
    }

    auto Hand::HasEnded() const -> bool
    {
        return !player_in_turn_.has_value() ||
               std::ranges::any_of(hands_, [](Pile const& p) { return p.empty(); });
    }

    auto Hand::Winner() const -> std::optional<PlyrIdxT>
    {
        if (!HasEnded()) return std::nullopt;
        auto const it = std::ranges::find_if(hands_, [](Pile const& p) { return p.empty(); });
        if (it == hands_.cend()) return std::nullopt;
        return static_cast<PlyrIdxT>(std::distance(hands_.cbegin(), it));
    }

    auto Hand::Score() const -> std::optional<uint32_t>
    {
        std::optional<PlyrIdxT> const won = Winner();
        if (!won) return std::nullopt;

        uint32_t total{};
        for (size_t seat{}; seat < hands_.size(); ++seat)
        {
            if (seat != *won) total += ClassicRules::PileScore(hands_[seat]);
        }
        return total;
    }

    auto Hand::TopOfDiscard() const -> Card const&
    {
        UNO_ASSERT(!discard_pile_.empty(), "Discard pile empty");
        return discard_pile_.front();
    }

    auto Hand::HandOf(PlyrIdxT const seat) const -> Pile const&
    {
        CheckSeat(seat, "seat");
        return hands_[seat];
    }

    auto Hand::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<HandSnapshot const>
    {
        CheckSeat(seat, "seat");

        std::shared_ptr<HandSnapshot> snap = std::make_shared<HandSnapshot>();
        snap->seat = seat;
        snap->n_players = static_cast<uint8_t>(PlayerCount());
        snap->dealer = dealer_;
        snap->player_in_turn = player_in_turn_;
        snap->previous_player = previous_player_;
        snap->direction = static_cast<int8_t>(direction_);
        snap->top = TopOfDiscard();
        snap->current_color = current_color_;
        snap->my_hand = hands_[seat];

        for (Pile const& p : hands_)
        {
            snap->other_counts.push_back(static_cast<uint8_t>(p.size()));
        }
        snap->uno_calls = uno_calls_;
        snap->draw_pile_size = static_cast<uint8_t>(draw_pile_.size());
        snap->discard_pile_size = static_cast<uint8_t>(discard_pile_.size());
        snap->accusation_window_open = accusation_window_open_;
        snap->ended = HasEnded();
        return snap;
    }

    auto Hand::DrawInto(PlyrIdxT const seat, size_t const count) -> size_t
    {
        Pile& hand = hands_.at(seat);
        size_t drawn{};
        while (drawn < count)
        {
            if (draw_pile_.empty())
            {
                RecycleDiscard();
                // every card is held by a player: the draw comes up short
                if (draw_pile_.empty()) break;
            }
            auto [cards, rest] = deck::DealCards(count - drawn, std::move(draw_pile_));
            draw_pile_ = std::move(rest);
            drawn += cards.size();
            hand.insert(hand.end(), cards.begin(), cards.end());
        }
        return drawn;
    }

    auto Hand::RecycleDiscard() -> void
    {
        UNO_ASSERT(draw_pile_.empty(), "Recycling the discard pile over a live draw pile");
        if (discard_pile_.size() <= 1) return;

        Pile under(discard_pile_.begin() + 1, discard_pile_.end());
        std::ranges::transform(under, under.begin(), deck::ClearWildColor);
        discard_pile_.resize(1);
        draw_pile_ = deck::ShuffleDeck(*shuffler_, std::move(under));
    }

    auto Hand::CheckSeat(PlyrIdxT const seat, char const* role) const -> void
    {
        if (seat >= PlayerCount())
            UNO_THROW(error::Code::PlayerIndexOutOfBounds,
                      std::format("{} index {} outside {} seats", role, static_cast<int>(seat), PlayerCount()));
    }

    auto Hand::RequireTurn(PlyrIdxT const seat) const -> void
    {
        if (HasEnded())
            UNO_THROW(error::Code::GameEnded, "No player in turn: the hand has ended");
        CheckSeat(seat, "actor");
        if (seat != *player_in_turn_)
            UNO_THROW(error::Code::NotPlayersTurn,
                      std::format("P{} acted out of turn; P{} is in turn",
                                  static_cast<int>(seat), static_cast<int>(*player_in_turn_)));
    }
}
