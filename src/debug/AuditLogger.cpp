#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Util.hpp"

using namespace uno::core;

namespace
{

auto s_cards(Pile const& cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += util::CardCode(cards[i]);
    }
    return body;
}

auto s_seat(std::optional<PlyrIdxT> const s) -> std::string
{
    return s ? std::format("P{}", static_cast<int>(*s)) : std::string("-");
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                if (act.color)
                {
                    return std::format("Play[P{} #{} as {}]", static_cast<int>(act.actor), act.card_idx,
                                       util::to_string(*act.color));
                }
                return std::format("Play[P{} #{}]", static_cast<int>(act.actor), act.card_idx);
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return std::format("Draw[P{}]", static_cast<int>(act.actor));
            }
            else if constexpr (std::is_same_v<T, SayUnoAction>)
            {
                return std::format("Uno[P{}]", static_cast<int>(act.player));
            }
            else
            {
                return std::format("Accuse[P{} -> P{}]", static_cast<int>(act.accuser), static_cast<int>(act.accused));
            }
        },
        a
    );
}

} // anonymous namespace

namespace uno::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    std::string names;
    for (size_t i{}; i < game.PlayerCount(); ++i)
    {
        names += std::format("{}{}", (i ? "," : ""), game.Players()[i]);
    }
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={} [{}]\n", game.PlayerCount(), names);
    out_ << std::format("Target={}\n", game.TargetScore());
    out_.flush();
}

auto AuditLogger::deal(Hand const& hand) -> void
{
    out_ << std::format(
        "Deal dealer=P{} top={} color={} turn={} dir={} draw={}\n",
        static_cast<int>(hand.Dealer()),
        util::CardCode(hand.TopOfDiscard()),
        util::to_string(hand.CurrentColor()),
        s_seat(hand.PlayerInTurn()),
        hand.Direction(),
        hand.DrawPile().size()
    );
}

auto AuditLogger::turn(HandSnapshot const& s,
                       PlyrIdxT actor,
                       PlayerAction const& a) -> void
{
    out_ << std::format(
        "Turn actor=P{} top={} color={} dir={} window={} hand=[{}]\n",
        static_cast<int>(actor),
        util::CardCode(s.top),
        util::to_string(s.current_color),
        static_cast<int>(s.direction),
        (s.accusation_window_open ? "open" : "closed"),
        s_cards(s.my_hand)
    );

    out_ << std::format("Action: {}\n", s_action(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied   ? "Applied" :
        (m == MoveOutcome::HandEnded ? "HandEnded" : "GameEnded"));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::hand_end(Hand const& hand) -> void
{
    std::string body;
    for (size_t i{}; i < hand.PlayerCount(); ++i)
    {
        body += std::format("{}{}:[{}]", (i ? " " : ""), i, s_cards(hand.Hands()[i]));
    }

    out_ << std::format("HandEnd winner={} points={} hands={}\n",
                        s_seat(hand.Winner()),
                        hand.Score().value_or(0),
                        body);
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    int const winner = game.Winner() ? static_cast<int>(*game.Winner()) : -1;

    std::string scores;
    for (size_t i{}; i < game.PlayerCount(); ++i)
    {
        scores += std::format("{}{}", (i ? "," : ""), game.Scores()[i]);
    }

    out_ << std::format("Winner={} hands={} scores=[{}]\n", winner, game.HandsPlayed(), scores);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
