//
// Codec.cpp
//
#include "Codec.hpp"

#include <format>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace uno::core::net
{
    auto ToFbColor(uno::core::Color c) noexcept -> uno::gen::net::Color
    {
        switch (c)
        {
        case uno::core::Color::Red: return uno::gen::net::Color::Red;
        case uno::core::Color::Yellow: return uno::gen::net::Color::Yellow;
        case uno::core::Color::Green: return uno::gen::net::Color::Green;
        case uno::core::Color::Blue: return uno::gen::net::Color::Blue;
        }
        return uno::gen::net::Color::Red;
    }

    auto FromFbColor(uno::gen::net::Color c) noexcept -> std::optional<uno::core::Color>
    {
        switch (c)
        {
        case uno::gen::net::Color::Red: return uno::core::Color::Red;
        case uno::gen::net::Color::Yellow: return uno::core::Color::Yellow;
        case uno::gen::net::Color::Green: return uno::core::Color::Green;
        case uno::gen::net::Color::Blue: return uno::core::Color::Blue;
        }
        return std::nullopt;
    }

    auto ToFbCardType(uno::core::CardType t) noexcept -> uno::gen::net::CardType
    {
        switch (t)
        {
        case uno::core::CardType::Numbered: return uno::gen::net::CardType::Numbered;
        case uno::core::CardType::Skip: return uno::gen::net::CardType::Skip;
        case uno::core::CardType::Reverse: return uno::gen::net::CardType::Reverse;
        case uno::core::CardType::Draw: return uno::gen::net::CardType::Draw;
        case uno::core::CardType::Wild: return uno::gen::net::CardType::Wild;
        case uno::core::CardType::WildDraw: return uno::gen::net::CardType::WildDraw;
        }
        return uno::gen::net::CardType::Numbered;
    }

    auto FromFbCardType(uno::gen::net::CardType t) noexcept -> std::optional<uno::core::CardType>
    {
        switch (t)
        {
        case uno::gen::net::CardType::Numbered: return uno::core::CardType::Numbered;
        case uno::gen::net::CardType::Skip: return uno::core::CardType::Skip;
        case uno::gen::net::CardType::Reverse: return uno::core::CardType::Reverse;
        case uno::gen::net::CardType::Draw: return uno::core::CardType::Draw;
        case uno::gen::net::CardType::Wild: return uno::core::CardType::Wild;
        case uno::gen::net::CardType::WildDraw: return uno::core::CardType::WildDraw;
        }
        return std::nullopt;
    }
}

namespace
{
    namespace fb = uno::gen::net;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)uno::core::Color::Blue == (int)fb::Color::Blue);
    static_assert((int)uno::core::CardType::WildDraw == (int)fb::CardType::WildDraw);

    auto to_fb_card(flatbuffers::FlatBufferBuilder& fbb, uno::core::Card const& c)
        -> flatbuffers::Offset<fb::Card>
    {
        return fb::CreateCard(
            fbb,
            uno::core::net::ToFbCardType(c.type),
            c.color.has_value(),
            c.color ? uno::core::net::ToFbColor(*c.color) : fb::Color::Red,
            c.number ? static_cast<int8_t>(*c.number) : int8_t{-1});
    }

    auto from_fb_card(fb::Card const* c) -> std::expected<uno::core::Card, uno::core::net::ParseError>
    {
        using uno::core::net::ParseError;
        if (!c) return std::unexpected(ParseError{"missing card"});

        std::optional<uno::core::CardType> const type = uno::core::net::FromFbCardType(c->type());
        if (!type) return std::unexpected(ParseError{"unknown card type"});

        uno::core::Card out{};
        out.type = *type;
        if (c->has_color())
        {
            std::optional<uno::core::Color> const color = uno::core::net::FromFbColor(c->color());
            if (!color) return std::unexpected(ParseError{"unknown card color"});
            out.color = color;
        }
        if (*type == uno::core::CardType::Numbered)
        {
            if (c->number() < 0 || c->number() > 9)
                return std::unexpected(ParseError{std::format("bad card number {}", static_cast<int>(c->number()))});
            out.number = static_cast<uint8_t>(c->number());
        }
        return out;
    }

    auto to_seat(int8_t v) -> std::optional<uno::core::PlyrIdxT>
    {
        if (v < 0) return std::nullopt;
        return static_cast<uno::core::PlyrIdxT>(v);
    }

    auto from_seat(std::optional<uno::core::PlyrIdxT> s) -> int8_t
    {
        return s ? static_cast<int8_t>(*s) : int8_t{-1};
    }

    auto finish_action(flatbuffers::FlatBufferBuilder& fbb,
                       std::uint64_t msg_id,
                       fb::Action kind,
                       flatbuffers::Offset<void> act)
        -> flatbuffers::DetachedBuffer
    {
        auto const m = fb::CreatePlayerActionMsg(fbb, msg_id, kind, act);
        auto const e = fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // Shared front door for every decoder: size, verifier, expected message kind
    auto open_envelope(std::span<std::byte const> bytes, fb::Message expected)
        -> std::expected<fb::Envelope const*, uno::core::net::ParseError>
    {
        using uno::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        if (env->message_type() != expected)
            return std::unexpected(ParseError{std::format("unexpected message kind {}",
                                                          static_cast<int>(env->message_type()))});
        return env;
    }
} // anonymous

namespace uno::core::net
{
    // ---------- Snapshot (hand -> seat) ----------

    auto BuildSnapshot(uno::core::Hand const& h,
                       uno::core::PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        std::shared_ptr<uno::core::HandSnapshot const> snap = h.SnapshotFor(seat);
        return BuildSnapshot(*snap, msg_id);
    }

    auto BuildSnapshot(uno::core::HandSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::Card>> my;
        my.reserve(snap.my_hand.size());
        for (uno::core::Card const& c : snap.my_hand)
        {
            my.push_back(to_fb_card(fbb, c));
        }
        auto const my_vec = fbb.CreateVector(my);
        auto const counts_vec = fbb.CreateVector(snap.other_counts);

        std::vector<uint8_t> calls(snap.uno_calls.begin(), snap.uno_calls.end());
        auto const calls_vec = fbb.CreateVector(calls);

        auto const top = to_fb_card(fbb, snap.top);

        auto const view = fb::CreateSeatView(
            fbb,
            /*schema_version*/ 1,
            /*seat*/ snap.seat,
            /*n_players*/ snap.n_players,
            /*dealer*/ snap.dealer,
            /*player_in_turn*/ from_seat(snap.player_in_turn),
            /*previous_player*/ from_seat(snap.previous_player),
            /*direction*/ snap.direction,
            /*top*/ top,
            /*current_color*/ ToFbColor(snap.current_color),
            /*my_hand*/ my_vec,
            /*other_counts*/ counts_vec,
            /*uno_calls*/ calls_vec,
            /*draw_pile_size*/ snap.draw_pile_size,
            /*discard_pile_size*/ snap.discard_pile_size,
            /*accusation_window_open*/ snap.accusation_window_open,
            /*ended*/ snap.ended
        );

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation (hand -> seat) ----------

    auto BuildViolation(uno::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(uno::core::error::describe(v));
        auto const vio = fb::CreateViolation(
            fbb, msg_id,
            static_cast<int16_t>(uno::core::error::Code::IllegalPlay),
            static_cast<int16_t>(v.code),
            txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildViolation(uno::core::OmegaException<uno::core::error::Code> const& e,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(e.what());
        auto const vio = fb::CreateViolation(
            fbb, msg_id, static_cast<int16_t>(e.data()), int16_t{-1}, txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Builders (seat -> hand) ----------

    auto BuildAction_Play(uno::core::PlyrIdxT actor,
                          std::size_t card_idx,
                          std::optional<uno::core::Color> color,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        if (card_idx > std::numeric_limits<uint8_t>::max())
            UNO_THROW(uno::core::error::Code::Serialization,
                      std::format("Card index {} does not fit the wire format", card_idx));

        flatbuffers::FlatBufferBuilder fbb;
        auto const p = fb::CreateAction_Play(
            fbb, actor, static_cast<uint8_t>(card_idx), color.has_value(),
            color ? ToFbColor(*color) : fb::Color::Red);
        return finish_action(fbb, msg_id, fb::Action::Action_Play, p.Union());
    }

    auto BuildAction_Draw(uno::core::PlyrIdxT actor,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const d = fb::CreateAction_Draw(fbb, actor);
        return finish_action(fbb, msg_id, fb::Action::Action_Draw, d.Union());
    }

    auto BuildAction_SayUno(uno::core::PlyrIdxT player,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const u = fb::CreateAction_SayUno(fbb, player);
        return finish_action(fbb, msg_id, fb::Action::Action_SayUno, u.Union());
    }

    auto BuildAction_Accuse(uno::core::PlyrIdxT accuser,
                            uno::core::PlyrIdxT accused,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_Accuse(fbb, accuser, accused);
        return finish_action(fbb, msg_id, fb::Action::Action_Accuse, a.Union());
    }

    auto BuildAction(uno::core::PlayerAction const& a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        return std::visit(
            [&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, uno::core::PlayAction>)
                    return BuildAction_Play(act.actor, act.card_idx, act.color, msg_id);
                else if constexpr (std::is_same_v<T, uno::core::DrawAction>)
                    return BuildAction_Draw(act.actor, msg_id);
                else if constexpr (std::is_same_v<T, uno::core::SayUnoAction>)
                    return BuildAction_SayUno(act.player, msg_id);
                else
                    return BuildAction_Accuse(act.accuser, act.accused, msg_id);
            },
            a
        );
    }

    // ---------- Decode (inbound wire) ----------

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        auto env = open_envelope(bytes, fb::Message::PlayerActionMsg);
        if (!env) return std::unexpected(env.error());

        auto const* pam = (*env)->message_as_PlayerActionMsg();
        if (!pam) return std::unexpected(ParseError{"empty message"});
        DecodedAction out{};
        out.msg_id = pam->msg_id();

        switch (pam->action_type())
        {
        case fb::Action::Action_Play:
        {
            auto const* p = pam->action_as_Action_Play();
            if (!p) return std::unexpected(ParseError{"empty action"});
            uno::core::PlayAction act{};
            act.actor = p->actor();
            act.card_idx = p->card_index();
            if (p->has_color())
            {
                std::optional<uno::core::Color> const c = FromFbColor(p->color());
                if (!c) return std::unexpected(ParseError{"unknown color"});
                act.color = c;
            }
            out.action = act;
            return out;
        }
        case fb::Action::Action_Draw:
        {
            auto const* d = pam->action_as_Action_Draw();
            if (!d) return std::unexpected(ParseError{"empty action"});
            out.action = uno::core::DrawAction{ .actor = d->actor() };
            return out;
        }
        case fb::Action::Action_SayUno:
        {
            auto const* u = pam->action_as_Action_SayUno();
            if (!u) return std::unexpected(ParseError{"empty action"});
            out.action = uno::core::SayUnoAction{ .player = u->player() };
            return out;
        }
        case fb::Action::Action_Accuse:
        {
            auto const* a = pam->action_as_Action_Accuse();
            if (!a) return std::unexpected(ParseError{"empty action"});
            out.action = uno::core::AccuseAction{ .accuser = a->accuser(), .accused = a->accused() };
            return out;
        }
        default:
            break;
        }
        return std::unexpected(ParseError{"unknown action"});
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<uno::core::HandSnapshot, ParseError>
    {
        auto env = open_envelope(bytes, fb::Message::SnapshotMsg);
        if (!env) return std::unexpected(env.error());

        auto const* sm = (*env)->message_as_SnapshotMsg();
        if (!sm) return std::unexpected(ParseError{"empty message"});
        auto const* view = sm->view();
        if (!view) return std::unexpected(ParseError{"snapshot without a view"});

        uno::core::HandSnapshot s{};
        s.seat = view->seat();
        s.n_players = view->n_players();
        s.dealer = view->dealer();
        s.player_in_turn = to_seat(view->player_in_turn());
        s.previous_player = to_seat(view->previous_player());
        s.direction = view->direction();

        auto top = from_fb_card(view->top());
        if (!top) return std::unexpected(top.error());
        s.top = *top;

        std::optional<uno::core::Color> const color = FromFbColor(view->current_color());
        if (!color) return std::unexpected(ParseError{"unknown current color"});
        s.current_color = *color;

        if (auto const* v = view->my_hand())
        {
            s.my_hand.reserve(v->size());
            for (auto const* fb_c : *v)
            {
                auto c = from_fb_card(fb_c);
                if (!c) return std::unexpected(c.error());
                s.my_hand.push_back(*c);
            }
        }
        if (auto const* v = view->other_counts())
            s.other_counts.assign(v->begin(), v->end());
        if (auto const* v = view->uno_calls())
        {
            for (uint8_t const b : *v) s.uno_calls.push_back(b != 0);
        }

        s.draw_pile_size = view->draw_pile_size();
        s.discard_pile_size = view->discard_pile_size();
        s.accusation_window_open = view->accusation_window_open();
        s.ended = view->ended();
        return s;
    }

    auto DecodeViolation(std::span<std::byte const> bytes)
        -> std::expected<DecodedViolation, ParseError>
    {
        auto env = open_envelope(bytes, fb::Message::Violation);
        if (!env) return std::unexpected(env.error());

        auto const* vio = (*env)->message_as_Violation();
        if (!vio) return std::unexpected(ParseError{"empty message"});
        DecodedViolation out{};
        out.msg_id = vio->msg_id();
        if (vio->error_code() >= 0 && vio->error_code() <= static_cast<int16_t>(uno::core::error::Code::Assertion))
            out.error = static_cast<uno::core::error::Code>(vio->error_code());
        if (vio->rule_code() >= 0 &&
            vio->rule_code() <= static_cast<int16_t>(uno::core::error::RuleViolationCode::Internal_Unreachable))
            out.rule = static_cast<uno::core::error::RuleViolationCode>(vio->rule_code());
        if (vio->message()) out.message = vio->message()->str();
        return out;
    }
}
