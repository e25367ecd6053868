//
// Created by Malik T on 21/08/2025.
//
#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fbn = shadow::gen::net;

namespace shadow::core::net
{
    auto ToFbPhase(Phase p) noexcept -> fbn::Phase
    {
        switch (p)
        {
        case Phase::Movement: return fbn::Phase::Movement;
        case Phase::Action: return fbn::Phase::Action;
        case Phase::End: return fbn::Phase::End;
        }
        return fbn::Phase::Movement;
    }

    auto FromFbPhase(fbn::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case fbn::Phase::Movement: return Phase::Movement;
        case fbn::Phase::Action: return Phase::Action;
        case fbn::Phase::End: return Phase::End;
        }
        return Phase::Movement;
    }

    auto ToFbZone(ZoneId z) noexcept -> fbn::ZoneId
    {
        switch (z)
        {
        case ZoneId::HermitsCabin: return fbn::ZoneId::HermitsCabin;
        case ZoneId::UnderworldGate: return fbn::ZoneId::UnderworldGate;
        case ZoneId::Church: return fbn::ZoneId::Church;
        case ZoneId::Cemetery: return fbn::ZoneId::Cemetery;
        case ZoneId::WeirdWoods: return fbn::ZoneId::WeirdWoods;
        case ZoneId::ErstwhileAltar: return fbn::ZoneId::ErstwhileAltar;
        }
        return fbn::ZoneId::HermitsCabin;
    }

    // Out-of-range wire values pass through so the validator reports them.
    auto FromFbZone(fbn::ZoneId z) noexcept -> ZoneId
    {
        switch (z)
        {
        case fbn::ZoneId::HermitsCabin: return ZoneId::HermitsCabin;
        case fbn::ZoneId::UnderworldGate: return ZoneId::UnderworldGate;
        case fbn::ZoneId::Church: return ZoneId::Church;
        case fbn::ZoneId::Cemetery: return ZoneId::Cemetery;
        case fbn::ZoneId::WeirdWoods: return ZoneId::WeirdWoods;
        case fbn::ZoneId::ErstwhileAltar: return ZoneId::ErstwhileAltar;
        }
        return static_cast<ZoneId>(z);
    }

    auto ToFbDeck(DeckKind d) noexcept -> fbn::DeckKind
    {
        switch (d)
        {
        case DeckKind::Light: return fbn::DeckKind::Light;
        case DeckKind::Dark: return fbn::DeckKind::Dark;
        case DeckKind::Vision: return fbn::DeckKind::Vision;
        }
        return fbn::DeckKind::Light;
    }

    auto FromFbDeck(fbn::DeckKind d) noexcept -> DeckKind
    {
        switch (d)
        {
        case fbn::DeckKind::Light: return DeckKind::Light;
        case fbn::DeckKind::Dark: return DeckKind::Dark;
        case fbn::DeckKind::Vision: return DeckKind::Vision;
        }
        return static_cast<DeckKind>(d);
    }

    auto ToFbFaction(Faction f) noexcept -> fbn::Faction
    {
        switch (f)
        {
        case Faction::Hunter: return fbn::Faction::Hunter;
        case Faction::Shadow: return fbn::Faction::Shadow;
        case Faction::Neutral: return fbn::Faction::Neutral;
        }
        return fbn::Faction::Neutral;
    }

    auto FromFbFaction(fbn::Faction f) noexcept -> Faction
    {
        switch (f)
        {
        case fbn::Faction::Hunter: return Faction::Hunter;
        case fbn::Faction::Shadow: return Faction::Shadow;
        case fbn::Faction::Neutral: return Faction::Neutral;
        }
        return Faction::Neutral;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)shadow::core::ZoneId::ErstwhileAltar == (int)fbn::ZoneId::ErstwhileAltar);
    static_assert((int)shadow::core::DeckKind::Vision == (int)fbn::DeckKind::Vision);
    static_assert((int)shadow::core::Phase::End == (int)fbn::Phase::End);
    static_assert((int)shadow::core::Faction::Neutral == (int)fbn::Faction::Neutral);
    static_assert((int)shadow::core::SessionStatus::Stalled == (int)fbn::SessionStatus::Stalled);

    auto ToFbChoice(shadow::core::ZoneChoice c) noexcept -> fbn::ZoneChoice
    {
        switch (c)
        {
        case shadow::core::ZoneChoice::Damage: return fbn::ZoneChoice::Damage;
        case shadow::core::ZoneChoice::Heal: return fbn::ZoneChoice::Heal;
        case shadow::core::ZoneChoice::Steal: return fbn::ZoneChoice::Steal;
        }
        return fbn::ZoneChoice::Damage;
    }

    auto FromFbChoice(fbn::ZoneChoice c) noexcept -> shadow::core::ZoneChoice
    {
        switch (c)
        {
        case fbn::ZoneChoice::Damage: return shadow::core::ZoneChoice::Damage;
        case fbn::ZoneChoice::Heal: return shadow::core::ZoneChoice::Heal;
        case fbn::ZoneChoice::Steal: return shadow::core::ZoneChoice::Steal;
        }
        return static_cast<shadow::core::ZoneChoice>(c);
    }

    auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, std::vector<shadow::core::CardWP> const& cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fbn::CardInfo>>>
    {
        std::vector<flatbuffers::Offset<fbn::CardInfo>> out;
        out.reserve(cards.size());
        for (shadow::core::CardWP const& w : cards)
        {
            if (auto const sp = w.lock())
            {
                auto const name = fbb.CreateString(sp->name.data(), sp->name.size());
                out.push_back(fbn::CreateCardInfo(fbb, sp->id, static_cast<uint8_t>(sp->key), name,
                                                  shadow::core::net::ToFbDeck(sp->deck)));
            }
        }
        return fbb.CreateVector(out);
    }

    template <typename T>
    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fbn::Message type, flatbuffers::Offset<T> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, type, msg.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    template <typename T>
    auto FinishAction(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id, fbn::Action type,
                      flatbuffers::Offset<T> act) -> flatbuffers::DetachedBuffer
    {
        auto const pam = fbn::CreatePlayerActionMsg(fbb, msg_id, type, act.Union());
        return Finish(fbb, fbn::Message::PlayerActionMsg, pam);
    }
} // anonymous

namespace shadow::core::net
{
    // ---------- Snapshot (server -> client) ----------

    auto BuildSnapshot(GameSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbn::PlayerView>> views;
        views.reserve(snap.players.size());
        for (PlayerView const& p : snap.players)
        {
            auto const name = fbb.CreateString(p.name);
            auto const equipment = ToFbCards(fbb, p.equipment);
            bool const identity = p.character.has_value() && p.faction.has_value();

            views.push_back(fbn::CreatePlayerView(
                fbb,
                /*id*/ p.id,
                /*name*/ name,
                /*is_bot*/ p.is_bot,
                /*hp*/ p.hp,
                /*hp_max*/ p.hp_max,
                /*alive*/ p.alive,
                /*revealed*/ p.revealed,
                /*has_position*/ p.position.has_value(),
                /*position*/ p.position ? ToFbZone(*p.position) : fbn::ZoneId::HermitsCabin,
                /*equipment*/ equipment,
                /*hand_count*/ p.hand_count,
                /*has_identity*/ identity,
                /*character*/ identity ? static_cast<uint8_t>(*p.character) : uint8_t{0},
                /*faction*/ identity ? ToFbFaction(*p.faction) : fbn::Faction::Hunter,
                /*ability_used*/ p.ability_used,
                /*ability_disabled*/ p.ability_disabled
            ));
        }
        auto const players_vec = fbb.CreateVector(views);
        auto const hand_vec = ToFbCards(fbb, snap.my_hand);
        auto const winners_vec = fbb.CreateVector(snap.winners);

        auto const view = fbn::CreateSeatView(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*seat*/ snap.seat,
            /*n_players*/ snap.n_players,
            /*phase*/ ToFbPhase(snap.phase),
            /*current*/ snap.current,
            /*turn*/ snap.turn,
            /*status*/ static_cast<fbn::SessionStatus>(snap.status),
            /*players*/ players_vec,
            /*my_hand*/ hand_vec,
            /*rolled*/ snap.rolled,
            /*has_roll*/ snap.movement_roll.has_value(),
            /*movement_roll*/ snap.movement_roll.value_or(0),
            /*moved*/ snap.moved,
            /*drawn*/ snap.drawn,
            /*attacked*/ snap.attacked,
            /*zone_used*/ snap.zone_used,
            /*has_winning_faction*/ snap.winning_faction.has_value(),
            /*winning_faction*/ snap.winning_faction ? ToFbFaction(*snap.winning_faction) : fbn::Faction::Hunter,
            /*winners*/ winners_vec
        );

        auto const sm = fbn::CreateSnapshotMsg(fbb, msg_id, view);
        return Finish(fbb, fbn::Message::SnapshotMsg, sm);
    }

    auto BuildSnapshot(GameImpl const& g, PlayerId seat, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        return BuildSnapshot(*g.SnapshotFor(seat), msg_id);
    }

    // ---------- Event / violation (server -> client) ----------

    auto BuildEvent(GameEvent const& ev, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(to_string(ev));
        auto const em = fbn::CreateEventMsg(fbb, msg_id, static_cast<uint8_t>(ev.index()), txt);
        return Finish(fbb, fbn::Message::EventMsg, em);
    }

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fbn::CreateViolation(fbb, msg_id, static_cast<int16_t>(v.code), txt);
        return Finish(fbb, fbn::Message::Violation, vio);
    }

    // ---------- Builders (client -> server) ----------

    auto BuildAction(PlayerId actor, PlayerAction const& action, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollMoveAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_RollMove, fbn::CreateAction_RollMove(fbb, actor));
            else if constexpr (std::is_same_v<T, MoveAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_Move,
                                    fbn::CreateAction_Move(fbb, actor, ToFbZone(act.zone)));
            else if constexpr (std::is_same_v<T, DrawAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_Draw,
                                    fbn::CreateAction_Draw(fbb, actor, ToFbDeck(act.deck)));
            else if constexpr (std::is_same_v<T, AttackAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_Attack,
                                    fbn::CreateAction_Attack(fbb, actor, act.target));
            else if constexpr (std::is_same_v<T, EndTurnAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_EndTurn, fbn::CreateAction_EndTurn(fbb, actor));
            else if constexpr (std::is_same_v<T, ActivateAbilityAction>)
            {
                auto const targets = fbb.CreateVector(act.targets);
                return FinishAction(fbb, msg_id, fbn::Action::Action_Activate,
                                    fbn::CreateAction_Activate(fbb, actor, targets, act.zone.has_value(),
                                                               act.zone ? ToFbZone(*act.zone)
                                                                        : fbn::ZoneId::HermitsCabin));
            }
            else if constexpr (std::is_same_v<T, RevealAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_Reveal, fbn::CreateAction_Reveal(fbb, actor));
            else if constexpr (std::is_same_v<T, GiveVisionAction>)
                return FinishAction(fbb, msg_id, fbn::Action::Action_GiveVision,
                                    fbn::CreateAction_GiveVision(fbb, actor, act.card_id, act.target));
            else
                return FinishAction(fbb, msg_id, fbn::Action::Action_UseZone,
                                    fbn::CreateAction_UseZone(fbb, actor, act.target, ToFbChoice(act.choice)));
        }, action);
    }

    // ---------- Decode (server <- inbound wire) ----------

    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* raw = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(raw, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fbn::GetEnvelope(raw);
        if (env->message_type() != fbn::Message::PlayerActionMsg)
            return std::unexpected(ParseError{"not a PlayerActionMsg"});

        auto const* pam = env->message_as_PlayerActionMsg();
        if (pam == nullptr || pam->action() == nullptr)
            return std::unexpected(ParseError{"PlayerActionMsg without an action"});
        DecodedAction out{};

        switch (pam->action_type())
        {
        case fbn::Action::Action_RollMove:
            out.actor = pam->action_as_Action_RollMove()->actor();
            out.action = RollMoveAction{};
            return out;

        case fbn::Action::Action_Move:
        {
            auto const* m = pam->action_as_Action_Move();
            out.actor = m->actor();
            out.action = MoveAction{FromFbZone(m->zone())};
            return out;
        }

        case fbn::Action::Action_Draw:
        {
            auto const* d = pam->action_as_Action_Draw();
            out.actor = d->actor();
            out.action = DrawAction{FromFbDeck(d->deck())};
            return out;
        }

        case fbn::Action::Action_Attack:
        {
            auto const* a = pam->action_as_Action_Attack();
            out.actor = a->actor();
            out.action = AttackAction{a->target()};
            return out;
        }

        case fbn::Action::Action_EndTurn:
            out.actor = pam->action_as_Action_EndTurn()->actor();
            out.action = EndTurnAction{};
            return out;

        case fbn::Action::Action_Activate:
        {
            auto const* a = pam->action_as_Action_Activate();
            out.actor = a->actor();

            ActivateAbilityAction act{};
            if (auto const* v = a->targets())
            {
                act.targets.assign(v->begin(), v->end());
            }
            if (a->has_zone()) act.zone = FromFbZone(a->zone());
            out.action = std::move(act);
            return out;
        }

        case fbn::Action::Action_Reveal:
            out.actor = pam->action_as_Action_Reveal()->actor();
            out.action = RevealAction{};
            return out;

        case fbn::Action::Action_GiveVision:
        {
            auto const* g = pam->action_as_Action_GiveVision();
            out.actor = g->actor();
            out.action = GiveVisionAction{g->card_id(), g->target()};
            return out;
        }

        case fbn::Action::Action_UseZone:
        {
            auto const* u = pam->action_as_Action_UseZone();
            out.actor = u->actor();
            out.action = UseZoneAction{u->target(), FromFbChoice(u->choice())};
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown action variant"});
        }
    }
} // namespace shadow::core::net
