//
// Created by Malik T on 05/10/2025.
//

#include "Abilities.hpp"

#include <algorithm>
#include <utility>
#include "Log.hpp"

namespace shadow::core
{
    AbilitySystem::AbilitySystem(GameSession& session, EventBus& bus, CombatResolver& combat, Dice& dice) :
        session_(session),
        bus_(bus),
        combat_(combat),
        dice_(dice)
    {
        sub_ = bus_.Subscribe([this](GameEvent const& ev) { OnEvent(ev); }, Channel::Rules);
    }

    AbilitySystem::~AbilitySystem()
    {
        bus_.Unsubscribe(sub_);
    }

    auto AbilitySystem::Register(PlayerId const player) -> bool
    {
        Player const* p = session_.PlayerAt(player);
        if (p == nullptr)
        {
            log::Warn("ability registration for unknown player {}", static_cast<int>(player));
            return false;
        }

        AbilityDecl const& decl = p->Ability();
        if (decl.kind != AbilityKind::Passive) return false;

        std::optional<Trigger> const trigger = ParseTrigger(decl.trigger_key);
        if (!trigger || *trigger == Trigger::Manual)
        {
            log::Warn("P{} ({}): unknown passive trigger '{}', ability not registered",
                      static_cast<int>(player), to_string(p->Character()), decl.trigger_key);
            return false;
        }

        if (Find(player) != nullptr) return true;
        registry_.push_back(Registration{player, *trigger});
        return true;
    }

    auto AbilitySystem::Unregister(PlayerId const player) -> void
    {
        std::erase_if(registry_, [player](Registration const& r) { return r.player == player; });
    }

    auto AbilitySystem::RegisterAll() -> void
    {
        for (Player const& p : session_.Players())
        {
            (void)Register(p.Id());
        }
    }

    auto AbilitySystem::IsRegistered(PlayerId const player) const -> bool
    {
        return Find(player) != nullptr;
    }

    auto AbilitySystem::Find(PlayerId const player) const -> Registration const*
    {
        auto const it = std::ranges::find_if(registry_, [player](Registration const& r) { return r.player == player; });
        return it != std::end(registry_) ? &*it : nullptr;
    }

    auto AbilitySystem::CanFire(Player const& p, Trigger const t) const -> bool
    {
        if (p.AbilityDisabled()) return false;
        if (p.Ability().requires_reveal && !p.IsRevealed()) return false;
        // on_death is the one trigger whose holder is already down.
        if (t == Trigger::OnDeath) return true;
        return p.IsAlive() && p.Hp() > 0;
    }

    auto AbilitySystem::OnEvent(GameEvent const& ev) -> void
    {
        std::visit([&]<typename T0>(T0 const& e)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DamageDealt>)
            {
                OnDamage(e);
            }
            else if constexpr (std::is_same_v<T, PlayerDied>)
            {
                OnDeath(e);
            }
            else if constexpr (std::is_same_v<T, TurnStarted>)
            {
                Fire(e.player, TriggerContext{.trigger = Trigger::OnTurnStart});
            }
            else if constexpr (std::is_same_v<T, CharacterRevealed>)
            {
                Fire(e.player, TriggerContext{.trigger = Trigger::OnReveal});
            }
        }, ev);
    }

    auto AbilitySystem::OnDamage(DamageDealt const& e) -> void
    {
        if (e.source != DamageSource::Attack || !e.attacker) return;

        TriggerContext ctx{.trigger = Trigger::OnAttacked, .source = e.attacker, .subject = e.victim, .amount = e.amount};
        Fire(e.victim, ctx);

        ctx.trigger = Trigger::OnAttack;
        Fire(*e.attacker, ctx);
    }

    auto AbilitySystem::OnDeath(PlayerDied const& e) -> void
    {
        TriggerContext ctx{.trigger = Trigger::OnDeath, .source = e.killer, .subject = e.victim};
        Fire(e.victim, ctx);

        // From here on the victim no longer reacts to anything.
        Unregister(e.victim);

        if (e.killer)
        {
            ctx.trigger = Trigger::OnKill;
            Fire(*e.killer, ctx);
        }

        ctx.trigger = Trigger::OnCharacterDeath;
        std::vector<Registration> const listeners = registry_;
        for (Registration const& r : listeners)
        {
            if (r.trigger != Trigger::OnCharacterDeath || r.player == e.victim) continue;
            Fire(r.player, ctx);
        }
    }

    auto AbilitySystem::Fire(PlayerId const player, TriggerContext const& ctx) -> void
    {
        Registration const* reg = Find(player);
        if (reg == nullptr || reg->trigger != ctx.trigger) return;

        Player const* p = session_.PlayerAt(player);
        if (p == nullptr || !CanFire(*p, ctx.trigger)) return;

        (void)Execute(player, ctx);
    }

    auto AbilitySystem::Execute(PlayerId const player, TriggerContext const& ctx) -> bool
    {
        Player* p = session_.PlayerAt(player);
        if (p == nullptr)
        {
            log::Warn("ability execute for unknown player {}", static_cast<int>(player));
            return false;
        }

        std::optional<std::string> desc = RunPassive(*p, ctx);
        if (!desc) return false;

        log::Debug("P{} {} {}: {}", static_cast<int>(player), to_string(p->Character()), to_string(ctx.trigger), *desc);
        bus_.Publish(AbilityTriggered{player, p->Character(), ctx.trigger, std::move(*desc)});
        return true;
    }

    auto AbilitySystem::CanActivate(Player const& p) -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        AbilityDecl const& decl = p.Ability();

        if (decl.kind != AbilityKind::Active)
            return std::unexpected(error::Viol(RVC::Ability_NotActive).with_actor(p.Id()));
        if (p.AbilityDisabled())
            return std::unexpected(error::Viol(RVC::Ability_Disabled).with_actor(p.Id()));
        if (decl.usage == UsagePolicy::Once && p.AbilityUsed())
            return std::unexpected(error::Viol(RVC::Ability_AlreadyUsed).with_actor(p.Id()));
        if (decl.requires_reveal && !p.IsRevealed())
            return std::unexpected(error::Viol(RVC::Ability_RequiresReveal).with_actor(p.Id()));
        return {};
    }

    auto AbilitySystem::Activate(PlayerId const player, std::span<PlayerId const> targets,
                                 std::optional<ZoneId> const zone) -> ActivationOutcome
    {
        Player* p = session_.PlayerAt(player);
        if (p == nullptr)
        {
            log::Warn("activation for unknown player {}", static_cast<int>(player));
            return ActivationOutcome{false, "unknown player", 0,
                                     error::Viol(error::RuleViolationCode::InvalidReference).with_actor(player)};
        }

        ActivationOutcome out{};
        if (auto const ok = CanActivate(*p); !ok)
        {
            out.description = error::describe(ok.error());
            out.violation = ok.error();
        }
        else if (!p->IsAlive())
        {
            out.description = "holder is dead";
            out.violation = error::Viol(error::RuleViolationCode::Ability_PreconditionFailed).with_actor(player);
        }
        else
        {
            out = RunActive(*p, targets, zone);
            if (out.success && p->Ability().usage == UsagePolicy::Once)
                p->ConsumeAbility();
        }

        bus_.Publish(AbilityActivated{player, p->Character(), out.success, out.description, out.payload});
        return out;
    }

    auto AbilitySystem::RevealSelf(Player& p) -> bool
    {
        if (!p.Reveal()) return false;
        bus_.Publish(CharacterRevealed{p.Id(), p.Character(), p.Alignment(), p.Ability().name});
        return true;
    }

    auto AbilitySystem::StealOneEquipment(Player& thief, Player& victim) -> std::optional<uint16_t>
    {
        if (victim.Equipment().empty()) return std::nullopt;

        CardSP card = std::move(victim.Equipment().front());
        victim.Equipment().erase(std::begin(victim.Equipment()));
        uint16_t const id = card->id;
        thief.Equipment().push_back(std::move(card));

        bus_.Publish(EquipmentChanged{victim.Id(), id, false});
        bus_.Publish(EquipmentChanged{thief.Id(), id, true});
        return id;
    }
}
