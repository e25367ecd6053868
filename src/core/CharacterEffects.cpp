//
// Created by Malik T on 05/10/2025.
//
// One rule per character card. Every CharacterId is listed in both switches
// so a new character cannot be added without deciding what it does here.

#include <format>
#include <string_view>
#include <utility>
#include "Abilities.hpp"
#include "ActionValidator.hpp"
#include "Log.hpp"

namespace shadow::core
{
    namespace
    {
        using RVC = error::RuleViolationCode;

        auto Fail(error::RuleViolation v, std::string why) -> ActivationOutcome
        {
            return ActivationOutcome{false, std::move(why), 0, std::move(v)};
        }

        // Failures reported by combat already carry their own violation.
        auto Fail(error::RuleViolation const& v) -> ActivationOutcome
        {
            return Fail(v, error::describe(v));
        }

        auto Pid(PlayerId const p) -> int
        {
            return static_cast<int>(p);
        }
    }

    auto AbilitySystem::RunPassive(Player& holder, TriggerContext const& ctx) -> std::optional<std::string>
    {
        switch (holder.Character())
        {
        case CharacterId::Catherine:
        {
            if (ctx.trigger != Trigger::OnTurnStart) return std::nullopt;
            int const healed = holder.Heal(1);
            return std::format("Stigmata heals {}", healed);
        }

        case CharacterId::Vampire:
        {
            if (ctx.trigger != Trigger::OnAttack || ctx.amount <= 0) return std::nullopt;
            int const healed = holder.Heal(2);
            return std::format("Suck Blood heals {}", healed);
        }

        case CharacterId::Werewolf:
        {
            if (ctx.trigger != Trigger::OnAttacked || !ctx.source) return std::nullopt;
            Player* attacker = session_.PlayerAt(*ctx.source);
            if (attacker == nullptr || attacker->Id() == holder.Id() || !attacker->IsAlive()) return std::nullopt;
            // No counter to a counter, and no counter while one is being resolved.
            if (holder.status.counterattacking || attacker->status.counterattacking) return std::nullopt;

            holder.status.counterattacking = true;
            CombatResult<RollOutcome> const roll = combat_.Attack(holder.Id(), attacker->Id());
            holder.status.counterattacking = false;

            if (!roll)
            {
                log::Warn("counterattack failed: {}", error::describe(roll.error()));
                return std::nullopt;
            }
            return std::format("Counterattack on P{} for {}", Pid(attacker->Id()), roll->damage);
        }

        case CharacterId::UltraSoul:
        {
            if (ctx.trigger != Trigger::OnTurnStart) return std::nullopt;
            for (Player const& p : session_.Players())
            {
                if (p.Id() == holder.Id() || !p.IsAlive() || p.Position() != ZoneId::UnderworldGate) continue;

                CombatResult<int> const dealt = combat_.ApplyDamage(holder.Id(), p.Id(), 3, DamageSource::Ability);
                if (!dealt) return std::nullopt;
                return std::format("Murder Ray deals {} to P{}", *dealt, Pid(p.Id()));
            }
            return std::nullopt;
        }

        case CharacterId::Bob:
        {
            if (ctx.trigger != Trigger::OnAttack || ctx.amount < 2 || !ctx.subject) return std::nullopt;
            Player* victim = session_.PlayerAt(*ctx.subject);
            if (victim == nullptr || victim->Id() == holder.Id()) return std::nullopt;

            std::optional<uint16_t> const card = StealOneEquipment(holder, *victim);
            if (!card) return std::nullopt;
            return std::format("Robbery takes card {} from P{}", *card, Pid(victim->Id()));
        }

        case CharacterId::Bryan:
        {
            if (ctx.trigger != Trigger::OnKill || !ctx.subject) return std::nullopt;
            Player const* victim = session_.PlayerAt(*ctx.subject);
            if (victim == nullptr || victim->HpMax() > 12) return std::nullopt;
            if (!RevealSelf(holder)) return std::nullopt;
            return std::format("My GOD!! reveals after killing P{}", Pid(victim->Id()));
        }

        case CharacterId::Daniel:
        {
            if (ctx.trigger != Trigger::OnCharacterDeath) return std::nullopt;
            if (!RevealSelf(holder)) return std::nullopt;
            return std::string{"Scream reveals Daniel"};
        }

        case CharacterId::Agnes:
        {
            if (ctx.trigger != Trigger::OnReveal || holder.status.capriccio) return std::nullopt;
            holder.status.capriccio = true;
            return std::string{"Capriccio turns to the left neighbour"};
        }

        // Actives, and the always-on traits read by combat and card resolution.
        case CharacterId::Emi:
        case CharacterId::Franklin:
        case CharacterId::George:
        case CharacterId::Ellen:
        case CharacterId::Fuka:
        case CharacterId::Gregor:
        case CharacterId::Unknown:
        case CharacterId::Valkyrie:
        case CharacterId::Wight:
        case CharacterId::Allie:
        case CharacterId::Charles:
        case CharacterId::David:
            log::Warn("{} has no passive effect for {}", to_string(holder.Character()), to_string(ctx.trigger));
            return std::nullopt;
        }

        log::Warn("no passive effect for character id {}", static_cast<int>(holder.Character()));
        return std::nullopt;
    }

    auto AbilitySystem::RunActive(Player& holder, std::span<PlayerId const> targets,
                                  std::optional<ZoneId> const zone) -> ActivationOutcome
    {
        // Exactly one living target other than the holder.
        PlayerId const me = holder.Id();
        auto single_target = [&]() -> Player*
        {
            if (targets.size() != 1) return nullptr;
            Player* t = session_.PlayerAt(targets.front());
            if (t == nullptr || t->Id() == me || !t->IsAlive()) return nullptr;
            return t;
        };
        auto no_targets = [&]() -> bool { return targets.empty(); };
        auto target_error = [&]() -> ActivationOutcome
        {
            if (targets.size() != 1)
                return Fail(error::Viol(RVC::Ability_BadTargetCount).with_actor(me)
                                .with_attempted(static_cast<uint8_t>(targets.size())),
                            std::format("needs exactly one target, got {}", targets.size()));
            return Fail(error::Viol(RVC::Ability_IllegalTarget).with_actor(me).with_target(targets.front()),
                        std::format("P{} is not a living target other than itself", Pid(targets.front())));
        };
        auto extra_targets = [&](std::string_view const ability) -> ActivationOutcome
        {
            return Fail(error::Viol(RVC::Ability_BadTargetCount).with_actor(me)
                            .with_attempted(static_cast<uint8_t>(targets.size())),
                        std::format("{} takes no targets", ability));
        };
        auto precondition = [&](std::string why) -> ActivationOutcome
        {
            return Fail(error::Viol(RVC::Ability_PreconditionFailed).with_actor(me), std::move(why));
        };

        switch (holder.Character())
        {
        case CharacterId::Emi:
        {
            if (!no_targets()) return extra_targets("Teleport");
            if (!zone) return precondition("Teleport needs a destination zone");
            if (session_.Current() != me || session_.PhaseNow() != Phase::Movement || session_.Progress().rolled)
                return precondition("Teleport replaces the movement roll");
            if (board::Distance(holder.Position(), *zone) != 1)
                return Fail(error::Viol(RVC::Ability_IllegalTarget).with_actor(me).with_zone(*zone),
                            std::format("{} is not adjacent", to_string(*zone)));

            holder.MoveTo(*zone);
            session_.Progress().rolled = true;
            session_.Progress().moved = true;
            return ActivationOutcome{true, std::format("Teleport to {}", to_string(*zone)), static_cast<int>(*zone)};
        }

        case CharacterId::Franklin:
        case CharacterId::George:
        {
            Player* t = single_target();
            if (t == nullptr) return target_error();
            bool const franklin = holder.Character() == CharacterId::Franklin;
            int const roll = franklin ? dice_.D6() : dice_.D4();

            CombatResult<int> const dealt = combat_.ApplyDamage(holder.Id(), t->Id(), roll, DamageSource::Ability);
            if (!dealt) return Fail(dealt.error());
            return ActivationOutcome{true, std::format("{} deals {} to P{}", franklin ? "Lightning" : "Demolish",
                                                       *dealt, Pid(t->Id())), *dealt};
        }

        case CharacterId::Ellen:
        {
            Player* t = single_target();
            if (t == nullptr) return target_error();
            t->DisableAbility();
            return ActivationOutcome{true, std::format("Chain of Forbidden Curse seals P{}", Pid(t->Id())), 0};
        }

        case CharacterId::Fuka:
        {
            Player* t = single_target();
            if (t == nullptr) return target_error();
            t->SetHp(t->HpMax() - 7);
            if (t->Hp() <= 0)
            {
                if (auto const died = combat_.ProcessDeath(t->Id(), holder.Id()); !died)
                    return Fail(died.error());
            }
            return ActivationOutcome{true, std::format("Dynamite Nurse sets P{} to 7 damage", Pid(t->Id())), t->Hp()};
        }

        case CharacterId::Gregor:
        {
            if (!no_targets()) return extra_targets("Ghostly Barrier");
            holder.status.damage_immune = true;
            return ActivationOutcome{true, "Ghostly Barrier until next turn", 0};
        }

        case CharacterId::Wight:
        {
            if (!no_targets()) return extra_targets("Multiplication");
            auto const dead = static_cast<int>(session_.DeadCount());
            if (dead == 0) return precondition("Multiplication needs at least one dead character");
            session_.GrantExtraTurns(static_cast<uint8_t>(dead));
            return ActivationOutcome{true, std::format("Multiplication grants {} extra turns", dead), dead};
        }

        case CharacterId::Allie:
        {
            if (!no_targets()) return extra_targets("Mother's Love");
            int const healed = holder.Heal(holder.HpMax());
            return ActivationOutcome{true, std::format("Mother's Love heals {}", healed), healed};
        }

        case CharacterId::Charles:
        {
            Player* t = single_target();
            if (t == nullptr) return target_error();
            if (session_.Current() != me || !session_.Progress().attacked)
                return precondition("Bloody Feast follows an attack this turn");
            if (holder.Hp() <= 2)
                return precondition("Bloody Feast would be fatal");
            if (!validator::IsLegalTarget(session_, me, t->Id()))
                return Fail(error::Viol(RVC::Ability_IllegalTarget).with_actor(me).with_target(t->Id()),
                            std::format("P{} is out of reach", Pid(t->Id())));

            if (auto const cost = combat_.ApplyDamage(holder.Id(), holder.Id(), 2, DamageSource::SelfCost); !cost)
                return Fail(cost.error());
            CombatResult<RollOutcome> const roll = combat_.Attack(holder.Id(), t->Id());
            if (!roll) return Fail(roll.error());
            return ActivationOutcome{true, std::format("Bloody Feast attacks P{} again for {}", Pid(t->Id()),
                                                       roll->damage), roll->damage};
        }

        case CharacterId::David:
        {
            if (!no_targets()) return extra_targets("Grave Digger");
            auto relic = [](Card const& c) { return c.type == CardType::Equipment && IsHolyRelic(c.key); };
            auto any_equipment = [](Card const& c) { return c.type == CardType::Equipment; };

            CardSP card = session_.DeckOf(DeckKind::Light).TakeFromDiscard(relic);
            if (!card) card = session_.DeckOf(DeckKind::Light).TakeFromDiscard(any_equipment);
            if (!card) card = session_.DeckOf(DeckKind::Dark).TakeFromDiscard(any_equipment);
            if (!card) return precondition("Grave Digger found no equipment in the discard piles");

            uint16_t const id = card->id;
            std::string desc = std::format("Grave Digger takes {}", card->name);
            holder.Equipment().push_back(std::move(card));
            bus_.Publish(EquipmentChanged{holder.Id(), id, true});
            return ActivationOutcome{true, std::move(desc), id};
        }

        // Passives and statics; CanActivate keeps these from getting here.
        case CharacterId::Unknown:
        case CharacterId::Vampire:
        case CharacterId::Werewolf:
        case CharacterId::UltraSoul:
        case CharacterId::Valkyrie:
        case CharacterId::Agnes:
        case CharacterId::Bob:
        case CharacterId::Bryan:
        case CharacterId::Catherine:
        case CharacterId::Daniel:
            return Fail(error::Viol(RVC::Ability_NotActive).with_actor(me),
                        std::format("{} has no active ability", to_string(holder.Character())));
        }

        log::Warn("no active effect for character id {}", static_cast<int>(holder.Character()));
        return Fail(error::Viol(RVC::Internal_Unreachable).with_actor(me), "unknown character");
    }
}
