//
// Created by Malik T on 04/10/2025.
//

#include "Combat.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>
#include "Log.hpp"

namespace shadow::core
{
    CombatResolver::CombatResolver(GameSession& session, EventBus& bus, Dice& dice) :
        session_(session),
        bus_(bus),
        dice_(dice)
    {
    }

    auto CombatResolver::IsNoMiss(Player const& p) -> bool
    {
        bool const valkyrie = p.Character() == CharacterId::Valkyrie &&
                              p.Ability().kind == AbilityKind::Static &&
                              p.IsRevealed() && !p.AbilityDisabled();
        return valkyrie || p.HasEquipment(EffectKind::ForcedSingleDie);
    }

    auto CombatResolver::MissingPlayer(PlayerId const id) const -> error::RuleViolation
    {
        log::Warn("combat: no player with id {}", static_cast<int>(id));
        return error::Viol(error::RuleViolationCode::InvalidReference).with_target(id);
    }

    auto CombatResolver::RollAttack(PlayerId const attacker, PlayerId const target) -> CombatResult<RollOutcome>
    {
        Player const* a = session_.PlayerAt(attacker);
        Player const* t = session_.PlayerAt(target);
        if (a == nullptr) return std::unexpected(MissingPlayer(attacker));
        if (t == nullptr) return std::unexpected(MissingPlayer(target));

        RollOutcome out{};
        out.d6 = dice_.D6();
        out.d4 = dice_.D4();

        if (t->Hp() <= 0 || !t->IsAlive())
        {
            out.target_down = true;
            return out;
        }

        if (IsNoMiss(*a))
        {
            out.single_die = true;
            out.base = out.d4;
        }
        else if (out.d6 == out.d4)
        {
            out.miss = true;
            return out;
        }
        else
        {
            out.base = std::abs(out.d6 - out.d4);
        }

        out.damage = std::max(1, out.base + a->AttackBonus() - t->DefenseBonus());
        return out;
    }

    auto CombatResolver::ApplyDamage(std::optional<PlayerId> const attacker, PlayerId const target,
                                     int const amount, DamageSource const source) -> CombatResult<int>
    {
        Player* t = session_.PlayerAt(target);
        if (t == nullptr) return std::unexpected(MissingPlayer(target));
        if (attacker && session_.PlayerAt(*attacker) == nullptr) return std::unexpected(MissingPlayer(*attacker));

        if (amount <= 0 || !t->IsAlive()) return 0;

        // Self-inflicted costs ignore protection.
        if (source != DamageSource::SelfCost)
        {
            if (t->status.shielded)
            {
                t->status.shielded = false;
                log::Debug("P{} shield absorbed {} damage", static_cast<int>(target), amount);
                return 0;
            }
            if (t->status.damage_immune)
            {
                log::Debug("P{} is immune, {} damage ignored", static_cast<int>(target), amount);
                return 0;
            }
        }

        int const dealt = t->Wound(amount);
        bus_.Publish(DamageDealt{attacker, target, dealt, source});

        if (t->Hp() <= 0 && t->IsAlive())
        {
            std::optional<PlayerId> const killer = (attacker && *attacker != target) ? attacker : std::nullopt;
            if (auto const died = ProcessDeath(target, killer); !died) return std::unexpected(died.error());
        }
        return dealt;
    }

    auto CombatResolver::ProcessDeath(PlayerId const victim, std::optional<PlayerId> const killer) -> CombatResult<bool>
    {
        Player* v = session_.PlayerAt(victim);
        if (v == nullptr) return std::unexpected(MissingPlayer(victim));
        Player* k = killer ? session_.PlayerAt(*killer) : nullptr;
        if (killer && k == nullptr) return std::unexpected(MissingPlayer(*killer));

        if (!v->IsAlive()) return false;
        v->MarkDead();

        if (k != nullptr && k->IsAlive())
        {
            Card const* rosary = k->EquipmentFor(EffectKind::StealOnKill);
            if (rosary != nullptr && RestrictionMatches(rosary->effect, k->Alignment()))
            {
                std::vector<CardSP> loot = std::exchange(v->Equipment(), {});
                for (CardSP& c : loot)
                {
                    uint16_t const id = c->id;
                    k->Equipment().push_back(std::move(c));
                    bus_.Publish(EquipmentChanged{victim, id, false});
                    bus_.Publish(EquipmentChanged{*killer, id, true});
                }
            }
        }

        CharacterInfo const* info = FindCharacter(v->Character());
        bus_.Publish(CharacterRevealed{victim, v->Character(), v->Alignment(),
                                       info != nullptr ? info->ability.name : std::string_view{}});
        bus_.Publish(PlayerDied{victim, killer});
        return true;
    }

    auto CombatResolver::Attack(PlayerId const attacker, PlayerId const target) -> CombatResult<RollOutcome>
    {
        CombatResult<RollOutcome> roll = RollAttack(attacker, target);
        if (!roll) return roll;

        if (roll->damage > 0)
        {
            CombatResult<int> const dealt = ApplyDamage(attacker, target, roll->damage, DamageSource::Attack);
            if (!dealt) return std::unexpected(dealt.error());
        }
        return roll;
    }
}
