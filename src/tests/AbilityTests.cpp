//
// Created by Malik T on 09/10/2025.
//

#include <gtest/gtest.h>
#include <array>

#include "TestSupport.hpp"

using namespace shadow::core;
using shadow::test::Rig;
using RVC = error::RuleViolationCode;

namespace
{
    auto NoTargets() -> std::span<PlayerId const>
    {
        return {};
    }
}

TEST(AbilityRegistry, OnlyPassivesWithKnownTriggersRegister)
{
    Rig r{CharacterId::Emi, CharacterId::Daniel, CharacterId::Catherine, CharacterId::Unknown};
    EXPECT_FALSE(r.abilities.IsRegistered(0));
    EXPECT_TRUE(r.abilities.IsRegistered(1));
    EXPECT_TRUE(r.abilities.IsRegistered(2));
    EXPECT_FALSE(r.abilities.IsRegistered(3));
    EXPECT_EQ(r.abilities.Registrations().size(), 2u);

    // Registering twice keeps one entry.
    EXPECT_TRUE(r.abilities.Register(1));
    EXPECT_EQ(r.abilities.Registrations().size(), 2u);
    EXPECT_FALSE(r.abilities.Register(9));
}

TEST(AbilityRegistry, TriggerKeys)
{
    EXPECT_EQ(ParseTrigger("on_kill"), std::optional<Trigger>{Trigger::OnKill});
    EXPECT_EQ(ParseTrigger("on_character_death"), std::optional<Trigger>{Trigger::OnCharacterDeath});
    EXPECT_FALSE(ParseTrigger("bogus").has_value());
    EXPECT_FALSE(ParseTrigger("").has_value());
}

TEST(Passive, CatherineHealsAtTurnStartOnceRevealed)
{
    Rig r{CharacterId::Catherine, CharacterId::Emi};
    r.P(0).SetHp(8);

    r.bus.Publish(TurnStarted{0, 1});
    EXPECT_EQ(r.P(0).Hp(), 8);

    r.P(0).Reveal();
    r.bus.Publish(TurnStarted{0, 1});
    EXPECT_EQ(r.P(0).Hp(), 9);
    EXPECT_EQ(r.Count<AbilityTriggered>(), 1u);

    r.P(0).SetHp(11);
    r.bus.Publish(TurnStarted{0, 2});
    EXPECT_EQ(r.P(0).Hp(), 11);
}

TEST(Passive, DeathCascadeRunsKillerBeforeBystanders)
{
    Rig r{CharacterId::Catherine, CharacterId::Bryan, CharacterId::Daniel, CharacterId::Emi};
    ASSERT_TRUE(r.abilities.IsRegistered(0));

    // Sampled when Bryan's passive reports, i.e. after the victim left the registry.
    std::optional<bool> victim_registered{};
    auto const tap = r.bus.Subscribe([&](GameEvent const& ev)
    {
        if (auto const* t = std::get_if<AbilityTriggered>(&ev); t != nullptr && t->trigger == Trigger::OnKill)
            victim_registered = r.abilities.IsRegistered(0);
    });

    ASSERT_TRUE(r.combat.ProcessDeath(0, PlayerId{1}).has_value());
    r.bus.Unsubscribe(tap);

    std::vector<AbilityTriggered> fired;
    size_t died_at{r.seen.size()};
    for (size_t i = 0; i < r.seen.size(); ++i)
    {
        if (std::holds_alternative<PlayerDied>(r.seen[i]) && died_at == r.seen.size()) died_at = i;
        if (auto const* t = std::get_if<AbilityTriggered>(&r.seen[i]))
        {
            EXPECT_GT(i, died_at);
            fired.push_back(*t);
        }
    }

    ASSERT_EQ(fired.size(), 2u);
    EXPECT_EQ(fired[0].player, 1);
    EXPECT_EQ(fired[0].trigger, Trigger::OnKill);
    EXPECT_EQ(fired[1].player, 2);
    EXPECT_EQ(fired[1].trigger, Trigger::OnCharacterDeath);
    ASSERT_TRUE(victim_registered.has_value());
    EXPECT_FALSE(*victim_registered);
    EXPECT_FALSE(r.abilities.IsRegistered(0));
}

TEST(Passive, DanielDoesNotScreamAtHisOwnDeath)
{
    Rig r{CharacterId::Daniel, CharacterId::Emi, CharacterId::Catherine};
    ASSERT_TRUE(r.abilities.IsRegistered(0));
    ASSERT_TRUE(r.combat.ProcessDeath(0, PlayerId{1}).has_value());
    EXPECT_FALSE(r.abilities.IsRegistered(0));
    EXPECT_EQ(r.Count<AbilityTriggered>(), 0u);
}

TEST(Passive, WerewolfCounterattacksOnce)
{
    Rig r{CharacterId::Emi, CharacterId::Werewolf};
    r.P(1).Reveal();
    r.dice.PushAttack(5, 2);
    r.dice.PushAttack(4, 1);

    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    EXPECT_EQ(r.P(1).Hp(), 11);
    EXPECT_EQ(r.P(0).Hp(), 7);
    EXPECT_FALSE(r.P(1).status.counterattacking);
    EXPECT_EQ(r.Count<DamageDealt>(), 2u);
}

TEST(Passive, HiddenWerewolfDoesNotCounter)
{
    Rig r{CharacterId::Emi, CharacterId::Werewolf};
    r.dice.PushAttack(5, 2);

    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    EXPECT_EQ(r.P(0).Hp(), 10);
    EXPECT_EQ(r.Count<AbilityTriggered>(), 0u);
}

TEST(Passive, VampireHealsAfterLandingAHit)
{
    Rig r{CharacterId::Vampire, CharacterId::Emi};
    r.P(0).Reveal();
    r.P(0).SetHp(10);
    r.dice.PushAttack(6, 3);

    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    EXPECT_EQ(r.P(1).Hp(), 7);
    EXPECT_EQ(r.P(0).Hp(), 12);

    // A miss heals nothing.
    r.dice.PushAttack(2, 2);
    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    EXPECT_EQ(r.P(0).Hp(), 12);
}

TEST(Passive, BobRobsOnAHeavyHit)
{
    Rig r{CharacterId::Bob, CharacterId::Emi};
    r.P(0).Reveal();
    shadow::test::Equip(r.P(1), CardKey::Talisman, EffectKind::Ward);
    shadow::test::Equip(r.P(1), CardKey::HolyRobe, EffectKind::DefenseBonus, 1);

    r.dice.PushAttack(2, 1);
    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    EXPECT_EQ(r.P(0).Equipment().size(), 0u);

    r.dice.PushAttack(6, 2);
    ASSERT_TRUE(r.combat.Attack(0, 1).has_value());
    ASSERT_EQ(r.P(0).Equipment().size(), 1u);
    EXPECT_EQ(r.P(0).Equipment().front()->key, CardKey::Talisman);
    EXPECT_EQ(r.P(1).Equipment().size(), 1u);
}

TEST(Passive, BryanRevealsAfterKillingASmallCharacter)
{
    Rig r{CharacterId::Bryan, CharacterId::Emi, CharacterId::Vampire};
    ASSERT_TRUE(r.combat.ProcessDeath(2, 0).has_value());
    EXPECT_FALSE(r.P(0).IsRevealed());

    ASSERT_TRUE(r.combat.ProcessDeath(1, 0).has_value());
    EXPECT_TRUE(r.P(0).IsRevealed());
}

TEST(Passive, DanielScreamsAtTheFirstDeath)
{
    Rig r{CharacterId::Daniel, CharacterId::Emi, CharacterId::Unknown};
    ASSERT_TRUE(r.combat.ProcessDeath(1, std::nullopt).has_value());
    EXPECT_TRUE(r.P(0).IsRevealed());
    EXPECT_EQ(r.Count<AbilityTriggered>(), 1u);
}

TEST(Passive, AgnesTurnsLeftWhenRevealed)
{
    Rig r{CharacterId::Agnes, CharacterId::Emi, CharacterId::Unknown};
    r.P(0).Reveal();
    r.bus.Publish(CharacterRevealed{0, CharacterId::Agnes, Faction::Neutral, "Capriccio"});
    EXPECT_TRUE(r.P(0).status.capriccio);
}

TEST(Passive, UltraSoulShootsTheGate)
{
    Rig r{CharacterId::UltraSoul, CharacterId::Emi, CharacterId::Allie};
    r.P(0).Reveal();
    r.P(2).MoveTo(ZoneId::UnderworldGate);

    r.bus.Publish(TurnStarted{0, 1});
    EXPECT_EQ(r.P(1).Hp(), 10);
    EXPECT_EQ(r.P(2).Hp(), 5);
}

TEST(Passive, DisabledHolderStaysQuiet)
{
    Rig r{CharacterId::Catherine, CharacterId::Emi};
    r.P(0).Reveal();
    r.P(0).SetHp(5);
    r.P(0).DisableAbility();

    r.bus.Publish(TurnStarted{0, 1});
    EXPECT_EQ(r.P(0).Hp(), 5);
}

TEST(Passive, ExecuteRunsTheEffectDirectly)
{
    Rig r{CharacterId::Catherine, CharacterId::Emi};
    r.P(0).SetHp(5);
    EXPECT_TRUE(r.abilities.Execute(0, TriggerContext{.trigger = Trigger::OnTurnStart}));
    EXPECT_EQ(r.P(0).Hp(), 6);
    EXPECT_FALSE(r.abilities.Execute(0, TriggerContext{.trigger = Trigger::OnKill}));
    EXPECT_FALSE(r.abilities.Execute(7, TriggerContext{.trigger = Trigger::OnTurnStart}));
}

TEST(Active, CanActivateIsReadOnly)
{
    Rig r{CharacterId::Gregor, CharacterId::Unknown};
    auto const first = AbilitySystem::CanActivate(r.P(0));
    auto const second = AbilitySystem::CanActivate(r.P(0));
    ASSERT_FALSE(first.has_value());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(first.error().code, RVC::Ability_RequiresReveal);
    EXPECT_EQ(second.error().code, RVC::Ability_RequiresReveal);

    auto const passive = AbilitySystem::CanActivate(r.P(1));
    ASSERT_FALSE(passive.has_value());
    EXPECT_EQ(passive.error().code, RVC::Ability_NotActive);
}

TEST(Active, GregorBarrierOncePerGame)
{
    Rig r{CharacterId::Gregor, CharacterId::Unknown};
    r.P(0).Reveal();

    ActivationOutcome const out = r.abilities.Activate(0, NoTargets());
    EXPECT_TRUE(out.success);
    EXPECT_TRUE(r.P(0).status.damage_immune);
    EXPECT_TRUE(r.P(0).AbilityUsed());

    ActivationOutcome const again = r.abilities.Activate(0, NoTargets());
    EXPECT_FALSE(again.success);
    auto const check = AbilitySystem::CanActivate(r.P(0));
    ASSERT_FALSE(check.has_value());
    EXPECT_EQ(check.error().code, RVC::Ability_AlreadyUsed);
    EXPECT_EQ(r.Count<AbilityActivated>(), 2u);
}

TEST(Active, FailedActivationKeepsTheOneUse)
{
    Rig r{CharacterId::Franklin, CharacterId::Unknown};
    r.P(0).Reveal();

    EXPECT_FALSE(r.abilities.Activate(0, NoTargets()).success);
    EXPECT_FALSE(r.P(0).AbilityUsed());

    r.dice.PushD6(5);
    std::array<PlayerId, 1> const target{1};
    ActivationOutcome const out = r.abilities.Activate(0, target);
    EXPECT_TRUE(out.success);
    EXPECT_EQ(out.payload, 5);
    EXPECT_EQ(r.P(1).Hp(), 6);
    EXPECT_TRUE(r.P(0).AbilityUsed());
}

TEST(Active, GeorgeUsesTheFourSidedDie)
{
    Rig r{CharacterId::George, CharacterId::Unknown};
    r.P(0).Reveal();
    r.dice.PushD4(3);
    std::array<PlayerId, 1> const target{1};
    EXPECT_TRUE(r.abilities.Activate(0, target).success);
    EXPECT_EQ(r.P(1).Hp(), 8);
}

TEST(Active, EllenSealsAnAbility)
{
    Rig r{CharacterId::Ellen, CharacterId::Vampire};
    r.P(0).Reveal();
    r.P(1).Reveal();
    r.P(1).SetHp(10);

    std::array<PlayerId, 1> const target{1};
    EXPECT_TRUE(r.abilities.Activate(0, target).success);
    EXPECT_TRUE(r.P(1).AbilityDisabled());

    r.dice.PushAttack(6, 3);
    ASSERT_TRUE(r.combat.Attack(1, 0).has_value());
    EXPECT_EQ(r.P(1).Hp(), 10);
}

TEST(Active, FukaSetsSevenDamage)
{
    Rig r{CharacterId::Fuka, CharacterId::Unknown};
    r.P(0).Reveal();
    std::array<PlayerId, 1> const target{1};
    EXPECT_TRUE(r.abilities.Activate(0, target).success);
    EXPECT_EQ(r.P(1).Hp(), 4);
    EXPECT_EQ(r.P(1).Damage(), 7);
}

TEST(Active, SelfIsNeverASingleTarget)
{
    Rig r{CharacterId::Ellen, CharacterId::Unknown};
    r.P(0).Reveal();
    std::array<PlayerId, 1> const self{0};
    EXPECT_FALSE(r.abilities.Activate(0, self).success);
    EXPECT_FALSE(r.P(0).AbilityDisabled());
}

TEST(Active, EmiTeleportsToAnAdjacentZone)
{
    Rig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(0).Reveal();

    EXPECT_FALSE(r.abilities.Activate(0, NoTargets(), ZoneId::HermitsCabin).success);
    ActivationOutcome const out = r.abilities.Activate(0, NoTargets(), ZoneId::Cemetery);
    EXPECT_TRUE(out.success);
    EXPECT_EQ(r.P(0).Position(), std::optional<ZoneId>{ZoneId::Cemetery});
    EXPECT_TRUE(r.session.Progress().moved);

    // The roll is spent now.
    EXPECT_FALSE(r.abilities.Activate(0, NoTargets(), ZoneId::WeirdWoods).success);
}

TEST(Active, WightNeedsTheDead)
{
    Rig r{CharacterId::Wight, CharacterId::Emi, CharacterId::Allie};
    r.P(0).Reveal();
    EXPECT_FALSE(r.abilities.Activate(0, NoTargets()).success);

    ASSERT_TRUE(r.combat.ProcessDeath(2, std::nullopt).has_value());
    ActivationOutcome const out = r.abilities.Activate(0, NoTargets());
    EXPECT_TRUE(out.success);
    EXPECT_EQ(r.session.ExtraTurns(), 1);
}

TEST(Active, AllieHealsFully)
{
    Rig r{CharacterId::Allie, CharacterId::Emi};
    r.P(0).Reveal();
    r.P(0).SetHp(2);
    ActivationOutcome const out = r.abilities.Activate(0, NoTargets());
    EXPECT_TRUE(out.success);
    EXPECT_EQ(out.payload, 6);
    EXPECT_EQ(r.P(0).Hp(), 8);
}

TEST(Active, CharlesPaysToAttackAgain)
{
    Rig r{CharacterId::Charles, CharacterId::Emi};
    r.P(0).Reveal();
    std::array<PlayerId, 1> const target{1};

    EXPECT_FALSE(r.abilities.Activate(0, target).success);

    r.session.Progress().attacked = true;
    r.dice.PushAttack(6, 1);
    ActivationOutcome const out = r.abilities.Activate(0, target);
    EXPECT_TRUE(out.success);
    EXPECT_EQ(r.P(0).Hp(), 9);
    EXPECT_EQ(r.P(1).Hp(), 5);
    EXPECT_FALSE(r.P(0).AbilityUsed());

    r.P(0).SetHp(2);
    EXPECT_FALSE(r.abilities.Activate(0, target).success);
    EXPECT_EQ(r.P(0).Hp(), 2);
}

TEST(Active, DavidDigsUpARelicFirst)
{
    Rig r{CharacterId::David, CharacterId::Emi};
    r.P(0).Reveal();

    EXPECT_FALSE(r.abilities.Activate(0, NoTargets()).success);

    Deck& light = r.session.DeckOf(DeckKind::Light);
    while (CardSP c = light.Draw(r.session.Rng())) light.Discard(std::move(c));

    ActivationOutcome const out = r.abilities.Activate(0, NoTargets());
    EXPECT_TRUE(out.success);
    ASSERT_EQ(r.P(0).Equipment().size(), 1u);
    EXPECT_TRUE(IsHolyRelic(r.P(0).Equipment().front()->key));
    EXPECT_EQ(r.Count<EquipmentChanged>(), 1u);
}

TEST(Active, FailuresCarryTheirViolation)
{
    Rig r{CharacterId::Franklin, CharacterId::Emi, CharacterId::Allie};
    r.P(0).Reveal();

    std::array<PlayerId, 2> const two{1, 2};
    ActivationOutcome const many = r.abilities.Activate(0, two);
    EXPECT_FALSE(many.success);
    ASSERT_TRUE(many.violation.has_value());
    EXPECT_EQ(many.violation->code, RVC::Ability_BadTargetCount);
    EXPECT_EQ(many.violation->attempted_count, std::optional<std::uint8_t>{2});

    ASSERT_TRUE(r.combat.ProcessDeath(2, std::nullopt).has_value());
    std::array<PlayerId, 1> const dead{2};
    ActivationOutcome const corpse = r.abilities.Activate(0, dead);
    ASSERT_TRUE(corpse.violation.has_value());
    EXPECT_EQ(corpse.violation->code, RVC::Ability_IllegalTarget);
    EXPECT_EQ(corpse.violation->target, std::optional<PlayerId>{2});
    EXPECT_FALSE(r.P(0).AbilityUsed());

    r.dice.PushD6(2);
    std::array<PlayerId, 1> const target{1};
    ActivationOutcome const ok = r.abilities.Activate(0, target);
    EXPECT_TRUE(ok.success);
    EXPECT_FALSE(ok.violation.has_value());

    ActivationOutcome const again = r.abilities.Activate(0, target);
    ASSERT_TRUE(again.violation.has_value());
    EXPECT_EQ(again.violation->code, RVC::Ability_AlreadyUsed);
}

TEST(Active, UnmetConditionsAreNotTargetErrors)
{
    {
        Rig r{CharacterId::Charles, CharacterId::Emi};
        r.P(0).Reveal();
        std::array<PlayerId, 1> const target{1};
        ActivationOutcome const out = r.abilities.Activate(0, target);
        ASSERT_TRUE(out.violation.has_value());
        EXPECT_EQ(out.violation->code, RVC::Ability_PreconditionFailed);
    }
    {
        Rig r{CharacterId::Emi, CharacterId::Allie};
        r.P(0).Reveal();
        ActivationOutcome const far = r.abilities.Activate(0, NoTargets(), ZoneId::HermitsCabin);
        ASSERT_TRUE(far.violation.has_value());
        EXPECT_EQ(far.violation->code, RVC::Ability_IllegalTarget);
        EXPECT_EQ(far.violation->zone, std::optional<ZoneId>{ZoneId::HermitsCabin});

        std::array<PlayerId, 1> const stray{1};
        ActivationOutcome const extra = r.abilities.Activate(0, stray, ZoneId::Cemetery);
        ASSERT_TRUE(extra.violation.has_value());
        EXPECT_EQ(extra.violation->code, RVC::Ability_BadTargetCount);
    }
    {
        Rig r{CharacterId::Valkyrie, CharacterId::Emi};
        ActivationOutcome const out = r.abilities.Activate(0, NoTargets());
        ASSERT_TRUE(out.violation.has_value());
        EXPECT_EQ(out.violation->code, RVC::Ability_NotActive);
    }
}
