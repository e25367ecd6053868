//
// Created by Malik T on 10/10/2025.
//

#include <gtest/gtest.h>

#include "../core/CardEffects.hpp"
#include "TestSupport.hpp"

using namespace shadow::core;
using shadow::test::MakeCard;
using shadow::test::Rig;

namespace
{
    struct CardRig : Rig
    {
        using Rig::Rig;
        CardResolver cards{session, bus, combat, dice};
    };

    auto Instant(CardKey key, EffectKind kind, int value, std::optional<Faction> only = std::nullopt,
                 DeckKind deck = DeckKind::Light) -> CardSP
    {
        return MakeCard(key, CardType::Instant, CardEffect{kind, value, only}, deck);
    }

    auto Vision(CardKey key, EffectKind kind, int value, std::optional<Faction> only = std::nullopt) -> CardSP
    {
        return MakeCard(key, CardType::Vision, CardEffect{kind, value, only}, DeckKind::Vision);
    }
}

TEST(Cards, HolyWaterHealsAndIsDiscarded)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(0).SetHp(5);

    auto const res = r.cards.Resolve(0, Instant(CardKey::HolyWaterOfHealing, EffectKind::Heal, 2));
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->applied);
    EXPECT_EQ(r.P(0).Hp(), 7);
    EXPECT_EQ(r.session.DeckOf(DeckKind::Light).DiscardSize(), 1u);
}

TEST(Cards, AdventOnlyAnswersHunters)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(0).SetHp(3);
    r.P(1).SetHp(3);

    auto const hunter = r.cards.Resolve(0, Instant(CardKey::Advent, EffectKind::RevealAndHealFull, 0, Faction::Hunter));
    ASSERT_TRUE(hunter.has_value());
    EXPECT_TRUE(r.P(0).IsRevealed());
    EXPECT_EQ(r.P(0).Hp(), 10);
    EXPECT_EQ(r.Count<CharacterRevealed>(), 1u);

    auto const shadow = r.cards.Resolve(1, Instant(CardKey::Advent, EffectKind::RevealAndHealFull, 0, Faction::Hunter));
    ASSERT_TRUE(shadow.has_value());
    EXPECT_FALSE(shadow->applied);
    EXPECT_FALSE(r.P(1).IsRevealed());
    EXPECT_EQ(r.P(1).Hp(), 3);
}

TEST(Cards, GuardianAngelAndConcealedKnowledge)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    ASSERT_TRUE(r.cards.Resolve(0, Instant(CardKey::GuardianAngel, EffectKind::Shield, 0)).has_value());
    EXPECT_TRUE(r.P(0).status.shielded);

    ASSERT_TRUE(r.cards.Resolve(0, Instant(CardKey::ConcealedKnowledge, EffectKind::ExtraTurn, 1)).has_value());
    EXPECT_EQ(r.session.ExtraTurns(), 1);
}

TEST(Cards, FlareHitsEveryoneElse)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie};
    ASSERT_TRUE(r.cards.Resolve(0, Instant(CardKey::FlareOfJudgement, EffectKind::DamageOthers, 2)).has_value());
    EXPECT_EQ(r.P(0).Hp(), 10);
    EXPECT_EQ(r.P(1).Hp(), 9);
    EXPECT_EQ(r.P(2).Hp(), 6);
}

TEST(Cards, DynamiteSparesTalismanHolders)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie};
    shadow::test::Equip(r.P(2), CardKey::Talisman, EffectKind::Ward);
    r.P(1).MoveTo(ZoneId::HermitsCabin);
    // 3 lands on the Church, area 1.
    r.dice.PushD6(3);

    auto const res = r.cards.Resolve(0, Instant(CardKey::Dynamite, EffectKind::DamageArea, 3, std::nullopt,
                                                DeckKind::Dark));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->amount, 3);
    EXPECT_EQ(r.P(0).Hp(), 7);
    EXPECT_EQ(r.P(1).Hp(), 11);
    EXPECT_EQ(r.P(2).Hp(), 8);
    EXPECT_EQ(r.session.DeckOf(DeckKind::Dark).DiscardSize(), 1u);
}

TEST(Cards, EquipmentIsWornAndVisionsAreHeld)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    ASSERT_TRUE(r.cards.Resolve(0, MakeCard(CardKey::Chainsaw, CardType::Equipment,
                                            CardEffect{EffectKind::AttackBonus, 1, {}}, DeckKind::Dark)).has_value());
    EXPECT_EQ(r.P(0).Equipment().size(), 1u);
    EXPECT_EQ(r.P(0).AttackBonus(), 1);
    EXPECT_EQ(r.Count<EquipmentChanged>(), 1u);

    ASSERT_TRUE(r.cards.Resolve(0, Vision(CardKey::VisionShadowStrike, EffectKind::VisionDamage, 1, Faction::Shadow))
                .has_value());
    EXPECT_EQ(r.P(0).Hand().size(), 1u);
}

TEST(Cards, VisionStrikesOnlyItsFaction)
{
    CardRig r{CharacterId::Emi, CharacterId::Vampire, CharacterId::Allie};
    CardSP const strike = Vision(CardKey::VisionShadowStrike, EffectKind::VisionDamage, 1, Faction::Shadow);
    CardSP const miss = Vision(CardKey::VisionShadowStrike, EffectKind::VisionDamage, 1, Faction::Shadow);
    r.P(0).Hand().push_back(strike);
    r.P(0).Hand().push_back(miss);

    auto const hit = r.cards.GiveVision(0, strike->id, 1);
    ASSERT_TRUE(hit.has_value());
    EXPECT_TRUE(hit->applied);
    EXPECT_EQ(r.P(1).Hp(), 12);

    auto const none = r.cards.GiveVision(0, miss->id, 2);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->applied);
    EXPECT_EQ(r.P(2).Hp(), 8);

    EXPECT_TRUE(r.P(0).Hand().empty());
    EXPECT_EQ(r.session.DeckOf(DeckKind::Vision).DiscardSize(), 2u);

    auto const gone = r.cards.GiveVision(0, miss->id, 2);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, error::RuleViolationCode::Vision_CardNotInHand);
}

TEST(Cards, SupremeVisionHitsTheTough)
{
    CardRig r{CharacterId::Emi, CharacterId::Werewolf, CharacterId::Allie};
    CardSP const a = Vision(CardKey::VisionSupreme, EffectKind::VisionDamageIfTough, 2);
    CardSP const b = Vision(CardKey::VisionSupreme, EffectKind::VisionDamageIfTough, 2);
    r.P(0).Hand().push_back(a);
    r.P(0).Hand().push_back(b);

    ASSERT_TRUE(r.cards.GiveVision(0, a->id, 1).has_value());
    ASSERT_TRUE(r.cards.GiveVision(0, b->id, 2).has_value());
    EXPECT_EQ(r.P(1).Hp(), 12);
    EXPECT_EQ(r.P(2).Hp(), 8);
}

TEST(Cards, MercyHealsItsFaction)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(1).SetHp(5);
    CardSP const mercy = Vision(CardKey::VisionShadowMercy, EffectKind::VisionHeal, 1, Faction::Shadow);
    r.P(0).Hand().push_back(mercy);
    ASSERT_TRUE(r.cards.GiveVision(0, mercy->id, 1).has_value());
    EXPECT_EQ(r.P(1).Hp(), 6);
}

TEST(Cards, HiddenUnknownLiesToVisions)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(1).SetHp(5);
    CardSP const strike = Vision(CardKey::VisionShadowStrike, EffectKind::VisionDamage, 1, Faction::Shadow);
    CardSP const hunter_mercy = Vision(CardKey::VisionHunterMercy, EffectKind::VisionHeal, 1, Faction::Hunter);
    r.P(0).Hand().push_back(strike);
    r.P(0).Hand().push_back(hunter_mercy);

    auto const denied = r.cards.GiveVision(0, strike->id, 1);
    ASSERT_TRUE(denied.has_value());
    EXPECT_FALSE(denied->applied);
    EXPECT_NE(denied->description.find("denies"), std::string::npos);
    EXPECT_EQ(r.P(1).Hp(), 5);
    EXPECT_EQ(r.Count<DamageDealt>(), 0u);

    auto const claimed = r.cards.GiveVision(0, hunter_mercy->id, 1);
    ASSERT_TRUE(claimed.has_value());
    EXPECT_TRUE(claimed->applied);
    EXPECT_EQ(r.P(1).Hp(), 6);
    EXPECT_EQ(r.session.DeckOf(DeckKind::Vision).DiscardSize(), 2u);
}

TEST(Cards, SealedOrRevealedUnknownTellsTheTruth)
{
    {
        CardRig r{CharacterId::Emi, CharacterId::Unknown};
        r.P(1).DisableAbility();
        CardSP const strike = Vision(CardKey::VisionShadowStrike, EffectKind::VisionDamage, 1, Faction::Shadow);
        r.P(0).Hand().push_back(strike);
        auto const hit = r.cards.GiveVision(0, strike->id, 1);
        ASSERT_TRUE(hit.has_value());
        EXPECT_TRUE(hit->applied);
        EXPECT_EQ(r.P(1).Hp(), 10);
    }
    {
        CardRig r{CharacterId::Emi, CharacterId::Unknown};
        ASSERT_TRUE(r.P(1).Reveal());
        r.P(1).SetHp(5);
        CardSP const hunter_mercy = Vision(CardKey::VisionHunterMercy, EffectKind::VisionHeal, 1, Faction::Hunter);
        r.P(0).Hand().push_back(hunter_mercy);
        auto const none = r.cards.GiveVision(0, hunter_mercy->id, 1);
        ASSERT_TRUE(none.has_value());
        EXPECT_FALSE(none->applied);
        EXPECT_EQ(r.P(1).Hp(), 5);
    }
}

TEST(Zones, WeirdWoodsHurtsOrHeals)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(0).MoveTo(ZoneId::WeirdWoods);
    r.P(0).SetHp(6);

    ASSERT_TRUE(r.cards.UseZone(0, 1, ZoneChoice::Damage).has_value());
    EXPECT_EQ(r.P(1).Hp(), 9);
    ASSERT_TRUE(r.cards.UseZone(0, 0, ZoneChoice::Heal).has_value());
    EXPECT_EQ(r.P(0).Hp(), 7);
}

TEST(Zones, AltarTakesEquipment)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    r.P(0).MoveTo(ZoneId::ErstwhileAltar);

    auto const empty = r.cards.UseZone(0, 1, ZoneChoice::Steal);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error::RuleViolationCode::Zone_IllegalTarget);

    shadow::test::Equip(r.P(1), CardKey::Handgun, EffectKind::ExtendedRange);
    ASSERT_TRUE(r.cards.UseZone(0, 1, ZoneChoice::Steal).has_value());
    EXPECT_EQ(r.P(0).Equipment().size(), 1u);
    EXPECT_TRUE(r.P(1).Equipment().empty());
}

TEST(Zones, OrdinaryZoneHasNoPower)
{
    CardRig r{CharacterId::Emi, CharacterId::Unknown};
    auto const res = r.cards.UseZone(0, 1, ZoneChoice::Damage);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RuleViolationCode::Zone_NoPower);
}
