//
// Created by Malik T on 02/10/2025.
//

#include "Card.hpp"

#include <array>

namespace shadow::core
{
    namespace
    {
        struct CardSpec
        {
            CardKey key;
            std::string_view name;
            DeckKind deck;
            CardType type;
            CardEffect effect;
            uint8_t copies;
        };

        constexpr std::array CatalogueSpecs{
            // Light
            CardSpec{CardKey::HolyWaterOfHealing, "Holy Water of Healing", DeckKind::Light, CardType::Instant,
                     {EffectKind::Heal, 2, {}}, 2},
            CardSpec{CardKey::Advent, "Advent", DeckKind::Light, CardType::Instant,
                     {EffectKind::RevealAndHealFull, 0, Faction::Hunter}, 1},
            CardSpec{CardKey::GuardianAngel, "Guardian Angel", DeckKind::Light, CardType::Instant,
                     {EffectKind::Shield, 0, {}}, 1},
            CardSpec{CardKey::ConcealedKnowledge, "Concealed Knowledge", DeckKind::Light, CardType::Instant,
                     {EffectKind::ExtraTurn, 1, {}}, 1},
            CardSpec{CardKey::FlareOfJudgement, "Flare of Judgement", DeckKind::Light, CardType::Instant,
                     {EffectKind::DamageOthers, 2, {}}, 1},
            CardSpec{CardKey::HolyRobe, "Holy Robe", DeckKind::Light, CardType::Equipment,
                     {EffectKind::DefenseBonus, 1, {}}, 1},
            CardSpec{CardKey::Talisman, "Talisman", DeckKind::Light, CardType::Equipment,
                     {EffectKind::Ward, 0, {}}, 1},
            CardSpec{CardKey::SilverRosary, "Silver Rosary", DeckKind::Light, CardType::Equipment,
                     {EffectKind::StealOnKill, 0, {}}, 1},
            CardSpec{CardKey::SpearOfLonginus, "Spear of Longinus", DeckKind::Light, CardType::Equipment,
                     {EffectKind::AttackBonus, 2, Faction::Hunter}, 1},
            // Dark
            CardSpec{CardKey::Dynamite, "Dynamite", DeckKind::Dark, CardType::Instant,
                     {EffectKind::DamageArea, 3, {}}, 2},
            CardSpec{CardKey::DiabolicRitual, "Diabolic Ritual", DeckKind::Dark, CardType::Instant,
                     {EffectKind::RevealAndHealFull, 0, Faction::Shadow}, 1},
            CardSpec{CardKey::Chainsaw, "Chainsaw", DeckKind::Dark, CardType::Equipment,
                     {EffectKind::AttackBonus, 1, {}}, 1},
            CardSpec{CardKey::ButcherKnife, "Butcher Knife", DeckKind::Dark, CardType::Equipment,
                     {EffectKind::AttackBonus, 1, {}}, 1},
            CardSpec{CardKey::RustedBroadAxe, "Rusted Broad Axe", DeckKind::Dark, CardType::Equipment,
                     {EffectKind::AttackBonus, 1, {}}, 1},
            CardSpec{CardKey::Masamune, "Masamune", DeckKind::Dark, CardType::Equipment,
                     {EffectKind::ForcedSingleDie, 0, {}}, 1},
            CardSpec{CardKey::Handgun, "Handgun", DeckKind::Dark, CardType::Equipment,
                     {EffectKind::ExtendedRange, 0, {}}, 1},
            // Vision
            CardSpec{CardKey::VisionShadowStrike, "I bet you're a Shadow", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionDamage, 1, Faction::Shadow}, 2},
            CardSpec{CardKey::VisionHunterStrike, "I bet you're a Hunter", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionDamage, 1, Faction::Hunter}, 2},
            CardSpec{CardKey::VisionNeutralStrike, "I bet you're a Neutral", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionDamage, 1, Faction::Neutral}, 1},
            CardSpec{CardKey::VisionHunterMercy, "Vision of Mercy (Hunter)", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionHeal, 1, Faction::Hunter}, 1},
            CardSpec{CardKey::VisionShadowMercy, "Vision of Mercy (Shadow)", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionHeal, 1, Faction::Shadow}, 1},
            CardSpec{CardKey::VisionNeutralMercy, "Vision of Mercy (Neutral)", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionHeal, 1, Faction::Neutral}, 1},
            CardSpec{CardKey::VisionSupreme, "Vision of the Supreme", DeckKind::Vision, CardType::Vision,
                     {EffectKind::VisionDamageIfTough, 2, {}}, 1},
        };
    }

    auto IsHolyRelic(CardKey const key) -> bool
    {
        switch (key)
        {
        case CardKey::Talisman:
        case CardKey::SpearOfLonginus:
        case CardKey::HolyRobe:
        case CardKey::SilverRosary:
            return true;
        default:
            return false;
        }
    }

    auto BuildDeckCards(DeckKind const deck, uint16_t& next_id) -> std::vector<CardSP>
    {
        std::vector<CardSP> out;
        for (CardSpec const& spec : CatalogueSpecs)
        {
            if (spec.deck != deck) continue;
            for (uint8_t i{}; i < spec.copies; ++i)
            {
                out.emplace_back(std::make_shared<Card>(next_id++, spec.key, spec.name, spec.deck, spec.type,
                                                        spec.effect));
            }
        }
        return out;
    }

    auto CatalogueSize() -> size_t
    {
        size_t total{};
        for (CardSpec const& spec : CatalogueSpecs) total += spec.copies;
        return total;
    }
}
