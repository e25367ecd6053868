//
// Created by Malik T on 02/10/2025.
//

#ifndef SHADOWHUNT_CARD_HPP
#define SHADOWHUNT_CARD_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "Types.hpp"

namespace shadow::core
{
    // Catalogue entries. Several physical cards may share a key.
    enum class CardKey : uint8_t
    {
        // Light deck
        HolyWaterOfHealing = 0,
        Advent,
        GuardianAngel,
        ConcealedKnowledge,
        FlareOfJudgement,
        HolyRobe,
        Talisman,
        SilverRosary,
        SpearOfLonginus,
        // Dark deck
        Dynamite,
        DiabolicRitual,
        Chainsaw,
        ButcherKnife,
        RustedBroadAxe,
        Masamune,
        Handgun,
        // Vision deck
        VisionShadowStrike,
        VisionHunterStrike,
        VisionNeutralStrike,
        VisionHunterMercy,
        VisionShadowMercy,
        VisionNeutralMercy,
        VisionSupreme
    };

    enum class EffectKind : uint8_t
    {
        None = 0,
        Heal,               // heal self by value
        RevealAndHealFull,  // restricted: reveal and heal to max
        Shield,             // one-shot protection from the next damage
        ExtraTurn,
        DamageOthers,       // value damage to every other living player
        DamageArea,         // roll d6, value damage to everyone in that area
        AttackBonus,
        DefenseBonus,
        Ward,               // immune to Dark deck damage cards
        StealOnKill,        // take all of the victim's equipment
        ForcedSingleDie,    // attack with the d4 only, never miss
        ExtendedRange,      // reach players outside the own area only
        VisionDamage,       // receiver takes value if restriction matches
        VisionHeal,         // receiver heals value if restriction matches
        VisionDamageIfTough // receiver takes value if hp_max >= 12
    };

    struct CardEffect
    {
        EffectKind kind{EffectKind::None};
        int value{};
        std::optional<Faction> restriction{};
    };

    struct Card
    {
        Card() = delete;
        Card(uint16_t id, CardKey key, std::string_view name, DeckKind deck, CardType type, CardEffect effect) :
            id(id), key(key), name(name), deck(deck), type(type), effect(effect) {}

        uint16_t id;
        CardKey key;
        std::string_view name;
        DeckKind deck;
        CardType type;
        CardEffect effect;
        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.id == b.id; }
    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;
    using CardWP = std::weak_ptr<Card>;
    using CCardWP = std::weak_ptr<Card const>;

    // True when the effect has no faction restriction or the restriction matches.
    inline auto RestrictionMatches(CardEffect const& e, Faction f) -> bool
    {
        return !e.restriction.has_value() || *e.restriction == f;
    }

    // Talisman, Spear of Longinus, Holy Robe, Silver Rosary.
    auto IsHolyRelic(CardKey key) -> bool;

    // Builds one full deck, assigning ids from next_id onwards.
    auto BuildDeckCards(DeckKind deck, uint16_t& next_id) -> std::vector<CardSP>;

    // Total number of cards across the three decks.
    auto CatalogueSize() -> size_t;
}

#endif //SHADOWHUNT_CARD_HPP
