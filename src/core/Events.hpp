//
// Created by Malik T on 03/10/2025.
//

#ifndef SHADOWHUNT_EVENTS_HPP
#define SHADOWHUNT_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "Characters.hpp"
#include "Types.hpp"

namespace shadow::core
{
    enum class DamageSource : uint8_t
    {
        Attack = 0,
        Ability,
        Card,
        Zone,
        SelfCost
    };

    struct DamageDealt
    {
        std::optional<PlayerId> attacker;
        PlayerId victim{};
        int amount{};
        DamageSource source{DamageSource::Attack};
    };

    struct PlayerDied
    {
        PlayerId victim{};
        std::optional<PlayerId> killer;
    };

    struct CharacterRevealed
    {
        PlayerId player{};
        CharacterId character{};
        Faction faction{};
        std::string_view ability_name{};
    };

    // Raised for both successful and failed activations.
    struct AbilityActivated
    {
        PlayerId player{};
        CharacterId character{};
        bool success{false};
        std::string description;
        int payload{};
    };

    struct AbilityTriggered
    {
        PlayerId player{};
        CharacterId character{};
        Trigger trigger{};
        std::string description;
    };

    struct TurnStarted
    {
        PlayerId player{};
        uint32_t turn{};
    };

    struct EquipmentChanged
    {
        PlayerId player{};
        uint16_t card_id{};
        bool gained{true};
    };

    struct CardDrawn
    {
        PlayerId player{};
        DeckKind deck{};
        uint16_t card_id{};
    };

    struct GameOver
    {
        std::optional<Faction> faction;
        std::vector<PlayerId> winners;
    };

    using GameEvent = std::variant<
      DamageDealt, PlayerDied, CharacterRevealed, AbilityActivated, AbilityTriggered,
      TurnStarted, EquipmentChanged, CardDrawn, GameOver>;

    // Rule listeners react to an event (and may publish more); observers only watch.
    // Observers of an event are called before its rule listeners, so cascaded events
    // reach observers after the event that caused them.
    enum class Channel : uint8_t
    {
        Observer = 0,
        Rules
    };

    class EventBus
    {
    public:
        using Listener = std::function<void(GameEvent const&)>;
        using SubscriptionId = uint32_t;

        EventBus() = default;
        EventBus(EventBus const&) = delete;
        auto operator=(EventBus const&) -> EventBus& = delete;

        auto Subscribe(Listener fn, Channel channel = Channel::Observer) -> SubscriptionId;
        auto Unsubscribe(SubscriptionId id) -> void;
        auto Publish(GameEvent const& ev) -> void;

        [[nodiscard]] auto ListenerCount() const noexcept -> size_t { return slots_.size(); }

    private:
        struct Slot
        {
            SubscriptionId id{};
            Channel channel{};
            Listener fn;
            bool active{true};
        };

        std::vector<std::shared_ptr<Slot>> slots_;
        SubscriptionId next_id_{1};
    };

    auto to_string(GameEvent const& ev) -> std::string;
}

#endif //SHADOWHUNT_EVENTS_HPP
