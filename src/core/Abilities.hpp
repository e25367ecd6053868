//
// Created by Malik T on 05/10/2025.
//

#ifndef SHADOWHUNT_ABILITIES_HPP
#define SHADOWHUNT_ABILITIES_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>
#include "Combat.hpp"
#include "Dice.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "Session.hpp"

namespace shadow::core
{
    struct Registration
    {
        PlayerId player{};
        Trigger trigger{};
    };

    // Who else took part in the event that fired a passive.
    struct TriggerContext
    {
        Trigger trigger{};
        std::optional<PlayerId> source{};  // attacker or killer
        std::optional<PlayerId> subject{}; // victim
        int amount{};
    };

    struct ActivationOutcome
    {
        bool success{false};
        std::string description;
        int payload{};
        std::optional<error::RuleViolation> violation{}; // set on failure
    };

    class AbilitySystem
    {
    public:
        // Subscribes to the bus (rules channel); the order of construction is the
        // order of reaction relative to other rule listeners.
        AbilitySystem(GameSession& session, EventBus& bus, CombatResolver& combat, Dice& dice);
        ~AbilitySystem();

        AbilitySystem(AbilitySystem const&) = delete;
        auto operator=(AbilitySystem const&) -> AbilitySystem& = delete;

        // Non-passive declarations are ignored (returns false quietly).
        // Unknown trigger keys are rejected with a warning.
        auto Register(PlayerId player) -> bool;
        auto Unregister(PlayerId player) -> void;
        auto RegisterAll() -> void;
        [[nodiscard]] auto IsRegistered(PlayerId player) const -> bool;
        [[nodiscard]] auto Registrations() const noexcept -> std::vector<Registration> const& { return registry_; }

        // Runs the holder's passive effect. Returns true when something happened.
        auto Execute(PlayerId player, TriggerContext const& ctx) -> bool;

        // Read-only.
        static auto CanActivate(Player const& p) -> error::ValidateResult;
        auto Activate(PlayerId player, std::span<PlayerId const> targets,
                      std::optional<ZoneId> zone = std::nullopt) -> ActivationOutcome;

    private:
        auto OnEvent(GameEvent const& ev) -> void;
        auto OnDamage(DamageDealt const& e) -> void;
        auto OnDeath(PlayerDied const& e) -> void;
        auto Fire(PlayerId player, TriggerContext const& ctx) -> void;
        auto Find(PlayerId player) const -> Registration const*;
        auto CanFire(Player const& p, Trigger t) const -> bool;

        // CharacterEffects.cpp
        auto RunPassive(Player& holder, TriggerContext const& ctx) -> std::optional<std::string>;
        auto RunActive(Player& holder, std::span<PlayerId const> targets,
                       std::optional<ZoneId> zone) -> ActivationOutcome;
        auto RevealSelf(Player& p) -> bool;
        auto StealOneEquipment(Player& thief, Player& victim) -> std::optional<uint16_t>;

    private:
        GameSession& session_;
        EventBus& bus_;
        CombatResolver& combat_;
        Dice& dice_;
        EventBus::SubscriptionId sub_{};
        std::vector<Registration> registry_;
    };
}

#endif //SHADOWHUNT_ABILITIES_HPP
