//
// Created by Malik T on 04/10/2025.
//

#ifndef SHADOWHUNT_COMBAT_HPP
#define SHADOWHUNT_COMBAT_HPP

#include <expected>
#include <optional>
#include "Dice.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "Session.hpp"

namespace shadow::core
{
    struct RollOutcome
    {
        int d6{};
        int d4{};
        bool miss{false};
        bool single_die{false};  // attacker used the d4 alone
        bool target_down{false}; // target already at 0 hp before the roll
        int base{};
        int damage{};
    };

    template <typename T>
    using CombatResult = std::expected<T, error::RuleViolation>;

    class CombatResolver
    {
    public:
        CombatResolver(GameSession& session, EventBus& bus, Dice& dice);

        CombatResolver(CombatResolver const&) = delete;
        auto operator=(CombatResolver const&) -> CombatResolver& = delete;

        // Rolls both dice and computes the damage. Does not touch hp.
        auto RollAttack(PlayerId attacker, PlayerId target) -> CombatResult<RollOutcome>;

        // Returns the damage actually dealt (0 when absorbed).
        auto ApplyDamage(std::optional<PlayerId> attacker, PlayerId target, int amount,
                         DamageSource source = DamageSource::Attack) -> CombatResult<int>;

        // Returns false when the victim was already dead (nothing raised).
        auto ProcessDeath(PlayerId victim, std::optional<PlayerId> killer) -> CombatResult<bool>;

        // RollAttack + ApplyDamage. Turn flags are left to the caller.
        auto Attack(PlayerId attacker, PlayerId target) -> CombatResult<RollOutcome>;

        // Revealed, enabled Valkyrie or a Masamune holder.
        static auto IsNoMiss(Player const& p) -> bool;

    private:
        auto MissingPlayer(PlayerId id) const -> error::RuleViolation;

    private:
        GameSession& session_;
        EventBus& bus_;
        Dice& dice_;
    };
}

#endif //SHADOWHUNT_COMBAT_HPP
