//
// Created by Malik T on 03/10/2025.
//

#include "Events.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace shadow::core
{
    auto EventBus::Subscribe(Listener fn, Channel const channel) -> SubscriptionId
    {
        SubscriptionId const id = next_id_++;
        slots_.push_back(std::make_shared<Slot>(Slot{id, channel, std::move(fn), true}));
        return id;
    }

    auto EventBus::Unsubscribe(SubscriptionId const id) -> void
    {
        auto const it = std::ranges::find_if(slots_, [id](auto const& s) { return s->id == id; });
        if (it == std::end(slots_)) return;
        (*it)->active = false;
        slots_.erase(it);
    }

    auto EventBus::Publish(GameEvent const& ev) -> void
    {
        // Listeners may subscribe/unsubscribe or publish while we iterate.
        std::vector<std::shared_ptr<Slot>> const snapshot = slots_;
        for (Channel const ch : {Channel::Observer, Channel::Rules})
        {
            for (auto const& slot : snapshot)
            {
                if (slot->channel != ch || !slot->active) continue;
                slot->fn(ev);
            }
        }
    }

    auto to_string(GameEvent const& ev) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& e) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DamageDealt>)
            {
                return std::format("DamageDealt {} -> P{} amount={} source={}",
                                   e.attacker ? std::format("P{}", static_cast<int>(*e.attacker)) : "none",
                                   static_cast<int>(e.victim), e.amount, static_cast<int>(e.source));
            }
            else if constexpr (std::is_same_v<T, PlayerDied>)
            {
                return std::format("PlayerDied P{} killer={}", static_cast<int>(e.victim),
                                   e.killer ? std::format("P{}", static_cast<int>(*e.killer)) : "none");
            }
            else if constexpr (std::is_same_v<T, CharacterRevealed>)
            {
                return std::format("CharacterRevealed P{} {} ({})", static_cast<int>(e.player),
                                   to_string(e.character), to_string(e.faction));
            }
            else if constexpr (std::is_same_v<T, AbilityActivated>)
            {
                return std::format("Ability{} P{} {}: {} [{}]", e.success ? "Activated" : "Failed",
                                   static_cast<int>(e.player), to_string(e.character), e.description, e.payload);
            }
            else if constexpr (std::is_same_v<T, AbilityTriggered>)
            {
                return std::format("AbilityTriggered P{} {} {}: {}", static_cast<int>(e.player),
                                   to_string(e.character), to_string(e.trigger), e.description);
            }
            else if constexpr (std::is_same_v<T, TurnStarted>)
            {
                return std::format("TurnStarted P{} turn={}", static_cast<int>(e.player), e.turn);
            }
            else if constexpr (std::is_same_v<T, EquipmentChanged>)
            {
                return std::format("Equipment{} P{} card={}", e.gained ? "Gained" : "Lost",
                                   static_cast<int>(e.player), e.card_id);
            }
            else if constexpr (std::is_same_v<T, CardDrawn>)
            {
                return std::format("CardDrawn P{} deck={} card={}", static_cast<int>(e.player),
                                   to_string(e.deck), e.card_id);
            }
            else
            {
                std::string ids;
                for (PlayerId const p : e.winners)
                {
                    ids += std::format("{}P{}", ids.empty() ? "" : ",", static_cast<int>(p));
                }
                return std::format("GameOver faction={} winners=[{}]",
                                   e.faction ? to_string(*e.faction) : "none", ids);
            }
        }, ev);
    }
}
