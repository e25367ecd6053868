//
// Created by Malik T on 07/10/2025.
//

#ifndef SHADOWHUNT_WINCONDITIONS_HPP
#define SHADOWHUNT_WINCONDITIONS_HPP

#include <optional>
#include <vector>
#include "Session.hpp"

namespace shadow::core
{
    enum class WinEvent : uint8_t
    {
        None = 0,
        Kill,
        GameEnding
    };

    struct WinContext
    {
        WinEvent event{WinEvent::None};
        std::optional<PlayerId> killer{};
        std::optional<PlayerId> victim{};
    };

    struct WinResult
    {
        bool game_over{false};
        std::optional<Faction> faction{};
        std::vector<PlayerId> winners; // ascending seat order
    };

    class WinEvaluator
    {
    public:
        explicit WinEvaluator(GameSession& session);

        // Call once per death, before the matching CheckWinConditions. Repeats are ignored.
        auto RegisterKill(std::optional<PlayerId> killer, PlayerId victim) -> void;
        auto CheckWinConditions(WinContext const& ctx) const -> WinResult;

        // Hunters win when no Shadow lives and a Hunter does; and vice versa.
        auto FactionWinner() const -> std::optional<Faction>;
        // Both Hunters and Shadows are gone.
        auto FactionsExtinct() const -> bool;

        auto NeutralSatisfied(Player const& p, WinContext const& ctx) const -> bool;
        // Bob, Bryan, Catherine, Charles and David end the game the moment they are satisfied.
        static auto IsGameEnding(CharacterId id) -> bool;

    private:
        auto Satisfied(Player const& p, WinContext const& ctx, bool follow_neighbour) const -> bool;
        auto Neighbour(Player const& p) const -> Player const&;

    private:
        GameSession& session_;
    };
}

#endif //SHADOWHUNT_WINCONDITIONS_HPP
