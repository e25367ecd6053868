//
// Created by Malik T on 20/08/2025.
//

#ifndef SHADOWHUNT_AUDITLOGGER_HPP
#define SHADOWHUNT_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Events.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace shadow::core::debug
{
    // Plain text transcript of one game, one line per record.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;
        
        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, dealt characters)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Per step (before Submit): snapshot, actor seat, proposed action
        auto turn(GameSnapshot const& s,
                  std::uint8_t actor,
                  PlayerAction const& a) -> void;

        // Per step outcome (after Submit)
        auto outcome(MoveOutcome m) -> void;

        // Hook for an Observer-channel subscription
        auto event(GameEvent const& ev) -> void;

        // Game end footer (faction and winner seats)
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

        auto IsOpen() const -> bool { return out_.is_open(); }

    private:
        std::ofstream out_;
    };

    auto describe(PlayerAction const& a) -> std::string;
}

#endif //SHADOWHUNT_AUDITLOGGER_HPP
