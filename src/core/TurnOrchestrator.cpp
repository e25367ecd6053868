//
// Created by Malik T on 07/10/2025.
//

#include "TurnOrchestrator.hpp"

#include "Log.hpp"

namespace shadow::core
{
    using RVC = error::RuleViolationCode;

    TurnOrchestrator::TurnOrchestrator(GameSession& session, EventBus& bus) :
        session_(session),
        bus_(bus)
    {
    }

    auto TurnOrchestrator::NextLiving(PlayerId const from) const -> std::optional<PlayerId>
    {
        size_t const n = session_.PlayerCount();
        for (size_t step{1}; step <= n; ++step)
        {
            auto const seat = static_cast<PlayerId>((from + step) % n);
            if (session_.Players()[seat].IsAlive()) return seat;
        }
        return std::nullopt;
    }

    auto TurnOrchestrator::Stall() -> error::ValidateResult
    {
        log::Error("no living players left, session stalled at turn {}", session_.Turn());
        session_.SetStatus(SessionStatus::Stalled);
        return std::unexpected(error::Viol(RVC::Liveness_NoLivingPlayers).with_phase(session_.PhaseNow()));
    }

    auto TurnOrchestrator::Start() -> error::ValidateResult
    {
        if (!session_.IsRunning())
            return std::unexpected(error::Viol(RVC::SessionNotRunning));

        // Seat n-1 precedes seat 0, so this finds the first living seat from 0.
        auto const first = NextLiving(static_cast<PlayerId>(session_.PlayerCount() - 1));
        if (!first) return Stall();
        EnterTurn(*first);
        return {};
    }

    auto TurnOrchestrator::AdvancePhase() -> error::ValidateResult
    {
        if (!session_.IsRunning())
            return std::unexpected(error::Viol(RVC::SessionNotRunning).with_phase(session_.PhaseNow()));

        switch (session_.PhaseNow())
        {
        case Phase::Movement:
            session_.SetPhase(Phase::Action);
            return {};
        case Phase::Action:
            session_.SetPhase(Phase::End);
            return {};
        case Phase::End:
            return HandOver();
        }
        return std::unexpected(error::Viol(RVC::Internal_Unreachable));
    }

    auto TurnOrchestrator::EndTurn() -> error::ValidateResult
    {
        if (!session_.IsRunning())
            return std::unexpected(error::Viol(RVC::SessionNotRunning).with_phase(session_.PhaseNow()));
        session_.SetPhase(Phase::End);
        return HandOver();
    }

    auto TurnOrchestrator::HandOver() -> error::ValidateResult
    {
        PlayerId const current = session_.Current();

        if (session_.CurrentPlayer().IsAlive() && session_.ConsumeExtraTurn())
        {
            EnterTurn(current);
            return {};
        }
        // Extra turns belong to the player who earned them.
        session_.ClearExtraTurns();

        std::optional<PlayerId> const next = NextLiving(current);
        if (!next) return Stall();

        if (*next <= current) session_.IncrementTurn();
        EnterTurn(*next);
        return {};
    }

    auto TurnOrchestrator::EnterTurn(PlayerId const player) -> void
    {
        session_.SetCurrent(player);
        session_.SetPhase(Phase::Movement);
        session_.ResetProgress();
        session_.CurrentPlayer().status.damage_immune = false;

        log::Debug("turn {}: P{}", session_.Turn(), static_cast<int>(player));
        bus_.Publish(TurnStarted{player, session_.Turn()});
    }
}
