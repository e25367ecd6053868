//
// Created by malikt on 8/20/25.
//

#ifndef SHADOWHUNT_RECORDINGAGENT_HPP
#define SHADOWHUNT_RECORDINGAGENT_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Agent.hpp"

namespace shadow::core::debug
{
    // Forwards to the wrapped agent and remembers every decision it made.
    class RecordingAgent final : public Agent
    {
    public:
        explicit RecordingAgent(std::unique_ptr<Agent> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const GameSnapshot> s,
                  std::chrono::steady_clock::time_point deadline) -> PlayerAction override
        {
            last_action_ = inner_->Play(std::move(s), deadline);
            has_last_ = true;
            ++decisions_;
            return last_action_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> PlayerAction const&
        {
            return last_action_;
        }

        auto Decisions() const -> size_t
        {
            return decisions_;
        }

    private:
        std::unique_ptr<Agent> inner_;
        PlayerAction last_action_{EndTurnAction{}}; // harmless default
        bool has_last_{false};
        size_t decisions_{0};
    };

    // Helper to wrap a vector<unique_ptr<Agent>>
    inline auto WrapRecording(std::vector<std::unique_ptr<Agent>>& agents)
        -> std::vector<std::unique_ptr<Agent>>
    {
        std::vector<std::unique_ptr<Agent>> out;
        out.reserve(agents.size());

        for (auto& a : agents)
        {
            out.emplace_back(std::make_unique<RecordingAgent>(std::move(a)));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Agent* a) -> RecordingAgent*
    {
        return dynamic_cast<RecordingAgent*>(a);
    }
} // namespace shadow::core::debug

#endif //SHADOWHUNT_RECORDINGAGENT_HPP
