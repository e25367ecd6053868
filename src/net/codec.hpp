//
// Created by Malik T on 21/08/2025.
//

#ifndef SHADOWHUNT_CODEC_HPP
#define SHADOWHUNT_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Game.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/shadow_net_generated.h"

namespace shadow::core::net
{
    inline constexpr uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // What a player action decodes into
    struct DecodedAction
    {
        PlayerId actor{};
        PlayerAction action{};
    };

    auto ToFbPhase(Phase p) noexcept -> shadow::gen::net::Phase;
    auto ToFbZone(ZoneId z) noexcept -> shadow::gen::net::ZoneId;
    auto ToFbDeck(DeckKind d) noexcept -> shadow::gen::net::DeckKind;
    auto ToFbFaction(Faction f) noexcept -> shadow::gen::net::Faction;

    auto FromFbPhase(shadow::gen::net::Phase p) noexcept -> Phase;
    auto FromFbZone(shadow::gen::net::ZoneId z) noexcept -> ZoneId;
    auto FromFbDeck(shadow::gen::net::DeckKind d) noexcept -> DeckKind;
    auto FromFbFaction(shadow::gen::net::Faction f) noexcept -> Faction;

    // --- Outbound (server -> client) ---

    auto BuildSnapshot(GameSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildSnapshot(GameImpl const& g, PlayerId seat, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildEvent(GameEvent const& ev, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Client -> server ---

    // Every action carries plain ids, so no game state is needed to build or decode one.
    auto BuildAction(PlayerId actor, PlayerAction const& action, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it.
    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>;
} // namespace shadow::core::net


#endif //SHADOWHUNT_CODEC_HPP
