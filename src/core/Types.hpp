//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_TYPES_HPP
#define SHADOWHUNT_TYPES_HPP

#define SHD_ALLOW_EXCEPTIONS true
#define SHD_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <string_view>
#include <variant>

namespace shadow::core::constants
{
    inline constexpr size_t ZoneCount = 6;
    inline constexpr size_t DeckCount = 3;
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 8;
    inline constexpr int DieSixFaces = 6;
    inline constexpr int DieFourFaces = 4;
}

namespace shadow::core
{
    using PlayerId = uint8_t;

    enum class Faction : uint8_t
    {
        Hunter = 0,
        Shadow,
        Neutral
    };

    // Order is part of the wire schema, append only.
    enum class CharacterId : uint8_t
    {
        // Hunters
        Emi = 0,
        Franklin,
        George,
        Ellen,
        Fuka,
        Gregor,
        // Shadows
        Unknown,
        Vampire,
        Werewolf,
        UltraSoul,
        Valkyrie,
        Wight,
        // Neutrals
        Allie,
        Agnes,
        Bob,
        Bryan,
        Catherine,
        Charles,
        Daniel,
        David
    };
    inline constexpr size_t CharacterCount = static_cast<size_t>(CharacterId::David) + 1;

    // Zones sit on a straight track, index order is the walking order.
    enum class ZoneId : uint8_t
    {
        HermitsCabin = 0,
        UnderworldGate,
        Church,
        Cemetery,
        WeirdWoods,
        ErstwhileAltar
    };

    enum class DeckKind : uint8_t
    {
        Light = 0,
        Dark,
        Vision
    };

    enum class CardType : uint8_t
    {
        Instant = 0,
        Equipment,
        Vision
    };

    enum class Phase : uint8_t
    {
        Movement = 0,
        Action,
        End
    };

    enum class SessionStatus : uint8_t
    {
        Running = 0,
        Finished,
        Stalled
    };

    struct Config
    {
        uint32_t n_players{5};
        uint64_t seed{std::random_device{}()};
        // When non-empty, seat i receives characters[i] instead of a random draw.
        std::vector<CharacterId> characters{};
        // Seats flagged here are driven by bots (affects the snapshot only).
        std::vector<bool> bot_seats{};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30ULL)};
    };

    inline auto to_string(Faction f) -> std::string_view
    {
        switch (f)
        {
        case Faction::Hunter: return "Hunter";
        case Faction::Shadow: return "Shadow";
        case Faction::Neutral: return "Neutral";
        }
        return "?";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Movement: return "Movement";
        case Phase::Action: return "Action";
        case Phase::End: return "End";
        }
        return "?";
    }

    inline auto to_string(ZoneId z) -> std::string_view
    {
        switch (z)
        {
        case ZoneId::HermitsCabin: return "Hermit's Cabin";
        case ZoneId::UnderworldGate: return "Underworld Gate";
        case ZoneId::Church: return "Church";
        case ZoneId::Cemetery: return "Cemetery";
        case ZoneId::WeirdWoods: return "Weird Woods";
        case ZoneId::ErstwhileAltar: return "Erstwhile Altar";
        }
        return "?";
    }

    inline auto to_string(DeckKind d) -> std::string_view
    {
        switch (d)
        {
        case DeckKind::Light: return "Light";
        case DeckKind::Dark: return "Dark";
        case DeckKind::Vision: return "Vision";
        }
        return "?";
    }
}

#endif //SHADOWHUNT_TYPES_HPP
