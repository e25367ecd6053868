#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "../core/Game.hpp"
#include "../core/StandardRules.hpp"
#include "../net/codec.hpp"

using namespace shadow::core;
using shadow::core::net::BuildAction;
using shadow::core::net::BuildSnapshot;
using shadow::core::net::DecodePlayerAction;
namespace fbn = shadow::gen::net;

namespace
{
    inline std::span<const std::byte> AsBytes(const flatbuffers::DetachedBuffer& buf)
    {
        const uint8_t* p = buf.data();
        return {reinterpret_cast<const std::byte*>(p), buf.size()};
    }

    auto MakeGame() -> std::unique_ptr<GameImpl>
    {
        Config cfg{
            .n_players = 3,
            .seed = 77,
            .characters = {CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie}
        };
        return std::make_unique<GameImpl>(cfg, std::make_unique<StandardRules>(),
                                          std::vector<std::unique_ptr<Agent>>{});
    }
}

TEST(Codec, ActivateCarriesTargetsAndZone)
{
    ActivateAbilityAction const sent{{2, 4}, ZoneId::Cemetery};
    auto const buf = BuildAction(3, sent, 11);

    auto const decoded = DecodePlayerAction(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->actor, 3);
    ASSERT_TRUE(std::holds_alternative<ActivateAbilityAction>(decoded->action));
    auto const& got = std::get<ActivateAbilityAction>(decoded->action);
    EXPECT_EQ(got.targets, (std::vector<PlayerId>{2, 4}));
    EXPECT_EQ(got.zone, std::optional<ZoneId>{ZoneId::Cemetery});
}

TEST(Codec, ActivateWithoutZone)
{
    auto const buf = BuildAction(0, ActivateAbilityAction{}, 12);
    auto const decoded = DecodePlayerAction(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value());
    auto const& got = std::get<ActivateAbilityAction>(decoded->action);
    EXPECT_TRUE(got.targets.empty());
    EXPECT_FALSE(got.zone.has_value());
}

TEST(Codec, ZoneAndVisionActions)
{
    {
        auto const buf = BuildAction(1, UseZoneAction{2, ZoneChoice::Steal}, 13);
        auto const decoded = DecodePlayerAction(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value());
        ASSERT_TRUE(std::holds_alternative<UseZoneAction>(decoded->action));
        EXPECT_EQ(std::get<UseZoneAction>(decoded->action).target, 2);
        EXPECT_EQ(std::get<UseZoneAction>(decoded->action).choice, ZoneChoice::Steal);
    }
    {
        auto const buf = BuildAction(1, GiveVisionAction{24, 0}, 14);
        auto const decoded = DecodePlayerAction(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value());
        ASSERT_TRUE(std::holds_alternative<GiveVisionAction>(decoded->action));
        EXPECT_EQ(std::get<GiveVisionAction>(decoded->action).card_id, 24);
        EXPECT_EQ(std::get<GiveVisionAction>(decoded->action).target, 0);
    }
}

TEST(Codec, RejectsGarbage)
{
    std::array<std::byte, 2> tiny{};
    EXPECT_FALSE(DecodePlayerAction(tiny).has_value());

    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(DecodePlayerAction(junk).has_value());
}

TEST(Codec, SnapshotIsNotAnAction)
{
    auto const game = MakeGame();
    auto const buf = BuildSnapshot(*game, 0, 1);
    auto const decoded = DecodePlayerAction(AsBytes(buf));
    ASSERT_FALSE(decoded.has_value());
}

TEST(Codec, SnapshotHidesOtherIdentities)
{
    auto const game = MakeGame();
    auto const buf = BuildSnapshot(*game, 1, 5);

    flatbuffers::Verifier verifier(buf.data(), buf.size());
    ASSERT_TRUE(fbn::VerifyEnvelopeBuffer(verifier));
    auto const* env = fbn::GetEnvelope(buf.data());
    ASSERT_EQ(env->message_type(), fbn::Message::SnapshotMsg);
    auto const* msg = env->message_as_SnapshotMsg();
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->msg_id(), 5u);

    auto const* view = msg->view();
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->schema_version(), shadow::core::net::SchemaVersion);
    EXPECT_EQ(view->seat(), 1);
    EXPECT_EQ(view->n_players(), 3);
    EXPECT_EQ(shadow::core::net::FromFbPhase(view->phase()), game->PhaseNow());
    ASSERT_EQ(view->players()->size(), 3u);

    auto const* me = view->players()->Get(1);
    EXPECT_TRUE(me->has_identity());
    EXPECT_EQ(me->character(), static_cast<uint8_t>(CharacterId::Unknown));
    EXPECT_EQ(shadow::core::net::FromFbFaction(me->faction()), Faction::Shadow);

    EXPECT_FALSE(view->players()->Get(0)->has_identity());
    EXPECT_FALSE(view->players()->Get(2)->has_identity());
}

TEST(Codec, OutOfRangeZoneReachesTheValidator)
{
    // A client is free to put any byte on the wire.
    flatbuffers::FlatBufferBuilder fbb;
    auto const move = fbn::CreateAction_Move(fbb, 0, static_cast<fbn::ZoneId>(9));
    auto const pam = fbn::CreatePlayerActionMsg(fbb, 15, fbn::Action::Action_Move, move.Union());
    fbn::FinishEnvelopeBuffer(fbb, fbn::CreateEnvelope(fbb, fbn::Message::PlayerActionMsg, pam.Union()));
    auto const buf = fbb.Release();

    auto const decoded = DecodePlayerAction(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value());

    auto const game = MakeGame();
    ASSERT_EQ(game->Submit(0, RollMoveAction{}), MoveOutcome::Applied);
    EXPECT_EQ(game->Submit(decoded->actor, decoded->action), MoveOutcome::Invalid);
    ASSERT_TRUE(game->LastViolation().has_value());
    EXPECT_EQ(game->LastViolation()->code, error::RuleViolationCode::InvalidReference);
}
