//
// Created by Malik T on 10/10/2025.
//

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

#include "../core/ActionValidator.hpp"
#include "../core/Game.hpp"
#include "../core/StandardRules.hpp"
#include "TestSupport.hpp"

using namespace shadow::core;
using shadow::test::ScriptedDice;
using RVC = error::RuleViolationCode;

namespace
{
    struct Table
    {
        ScriptedDice* dice{};
        std::unique_ptr<GameImpl> game;
    };

    auto MakeTable(std::vector<CharacterId> cast, std::vector<std::unique_ptr<Agent>> agents = {}) -> Table
    {
        Config cfg{
            .n_players = static_cast<uint32_t>(cast.size()),
            .seed = 5,
            .characters = std::move(cast),
            .turn_timeout = std::chrono::seconds(2u)
        };
        auto dice = std::make_unique<ScriptedDice>();
        ScriptedDice* raw = dice.get();
        return Table{raw, std::make_unique<GameImpl>(cfg, std::make_unique<StandardRules>(), std::move(agents),
                                                     std::move(dice))};
    }

    auto Rejected(GameImpl& g, PlayerId actor, PlayerAction const& a) -> std::optional<RVC>
    {
        if (g.Submit(actor, a) != MoveOutcome::Invalid) return std::nullopt;
        if (!g.LastViolation()) return std::nullopt;
        return g.LastViolation()->code;
    }

    // Always asks for something that cannot be done in the movement phase.
    class StubbornAgent final : public Agent
    {
    public:
        auto Play(std::shared_ptr<const GameSnapshot>, std::chrono::steady_clock::time_point) -> PlayerAction override
        {
            return DrawAction{DeckKind::Light};
        }
    };

    class SlowAgent final : public Agent
    {
    public:
        auto Play(std::shared_ptr<const GameSnapshot>, std::chrono::steady_clock::time_point) -> PlayerAction override
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            return RollMoveAction{};
        }
    };
}

TEST(GameSetup, OpensOnSeatZeroInMovement)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;
    EXPECT_FALSE(g.IsOver());
    EXPECT_EQ(g.Current(), 0);
    EXPECT_EQ(g.PhaseNow(), Phase::Movement);
    EXPECT_EQ(g.Session().Turn(), 1u);
    EXPECT_EQ(g.Session().Players()[1].Character(), CharacterId::Unknown);
    EXPECT_EQ(g.Session().Players()[2].Name(), "P2");
    EXPECT_FALSE(g.Session().Players()[0].Position().has_value());
}

TEST(GameSetup, StandardSplits)
{
    std::mt19937_64 rng{1};
    auto count = [](std::vector<CharacterId> const& cast, Faction f)
    {
        return std::ranges::count_if(cast, [f](CharacterId c) { return FindCharacter(c)->faction == f; });
    };

    Config five{.n_players = 5, .seed = 1};
    std::vector<CharacterId> const a = GameImpl::DealCharacters(five, rng);
    ASSERT_EQ(a.size(), 5u);
    EXPECT_EQ(count(a, Faction::Hunter), 2);
    EXPECT_EQ(count(a, Faction::Shadow), 2);
    EXPECT_EQ(count(a, Faction::Neutral), 1);

    Config eight{.n_players = 8, .seed = 1};
    std::vector<CharacterId> const b = GameImpl::DealCharacters(eight, rng);
    EXPECT_EQ(count(b, Faction::Hunter), 3);
    EXPECT_EQ(count(b, Faction::Shadow), 3);
    EXPECT_EQ(count(b, Faction::Neutral), 2);
}

TEST(GameSetup, UnfitCastFallsBackToTheSplit)
{
    std::mt19937_64 rng{2};
    Config dup{.n_players = 3, .seed = 1, .characters = {CharacterId::Emi, CharacterId::Emi, CharacterId::Allie}};
    std::vector<CharacterId> cast = GameImpl::DealCharacters(dup, rng);
    ASSERT_EQ(cast.size(), 3u);
    std::ranges::sort(cast);
    EXPECT_EQ(std::ranges::adjacent_find(cast), std::end(cast));

    Config fit{.n_players = 2, .seed = 1, .characters = {CharacterId::Bob, CharacterId::Wight}};
    EXPECT_EQ(GameImpl::DealCharacters(fit, rng), fit.characters);
}

TEST(GameSetup, TableSizeIsClamped)
{
    Config big{.n_players = 12, .seed = 3};
    GameImpl g{big, std::make_unique<StandardRules>(), {}};
    EXPECT_EQ(g.PlayerCount(), 8u);

    Config small{.n_players = 1, .seed = 3};
    GameImpl h{small, std::make_unique<StandardRules>(), {}};
    EXPECT_EQ(h.PlayerCount(), 2u);
}

TEST(Validation, MovementPhaseRules)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;

    EXPECT_EQ(Rejected(g, 0, DrawAction{DeckKind::Light}), RVC::Draw_WrongPhase);
    EXPECT_EQ(Rejected(g, 0, AttackAction{1}), RVC::Attack_WrongPhase);
    EXPECT_EQ(Rejected(g, 0, MoveAction{ZoneId::Church}), RVC::Move_NotRolled);
    EXPECT_EQ(Rejected(g, 1, RollMoveAction{}), RVC::WrongActor_CurrentPlayerRequired);
    EXPECT_EQ(Rejected(g, 1, EndTurnAction{}), RVC::WrongActor_CurrentPlayerRequired);
    EXPECT_EQ(Rejected(g, 0, UseZoneAction{1, ZoneChoice::Damage}), RVC::Zone_WrongPhase);
    EXPECT_EQ(Rejected(g, 0, GiveVisionAction{3, 1}), RVC::Vision_WrongPhase);

    // Nothing above moved the game on.
    EXPECT_EQ(g.Current(), 0);
    EXPECT_FALSE(g.Session().Progress().rolled);
}

TEST(Validation, NamedActions)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameSession const& s = t.game->Session();

    EXPECT_TRUE(validator::Named(s, 0, validator::RollMovementId).has_value());
    EXPECT_TRUE(validator::Named(s, 0, validator::EndTurnId).has_value());

    auto const unknown = validator::Named(s, 0, "teleport");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, RVC::UnknownAction);

    auto const draw = validator::Named(s, 0, validator::DrawCardId);
    ASSERT_FALSE(draw.has_value());
    EXPECT_EQ(draw.error().code, RVC::Draw_WrongPhase);
}

TEST(Validation, RollMoveDrawEnd)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;
    t.dice->PushD6(2);

    EXPECT_EQ(g.Submit(0, RollMoveAction{}), MoveOutcome::Applied);
    EXPECT_EQ(g.Session().Progress().movement_roll, std::optional<uint8_t>{2});
    EXPECT_EQ(Rejected(g, 0, RollMoveAction{}), RVC::Roll_AlreadyRolled);
    EXPECT_EQ(validator::ReachableZones(g.Session(), 0),
              (std::vector<ZoneId>{ZoneId::HermitsCabin, ZoneId::UnderworldGate}));
    EXPECT_EQ(Rejected(g, 0, MoveAction{ZoneId::Cemetery}), RVC::Move_OutOfRange);
    EXPECT_EQ(Rejected(g, 0, MoveAction{static_cast<ZoneId>(9)}), RVC::InvalidReference);

    EXPECT_EQ(g.Submit(0, MoveAction{ZoneId::UnderworldGate}), MoveOutcome::Applied);
    EXPECT_EQ(g.PhaseNow(), Phase::Action);
    EXPECT_EQ(g.Session().Players()[0].Position(), std::optional<ZoneId>{ZoneId::UnderworldGate});

    EXPECT_EQ(g.Submit(0, DrawAction{DeckKind::Vision}), MoveOutcome::Applied);
    EXPECT_EQ(g.Session().Players()[0].Hand().size(), 1u);
    EXPECT_EQ(Rejected(g, 0, DrawAction{DeckKind::Light}), RVC::Draw_AlreadyDrawn);

    EXPECT_EQ(Rejected(g, 0, AttackAction{9}), RVC::InvalidReference);
    EXPECT_EQ(Rejected(g, 0, AttackAction{1}), RVC::Attack_NoLegalTarget);
    EXPECT_EQ(Rejected(g, 0, UseZoneAction{1, ZoneChoice::Damage}), RVC::Zone_NoPower);
    EXPECT_EQ(Rejected(g, 0, GiveVisionAction{999, 1}), RVC::Vision_CardNotInHand);

    uint16_t const vision = g.Session().Players()[0].Hand().front()->id;
    EXPECT_EQ(Rejected(g, 0, GiveVisionAction{vision, 0}), RVC::Vision_IllegalTarget);
    EXPECT_NE(g.Submit(0, GiveVisionAction{vision, 2}), MoveOutcome::Invalid);
    EXPECT_TRUE(g.Session().Players()[0].Hand().empty());

    EXPECT_EQ(g.Submit(0, EndTurnAction{}), MoveOutcome::TurnEnded);
    EXPECT_EQ(g.Current(), 1);
    EXPECT_EQ(g.PhaseNow(), Phase::Movement);
}

TEST(Validation, DeckMustBeInTheZone)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown});
    GameImpl& g = *t.game;
    t.dice->PushD6(4);

    ASSERT_EQ(g.Submit(0, RollMoveAction{}), MoveOutcome::Applied);
    ASSERT_EQ(g.Submit(0, MoveAction{ZoneId::Church}), MoveOutcome::Applied);
    EXPECT_EQ(Rejected(g, 0, DrawAction{DeckKind::Dark}), RVC::Draw_DeckNotInZone);
}

TEST(Validation, RevealOnce)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;
    size_t reveals{};
    auto const sub = g.Bus().Subscribe([&reveals](GameEvent const& ev)
    {
        reveals += std::holds_alternative<CharacterRevealed>(ev) ? 1u : 0u;
    });

    EXPECT_EQ(g.Submit(0, RevealAction{}), MoveOutcome::Applied);
    EXPECT_TRUE(g.Session().Players()[0].IsRevealed());
    EXPECT_EQ(Rejected(g, 0, RevealAction{}), RVC::Reveal_AlreadyRevealed);
    EXPECT_EQ(reveals, 1u);
    g.Bus().Unsubscribe(sub);
}

TEST(Validation, AbilityGate)
{
    Table t = MakeTable({CharacterId::Gregor, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;

    EXPECT_EQ(Rejected(g, 0, ActivateAbilityAction{}), RVC::Ability_RequiresReveal);
    ASSERT_EQ(g.Submit(0, RevealAction{}), MoveOutcome::Applied);
    EXPECT_EQ(g.Submit(0, ActivateAbilityAction{}), MoveOutcome::Applied);
    EXPECT_TRUE(g.Session().Players()[0].status.damage_immune);
    EXPECT_EQ(Rejected(g, 0, ActivateAbilityAction{}), RVC::Ability_AlreadyUsed);
}

TEST(Validation, FailedActivationLeavesItsViolation)
{
    Table t = MakeTable({CharacterId::Franklin, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;
    ASSERT_EQ(g.Submit(0, RevealAction{}), MoveOutcome::Applied);

    // Passes the gate; the effect itself refuses two targets.
    EXPECT_EQ(g.Submit(0, ActivateAbilityAction{.targets = {1, 2}}), MoveOutcome::Applied);
    ASSERT_TRUE(g.LastViolation().has_value());
    EXPECT_EQ(g.LastViolation()->code, RVC::Ability_BadTargetCount);
    EXPECT_FALSE(g.Session().Players()[0].AbilityUsed());

    t.dice->PushD6(3);
    EXPECT_EQ(g.Submit(0, ActivateAbilityAction{.targets = {1}}), MoveOutcome::Applied);
    EXPECT_FALSE(g.LastViolation().has_value());
    EXPECT_EQ(g.Session().Players()[1].Hp(), 8);
}

TEST(GameFlow, DeathOnOwnTurnEndsIt)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Franklin, CharacterId::Unknown, CharacterId::Vampire});
    GameImpl& g = *t.game;
    Player& emi = g.Session().Players()[0];
    emi.MoveTo(ZoneId::WeirdWoods);
    emi.SetHp(1);
    g.Session().SetPhase(Phase::Action);

    EXPECT_EQ(g.Submit(0, UseZoneAction{0, ZoneChoice::Damage}), MoveOutcome::TurnEnded);
    EXPECT_FALSE(emi.IsAlive());
    EXPECT_FALSE(g.IsOver());
    EXPECT_EQ(g.Current(), 1);
    ASSERT_EQ(g.Session().Tracking().deaths.size(), 1u);
    EXPECT_EQ(g.Session().Tracking().first_death, std::optional<PlayerId>{0});
}

TEST(GameFlow, LastShadowDownEndsTheGame)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Vampire, CharacterId::Allie});
    GameImpl& g = *t.game;
    std::optional<GameOver> over;
    auto const sub = g.Bus().Subscribe([&over](GameEvent const& ev)
    {
        if (auto const* e = std::get_if<GameOver>(&ev)) over = *e;
    });

    t.dice->PushD6(3);
    ASSERT_EQ(g.Submit(0, RollMoveAction{}), MoveOutcome::Applied);
    ASSERT_EQ(g.Submit(0, MoveAction{ZoneId::Church}), MoveOutcome::Applied);
    g.Session().Players()[1].MoveTo(ZoneId::Cemetery);
    g.Session().Players()[1].SetHp(2);
    t.dice->PushAttack(6, 2);

    EXPECT_EQ(g.Submit(0, AttackAction{1}), MoveOutcome::GameEnded);
    EXPECT_TRUE(g.IsOver());
    EXPECT_EQ(g.Session().Status(), SessionStatus::Finished);
    EXPECT_EQ(g.Session().WinningFaction(), std::optional<Faction>{Faction::Hunter});
    EXPECT_EQ(g.Session().Winners(), (std::vector<PlayerId>{0, 2}));
    ASSERT_TRUE(over.has_value());
    EXPECT_EQ(over->winners, (std::vector<PlayerId>{0, 2}));

    EXPECT_EQ(g.Submit(0, EndTurnAction{}), MoveOutcome::GameEnded);
    ASSERT_TRUE(g.LastViolation().has_value());
    EXPECT_EQ(g.LastViolation()->code, RVC::SessionNotRunning);
    g.Bus().Unsubscribe(sub);
}

TEST(GameFlow, SnapshotHidesOtherIdentities)
{
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown, CharacterId::Allie});
    GameImpl& g = *t.game;
    ASSERT_EQ(g.Submit(0, RevealAction{}), MoveOutcome::Applied);

    auto const snap = g.SnapshotFor(1);
    ASSERT_EQ(snap->players.size(), 3u);
    EXPECT_EQ(snap->seat, 1);
    EXPECT_EQ(snap->players[0].character, std::optional<CharacterId>{CharacterId::Emi});
    EXPECT_EQ(snap->players[1].character, std::optional<CharacterId>{CharacterId::Unknown});
    EXPECT_FALSE(snap->players[2].character.has_value());
    EXPECT_FALSE(snap->players[2].faction.has_value());
}

TEST(GameLoop, RepeatedRejectionsEndTheTurn)
{
    std::vector<std::unique_ptr<Agent>> agents;
    agents.emplace_back(std::make_unique<StubbornAgent>());
    agents.emplace_back(std::make_unique<StubbornAgent>());
    Table t = MakeTable({CharacterId::Emi, CharacterId::Unknown}, std::move(agents));
    GameImpl& g = *t.game;

    for (uint32_t i{}; i < GameImpl::MaxInvalidStreak; ++i)
    {
        EXPECT_EQ(g.Step(), MoveOutcome::Invalid);
    }
    EXPECT_EQ(g.Step(), MoveOutcome::TurnEnded);
    EXPECT_EQ(g.Current(), 1);
}

TEST(GameLoop, LateAgentLosesItsTurn)
{
    std::vector<std::unique_ptr<Agent>> agents;
    agents.emplace_back(std::make_unique<SlowAgent>());
    agents.emplace_back(std::make_unique<SlowAgent>());
    Config cfg{
        .n_players = 2,
        .seed = 8,
        .characters = {CharacterId::Emi, CharacterId::Unknown},
        .turn_timeout = std::chrono::milliseconds(20)
    };
    {
        GameImpl g{cfg, std::make_unique<StandardRules>(), std::move(agents)};
        EXPECT_EQ(g.Step(), MoveOutcome::TurnEnded);
        EXPECT_EQ(g.Current(), 1);
        // Let the abandoned decision finish before its agent goes away.
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
}
