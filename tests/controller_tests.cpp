#include <catch2/catch.hpp>

#include "game_controller.h"
#include "scripted_random.h"
#include "story_content.h"

#include <algorithm>
#include <limits>
#include <type_traits>

// The active battle refers to the controller's own player.
static_assert(!std::is_copy_constructible<GameController>::value, "controller must stay in place");
static_assert(!std::is_move_constructible<GameController>::value, "controller must stay in place");

static const SceneDescriptor &Scene(const GameController &game)
{
    return std::get<SceneDescriptor>(game.CurrentFrame());
}

static bool ChronicleContains(const GameController &game, const std::string &needle)
{
    const auto &log = game.Chronicle();
    return std::any_of(log.begin(), log.end(),
                       [&](const std::string &line) { return line.find(needle) != std::string::npos; });
}

// crash_site -> swamp_edge -> fight the Tusked Frog with three quick hits.
static void WinFirstFight(GameController &game)
{
    REQUIRE(game.SelectOption(1));
    REQUIRE(game.CurrentNode() == "swamp_edge");
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.Phase() == GamePhase::Battle);
    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(game.SelectOption(0));
    }
    REQUIRE(game.Phase() == GamePhase::Victory);
}

TEST_CASE("Start renders the entry node with three slots", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    GameController game(story, rng);

    const Frame &frame = game.Start();
    REQUIRE_FALSE(IsGameOver(frame));

    const SceneDescriptor &scene = Scene(game);
    CHECK(game.CurrentNode() == "crash_site");
    CHECK(scene.caption == "Crashed Lander");
    CHECK(scene.narration.find("lander") != std::string::npos);
    CHECK(scene.options[0].enabled);
    CHECK(scene.options[0].label == "Search the wreckage.");
    CHECK(scene.options[1].enabled);
    CHECK_FALSE(scene.options[2].enabled);
    CHECK(scene.options[2].label.empty());
    CHECK(ChronicleContains(game, "WORLD READY"));
}

TEST_CASE("Disabled and out of range slots are ignored", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    GameController game(story, rng);
    game.Start();

    CHECK_FALSE(game.SelectOption(2));
    CHECK_FALSE(game.SelectOption(7));
    CHECK_FALSE(game.SelectOption(std::numeric_limits<size_t>::max()));
    CHECK(ChronicleContains(game, "no slot at index " + std::to_string(std::numeric_limits<size_t>::max())));
    CHECK_FALSE(ChronicleContains(game, "slot 0"));
    CHECK(game.CurrentNode() == "crash_site");
    CHECK(ChronicleContains(game, "LOCKED CHOICE"));
    CHECK_FALSE(game.SelectCombatAction(CombatAction::Quick));
}

TEST_CASE("One-time loot is granted on the first visit only", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    GameController game(story, rng);
    game.Start();

    REQUIRE(game.SelectOption(0));
    const std::string firstVisit = Scene(game).narration;
    CHECK(firstVisit.find("Found 1x Med Gel.") != std::string::npos);
    CHECK(game.GetPlayer().ItemCount("Med Gel") == 2);
    CHECK(game.HasFlag("wreckage_looted"));

    REQUIRE(game.SelectOption(0));
    REQUIRE(game.CurrentNode() == "crash_site");
    REQUIRE(game.SelectOption(0));
    const std::string secondVisit = Scene(game).narration;
    CHECK(secondVisit.find("Nothing new here.") != std::string::npos);
    CHECK(secondVisit != firstVisit);
    CHECK(game.GetPlayer().ItemCount("Med Gel") == 2);
}

TEST_CASE("One-time flags belong to the session", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    GameController first(story, rng);
    GameController second(story, rng);
    first.Start();
    second.Start();

    REQUIRE(first.SelectOption(0));
    REQUIRE(second.SelectOption(0));
    CHECK(first.GetPlayer().ItemCount("Med Gel") == 2);
    CHECK(second.GetPlayer().ItemCount("Med Gel") == 2);
}

TEST_CASE("Winning a battle returns to the recorded node", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    rng.Ranges({20, 10, 20, 10, 20});
    GameController game(story, rng);
    game.Start();

    REQUIRE(game.SelectOption(1));
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.Phase() == GamePhase::Battle);
    CHECK(game.ReturnTarget() == "reeds");
    CHECK(Scene(game).caption == "Battle: Tusked Frog");
    CHECK(Scene(game).options[0].label == "Quick Attack");
    CHECK(Scene(game).options[1].label == "Heavy Attack");
    CHECK(Scene(game).options[2].label == "Use Item (Med Gel x1)");
    CHECK(ChronicleContains(game, "BATTLE // Tusked Frog attacks"));

    REQUIRE(game.SelectCombatAction(CombatAction::Quick));
    CHECK(game.GetPlayer().Health() == 90);
    CHECK(Scene(game).narration.find("Tusked Frog: Health - 30/50") != std::string::npos);

    REQUIRE(game.SelectOption(0));
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.Phase() == GamePhase::Victory);
    CHECK(game.Battle()->State() == CombatState::Won);

    const SceneDescriptor &victory = Scene(game);
    CHECK(victory.options[0].label == "Continue");
    CHECK(victory.options[0].enabled);
    CHECK_FALSE(victory.options[1].enabled);
    CHECK_FALSE(victory.options[2].enabled);
    CHECK(victory.narration.find("LEVEL UP!") != std::string::npos);
    CHECK_FALSE(game.SelectCombatAction(CombatAction::Quick));

    REQUIRE(game.SelectOption(0));
    CHECK(game.Phase() == GamePhase::Story);
    CHECK(game.CurrentNode() == "reeds");
    CHECK(game.Battle() == nullptr);
    CHECK(game.GetPlayer().Level() == 2);
    CHECK(ChronicleContains(game, "VICTORY // Tusked Frog defeated"));
}

TEST_CASE("Battle slots map to heavy attack and item use", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    rng.Units({0.9}).Ranges({10, 10});
    GameController game(story, rng);
    game.Start();

    REQUIRE(game.SelectOption(1));
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.Phase() == GamePhase::Battle);

    // Slot 2 is the heavy attack; a draw of 0.9 misses.
    REQUIRE(game.SelectOption(1));
    CHECK(game.Battle()->Opponent()->Health() == 50);
    CHECK(game.GetPlayer().Health() == 90);
    CHECK(Scene(game).narration.find("dodged the heavy attack") != std::string::npos);

    // Slot 3 uses the Med Gel.
    REQUIRE(game.SelectOption(2));
    CHECK(game.GetPlayer().ItemCount("Med Gel") == 0);
    CHECK(game.GetPlayer().Health() == 90);
    CHECK(game.Battle()->Opponent()->Health() == 50);
    CHECK(Scene(game).narration.find("recover 10 HP") != std::string::npos);
    CHECK(Scene(game).options[2].label == "Use Item (Med Gel x0)");
    CHECK(rng.PendingRanges() == 0);
}

TEST_CASE("Each battle option spawns a fresh enemy", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    rng.Ranges({20, 10});
    GameController game(story, rng);
    game.Start();

    REQUIRE(game.SelectOption(1));
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.SelectCombatAction(CombatAction::Quick));
    CHECK(game.Battle()->Opponent()->Health() == 30);

    // A second controller reaching the same option meets a full-health frog.
    GameController other(story, rng);
    other.Start();
    REQUIRE(other.SelectOption(1));
    REQUIRE(other.SelectOption(0));
    CHECK(other.Battle()->Opponent()->Health() == 50);
}

TEST_CASE("Losing a battle ends the game", "[controller]")
{
    GameConfig config;
    config.playerHealth = 5;
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    rng.Ranges({20, 10});
    GameController game(story, rng, config);
    game.Start();

    REQUIRE(game.SelectOption(1));
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.SelectCombatAction(CombatAction::Quick));

    REQUIRE(IsGameOver(game.CurrentFrame()));
    CHECK(game.Phase() == GamePhase::GameOver);
    CHECK(game.Battle() == nullptr);
    const auto &over = std::get<GameOverDescriptor>(game.CurrentFrame());
    CHECK(over.narration.find("GAME OVER") != std::string::npos);
    CHECK(ChronicleContains(game, "DEFEAT // fell to Tusked Frog"));

    CHECK_FALSE(game.SelectOption(0));
    CHECK_FALSE(game.SelectCombatAction(CombatAction::Quick));
}

TEST_CASE("Endings leave no options and freeze the session", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    rng.Ranges({20, 10, 20, 10, 20});
    GameController game(story, rng);
    game.Start();

    WinFirstFight(game);
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.SelectOption(1));
    REQUIRE(game.CurrentNode() == "ridge");
    REQUIRE(game.SelectOption(0));
    REQUIRE(game.CurrentNode() == "beacon");
    CHECK(Scene(game).narration.find("gains 15 XP") != std::string::npos);

    REQUIRE(game.SelectOption(1));
    REQUIRE(IsGameOver(game.CurrentFrame()));
    CHECK(game.Phase() == GamePhase::GameOver);
    const auto &over = std::get<GameOverDescriptor>(game.CurrentFrame());
    CHECK(over.narration.find("rescue shuttle") != std::string::npos);
    CHECK(ChronicleContains(game, "ENDING // story complete"));

    const int health = game.GetPlayer().Health();
    const int experience = game.GetPlayer().Experience();
    for (size_t slot = 0; slot < 4; ++slot)
    {
        CHECK_FALSE(game.SelectOption(slot));
    }
    CHECK_FALSE(game.SelectCombatAction(CombatAction::Heavy));
    CHECK(game.CurrentNode() == "beacon");
    CHECK(game.GetPlayer().Health() == health);
    CHECK(game.GetPlayer().Experience() == experience);
    CHECK(IsGameOver(game.CurrentFrame()));
}

TEST_CASE("Status bar summarises the player", "[controller]")
{
    const StoryGraph story = BuildSwampStory();
    ScriptedRandom rng;
    GameController game(story, rng);
    game.Start();

    CHECK(game.StatusBar() == "Astronaut  Lv 1 | HP 100/100 | ATK 20 | XP 0/20 | SP 0 | Med Gel x1");
}

TEST_CASE("Broken content is rejected at start", "[controller]")
{
    StoryGraph story;
    story.Add(StoryNode{"start", "Start", "Nowhere to go.", {{"Leave.", StoryRoute{"missing"}}}, {}});
    story.SetEntry("start");
    ScriptedRandom rng;
    GameController game(story, rng);

    CHECK_THROWS_AS(game.Start(), ContentError);
}
