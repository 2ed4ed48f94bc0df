#pragma once

#include "character.h"
#include "combat.h"
#include "random_source.h"
#include "scene.h"
#include "story.h"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

enum class GamePhase
{
    Story,
    Battle,
    Victory,
    GameOver
};

const char *GamePhaseLabel(GamePhase phase);

// Owns one play session: the player, the one-time flags, the active battle and
// the chronicle. The story graph is shared, read-only content.
class GameController
{
public:
    GameController(const StoryGraph &story, RandomSource &rng, const GameConfig &config = DefaultConfig());

    // The active battle holds a reference to the player member.
    GameController(const GameController &) = delete;
    GameController &operator=(const GameController &) = delete;
    GameController(GameController &&) = delete;
    GameController &operator=(GameController &&) = delete;

    // Validates the story and renders the entry node.
    const Frame &Start();

    // Index into the slots of the last emitted scene. Returns false and
    // changes nothing for disabled slots or after the game is over.
    bool SelectOption(size_t index);

    // Only meaningful during a battle.
    bool SelectCombatAction(CombatAction action);

    const Frame &CurrentFrame() const { return frame; }
    GamePhase Phase() const { return phase; }
    const std::string &CurrentNode() const { return currentNode; }
    const Player &GetPlayer() const { return player; }
    const CombatSession *Battle() const { return battle.get(); }
    const std::string &ReturnTarget() const { return returnTarget; }
    bool HasFlag(const std::string &flag) const;

    std::string StatusBar() const;
    const std::vector<std::string> &Chronicle() const { return chronicle; }

private:
    void EnterNode(const std::string &id);
    void StartBattle(const BattleRoute &route);
    void RunCombatAction(CombatAction action);
    void FinishStory(const std::string &ending);
    void RenderBattle();
    void RenderGameOver(const std::string &narration);
    void Log(const std::string &line);

    const StoryGraph &story;
    RandomSource &rng;
    GameConfig config;

    Player player;
    GamePhase phase = GamePhase::Story;
    std::string currentNode;
    std::unique_ptr<CombatSession> battle;
    std::string returnTarget;
    std::unordered_set<std::string> flags;
    std::vector<std::string> chronicle;
    Frame frame;
};
