#include "game_controller.h"

#include "chronicle.h"

const char *GamePhaseLabel(GamePhase phase)
{
    switch (phase)
    {
    case GamePhase::Story:
        return "Story";
    case GamePhase::Battle:
        return "Battle";
    case GamePhase::Victory:
        return "Victory";
    case GamePhase::GameOver:
        return "Game Over";
    default:
        return "Unknown";
    }
}

static bool AddFlag(std::unordered_set<std::string> &flags, const std::string &flag)
{
    if (flag.empty())
    {
        return false;
    }
    return flags.insert(flag).second;
}

GameController::GameController(const StoryGraph &story, RandomSource &rng, const GameConfig &config)
    : story(story), rng(rng), config(config), player(config)
{
}

const Frame &GameController::Start()
{
    story.Validate();
    Log("WORLD READY // " + std::to_string(story.Size()) + " story nodes loaded");
    EnterNode(story.Entry());
    return frame;
}

bool GameController::HasFlag(const std::string &flag) const
{
    return flags.find(flag) != flags.end();
}

bool GameController::SelectOption(size_t index)
{
    if (phase == GamePhase::GameOver || IsGameOver(frame))
    {
        return false;
    }

    const auto &scene = std::get<SceneDescriptor>(frame);
    if (index >= scene.options.size())
    {
        Log("LOCKED CHOICE // no slot at index " + std::to_string(index));
        return false;
    }
    if (!scene.options[index].enabled)
    {
        Log("LOCKED CHOICE // slot " + std::to_string(index + 1) + " is not available");
        return false;
    }

    switch (phase)
    {
    case GamePhase::Battle:
    {
        static const CombatAction kSlotActions[kMaxOptions] = {
            CombatAction::Quick, CombatAction::Heavy, CombatAction::Consumable};
        RunCombatAction(kSlotActions[index]);
        return true;
    }
    case GamePhase::Victory:
    {
        battle.reset();
        const std::string target = returnTarget;
        returnTarget.clear();
        EnterNode(target);
        return true;
    }
    default:
        break;
    }

    const StoryNode &node = story.Find(currentNode);
    if (index >= node.options.size())
    {
        return false;
    }

    const Option &pick = node.options[index];
    Log("YOU // " + pick.text);
    if (const auto *next = std::get_if<StoryRoute>(&pick.route))
    {
        EnterNode(next->target);
    }
    else if (const auto *fight = std::get_if<BattleRoute>(&pick.route))
    {
        StartBattle(*fight);
    }
    else
    {
        FinishStory(std::get<EndRoute>(pick.route).ending);
    }
    return true;
}

bool GameController::SelectCombatAction(CombatAction action)
{
    if (phase != GamePhase::Battle || !battle)
    {
        return false;
    }
    RunCombatAction(action);
    return true;
}

std::string GameController::StatusBar() const
{
    std::string items;
    for (const auto &entry : player.Inventory())
    {
        if (entry.second <= 0)
        {
            continue;
        }
        items += " | " + entry.first + " x" + std::to_string(entry.second);
    }

    return player.Name() + "  Lv " + std::to_string(player.Level()) +
           " | HP " + std::to_string(player.Health()) + "/" + std::to_string(player.MaxHealth()) +
           " | ATK " + std::to_string(player.Attack()) +
           " | XP " + std::to_string(player.Experience()) + "/" + std::to_string(player.ExpToNextLevel()) +
           " | SP " + std::to_string(player.SkillPoints()) + items;
}

void GameController::EnterNode(const std::string &id)
{
    const StoryNode &node = story.Find(id);
    currentNode = node.id;
    phase = GamePhase::Story;
    Log("NODE // " + node.caption);

    std::vector<std::string> lines{node.description};
    if (!node.effect.flag.empty())
    {
        if (AddFlag(flags, node.effect.flag))
        {
            const auto effectLines = ApplyEffect(node.effect, player);
            lines.push_back("");
            lines.insert(lines.end(), effectLines.begin(), effectLines.end());
            Log("EFFECT // " + node.effect.flag);
        }
        else
        {
            lines.push_back("");
            lines.push_back("Nothing new here.");
        }
    }

    SceneDescriptor scene;
    scene.caption = node.caption;
    scene.narration = JoinLines(lines);
    for (size_t i = 0; i < node.options.size() && i < scene.options.size(); ++i)
    {
        scene.options[i] = SceneOption{node.options[i].text, true};
    }
    frame = scene;
}

void GameController::StartBattle(const BattleRoute &route)
{
    returnTarget = route.returnTarget;
    battle = std::make_unique<CombatSession>(player, route.enemy, rng);
    phase = GamePhase::Battle;
    Log("BATTLE // " + route.enemy.name + " attacks");
    RenderBattle();
}

void GameController::RunCombatAction(CombatAction action)
{
    if (!battle->Act(action))
    {
        return;
    }

    switch (battle->State())
    {
    case CombatState::Won:
        phase = GamePhase::Victory;
        Log("VICTORY // " + battle->OpponentName() + " defeated");
        RenderBattle();
        break;
    case CombatState::Lost:
        Log("DEFEAT // fell to " + battle->OpponentName());
        RenderGameOver(JoinLines(battle->Log()) + "\n\nGAME OVER");
        battle.reset();
        break;
    default:
        RenderBattle();
        break;
    }
}

void GameController::FinishStory(const std::string &ending)
{
    Log("ENDING // story complete");
    RenderGameOver(ending + "\n\nTHE END");
}

void GameController::RenderBattle()
{
    SceneDescriptor scene;
    scene.caption = "Battle: " + battle->OpponentName();

    std::vector<std::string> lines;
    if (battle->Opponent())
    {
        lines.push_back(player.StatusLine() + "  |  " + battle->Opponent()->StatusLine());
        lines.push_back("");
    }
    lines.insert(lines.end(), battle->Log().begin(), battle->Log().end());
    scene.narration = JoinLines(lines);

    if (battle->State() == CombatState::Won)
    {
        scene.options[0] = SceneOption{"Continue", true};
    }
    else
    {
        scene.options[0] = SceneOption{CombatActionLabel(CombatAction::Quick), true};
        scene.options[1] = SceneOption{CombatActionLabel(CombatAction::Heavy), true};
        scene.options[2] = SceneOption{
            std::string(CombatActionLabel(CombatAction::Consumable)) + " (" + config.consumableName + " x" +
                std::to_string(player.ItemCount(config.consumableName)) + ")",
            true};
    }
    frame = scene;
}

void GameController::RenderGameOver(const std::string &narration)
{
    phase = GamePhase::GameOver;
    frame = GameOverDescriptor{narration};
}

void GameController::Log(const std::string &line)
{
    PushLog(chronicle, line, config.chronicleLines);
}
