#include "story_content.h"

EnemyTemplate TuskedFrog()
{
    return EnemyTemplate{"Tusked Frog", 50, 10, 25};
}

EnemyTemplate BogLurker()
{
    return EnemyTemplate{"Bog Lurker", 70, 12, 35};
}

EnemyTemplate FrogMatriarch()
{
    return EnemyTemplate{"Frog Matriarch", 110, 16, 60};
}

StoryGraph BuildSwampStory()
{
    std::vector<StoryNode> nodes;

    nodes.push_back(StoryNode{
        "crash_site",
        "Crashed Lander",
        "Your lander lies half sunk in black mud. Steam hisses from the hull and the swamp "
        "croaks back at you from every direction.",
        {
            {"Search the wreckage.", StoryRoute{"wreckage"}},
            {"Wade into the swamp.", StoryRoute{"swamp_edge"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "wreckage",
        "Lander Wreckage",
        "Twisted panels and a cracked emergency locker. Most of the supplies floated away.",
        {
            {"Climb back out.", StoryRoute{"crash_site"}},
        },
        {"wreckage_looted", "You pry the locker open.", 0, "Med Gel", 1, 0}});

    nodes.push_back(StoryNode{
        "swamp_edge",
        "Swamp Edge",
        "A Tusked Frog the size of a rover squats on the only dry path. Its tusks drip with "
        "algae as it turns to face you.",
        {
            {"Fight the Tusked Frog.", BattleRoute{TuskedFrog(), "reeds"}},
            {"Retreat to the lander.", StoryRoute{"crash_site"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "reeds",
        "Whispering Reeds",
        "Past the frog the path splits. Glowing spores drift to the left; a rocky ridge rises "
        "to the right.",
        {
            {"Follow the glowing spores.", StoryRoute{"spore_pool"}},
            {"Climb the ridge.", StoryRoute{"ridge"}},
            {"Head back to the swamp edge.", StoryRoute{"swamp_edge"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "spore_pool",
        "Spore Pool",
        "A warm pool shimmers with bioluminescent spores.",
        {
            {"Return to the reeds.", StoryRoute{"reeds"}},
        },
        {"spore_pool_bathed", "The spores settle on your suit and knit your wounds.", 40, "", 0, 0}});

    nodes.push_back(StoryNode{
        "ridge",
        "Survey Ridge",
        "From the ridge you can see the whole basin. A survey beacon blinks beside a cave "
        "mouth that reeks of frog.",
        {
            {"Inspect the survey beacon.", StoryRoute{"beacon"}},
            {"Descend toward the cave.", StoryRoute{"lair_gate"}},
            {"Go back down to the reeds.", StoryRoute{"reeds"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "beacon",
        "Survey Beacon",
        "The beacon is an old colony model. Its console still answers.",
        {
            {"Return to the ridge.", StoryRoute{"ridge"}},
            {"Send a distress call and wait.",
             EndRoute{"A rescue shuttle answers within the hour. You leave the swamp with its "
                      "secrets intact and a story nobody believes."}},
        },
        {"beacon_calibrated", "You recalibrate the beacon and download the basin survey.", 0, "", 0, 15}});

    nodes.push_back(StoryNode{
        "lair_gate",
        "Cave Mouth",
        "A Bog Lurker uncoils from the mud at the cave entrance, blocking the way in.",
        {
            {"Fight the Bog Lurker.", BattleRoute{BogLurker(), "lair"}},
            {"Back off to the ridge.", StoryRoute{"ridge"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "lair",
        "Matriarch's Lair",
        "Deep in the cave the Frog Matriarch rests on a mound of salvaged metal. Your lander's "
        "missing fuel cell glows among the scrap.",
        {
            {"Challenge the Frog Matriarch.", BattleRoute{FrogMatriarch(), "throne"}},
            {"Flee to the ridge.", StoryRoute{"ridge"}},
        },
        {}});

    nodes.push_back(StoryNode{
        "throne",
        "Scrap Throne",
        "The Matriarch's mound is yours. The fuel cell is intact.",
        {
            {"Refit the lander and launch.",
             EndRoute{"The lander coughs, then roars. You break orbit with a fuel cell, a tusk and "
                      "a new respect for amphibians."}},
            {"Stay and study the swamp.",
             EndRoute{"You set up camp beside the beacon. The frogs keep their distance now. "
                      "Science can wait for the rescue ship."}},
        },
        {"matriarch_hoard", "You dig through the hoard.", 0, "Frog Tusk", 1, 0}});

    return StoryGraph(std::move(nodes), "crash_site");
}
