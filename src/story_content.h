#pragma once

#include "story.h"

// Enemies met on the swamp world.
EnemyTemplate TuskedFrog();
EnemyTemplate BogLurker();
EnemyTemplate FrogMatriarch();

// The authored adventure. Entry node is "crash_site".
StoryGraph BuildSwampStory();
