#include "game_controller.h"
#include "story_content.h"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <variant>
#include <vector>

static unsigned char U8(int value)
{
    return static_cast<unsigned char>(std::clamp(value, 0, 255));
}

static uint32_t HashNoise(int x, int y, int frame)
{
    uint32_t h = static_cast<uint32_t>(x) * 374761393u;
    h += static_cast<uint32_t>(y) * 668265263u;
    h += static_cast<uint32_t>(frame) * 2246822519u;
    h = (h ^ (h >> 13u)) * 1274126177u;
    return h ^ (h >> 16u);
}

static bool ParseSeed(int argc, char **argv, uint32_t &seed)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--seed") != 0)
        {
            continue;
        }
        if (i + 1 >= argc)
        {
            return false;
        }
        char *end = nullptr;
        const unsigned long value = std::strtoul(argv[i + 1], &end, 10);
        if (end == argv[i + 1] || *end != '\0')
        {
            return false;
        }
        seed = static_cast<uint32_t>(value);
        ++i;
    }
    return true;
}

// Splits text on newlines, then greedily packs words into lines no wider than maxWidth.
static std::vector<std::string> WrapText(const std::string &text, int fontSize, int maxWidth)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size())
    {
        const size_t end = std::min(text.find('\n', start), text.size());
        const std::string paragraph = text.substr(start, end - start);

        std::string line;
        size_t pos = 0;
        while (pos < paragraph.size())
        {
            const size_t space = std::min(paragraph.find(' ', pos), paragraph.size());
            const std::string word = paragraph.substr(pos, space - pos);
            const std::string candidate = line.empty() ? word : line + " " + word;
            if (!line.empty() && MeasureText(candidate.c_str(), fontSize) > maxWidth)
            {
                out.push_back(line);
                line = word;
            }
            else
            {
                line = candidate;
            }
            pos = space + 1;
        }
        out.push_back(line);
        start = end + 1;
    }
    return out;
}

static void DrawBackdrop(GamePhase phase, int w, int h, float t)
{
    switch (phase)
    {
    case GamePhase::Battle:
    {
        DrawRectangleGradientV(0, 0, w, h, Color{46, 12, 16, 255}, Color{10, 4, 6, 255});
        const int pulse = 60 + static_cast<int>((std::sin(t * 3.0f) + 1.0f) * 30.0f);
        DrawRectangle(0, 0, w, 72, Color{96, 20, 22, U8(pulse)});
        DrawCircleGradient(w / 2, 150, 240.0f, Color{220, 60, 48, 44}, BLANK);
        break;
    }
    case GamePhase::Victory:
        DrawRectangleGradientV(0, 0, w, h, Color{40, 36, 14, 255}, Color{8, 8, 4, 255});
        DrawCircleGradient(w / 2, 140, 260.0f, Color{240, 210, 120, 52}, BLANK);
        break;
    case GamePhase::GameOver:
        DrawRectangleGradientV(0, 0, w, h, Color{8, 10, 14, 255}, Color{0, 0, 0, 255});
        break;
    default:
    {
        DrawRectangleGradientV(0, 0, w, h, Color{14, 38, 30, 255}, Color{4, 12, 10, 255});
        const float sway = std::sin(t * 0.6f) * 26.0f;
        DrawCircleGradient(w / 3 + static_cast<int>(sway), 160, 260.0f, Color{74, 160, 110, 60}, BLANK);
        for (int i = 0; i < 14; ++i)
        {
            const float x = 40.0f + static_cast<float>(i) * 96.0f;
            const float bend = std::sin(t * 0.8f + static_cast<float>(i) * 0.9f) * 12.0f;
            DrawLineEx(Vector2{x, static_cast<float>(h)}, Vector2{x + bend, static_cast<float>(h) - 180.0f},
                       3.0f, Color{60, 120, 80, 70});
        }
        break;
    }
    }
}

static void DrawSpores(int w, int h, int frame)
{
    for (int i = 0; i < 160; ++i)
    {
        const uint32_t n = HashNoise(i * 23, frame / 3 + i * 11, frame / 3);
        const int x = static_cast<int>(n % static_cast<uint32_t>(w));
        const int y = static_cast<int>((n / 17u) % static_cast<uint32_t>(h));
        if ((n & 15u) == 0u)
        {
            DrawCircle(x, y, 1.5f, Color{170, 240, 190, 34});
        }
    }
}

static void DrawCinematicFrame(int screenWidth, int screenHeight, float t)
{
    const int topBand = 36;
    const int bottomBand = 40;
    DrawRectangle(0, 0, screenWidth, topBand, Color{2, 2, 4, 230});
    DrawRectangle(0, screenHeight - bottomBand, screenWidth, bottomBand, Color{2, 2, 4, 236});
    DrawRectangleGradientV(0, topBand - 2, screenWidth, 24,
                           Color{0, 0, 0, U8(120 + static_cast<int>(std::sin(t * 1.5f) * 12.0f))}, BLANK);
}

static void DrawStatusBar(const GameController &game, int w)
{
    const Player &player = game.GetPlayer();
    DrawText(game.StatusBar().c_str(), 14, 10, 17, Color{198, 216, 225, 240});

    const int barWidth = 180;
    const int x = w - barWidth - 60;
    const int filled = player.MaxHealth() > 0 ? (barWidth * player.Health()) / player.MaxHealth() : 0;
    DrawRectangle(x, 12, barWidth, 12, Color{56, 22, 22, 220});
    DrawRectangle(x, 12, filled, 12, Color{112, 214, 140, 245});
    DrawRectangleLines(x, 12, barWidth, 12, Color{130, 152, 166, 220});
    DrawText(GamePhaseLabel(game.Phase()), x + barWidth + 8, 10, 14, Color{238, 198, 132, 255});
}

static Rectangle SlotRect(size_t slot, int w, int h)
{
    return Rectangle{
        46.0f,
        static_cast<float>(h - 290 + static_cast<int>(slot) * 40),
        static_cast<float>(w - 92),
        34.0f};
}

static void DrawNarrationPanel(const std::string &caption, const std::string &narration, int w, int h)
{
    const Rectangle panel{30.0f, 52.0f, static_cast<float>(w - 60), static_cast<float>(h - 360)};
    DrawRectangleRec(panel, Color{7, 8, 10, 220});
    DrawRectangleLinesEx(panel, 1.8f, Color{125, 157, 180, 255});

    DrawText(caption.c_str(), static_cast<int>(panel.x + 16.0f), static_cast<int>(panel.y + 14.0f), 24,
             Color{246, 188, 128, 255});

    const int fontSize = 18;
    const int lineHeight = 22;
    const auto lines = WrapText(narration, fontSize, static_cast<int>(panel.width) - 32);
    const int capacity = (static_cast<int>(panel.height) - 56) / lineHeight;
    const size_t visible = static_cast<size_t>(std::max(capacity, 1));
    const size_t start = lines.size() > visible ? lines.size() - visible : 0;
    for (size_t i = start; i < lines.size(); ++i)
    {
        const int row = static_cast<int>(i - start);
        DrawText(lines[i].c_str(), static_cast<int>(panel.x + 16.0f),
                 static_cast<int>(panel.y + 48.0f) + row * lineHeight, fontSize, RAYWHITE);
    }
}

static void DrawOptionSlots(const SceneDescriptor &scene, int w, int h)
{
    for (size_t i = 0; i < scene.options.size(); ++i)
    {
        const SceneOption &option = scene.options[i];
        const Rectangle btn = SlotRect(i, w, h);
        const bool hover = option.enabled && CheckCollisionPointRec(GetMousePosition(), btn);

        const Color base = !option.enabled ? Color{20, 20, 24, 160}
                                           : (hover ? Color{58, 76, 88, 255} : Color{32, 42, 52, 255});
        const Color border = !option.enabled ? Color{72, 72, 82, 160} : Color{132, 154, 172, 255};
        DrawRectangleRec(btn, base);
        DrawRectangleLinesEx(btn, 1.0f, border);

        if (option.enabled)
        {
            DrawText(TextFormat("%d. %s", static_cast<int>(i + 1), option.label.c_str()),
                     static_cast<int>(btn.x + 10.0f), static_cast<int>(btn.y + 8.0f), 18, RAYWHITE);
        }
    }
}

static void DrawChronicle(const std::vector<std::string> &chronicle, int w, int h)
{
    DrawRectangle(0, h - 168, w, 128, Color{8, 10, 14, 190});
    DrawText("CHRONICLE", 14, h - 162, 16, Color{238, 198, 132, 255});
    const size_t visibleLines = 5;
    const size_t start = (chronicle.size() > visibleLines) ? chronicle.size() - visibleLines : 0;
    for (size_t i = start; i < chronicle.size(); ++i)
    {
        const int row = static_cast<int>(i - start);
        DrawText(chronicle[i].c_str(), 14, h - 140 + row * 19, 15, Color{198, 208, 214, 246});
    }
}

// One intent per frame at most; the controller runs the whole turn before the next frame.
static void HandleInput(GameController &game, int w, int h)
{
    if (game.Phase() == GamePhase::GameOver)
    {
        return;
    }

    if (game.Phase() == GamePhase::Battle)
    {
        if (IsKeyPressed(KEY_Q))
        {
            game.SelectCombatAction(CombatAction::Quick);
            return;
        }
        if (IsKeyPressed(KEY_H))
        {
            game.SelectCombatAction(CombatAction::Heavy);
            return;
        }
        if (IsKeyPressed(KEY_C))
        {
            game.SelectCombatAction(CombatAction::Consumable);
            return;
        }
    }

    const int keys[kMaxOptions] = {KEY_ONE, KEY_TWO, KEY_THREE};
    for (size_t i = 0; i < kMaxOptions; ++i)
    {
        if (IsKeyPressed(keys[i]))
        {
            game.SelectOption(i);
            return;
        }
    }

    if (!IsMouseButtonPressed(MOUSE_LEFT_BUTTON))
    {
        return;
    }

    const auto *scene = std::get_if<SceneDescriptor>(&game.CurrentFrame());
    if (scene == nullptr)
    {
        return;
    }
    for (size_t i = 0; i < scene->options.size(); ++i)
    {
        if (scene->options[i].enabled && CheckCollisionPointRec(GetMousePosition(), SlotRect(i, w, h)))
        {
            game.SelectOption(i);
            return;
        }
    }
}

// Keeps the raylib window open for the lifetime of the scope.
struct WindowSession
{
    explicit WindowSession(const GameConfig &config)
    {
        InitWindow(config.screenWidth, config.screenHeight, config.windowTitle.c_str());
        SetTargetFPS(60);
    }
    ~WindowSession() { CloseWindow(); }

    WindowSession(const WindowSession &) = delete;
    WindowSession &operator=(const WindowSession &) = delete;
};

static void RunGame(const GameConfig &config)
{
    const StoryGraph story = BuildSwampStory();
    MersenneRandom rng(config.seed);
    GameController game(story, rng, config);

    WindowSession window(config);
    TraceLog(LOG_INFO, "ASTROFROG: session seed %u", static_cast<unsigned>(config.seed));
    game.Start();

    const int w = config.screenWidth;
    const int h = config.screenHeight;
    int frameCounter = 0;

    while (!WindowShouldClose())
    {
        ++frameCounter;
        const float t = static_cast<float>(GetTime());

        HandleInput(game, w, h);

        BeginDrawing();
        ClearBackground(BLACK);

        DrawBackdrop(game.Phase(), w, h, t);
        DrawSpores(w, h, frameCounter);

        const Frame &frame = game.CurrentFrame();
        if (const auto *scene = std::get_if<SceneDescriptor>(&frame))
        {
            DrawNarrationPanel(scene->caption, scene->narration, w, h);
            DrawOptionSlots(*scene, w, h);
        }
        else
        {
            const auto &over = std::get<GameOverDescriptor>(frame);
            DrawNarrationPanel("Game Over", over.narration, w, h);
            DrawText("ESC: quit", 46, h - 286, 18, Color{182, 182, 182, 210});
        }

        DrawChronicle(game.Chronicle(), w, h);
        DrawCinematicFrame(w, h, t);
        DrawStatusBar(game, w);
        DrawText("LMB or 1-3: choose | Q/H/C in battle | ESC: quit", w - 430, h - 26, 12,
                 Color{182, 182, 182, 210});

        EndDrawing();
    }
}

int main(int argc, char **argv)
{
    GameConfig config;
    if (!ParseSeed(argc, argv, config.seed))
    {
        TraceLog(LOG_ERROR, "usage: %s [--seed N]", argv[0]);
        return 1;
    }
    config.seed = ResolveSeed(config.seed);

    try
    {
        RunGame(config);
    }
    catch (const ContentError &e)
    {
        TraceLog(LOG_ERROR, "ASTROFROG: story content rejected: %s", e.what());
        return 1;
    }
    return 0;
}
