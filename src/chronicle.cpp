#include "chronicle.h"

void PushLog(std::vector<std::string> &log, const std::string &line, size_t maxLines)
{
    if (line.empty())
    {
        return;
    }
    log.push_back(line);
    if (log.size() > maxLines)
    {
        const size_t overflow = log.size() - maxLines;
        log.erase(log.begin(), log.begin() + static_cast<std::ptrdiff_t>(overflow));
    }
}

void PushLines(std::vector<std::string> &log, const std::vector<std::string> &lines, size_t maxLines)
{
    for (const auto &line : lines)
    {
        PushLog(log, line, maxLines);
    }
}

std::string JoinLines(const std::vector<std::string> &lines)
{
    std::string text;
    for (const auto &line : lines)
    {
        if (!text.empty())
        {
            text += '\n';
        }
        text += line;
    }
    return text;
}
