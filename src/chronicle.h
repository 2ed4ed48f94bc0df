#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Appends a line and drops the oldest entries once the log exceeds maxLines.
// Empty lines are ignored.
void PushLog(std::vector<std::string> &log, const std::string &line, size_t maxLines = 16);

void PushLines(std::vector<std::string> &log, const std::vector<std::string> &lines, size_t maxLines = 16);

std::string JoinLines(const std::vector<std::string> &lines);
