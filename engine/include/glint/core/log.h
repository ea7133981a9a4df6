#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace glint
{
namespace Log
{

enum class Level { Info, Warn, Error };

struct LogEntry
{
    Level level;
    double timestamp; // seconds since start
    std::string message;
};

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

// Drop console echo (tests keep the in-memory history only)
void setEcho(bool enabled);

const std::vector<LogEntry>& getEntries();
size_t countAtLevel(Level level);
void clear();

} // namespace Log
} // namespace glint
