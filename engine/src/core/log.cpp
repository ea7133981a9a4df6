#include <glint/core/log.h>
#include <iostream>
#include <chrono>
#include <cstdio>

namespace glint
{
namespace Log
{

static std::vector<LogEntry> s_entries;
static const auto s_startTime = std::chrono::steady_clock::now();
static bool s_echo = true;

// The editor console only ever shows the tail
static constexpr size_t MAX_ENTRIES = 4096;

static double elapsed()
{
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - s_startTime).count();
}

static void record(Level level, const char* tag, std::ostream& out, std::string_view msg)
{
    double ts = elapsed();
    if (s_echo)
    {
        char tsBuf[16];
        std::snprintf(tsBuf, sizeof(tsBuf), "[%7.3fs]", ts);
        out << tsBuf << " " << tag << " " << msg << "\n";
    }

    if (s_entries.size() >= MAX_ENTRIES)
        s_entries.erase(s_entries.begin(), s_entries.begin() + MAX_ENTRIES / 4);
    s_entries.push_back({ level, ts, std::string(msg) });
}

void info(std::string_view msg)
{
    record(Level::Info, "[GLINT INFO]", std::cout, msg);
}

void warn(std::string_view msg)
{
    record(Level::Warn, "[GLINT WARN]", std::cerr, msg);
}

void error(std::string_view msg)
{
    record(Level::Error, "[GLINT ERROR]", std::cerr, msg);
}

void setEcho(bool enabled)
{
    s_echo = enabled;
}

const std::vector<LogEntry>& getEntries()
{
    return s_entries;
}

size_t countAtLevel(Level level)
{
    size_t n = 0;
    for (const auto& e : s_entries)
        if (e.level == level)
            ++n;
    return n;
}

void clear()
{
    s_entries.clear();
}

} // namespace Log
} // namespace glint
