#include <prism/core/log.h>
#include <iostream>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace prism
{
namespace Log
{

static std::vector<LogEntry> s_entries;
static std::mutex s_mutex;
static bool s_quiet = false;
static const auto s_startTime = std::chrono::steady_clock::now();

static double elapsed()
{
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - s_startTime).count();
}

static void print(const char* tag, std::ostream& out, double ts, std::string_view msg)
{
    char tsBuf[16];
    std::snprintf(tsBuf, sizeof(tsBuf), "[%7.3fs]", ts);
    out << tsBuf << " " << tag << " " << msg << "\n";
}

static void record(Level level, const char* tag, std::ostream& out, std::string_view msg)
{
    double ts = elapsed();
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_quiet)
        print(tag, out, ts, msg);
    s_entries.push_back({ level, ts, std::string(msg) });
}

void info(std::string_view msg)
{
    record(Level::Info, "[PRISM INFO]", std::cout, msg);
}

void warn(std::string_view msg)
{
    record(Level::Warn, "[PRISM WARN]", std::cerr, msg);
}

void error(std::string_view msg)
{
    record(Level::Error, "[PRISM ERROR]", std::cerr, msg);
}

void setQuiet(bool quiet)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_quiet = quiet;
}

std::vector<LogEntry> getEntries()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_entries;
}

void clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_entries.clear();
}

} // namespace Log
} // namespace prism
