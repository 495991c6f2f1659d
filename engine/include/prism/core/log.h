#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace prism
{
namespace Log
{

enum class Level { Info, Warn, Error };

struct LogEntry
{
    Level level;
    double timestamp; // seconds since first use of the log
    std::string message;
};

// Thread-safe; worker threads may log during a dispatch.
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

// Suppresses console output (entries are still recorded). Used by tests.
void setQuiet(bool quiet);

std::vector<LogEntry> getEntries();
void clear();

} // namespace Log
} // namespace prism
