#include <rgmcp/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace rgmcp
{
namespace log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::atomic<std::ostream*> g_sink{nullptr};
std::mutex g_write_mutex;

std::string to_lower(std::string input)
{
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input;
}

// One record per line: embedded line breaks are written escaped
std::string single_line(const std::string& message)
{
    if (message.find_first_of("\r\n") == std::string::npos)
        return message;

    std::string out;
    out.reserve(message.size() + 8);
    for (char c : message)
    {
        if (c == '\n')
            out += "\\n";
        else if (c == '\r')
            out += "\\r";
        else
            out += c;
    }
    return out;
}
} // namespace

std::optional<Level> parse_level(const std::string& name)
{
    std::string normalized = to_lower(name);
    if (normalized == "trace")
        return Level::Trace;
    if (normalized == "debug")
        return Level::Debug;
    if (normalized == "info")
        return Level::Info;
    if (normalized == "warn" || normalized == "warning")
        return Level::Warn;
    if (normalized == "error")
        return Level::Error;
    return std::nullopt;
}

const char* level_name(Level level)
{
    switch (level)
    {
    case Level::Trace:
        return "TRACE";
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level.store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level)
{
    return static_cast<int>(level) >= g_level.load();
}

void set_sink(std::ostream* sink)
{
    g_sink.store(sink);
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;

    std::ostream* sink = g_sink.load();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = sink ? *sink : std::cerr;
    out << "[rgmcp] " << level_name(level) << " " << single_line(message) << std::endl;
}

} // namespace log
} // namespace rgmcp
