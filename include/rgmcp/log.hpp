#ifndef RGMCP_LOG_HPP
#define RGMCP_LOG_HPP

#include <optional>
#include <ostream>
#include <string>

namespace rgmcp
{
namespace log
{

enum class Level
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error
};

/// Parse a level name (case-insensitive). Returns nullopt for unknown names.
std::optional<Level> parse_level(const std::string& name);

const char* level_name(Level level);

/// Records below this level are dropped. Default: Info.
void set_level(Level level);
Level level();

bool enabled(Level level);

/// Redirect output (tests). Default is std::cerr; stdout is reserved for protocol data.
void set_sink(std::ostream* sink);

/// Write one line: "[rgmcp] LEVEL message"
void write(Level level, const std::string& message);

inline void trace(const std::string& message)
{
    write(Level::Trace, message);
}
inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace log
} // namespace rgmcp

#endif // RGMCP_LOG_HPP
