#pragma once
///@file

#include "nixbind/util/fmt.hh"

#include <memory>
#include <string>
#include <string_view>

namespace nixbind {

/**
 * Log levels. The numeric values match the engine's `nix_verbosity`.
 */
typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

/**
 * Where nixbind's own diagnostics go. The engine logs separately, see
 * `setEngineVerbosity()`.
 */
class Logger
{
public:

    virtual ~Logger() = default;

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void warn(const std::string & msg)
    {
        log(lvlWarn, "warning: " + msg);
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * A logger that writes every message it receives to stderr, one line
 * per message.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * Messages above this level are neither formatted nor handed to
 * `logger`.
 */
extern Verbosity verbosity;

/**
 * A macro, so that the arguments are only evaluated when the message
 * is actually logged.
 */
#define printMsg(level, args...)                          \
    do {                                                  \
        auto __lvl = level;                               \
        if (__lvl <= nixbind::verbosity)                  \
            nixbind::logger->log(__lvl, nixbind::fmt(args)); \
    } while (0)

#define printError(args...) printMsg(nixbind::lvlError, args)
#define debug(args...) printMsg(nixbind::lvlDebug, args)

/**
 * Log a message with a `warning:` prefix if `verbosity` admits
 * warnings.
 */
template<typename... Args>
void warn(const std::string & fs, const Args &... args)
{
    if (lvlWarn <= verbosity)
        logger->warn(fmt(fs, args...));
}

} // namespace nixbind
