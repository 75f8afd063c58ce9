#pragma once
///@file

#include "nixbind/util/logging.hh"

#include <memory>
#include <sstream>
#include <string>

namespace nixbind {

/**
 * A logger that records the messages it is handed. The logging macros
 * and `warn()` check `verbosity` before calling the logger, so messages
 * above it never arrive here.
 */
class CaptureLogger : public Logger
{
    std::ostringstream oss;

public:

    std::string get() const
    {
        return oss.str();
    }

    void log(Verbosity lvl, std::string_view s) override;
};

/**
 * Replaces the global logger with a `CaptureLogger` for the lifetime of
 * this object.
 */
class CaptureLogging
{
    std::unique_ptr<Logger> oldLogger;
    CaptureLogger * capture;

public:

    CaptureLogging();

    CaptureLogging(const CaptureLogging &) = delete;
    CaptureLogging & operator=(const CaptureLogging &) = delete;

    ~CaptureLogging();

    std::string get() const
    {
        return capture->get();
    }
};

} // namespace nixbind
