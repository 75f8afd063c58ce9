#include "nixbind/util/tests/capture-logger.hh"

namespace nixbind {

void CaptureLogger::log(Verbosity lvl, std::string_view s)
{
    oss << s << std::endl;
}

CaptureLogging::CaptureLogging()
{
    auto newLogger = std::make_unique<CaptureLogger>();
    capture = newLogger.get();
    oldLogger = std::move(logger);
    logger = std::move(newLogger);
}

CaptureLogging::~CaptureLogging()
{
    logger = std::move(oldLogger);
}

} // namespace nixbind
