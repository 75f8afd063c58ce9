#include "nixbind/util/init-once.hh"
#include "nixbind/util/logging.hh"

namespace nixbind {

InitOnce::InitOnce(std::string what, std::function<void()> routine)
    : what(std::move(what))
    , routine(std::move(routine))
{
}

void InitOnce::ensure()
{
    /* `std::call_once` would retry a routine that throws, so the
       exception is captured here and the call always completes. */
    std::call_once(flag, [this]() {
        debug("running %s", what);
        try {
            routine();
        } catch (BaseError & e) {
            failure = e.msg();
        } catch (std::exception & e) {
            failure = e.what();
        }
        attempted_ = true;
        if (failure)
            printError("%s failed: %s", what, *failure);
    });

    if (failure)
        throw InitError("%s error: %s", what, *failure);
}

} // namespace nixbind
