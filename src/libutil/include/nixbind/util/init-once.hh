#pragma once
///@file

#include "nixbind/util/error.hh"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace nixbind {

/**
 * A write-once cell around an initialisation routine that must run at
 * most once per process.
 *
 * The first call to `ensure()` runs the routine; concurrent callers
 * block until it has finished. The outcome is permanent: if the routine
 * threw, every call to `ensure()`, including the first, throws an
 * `InitError` carrying the original message, and the routine is never
 * retried.
 */
class InitOnce
{
    const std::string what;
    std::function<void()> routine;
    std::once_flag flag;
    std::atomic<bool> attempted_{false};
    std::optional<std::string> failure;

public:

    /**
     * @param what Name of the initialisation step, used as the prefix of
     * the error message (`<what> error: <message>`).
     */
    InitOnce(std::string what, std::function<void()> routine);

    InitOnce(const InitOnce &) = delete;
    InitOnce & operator=(const InitOnce &) = delete;

    void ensure();

    /**
     * Whether the routine has run (successfully or not).
     */
    bool attempted() const
    {
        return attempted_;
    }
};

} // namespace nixbind
