#pragma once
///@file

#include "nixbind/util/error.hh"

#include <utility>

namespace nixbind {

/**
 * The collector could not register the current thread. No engine work
 * may proceed on that thread.
 */
MakeError(RegistrationError, Error);

/**
 * Whether the calling thread is registered with the collector.
 */
bool isThreadRegistered();

/**
 * Registers the current thread with the collector for the lifetime of
 * this object, unless it was registered already.
 *
 * Only the guard that performed the registration unregisters the thread,
 * so guards nest: an inner guard on an already registered thread does
 * nothing in either direction.
 *
 * Constructing a guard initialises the evaluator if needed. Make sure
 * `ensureInitialized()` has already run on the main thread first:
 * otherwise the first guard's thread becomes the one the collector
 * initialised on, it counts as registered, and the guard does not own
 * (or release) its registration.
 */
class ThreadRegistration
{
    bool registeredHere = false;

public:

    /**
     * @throws InitError if the evaluator could not be initialised.
     * @throws RegistrationError if the collector refused the thread.
     */
    ThreadRegistration();

    ThreadRegistration(const ThreadRegistration &) = delete;
    ThreadRegistration & operator=(const ThreadRegistration &) = delete;

    ~ThreadRegistration();

    bool ownsRegistration() const
    {
        return registeredHere;
    }
};

/**
 * Run `f` on the current thread while it is registered with the
 * collector, and return its result. Any thread that holds or forces
 * values must do so inside such a call (the thread that initialised the
 * evaluator is registered implicitly).
 *
 * The first call in the process must come after `ensureInitialized()`
 * has run on the main thread; see `ThreadRegistration`.
 */
template<typename F>
auto withRegisteredThread(F && f) -> decltype(std::forward<F>(f)())
{
    ThreadRegistration registration;
    return std::forward<F>(f)();
}

/**
 * Run a full collection now.
 */
void runCollectionNow();

} // namespace nixbind
