#pragma once
///@file

namespace nixbind {

/**
 * Initialise the garbage collector and the evaluator library.
 *
 * The first call enables dynamic thread registration in the collector
 * and runs `nix_libexpr_init`. Every call, concurrent or later, observes
 * that single outcome: a failure is rethrown as `InitError` and the
 * initialisation is never attempted again.
 *
 * The first call must be made on the main thread (or whichever thread
 * will own the process's stack bottom): it runs `GC_INIT`, and the
 * collector treats the calling thread as registered from then on.
 */
void ensureInitialized();

} // namespace nixbind
