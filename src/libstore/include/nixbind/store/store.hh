#pragma once
///@file

#include "nixbind/util/types.hh"

#include <memory>
#include <string>

#include "nix_api_store.h"

namespace nixbind {

/**
 * Initialise the engine's store library. Runs at most once per process;
 * a failure is cached and rethrown as `InitError`.
 */
void ensureLibStoreInitialized();

/**
 * A handle to a store opened by the engine.
 *
 * Copies share the same underlying store, which is closed when the last
 * copy is destroyed. An `EvalState` keeps its own copy, so a store
 * always outlives the evaluator states bound to it.
 */
class Store
{
    std::shared_ptr<::Store> store;

    explicit Store(::Store * store);

public:

    /**
     * Open a store.
     *
     * @param uri A store URI such as `auto`, `daemon` or `dummy://`.
     * @param params Store parameters, as documented in `nix help-stores`.
     * @throws EngineError if the engine cannot open the store.
     */
    static Store open(const std::string & uri, const StringMap & params = {});

    /**
     * Open the store named by the `store` setting.
     */
    static Store openDefault();

    ::Store * raw() const
    {
        return store.get();
    }

    /**
     * The URI of the store, as normalised by the engine.
     */
    std::string getUri() const;

    /**
     * The store directory, usually `/nix/store`.
     */
    std::string getStoreDir() const;

    /**
     * The version of the store's implementation, e.g. of a remote
     * daemon. Empty if the store doesn't report one.
     */
    std::string getVersion() const;

    bool operator==(const Store & other) const
    {
        return store == other.store;
    }
};

} // namespace nixbind
