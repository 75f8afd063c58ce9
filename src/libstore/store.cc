#include "nixbind/store/store.hh"
#include "nixbind/store/globals.hh"
#include "nixbind/util/engine-settings.hh"
#include "nixbind/util/error-channel.hh"
#include "nixbind/util/init-once.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/string-callback.hh"

#include <array>
#include <vector>

namespace nixbind {

void ensureLibStoreInitialized()
{
    static InitOnce init("nix_libstore_init", []() {
        ensureLibUtilInitialized();
        ErrorChannel channel;
        nix_libstore_init(channel.ptr());
        channel.check();
    });
    init.ensure();
}

Store::Store(::Store * store)
    : store(store, nix_store_free)
{
}

Store Store::open(const std::string & uri, const StringMap & params)
{
    ensureLibStoreInitialized();

    /* The engine takes a null-terminated array of [key, value] pairs. */
    std::vector<std::array<const char *, 2>> pairs;
    for (auto & [key, value] : params)
        pairs.push_back({key.c_str(), value.c_str()});
    std::vector<const char **> paramsPtrs;
    for (auto & pair : pairs)
        paramsPtrs.push_back(pair.data());
    paramsPtrs.push_back(nullptr);

    ErrorChannel channel;
    auto * p = nix_store_open(channel.ptr(), uri.c_str(), params.empty() ? nullptr : paramsPtrs.data());
    channel.check();
    if (!p)
        throw EngineError(NIX_ERR_UNKNOWN, fmt("nix_store_open returned a null pointer for '%s'", uri));

    debug("opened store '%s'", uri);
    return Store(p);
}

Store Store::openDefault()
{
    return open(storeSettings.storeUri.get());
}

std::string Store::getUri() const
{
    ErrorChannel channel;
    std::string res;
    nix_store_get_uri(channel.ptr(), raw(), NIXBIND_RECEIVE_STRING(res));
    channel.check();
    return res;
}

std::string Store::getStoreDir() const
{
    ErrorChannel channel;
    std::string res;
    nix_store_get_storedir(channel.ptr(), raw(), NIXBIND_RECEIVE_STRING(res));
    channel.check();
    return res;
}

std::string Store::getVersion() const
{
    ErrorChannel channel;
    std::string res;
    nix_store_get_version(channel.ptr(), raw(), NIXBIND_RECEIVE_STRING(res));
    channel.check();
    return res;
}

} // namespace nixbind
