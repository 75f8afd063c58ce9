#include "nixbind/util/engine-settings.hh"
#include "nixbind/util/config-global.hh"
#include "nixbind/util/error-channel.hh"
#include "nixbind/util/init-once.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/string-callback.hh"

#include "nix_api_util.h"

namespace nixbind {

void ensureLibUtilInitialized()
{
    static InitOnce init("nix_libutil_init", []() {
        ErrorChannel channel;
        nix_libutil_init(channel.ptr());
        channel.check();
        loadConfFromEnv();
    });
    init.ensure();
}

std::string engineVersion()
{
    return nix_version_get();
}

std::optional<std::string> getEngineSetting(const std::string & name)
{
    ensureLibUtilInitialized();
    ErrorChannel channel;
    std::string value;
    auto res = nix_setting_get(channel.ptr(), name.c_str(), NIXBIND_RECEIVE_STRING(value));
    if (res == NIX_ERR_KEY) {
        channel.clear();
        return std::nullopt;
    }
    channel.check();
    return value;
}

void setEngineSetting(const std::string & name, const std::string & value)
{
    ensureLibUtilInitialized();
    ErrorChannel channel;
    auto res = nix_setting_set(channel.ptr(), name.c_str(), value.c_str());
    if (res == NIX_ERR_KEY) {
        channel.clear();
        throw UsageError("unknown engine setting '%s'", name);
    }
    channel.check();
    debug("set engine setting '%s' to '%s'", name, value);
}

void setEngineVerbosity(Verbosity level)
{
    ensureLibUtilInitialized();
    ErrorChannel channel;
    nix_set_verbosity(channel.ptr(), static_cast<nix_verbosity>(level));
    channel.check();
}

} // namespace nixbind
