#include "nixbind/util/config-global.hh"
#include "nixbind/util/logging.hh"

#include <cstdlib>
#include <vector>

namespace nixbind {

static std::vector<Config *> & registrations()
{
    static std::vector<Config *> configs;
    return configs;
}

GlobalConfig::Register::Register(Config * config)
{
    registrations().push_back(config);
}

bool GlobalConfig::set(std::string_view name, const std::string & value)
{
    for (auto config : registrations())
        if (config->set(name, value))
            return true;
    return false;
}

Strings GlobalConfig::applyConfig(const std::string & contents, const std::string & origin)
{
    Strings unknown;
    for (auto & [name, value] : parseConfig(contents, origin))
        if (!set(name, value))
            unknown.push_back(name);
    return unknown;
}

GlobalConfig globalConfig;

void loadConfFromEnv()
{
    auto contents = std::getenv("NIXBIND_CONFIG");
    if (!contents)
        return;

    debug("applying configuration from NIXBIND_CONFIG");
    for (auto & name : globalConfig.applyConfig(contents, "NIXBIND_CONFIG"))
        warn("unknown setting '%s'", name);
}

} // namespace nixbind
