#include "nixbind/util/configuration.hh"
#include "nixbind/util/error.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/strings.hh"

namespace nixbind {

AbstractSetting::AbstractSetting(Config * owner, std::string name, std::string description, StringSet aliases)
    : name(std::move(name))
    , description(std::move(description))
    , aliases(std::move(aliases))
{
    owner->addSetting(this);
}

void Config::addSetting(AbstractSetting * setting)
{
    index.emplace(setting->name, setting);
    for (auto & alias : setting->aliases)
        index.emplace(alias, setting);
}

bool Config::set(std::string_view name, const std::string & value)
{
    auto i = index.find(name);
    bool append = false;

    if (i == index.end() && hasPrefix(name, "extra-")) {
        i = index.find(name.substr(6));
        if (i != index.end() && !i->second->isAppendable())
            i = index.end();
        append = true;
    }

    if (i == index.end())
        return false;

    auto setting = i->second;
    setting->set(value, append);
    setting->overridden = true;
    debug("setting '%s' is now '%s'", setting->name, setting->toString());
    return true;
}

template<>
std::string Setting<std::string>::toString() const
{
    return value;
}

template<>
void Setting<std::string>::set(const std::string & str, bool append)
{
    value = str;
}

template<>
bool Setting<std::string>::isAppendable() const
{
    return false;
}

template<>
std::string Setting<Strings>::toString() const
{
    return concatStringsSep(" ", value);
}

template<>
void Setting<Strings>::set(const std::string & str, bool append)
{
    auto items = tokenizeString(str);
    if (!append)
        value.clear();
    value.splice(value.end(), items);
}

template<>
bool Setting<Strings>::isAppendable() const
{
    return true;
}

std::vector<std::pair<std::string, std::string>> parseConfig(const std::string & contents, const std::string & origin)
{
    std::vector<std::pair<std::string, std::string>> assignments;

    for (auto & rawLine : tokenizeString(contents, "\n")) {
        auto line = rawLine.substr(0, rawLine.find('#'));
        auto words = tokenizeString(line);
        if (words.empty())
            continue;

        auto name = words.front();
        words.pop_front();
        if (words.empty() || words.front() != "=")
            throw UsageError("syntax error in configuration line '%s' in '%s'", line, origin);
        words.pop_front();

        assignments.emplace_back(std::move(name), concatStringsSep(" ", words));
    }

    return assignments;
}

} // namespace nixbind
