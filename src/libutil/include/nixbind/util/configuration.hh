#pragma once
///@file

#include "nixbind/util/types.hh"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nixbind {

class Config;

/**
 * A named, documented configuration value. Constructing a setting
 * registers it, under its name and each alias, with the `Config` that
 * owns it:
 *
 *   struct StoreSettings : Config
 *   {
 *       Setting<std::string> storeUri{this, "auto", "store", "The store to open."};
 *   };
 */
class AbstractSetting
{
    friend class Config;

    bool overridden = false;

public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    AbstractSetting(const AbstractSetting &) = delete;
    AbstractSetting & operator=(const AbstractSetting &) = delete;

    /**
     * Whether the value came from `Config::set` rather than from the
     * default or an assignment in code.
     */
    bool isOverridden() const
    {
        return overridden;
    }

    /**
     * The value in the textual form `Config::set` accepts.
     */
    virtual std::string toString() const = 0;

protected:

    AbstractSetting(Config * owner, std::string name, std::string description, StringSet aliases);

    virtual ~AbstractSetting() = default;

    /**
     * Replace the value with `str`, or add `str` to it if `append`.
     */
    virtual void set(const std::string & str, bool append) = 0;

    /**
     * Whether `extra-<name>` adds to this setting.
     */
    virtual bool isAppendable() const = 0;
};

/**
 * A setting holding a `T`. Implemented for `std::string`, and for
 * `Strings`, whose textual form is a whitespace-separated list.
 */
template<typename T>
class Setting : public AbstractSetting
{
    T value;

public:

    Setting(Config * owner, T def, std::string name, std::string description, StringSet aliases = {})
        : AbstractSetting(owner, std::move(name), std::move(description), std::move(aliases))
        , value(std::move(def))
    {
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    Setting & operator=(T v)
    {
        value = std::move(v);
        return *this;
    }

    std::string toString() const override;

protected:

    void set(const std::string & str, bool append) override;

    bool isAppendable() const override;
};

template<>
std::string Setting<std::string>::toString() const;
template<>
void Setting<std::string>::set(const std::string & str, bool append);
template<>
bool Setting<std::string>::isAppendable() const;

template<>
std::string Setting<Strings>::toString() const;
template<>
void Setting<Strings>::set(const std::string & str, bool append);
template<>
bool Setting<Strings>::isAppendable() const;

/**
 * A group of settings, usually one per library, addressed by name.
 * Settings are owned by the subclass; a `Config` only indexes them.
 */
class Config
{
    friend class AbstractSetting;

    std::map<std::string, AbstractSetting *, std::less<>> index;

    void addSetting(AbstractSetting * setting);

public:

    Config() = default;

    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    /**
     * Set the setting called `name`, either directly or by alias. A
     * name of the form `extra-<name>` appends to a list setting.
     *
     * @return whether this config has a setting by that name.
     */
    bool set(std::string_view name, const std::string & value);
};

/**
 * Split configuration text into `name = value` assignments. Lines are
 * separated by newlines, `#` starts a comment, and the value is the
 * rest of the line with runs of whitespace collapsed to one space.
 *
 * @param origin Where `contents` came from, for error messages.
 * @throws UsageError on a non-empty line that is not an assignment.
 */
std::vector<std::pair<std::string, std::string>> parseConfig(const std::string & contents, const std::string & origin);

} // namespace nixbind
