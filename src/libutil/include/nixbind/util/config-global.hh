#pragma once
///@file

#include "nixbind/util/configuration.hh"

namespace nixbind {

/**
 * Every `Config` that registered itself with `GlobalConfig::Register`,
 * addressed as one. nixbind's libraries each register one.
 */
struct GlobalConfig
{
    struct Register
    {
        Register(Config * config);
    };

    /**
     * Offer the assignment to each registered config in turn.
     *
     * @return whether any of them took it.
     */
    bool set(std::string_view name, const std::string & value);

    /**
     * Parse `contents` with `parseConfig()` and apply it. Nothing is
     * applied if it does not parse.
     *
     * @return the names no registered config knows, in order.
     */
    Strings applyConfig(const std::string & contents, const std::string & origin);
};

extern GlobalConfig globalConfig;

/**
 * Apply the `NIXBIND_CONFIG` environment variable, if set, to
 * `globalConfig`, and warn about each unknown name.
 *
 * @throws UsageError if the variable does not parse.
 */
void loadConfFromEnv();

} // namespace nixbind
