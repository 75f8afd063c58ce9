#pragma once
///@file

#include "nixbind/util/logging.hh"

#include <optional>
#include <string>

namespace nixbind {

/**
 * Initialise the engine's utility library and apply `NIXBIND_CONFIG`.
 * Runs at most once per process; a failure is cached and rethrown as
 * `InitError`.
 */
void ensureLibUtilInitialized();

/**
 * The version string of the engine library we are linked against.
 */
std::string engineVersion();

/**
 * Read one of the engine's own settings (as in `nix.conf`).
 *
 * @return the value, or `std::nullopt` if the engine knows no setting
 * by that name.
 */
std::optional<std::string> getEngineSetting(const std::string & name);

/**
 * Change one of the engine's own settings.
 *
 * @throws UsageError if the engine knows no setting by that name.
 */
void setEngineSetting(const std::string & name, const std::string & value);

/**
 * Set the verbosity of the engine's own logger.
 */
void setEngineVerbosity(Verbosity level);

} // namespace nixbind
