#pragma once
///@file

#include "nixbind/util/error.hh"

#include <memory>
#include <optional>

#include "nix_api_util.h"

namespace nixbind {

/**
 * A boundary call into the engine reported a failure.
 *
 * Recoverable: the object the call was made on stays usable for
 * unrelated calls.
 */
class EngineError : public Error
{
    nix_err code_;
    std::optional<std::string> name_;
    std::optional<std::string> infoMsg_;

public:

    /**
     * @param code The engine's error code, never `NIX_OK`.
     * @param msg The engine's full error message.
     * @param name The class of the engine-side exception, for `NIX_ERR_NIX_ERROR`.
     * @param infoMsg The engine-side message without decoration, for `NIX_ERR_NIX_ERROR`.
     */
    EngineError(
        nix_err code,
        const std::string & msg,
        std::optional<std::string> name = std::nullopt,
        std::optional<std::string> infoMsg = std::nullopt);

    nix_err code() const
    {
        return code_;
    }

    const std::optional<std::string> & name() const
    {
        return name_;
    }

    const std::optional<std::string> & infoMsg() const
    {
        return infoMsg_;
    }
};

/**
 * Owns one `nix_c_context`, the scratch object the engine writes
 * failure information into.
 *
 * Pass `ptr()` to a boundary call, then call `check()` before the
 * channel is used for anything else. A channel must not be shared
 * between calls that run concurrently.
 */
class ErrorChannel
{
    struct ContextDeleter
    {
        void operator()(nix_c_context * ctx) const
        {
            nix_c_context_free(ctx);
        }
    };

    std::unique_ptr<nix_c_context, ContextDeleter> ctx;

public:

    ErrorChannel();

    ErrorChannel(ErrorChannel &&) = default;
    ErrorChannel & operator=(ErrorChannel &&) = default;

    nix_c_context * ptr() const
    {
        return ctx.get();
    }

    /**
     * Whether the last boundary call left an error. Does not consume it.
     */
    bool hasError() const;

    /**
     * Throw `EngineError` if the last boundary call left an error.
     *
     * The error is consumed in either case: a second `check()` without
     * an intervening call does not throw.
     */
    void check();

    /**
     * Discard a pending error that the caller has handled itself.
     */
    void clear();
};

} // namespace nixbind
