#include "nixbind/util/error-channel.hh"
#include "nixbind/util/string-callback.hh"

#include <new>

namespace nixbind {

EngineError::EngineError(
    nix_err code, const std::string & msg, std::optional<std::string> name, std::optional<std::string> infoMsg)
    : Error(msg)
    , code_(code)
    , name_(std::move(name))
    , infoMsg_(std::move(infoMsg))
{
}

ErrorChannel::ErrorChannel()
    : ctx(nix_c_context_create())
{
    if (!ctx)
        throw std::bad_alloc();
}

bool ErrorChannel::hasError() const
{
    return nix_err_code(ctx.get()) != NIX_OK;
}

void ErrorChannel::clear()
{
    nix_clear_err(ctx.get());
}

void ErrorChannel::check()
{
    auto code = nix_err_code(ctx.get());
    if (code == NIX_OK)
        return;

    unsigned int n = 0;
    const char * p = nix_err_msg(nullptr, ctx.get(), &n);
    std::string msg = p ? std::string(p, n) : "unknown error";

    std::optional<std::string> name, infoMsg;
    if (code == NIX_ERR_NIX_ERROR) {
        std::string s;
        if (nix_err_name(nullptr, ctx.get(), NIXBIND_RECEIVE_STRING(s)) == NIX_OK)
            name = std::move(s);
        s.clear();
        if (nix_err_info_msg(nullptr, ctx.get(), NIXBIND_RECEIVE_STRING(s)) == NIX_OK)
            infoMsg = std::move(s);
    }

    /* The message is copied out; the context can be reused. */
    clear();

    throw EngineError(code, msg, std::move(name), std::move(infoMsg));
}

} // namespace nixbind
