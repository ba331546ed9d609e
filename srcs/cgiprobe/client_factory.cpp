#include "cgiprobe/client_factory.hpp"

#include "network/url.hpp"
#include "utils/log.hpp"

namespace cgiprobe
{

Result<CgiClient*> ClientFactory::create(
    const std::string& target, const Options& options)
{
    const std::string scheme = network::Url::schemeOf(target);
    if (scheme.empty())
    {
        utils::Log::debug("local target: " + target);
        Result<LocalClient*> local = LocalClient::create(target, options.local);
        if (local.isError())
            return Result<CgiClient*>(ERROR,
                ErrorCode(local.getErrorCode()), local.getErrorMessage());
        return static_cast<CgiClient*>(local.unwrap());
    }
    if (scheme == "http" || scheme == "https")
    {
        utils::Log::debug("remote target: " + target);
        Result<RemoteClient*> remote =
            RemoteClient::create(target, options.remote);
        if (remote.isError())
            return Result<CgiClient*>(ERROR,
                ErrorCode(remote.getErrorCode()), remote.getErrorMessage());
        return static_cast<CgiClient*>(remote.unwrap());
    }
    return Result<CgiClient*>(ERROR, errorCode(kConfigurationError),
        "unsupported scheme '" + scheme + "': " + target);
}

}  // namespace cgiprobe
