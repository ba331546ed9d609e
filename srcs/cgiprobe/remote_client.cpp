#include "cgiprobe/remote_client.hpp"

#include <sstream>

#include "cgiprobe/version.hpp"
#include "http/http_request_encoder.hpp"
#include "http/http_response.hpp"
#include "http/response_headers.hpp"
#include "network/http_transport.hpp"

namespace cgiprobe
{

RemoteClient::Options::Options()
    : user_agent("cgiprobe/" CGIPROBE_VERSION),
      fail_on_error_status(true),
      verify_peer(true),
      max_response_bytes(0)
{
}

RemoteClient::RemoteClient(const network::Url& url, const std::string& target,
    const Options& options)
    : CgiClient(target), url_(url), options_(options)
{
}

RemoteClient::~RemoteClient() {}

Result<RemoteClient*> RemoteClient::create(
    const std::string& url, const Options& options)
{
    Result<network::Url> parsed = network::Url::parse(url);
    if (parsed.isError())
        return Result<RemoteClient*>(ERROR, errorCode(kConfigurationError),
            "invalid url: " + parsed.getErrorMessage());
    return new RemoteClient(parsed.unwrap(), url, options);
}

const char* RemoteClient::backendName() const { return "remote"; }

Result<void> RemoteClient::invoke_(const CgiRequest& request, CgiResult& out)
{
    http::OutgoingRequest outgoing;
    outgoing.method = request.method;
    outgoing.host = url_.hostHeader();
    if (request.method == http::HttpMethod::GET)
    {
        outgoing.target = url_.requestTarget(request.query.encode());
    }
    else
    {
        outgoing.target = url_.requestTarget("");
        outgoing.content_type = request.content_type;
        outgoing.body = request.body;
    }

    network::HttpTransport::Options transport_options;
    transport_options.user_agent = options_.user_agent;
    transport_options.verify_peer = options_.verify_peer;
    transport_options.max_response_bytes = options_.max_response_bytes;

    Result<http::HttpResponse> received =
        network::HttpTransport(transport_options).roundTrip(url_, outgoing);
    if (received.isError())
        return Result<void>(ERROR, errorCode(kInvocationFailure),
            received.getErrorMessage());

    const http::HttpResponse response = received.unwrap();
    http::ResponseHeaders headers;
    headers.addAll(response.getHeaders());
    out.setStatus(response.getStatus());
    out.setHeaders(headers);
    out.setContent(response.getBody());

    if (options_.fail_on_error_status &&
        response.getStatus() >= kErrorStatusMin)
    {
        std::ostringstream oss;
        oss << "server responded with status " << response.getStatus();
        if (!response.getReasonPhrase().empty())
            oss << " " << response.getReasonPhrase();
        return Result<void>(ERROR, errorCode(kNonSuccessExit), oss.str());
    }
    return Result<void>();
}

}  // namespace cgiprobe
