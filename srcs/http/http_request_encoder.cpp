#include "http/http_request_encoder.hpp"

#include <sstream>

#include "http/header.hpp"
#include "http/syntax.hpp"

namespace http
{

HttpRequestEncoder::HttpRequestEncoder(const Options& options)
    : options_(options)
{
}

HttpRequestEncoder::~HttpRequestEncoder() {}

bool HttpRequestEncoder::containsLineBreak_(const std::string& s)
{
    return s.find_first_of("\r\n") != std::string::npos;
}

void HttpRequestEncoder::appendString_(
    utils::ByteVector& out, const std::string& s)
{
    out.insert(out.end(), s.begin(), s.end());
}

void HttpRequestEncoder::appendHeader_(
    utils::ByteVector& out, const std::string& name, const std::string& value)
{
    appendString_(out, name);
    appendString_(out, ": ");
    appendString_(out, value);
    appendString_(out, HttpSyntax::kCrlf);
}

Result<utils::ByteVector> HttpRequestEncoder::encode(
    const OutgoingRequest& request) const
{
    if (request.method == HttpMethod::UNKNOWN)
        return Result<utils::ByteVector>(ERROR, "unsupported request method");
    if (request.target.empty() || request.target[0] != '/')
        return Result<utils::ByteVector>(
            ERROR, "request target must start with '/'");
    if (request.host.empty())
        return Result<utils::ByteVector>(ERROR, "empty Host");
    // ヘッダーインジェクション防止
    if (containsLineBreak_(request.target) || containsLineBreak_(request.host) ||
        containsLineBreak_(request.content_type) ||
        containsLineBreak_(options_.user_agent))
        return Result<utils::ByteVector>(
            ERROR, "line break in request line or header value");
    if (request.target.find(' ') != std::string::npos)
        return Result<utils::ByteVector>(
            ERROR, "space in request target: " + request.target);

    utils::ByteVector out;

    // Request-Line
    appendString_(out, std::string(request.method.c_str()) + " " +
                           request.target + " " +
                           HttpSyntax::kHttpVersionPrefix + "1.1" +
                           HttpSyntax::kCrlf);

    appendHeader_(out, HeaderName(HeaderName::HOST).toString(), request.host);
    if (!options_.user_agent.empty())
        appendHeader_(out, HeaderName(HeaderName::USER_AGENT).toString(),
            options_.user_agent);
    appendHeader_(out, HeaderName(HeaderName::ACCEPT).toString(), "*/*");
    appendHeader_(out, HeaderName(HeaderName::CONNECTION).toString(), "close");

    if (request.method == HttpMethod::POST)
    {
        appendHeader_(out, HeaderName(HeaderName::CONTENT_TYPE).toString(),
            request.content_type);
        std::ostringstream oss;
        oss << request.body.size();
        appendHeader_(
            out, HeaderName(HeaderName::CONTENT_LENGTH).toString(), oss.str());
    }

    // End of headers
    appendString_(out, HttpSyntax::kCrlf);

    if (request.method == HttpMethod::POST)
        out.insert(out.end(), request.body.begin(), request.body.end());

    return out;
}

}  // namespace http
