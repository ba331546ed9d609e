#include "cgiprobe/cgi_client.hpp"

#include <sstream>

#include "http/content_types.hpp"
#include "utils/log.hpp"

namespace cgiprobe
{

const char* const CgiClient::kDefaultPostMimeType =
    http::ContentType(http::ContentType::TEXT_PLAIN).c_str();

CgiClient::CgiClient(const std::string& target) : target_(target), result_()
{
}

CgiClient::~CgiClient() {}

Result<void> CgiClient::get(const http::FormFields& query)
{
    return call_(CgiRequest::get(query));
}

Result<void> CgiClient::post(const http::FormFields& data)
{
    return call_(CgiRequest::post(data));
}

Result<void> CgiClient::post(const std::string& data, const std::string& mime)
{
    return call_(CgiRequest::post(utils::toBytes(data), mime));
}

Result<void> CgiClient::post(
    const utils::ByteVector& data, const std::string& mime)
{
    return call_(CgiRequest::post(data, mime));
}

Result<void> CgiClient::call_(const CgiRequest& request)
{
    utils::Log::info(std::string(backendName()) + " " +
                     request.method.toString() + " " + target_);

    // 前回の結果は引き継がない
    CgiResult fresh;
    Result<void> r = invoke_(request, fresh);
    result_ = fresh;

    if (r.isError())
    {
        std::ostringstream oss;
        oss << errorKindName(r.getErrorCode()) << ": " << r.getErrorMessage();
        if (r.getErrorCode() == kNonSuccessExit)
            utils::Log::warning(target_ + ": " + oss.str());
        else
            utils::Log::error(target_, oss.str());
    }
    return r;
}

}  // namespace cgiprobe
