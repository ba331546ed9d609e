#include "cgiprobe/cgi_result.hpp"

namespace cgiprobe
{

CgiResult::CgiResult()
    : has_status_(false), status_(0), headers_(), content_(), stderr_()
{
}

Result<int> CgiResult::status() const
{
    if (!has_status_)
        return Result<int>(ERROR, "response has no status line");
    return status_;
}

void CgiResult::setStatus(int status)
{
    has_status_ = true;
    status_ = status;
}

void CgiResult::setHeaders(const http::ResponseHeaders& headers)
{
    headers_ = headers;
}

void CgiResult::setContent(const utils::ByteVector& content)
{
    content_ = content;
}

void CgiResult::setStderr(const std::string& text) { stderr_ = text; }

void CgiResult::assignResponse(const http::CgiResponse& response)
{
    has_status_ = response.hasStatus();
    status_ = response.getStatus();
    headers_ = response.getHeaders();
    content_ = response.getContent();
}

void CgiResult::clearResponse()
{
    has_status_ = false;
    status_ = 0;
    headers_.clear();
    content_.clear();
}

bool CgiResult::sameResponseAs(const CgiResult& rhs) const
{
    if (has_status_ != rhs.has_status_)
        return false;
    if (has_status_ && status_ != rhs.status_)
        return false;
    return headers_ == rhs.headers_ && content_ == rhs.content_;
}

}  // namespace cgiprobe
