#include "http/cgi_response.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

#include "http/syntax.hpp"

namespace http
{

CgiResponse::CgiResponse()
    : has_status_(false), status_(0), headers_(), content_()
{
}

CgiResponse::CgiResponse(const CgiResponse& rhs)
    : has_status_(rhs.has_status_),
      status_(rhs.status_),
      headers_(rhs.headers_),
      content_(rhs.content_)
{
}

CgiResponse& CgiResponse::operator=(const CgiResponse& rhs)
{
    if (this == &rhs)
        return *this;
    has_status_ = rhs.has_status_;
    status_ = rhs.status_;
    headers_ = rhs.headers_;
    content_ = rhs.content_;
    return *this;
}

CgiResponse::~CgiResponse() {}

bool CgiResponse::hasStatus() const { return has_status_; }

int CgiResponse::getStatus() const { return status_; }

const ResponseHeaders& CgiResponse::getHeaders() const { return headers_; }

const utils::ByteVector& CgiResponse::getContent() const { return content_; }

std::string CgiResponse::trim_(const std::string& s, const std::string& chars)
{
    const std::string::size_type start = s.find_first_not_of(chars);
    if (start == std::string::npos)
        return std::string();
    const std::string::size_type end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

bool CgiResponse::startsWithIgnoreCase_(
    const std::string& s, const std::string& prefix)
{
    if (s.size() < prefix.size())
        return false;
    return equalsIgnoreCase(s.substr(0, prefix.size()), prefix);
}

// "HTTP/1.1 200 OK" の2番目のトークンを整数として読む
Result<int> CgiResponse::parseStatusLine_(const std::string& line)
{
    std::istringstream iss(line);
    std::string protocol;
    std::string code;
    iss >> protocol >> code;
    if (code.empty())
        return Result<int>(ERROR, "status line has no status code: " + line);

    for (size_t i = 0; i < code.size(); ++i)
    {
        if (code[i] < '0' || code[i] > '9')
            return Result<int>(ERROR, "invalid status code: " + code);
    }

    errno = 0;
    const long n = std::strtol(code.c_str(), NULL, 10);
    if (errno == ERANGE || n > INT_MAX)
        return Result<int>(ERROR, "status code out of range: " + code);
    return static_cast<int>(n);
}

Result<void> CgiResponse::parseHeaderLine_(const std::string& line)
{
    const std::string::size_type pos = line.find(':');
    if (pos == std::string::npos)
        return Result<void>(ERROR, "invalid CGI header line: " + line);

    const std::string name = trim_(line.substr(0, pos), HttpSyntax::kOWS);
    const std::string value = trim_(line.substr(pos + 1), HttpSyntax::kOWS);

    if (name.empty())
        return Result<void>(ERROR, "invalid CGI header name: " + line);

    headers_.add(name, value);
    return Result<void>();
}

Result<CgiResponse> CgiResponse::decode(const std::string& raw)
{
    return decode(utils::toBytes(raw));
}

Result<CgiResponse> CgiResponse::decode(const utils::ByteVector& raw)
{
    std::vector<std::string> lines;
    bool found_boundary = false;
    size_t pos = 0;

    // ヘッダー終端（空行）まで1行ずつ取り出す
    while (pos < raw.size())
    {
        size_t end = pos;
        while (end < raw.size() && raw[end] != '\n')
            ++end;

        const std::string line =
            trim_(std::string(raw.begin() + pos, raw.begin() + end),
                HttpSyntax::kWhitespace);
        pos = (end < raw.size()) ? end + 1 : raw.size();

        if (line.empty())
        {
            found_boundary = true;
            break;
        }
        lines.push_back(line);
    }

    CgiResponse response;
    if (found_boundary)
        response.content_.assign(raw.begin() + pos, raw.end());

    size_t first_header = 0;
    if (!lines.empty() &&
        startsWithIgnoreCase_(lines[0], HttpSyntax::kStatusLinePrefix))
    {
        Result<int> status = parseStatusLine_(lines[0]);
        if (status.isError())
            return Result<CgiResponse>(ERROR, status.getErrorMessage());
        response.has_status_ = true;
        response.status_ = status.unwrap();
        first_header = 1;
    }

    for (size_t i = first_header; i < lines.size(); ++i)
    {
        Result<void> h = response.parseHeaderLine_(lines[i]);
        if (h.isError())
            return Result<CgiResponse>(ERROR, h.getErrorMessage());
    }

    return response;
}

}  // namespace http
