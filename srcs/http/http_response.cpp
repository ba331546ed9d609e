#include "http/http_response.hpp"

#include <cerrno>
#include <cstdlib>

#include "http/syntax.hpp"

namespace http
{

HttpResponse::HttpResponse()
    : http_version_(), status_(0), reason_phrase_(), headers_(), body_()
{
}

HttpResponse::HttpResponse(const HttpResponse& rhs)
    : http_version_(rhs.http_version_),
      status_(rhs.status_),
      reason_phrase_(rhs.reason_phrase_),
      headers_(rhs.headers_),
      body_(rhs.body_)
{
}

HttpResponse& HttpResponse::operator=(const HttpResponse& rhs)
{
    if (this == &rhs)
        return *this;
    http_version_ = rhs.http_version_;
    status_ = rhs.status_;
    reason_phrase_ = rhs.reason_phrase_;
    headers_ = rhs.headers_;
    body_ = rhs.body_;
    return *this;
}

HttpResponse::~HttpResponse() {}

int HttpResponse::getStatus() const { return status_; }

const std::string& HttpResponse::getReasonPhrase() const
{
    return reason_phrase_;
}

const std::string& HttpResponse::getHttpVersion() const
{
    return http_version_;
}

const HeaderVector& HttpResponse::getHeaders() const { return headers_; }

Result<std::string> HttpResponse::getHeader(const std::string& name) const
{
    for (HeaderVector::const_iterator it = headers_.begin();
        it != headers_.end(); ++it)
    {
        if (equalsIgnoreCase(it->first, name))
            return it->second;
    }
    return Result<std::string>(ERROR, std::string(), "header not found");
}

const utils::ByteVector& HttpResponse::getBody() const { return body_; }

// LF までを1行として取り出す（末尾の CR は落とす）。
// LF が見つからなければ false（pos は進めない）。
bool HttpResponse::readLine_(
    const utils::ByteVector& raw, size_t* pos, std::string* line)
{
    size_t end = *pos;
    while (end < raw.size() && raw[end] != '\n')
        ++end;
    if (end >= raw.size())
        return false;

    size_t line_end = end;
    if (line_end > *pos && raw[line_end - 1] == '\r')
        --line_end;
    line->assign(raw.begin() + *pos, raw.begin() + line_end);
    *pos = end + 1;
    return true;
}

Result<void> HttpResponse::parseStatusLine_(const std::string& line)
{
    // HTTP-version SP status-code SP [ reason-phrase ]
    if (line.compare(0, HttpSyntax::kHttpVersionPrefix.size(),
            HttpSyntax::kHttpVersionPrefix) != 0)
        return Result<void>(ERROR, "invalid status line: " + line);

    const std::string::size_type sp1 = line.find(' ');
    if (sp1 == std::string::npos)
        return Result<void>(ERROR, "invalid status line: " + line);
    const std::string::size_type sp2 = line.find(' ', sp1 + 1);

    const std::string code = (sp2 == std::string::npos)
                                 ? line.substr(sp1 + 1)
                                 : line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (code.size() != 3)
        return Result<void>(ERROR, "invalid status code: " + code);
    for (size_t i = 0; i < code.size(); ++i)
    {
        if (code[i] < '0' || code[i] > '9')
            return Result<void>(ERROR, "invalid status code: " + code);
    }

    http_version_ = line.substr(0, sp1);
    status_ = std::atoi(code.c_str());
    reason_phrase_ =
        (sp2 == std::string::npos) ? std::string() : line.substr(sp2 + 1);
    return Result<void>();
}

Result<void> HttpResponse::parseHeaderLine_(const std::string& line)
{
    // obs-fold: 直前のヘッダー値の続き
    if ((line[0] == ' ' || line[0] == '\t') && !headers_.empty())
    {
        const std::string::size_type start =
            line.find_first_not_of(HttpSyntax::kOWS);
        if (start != std::string::npos)
            headers_.back().second += " " + line.substr(start);
        return Result<void>();
    }

    const std::string::size_type colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
        return Result<void>(ERROR, "invalid header line: " + line);

    const std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    const std::string::size_type start = value.find_first_not_of(HttpSyntax::kOWS);
    if (start == std::string::npos)
        value.clear();
    else
        value = value.substr(
            start, value.find_last_not_of(HttpSyntax::kOWS) - start + 1);

    headers_.push_back(HeaderPair(name, value));
    return Result<void>();
}

bool HttpResponse::isChunked_() const
{
    for (HeaderVector::const_iterator it = headers_.begin();
        it != headers_.end(); ++it)
    {
        if (HeaderName::fromString(it->first) != HeaderName::TRANSFER_ENCODING)
            continue;
        const std::string v = toLowerAscii(it->second);
        if (v.find("chunked") != std::string::npos)
            return true;
    }
    return false;
}

Result<void> HttpResponse::decodeChunked_(const utils::ByteVector& raw, size_t pos)
{
    while (true)
    {
        std::string size_line;
        if (!readLine_(raw, &pos, &size_line))
            return Result<void>(ERROR, "truncated chunk size line");

        // chunk-ext は無視する
        const std::string::size_type semi = size_line.find(';');
        if (semi != std::string::npos)
            size_line.erase(semi);
        const std::string::size_type last =
            size_line.find_last_not_of(HttpSyntax::kOWS);
        if (last == std::string::npos)
            return Result<void>(ERROR, "empty chunk size line");
        size_line.erase(last + 1);

        char* endp = NULL;
        errno = 0;
        const unsigned long size = std::strtoul(size_line.c_str(), &endp, 16);
        if (endp == size_line.c_str() || *endp != '\0' || errno == ERANGE)
            return Result<void>(ERROR, "invalid chunk size: " + size_line);

        if (size == 0)
            break;

        if (raw.size() - pos < size)
            return Result<void>(ERROR, "truncated chunk data");
        body_.insert(body_.end(), raw.begin() + pos, raw.begin() + pos + size);
        pos += size;

        std::string crlf;
        if (!readLine_(raw, &pos, &crlf) || !crlf.empty())
            return Result<void>(ERROR, "missing CRLF after chunk data");
    }

    // trailer-section は読み捨てる（接続終了で打ち切られていても許容）
    std::string trailer;
    while (readLine_(raw, &pos, &trailer) && !trailer.empty())
    {
    }
    return Result<void>();
}

Result<void> HttpResponse::parseBody_(const utils::ByteVector& raw, size_t body_start)
{
    // RFC 9112 Section 6.3: ボディを持たないステータス
    if (status_ == 204 || status_ == 304)
        return Result<void>();

    if (isChunked_())
        return decodeChunked_(raw, body_start);

    Result<std::string> cl =
        getHeader(HeaderName(HeaderName::CONTENT_LENGTH).toString());
    if (cl.isOk())
    {
        const std::string v = cl.unwrap();
        char* endp = NULL;
        errno = 0;
        const unsigned long n = std::strtoul(v.c_str(), &endp, 10);
        if (v.empty() || *endp != '\0' || errno == ERANGE || v[0] == '-')
            return Result<void>(ERROR, "invalid Content-Length: " + v);
        if (raw.size() - body_start < n)
            return Result<void>(ERROR, "truncated response body");
        body_.assign(raw.begin() + body_start, raw.begin() + body_start + n);
        return Result<void>();
    }

    // close-delimited
    body_.assign(raw.begin() + body_start, raw.end());
    return Result<void>();
}

Result<HttpResponse> HttpResponse::parse(const utils::ByteVector& raw)
{
    size_t pos = 0;
    while (true)
    {
        HttpResponse response;

        std::string status_line;
        if (!readLine_(raw, &pos, &status_line))
            return Result<HttpResponse>(ERROR, "truncated or empty response");
        Result<void> s = response.parseStatusLine_(status_line);
        if (s.isError())
            return Result<HttpResponse>(ERROR, s.getErrorMessage());

        while (true)
        {
            std::string line;
            if (!readLine_(raw, &pos, &line))
                return Result<HttpResponse>(
                    ERROR, "truncated response header");
            if (line.empty())
                break;
            Result<void> h = response.parseHeaderLine_(line);
            if (h.isError())
                return Result<HttpResponse>(ERROR, h.getErrorMessage());
        }

        // 1xx は中間レスポンス。続く最終レスポンスを読む。
        if (response.status_ >= 100 && response.status_ < 200)
            continue;

        Result<void> b = response.parseBody_(raw, pos);
        if (b.isError())
            return Result<HttpResponse>(ERROR, b.getErrorMessage());
        return response;
    }
}

}  // namespace http
