#include "network/url.hpp"

#include <cctype>

#include "http/header.hpp"

namespace network
{

Url::Url() : scheme_(), host_(), port_(), path_(), query_() {}

std::string Url::schemeOf(const std::string& target)
{
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    if (target.empty() || !std::isalpha(static_cast<unsigned char>(target[0])))
        return std::string();

    for (size_t i = 1; i < target.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(target[i]);
        if (c == ':')
            return http::toLowerAscii(target.substr(0, i));
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return std::string();
    }
    return std::string();
}

unsigned int Url::defaultPortFor_(const std::string& scheme)
{
    return scheme == "https" ? 443 : 80;
}

bool Url::hasDefaultPort() const
{
    return port_.toInt() == defaultPortFor_(scheme_);
}

Result<Url> Url::parse(const std::string& url)
{
    Url out;
    out.scheme_ = schemeOf(url);
    if (out.scheme_ != "http" && out.scheme_ != "https")
        return Result<Url>(ERROR, "unsupported URL scheme: " + url);

    const std::string::size_type after_scheme = out.scheme_.size() + 1;
    if (url.compare(after_scheme, 2, "//") != 0)
        return Result<Url>(ERROR, "URL has no authority: " + url);

    for (size_t i = 0; i < url.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(url[i]);
        if (c <= 0x20 || c == 0x7f)
            return Result<Url>(ERROR, "URL contains whitespace or control "
                                      "characters: " + url);
    }

    const std::string::size_type auth_start = after_scheme + 2;
    std::string::size_type auth_end = url.find_first_of("/?#", auth_start);
    if (auth_end == std::string::npos)
        auth_end = url.size();
    std::string authority = url.substr(auth_start, auth_end - auth_start);

    // userinfo は扱わない
    if (authority.find('@') != std::string::npos)
        return Result<Url>(ERROR, "URL userinfo is not supported: " + url);

    std::string port_str;
    if (!authority.empty() && authority[0] == '[')
    {
        const std::string::size_type close = authority.find(']');
        if (close == std::string::npos)
            return Result<Url>(ERROR, "unterminated IPv6 literal: " + url);
        out.host_ = authority.substr(1, close - 1);
        const std::string rest = authority.substr(close + 1);
        if (!rest.empty())
        {
            if (rest[0] != ':')
                return Result<Url>(ERROR, "invalid authority: " + url);
            port_str = rest.substr(1);
        }
    }
    else
    {
        const std::string::size_type colon = authority.find(':');
        out.host_ = authority.substr(0, colon);
        if (colon != std::string::npos)
            port_str = authority.substr(colon + 1);
    }
    if (out.host_.empty())
        return Result<Url>(ERROR, "URL has no host: " + url);

    if (port_str.empty())
    {
        out.port_ = PortType(defaultPortFor_(out.scheme_));
    }
    else
    {
        Result<PortType> p = PortType::parse(port_str);
        if (p.isError())
            return Result<Url>(ERROR, p.getErrorMessage());
        out.port_ = p.unwrap();
    }

    // path / query（fragment は送信しない）
    std::string rest = url.substr(auth_end);
    const std::string::size_type hash = rest.find('#');
    if (hash != std::string::npos)
        rest.erase(hash);
    const std::string::size_type q = rest.find('?');
    if (q == std::string::npos)
    {
        out.path_ = rest;
    }
    else
    {
        out.path_ = rest.substr(0, q);
        out.query_ = rest.substr(q + 1);
    }
    if (out.path_.empty())
        out.path_ = "/";

    return out;
}

std::string Url::hostHeader() const
{
    std::string h = (host_.find(':') != std::string::npos)
                        ? "[" + host_ + "]"
                        : host_;
    if (!hasDefaultPort())
        h += ":" + port_.toString();
    return h;
}

std::string Url::requestTarget(const std::string& extra_query) const
{
    std::string target = path_;
    if (query_.empty() && extra_query.empty())
        return target;

    target += "?";
    target += query_;
    if (!query_.empty() && !extra_query.empty())
        target += "&";
    target += extra_query;
    return target;
}

}  // namespace network
