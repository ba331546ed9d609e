#include "http/response_headers.hpp"

namespace http
{

// HeaderValue --------------------------

HeaderValue::HeaderValue(const std::string& first) : kind_(kSingle), values_()
{
    values_.push_back(first);
}

void HeaderValue::append(const std::string& value)
{
    values_.push_back(value);
    kind_ = kMultiple;
}

Result<std::string> HeaderValue::single() const
{
    if (kind_ != kSingle)
        return Result<std::string>(
            ERROR, std::string(), "header has multiple values");
    return values_[0];
}

Result<std::vector<std::string> > HeaderValue::multiple() const
{
    if (kind_ != kMultiple)
        return Result<std::vector<std::string> >(
            ERROR, "header has a single value");
    return values_;
}

bool HeaderValue::operator==(const HeaderValue& rhs) const
{
    return kind_ == rhs.kind_ && values_ == rhs.values_;
}

// ResponseHeaders --------------------------

ResponseHeaders::ResponseHeaders() : headers_() {}

void ResponseHeaders::add(const std::string& name, const std::string& value)
{
    const std::string key = toLowerAscii(name);
    Map::iterator it = headers_.find(key);
    if (it == headers_.end())
    {
        headers_.insert(std::make_pair(key, HeaderValue(value)));
        return;
    }
    it->second.append(value);
}

void ResponseHeaders::addAll(const HeaderVector& headers)
{
    for (HeaderVector::const_iterator it = headers.begin();
        it != headers.end(); ++it)
    {
        add(it->first, it->second);
    }
}

void ResponseHeaders::clear() { headers_.clear(); }

bool ResponseHeaders::has(const std::string& name) const
{
    return headers_.find(toLowerAscii(name)) != headers_.end();
}

Result<HeaderValue> ResponseHeaders::find(const std::string& name) const
{
    Map::const_iterator it = headers_.find(toLowerAscii(name));
    if (it == headers_.end())
        return Result<HeaderValue>(
            ERROR, HeaderValue(std::string()), "header not found: " + name);
    return it->second;
}

Result<std::string> ResponseHeaders::first(const std::string& name) const
{
    Map::const_iterator it = headers_.find(toLowerAscii(name));
    if (it == headers_.end())
        return Result<std::string>(
            ERROR, std::string(), "header not found: " + name);
    return it->second.values()[0];
}

bool ResponseHeaders::operator==(const ResponseHeaders& rhs) const
{
    return headers_ == rhs.headers_;
}

}  // namespace http
