#include "http/cgi_meta_variables.hpp"

#include <sstream>

namespace http
{

CgiMetaVariables::CgiMetaVariables() : variables_() {}

CgiMetaVariables::CgiMetaVariables(const VariableMap& base) : variables_(base)
{
}

void CgiMetaVariables::set(const std::string& name, const std::string& value)
{
    variables_[name] = value;
}

Result<std::string> CgiMetaVariables::get(const std::string& name) const
{
    VariableMap::const_iterator it = variables_.find(name);
    if (it == variables_.end())
        return Result<std::string>(
            ERROR, std::string(), "meta variable not set: " + name);
    return it->second;
}

bool CgiMetaVariables::has(const std::string& name) const
{
    return variables_.find(name) != variables_.end();
}

void CgiMetaVariables::setRequestMethod(HttpMethod method)
{
    set("REQUEST_METHOD", method.toString());
}

void CgiMetaVariables::setQueryString(const std::string& query_string)
{
    set("QUERY_STRING", query_string);
}

void CgiMetaVariables::setContentLength(unsigned long content_length)
{
    std::ostringstream oss;
    oss << content_length;
    set("CONTENT_LENGTH", oss.str());
}

void CgiMetaVariables::setContentType(const std::string& content_type)
{
    set("CONTENT_TYPE", content_type);
}

const CgiMetaVariables::VariableMap& CgiMetaVariables::getAll() const
{
    return variables_;
}

std::vector<std::string> CgiMetaVariables::toEnvEntries() const
{
    std::vector<std::string> entries;
    for (VariableMap::const_iterator it = variables_.begin();
        it != variables_.end(); ++it)
    {
        entries.push_back(it->first + "=" + it->second);
    }
    return entries;
}

CgiMetaVariables CgiMetaVariables::forGet(
    const std::string& query_string, const VariableMap& base)
{
    CgiMetaVariables v(base);
    v.setRequestMethod(HttpMethod::GET);
    v.setQueryString(query_string);
    return v;
}

CgiMetaVariables CgiMetaVariables::forPost(unsigned long content_length,
    const std::string& content_type, const VariableMap& base)
{
    CgiMetaVariables v(base);
    v.setRequestMethod(HttpMethod::POST);
    v.setContentLength(content_length);
    v.setContentType(content_type);
    return v;
}

}  // namespace http
