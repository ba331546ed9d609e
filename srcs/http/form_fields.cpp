#include "http/form_fields.hpp"

#include <sstream>

namespace http
{

FormFields::FormFields() : fields_() {}

FormFields& FormFields::add(const std::string& key, const std::string& value)
{
    fields_.push_back(Field(key, value));
    return *this;
}

FormFields& FormFields::add(const std::string& key, const char* value)
{
    return add(key, std::string(value == NULL ? "" : value));
}

FormFields& FormFields::add(const std::string& key, long value)
{
    std::ostringstream oss;
    oss << value;
    return add(key, oss.str());
}

std::string FormFields::encode() const
{
    std::string out;
    for (FieldVector::const_iterator it = fields_.begin(); it != fields_.end();
        ++it)
    {
        if (it != fields_.begin())
            out.push_back('&');
        out += percentEncode(it->first);
        out.push_back('=');
        out += percentEncode(it->second);
    }
    return out;
}

FormFields FormFields::parse(const std::string& encoded)
{
    FormFields fields;
    std::string::size_type start = 0;
    while (start <= encoded.size())
    {
        std::string::size_type amp = encoded.find('&', start);
        if (amp == std::string::npos)
            amp = encoded.size();

        const std::string pair = encoded.substr(start, amp - start);
        if (!pair.empty())
        {
            const std::string::size_type eq = pair.find('=');
            if (eq == std::string::npos)
                fields.add(percentDecode(pair), std::string());
            else
                fields.add(percentDecode(pair.substr(0, eq)),
                    percentDecode(pair.substr(eq + 1)));
        }
        start = amp + 1;
    }
    return fields;
}

std::vector<std::string> FormFields::getAll(const std::string& key) const
{
    std::vector<std::string> out;
    for (FieldVector::const_iterator it = fields_.begin(); it != fields_.end();
        ++it)
    {
        if (it->first == key)
            out.push_back(it->second);
    }
    return out;
}

bool FormFields::isUnreservedChar_(unsigned char c)
{
    if (c >= 'a' && c <= 'z')
        return true;
    if (c >= 'A' && c <= 'Z')
        return true;
    if (c >= '0' && c <= '9')
        return true;
    if (c == '-' || c == '.' || c == '_' || c == '~')
        return true;
    return false;
}

int FormFields::hexValue_(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string FormFields::percentEncode(const std::string& s)
{
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (std::string::size_type i = 0; i < s.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (isUnreservedChar_(c))
        {
            out.push_back(static_cast<char>(c));
        }
        else if (c == ' ')
        {
            out.push_back('+');
        }
        else
        {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string FormFields::percentDecode(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (std::string::size_type i = 0; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c == '+')
        {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < s.size())
        {
            const int hi = hexValue_(s[i + 1]);
            const int lo = hexValue_(s[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

}  // namespace http
