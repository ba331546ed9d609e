#ifndef HTTP_HEADER_TYPES_HPP_
#define HTTP_HEADER_TYPES_HPP_

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace http
{

// RFC 9110 セクション 5.1:
// ヘッダーフィールド名は大文字小文字を区別しない
inline std::string toLowerAscii(const std::string& s)
{
    std::string out(s);
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = static_cast<char>(
            std::tolower(static_cast<unsigned char>(out[i])));
    return out;
}

inline bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// 受信順を保持したヘッダー行（名前, 値）の並び
typedef std::pair<std::string, std::string> HeaderPair;
typedef std::vector<HeaderPair> HeaderVector;

// このライブラリが送受信で扱う標準ヘッダー
class HeaderName
{
   public:
    enum Type
    {
        UNKNOWN,
        CONTENT_TYPE,
        CONTENT_LENGTH,
        TRANSFER_ENCODING,
        HOST,
        CONNECTION,
        USER_AGENT,
        ACCEPT
    };

    HeaderName(Type v = UNKNOWN) : type_(v) {}

    bool operator==(const HeaderName& other) const
    {
        return type_ == other.type_;
    }
    bool operator!=(const HeaderName& other) const
    {
        return type_ != other.type_;
    }
    bool operator==(Type t) const { return type_ == t; }
    bool operator!=(Type t) const { return type_ != t; }

    operator Type() const { return type_; }

    // 正規化された大文字小文字表記で返す
    const char* c_str() const
    {
        switch (type_)
        {
            case CONTENT_TYPE:
                return "Content-Type";
            case CONTENT_LENGTH:
                return "Content-Length";
            case TRANSFER_ENCODING:
                return "Transfer-Encoding";
            case HOST:
                return "Host";
            case CONNECTION:
                return "Connection";
            case USER_AGENT:
                return "User-Agent";
            case ACCEPT:
                return "Accept";
            default:
                return "";
        }
    }

    std::string toString() const { return std::string(c_str()); }

    static HeaderName fromString(const std::string& name)
    {
        static const Type kAll[] = {CONTENT_TYPE, CONTENT_LENGTH,
            TRANSFER_ENCODING, HOST, CONNECTION, USER_AGENT, ACCEPT};
        for (size_t i = 0; i < sizeof(kAll) / sizeof(kAll[0]); ++i)
        {
            if (equalsIgnoreCase(name, HeaderName(kAll[i]).c_str()))
                return kAll[i];
        }
        return UNKNOWN;
    }

   private:
    Type type_;
};

}  // namespace http

#endif
