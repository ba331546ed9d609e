#ifndef HTTP_CONTENT_TYPES_HPP_
#define HTTP_CONTENT_TYPES_HPP_

#include <string>

namespace http
{

// リクエストボディに付与する MIME タイプ
class ContentType
{
   public:
    enum Type
    {
        UNKNOWN,
        TEXT_PLAIN,                        // 生データ POST のデフォルト
        APPLICATION_X_WWW_FORM_URLENCODED  // フォームエンコードした POST
    };

    ContentType(Type v = UNKNOWN) : type_(v) {}

    bool operator==(const ContentType& other) const
    {
        return type_ == other.type_;
    }
    bool operator!=(const ContentType& other) const
    {
        return type_ != other.type_;
    }
    bool operator==(Type t) const { return type_ == t; }
    bool operator!=(Type t) const { return type_ != t; }

    operator Type() const { return type_; }

    const char* c_str() const
    {
        switch (type_)
        {
            case TEXT_PLAIN:
                return "text/plain";
            case APPLICATION_X_WWW_FORM_URLENCODED:
                return "application/x-www-form-urlencoded";
            default:
                return "application/octet-stream";
        }
    }

    std::string toString() const { return std::string(c_str()); }

   private:
    Type type_;
};

}  // namespace http

#endif
