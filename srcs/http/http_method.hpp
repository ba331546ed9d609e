#ifndef HTTP_HTTP_METHOD_HPP_
#define HTTP_HTTP_METHOD_HPP_

#include <string>

namespace http
{

// CGI 呼び出しで扱うメソッド（GET / POST）
class HttpMethod
{
   public:
    enum Type
    {
        GET,
        POST,
        UNKNOWN
    };

    // デフォルトはUNKNOWN、またはEnumからの暗黙変換を許可
    HttpMethod(Type v = UNKNOWN) : type_(v) {}

    bool operator==(const HttpMethod& other) const
    {
        return type_ == other.type_;
    }
    bool operator!=(const HttpMethod& other) const
    {
        return type_ != other.type_;
    }
    bool operator==(Type t) const { return type_ == t; }
    bool operator!=(Type t) const { return type_ != t; }

    // switch (method) { case HttpMethod::GET: ... } 用
    operator Type() const { return type_; }

    // REQUEST_METHOD / リクエストラインに書く文字列
    const char* c_str() const
    {
        switch (type_)
        {
            case GET:
                return "GET";
            case POST:
                return "POST";
            default:
                return "UNKNOWN";
        }
    }

    std::string toString() const { return std::string(c_str()); }

   private:
    Type type_;
};

}  // namespace http

#endif
