#ifndef HTTP_HTTP_REQUEST_ENCODER_HPP_
#define HTTP_HTTP_REQUEST_ENCODER_HPP_

#include <string>

#include "http/http_method.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace http
{

using namespace utils::result;

// 送信する HTTP/1.1 リクエスト
struct OutgoingRequest
{
    HttpMethod method;
    std::string host;          // Host ヘッダー（必要ならポート付き）
    std::string target;        // origin-form: "/path?query"
    std::string content_type;  // POST のみ
    utils::ByteVector body;    // POST のみ

    OutgoingRequest() : method(), host(), target(), content_type(), body() {}
};

// リクエストを送出バイト列に変換する
// 1リクエスト1接続のため常に Connection: close を付ける。
class HttpRequestEncoder
{
   public:
    struct Options
    {
        std::string user_agent;  // 空なら User-Agent を送らない

        Options() : user_agent() {}
    };

    explicit HttpRequestEncoder(const Options& options);
    ~HttpRequestEncoder();

    Result<utils::ByteVector> encode(const OutgoingRequest& request) const;

   private:
    Options options_;

    static bool containsLineBreak_(const std::string& s);
    static void appendString_(utils::ByteVector& out, const std::string& s);
    static void appendHeader_(utils::ByteVector& out, const std::string& name,
        const std::string& value);
};

}  // namespace http

#endif
