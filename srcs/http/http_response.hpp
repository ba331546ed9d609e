#ifndef HTTP_HTTP_RESPONSE_HPP_
#define HTTP_HTTP_RESPONSE_HPP_

#include <string>

#include "http/header.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace http
{

using namespace utils::result;

// サーバーから受信した HTTP/1.x レスポンス
// - ヘッダーは受信順のまま (名前, 値) の並びで保持する（同名ヘッダーの
//   グループ化は行わない）
// - ボディは Transfer-Encoding: chunked をデコード済み
class HttpResponse
{
   public:
    HttpResponse();
    HttpResponse(const HttpResponse& rhs);
    HttpResponse& operator=(const HttpResponse& rhs);
    ~HttpResponse();

    // 接続終了までに受信したバイト列全体をパースする
    static Result<HttpResponse> parse(const utils::ByteVector& raw);

    int getStatus() const;
    const std::string& getReasonPhrase() const;
    const std::string& getHttpVersion() const;
    const HeaderVector& getHeaders() const;
    Result<std::string> getHeader(const std::string& name) const;
    const utils::ByteVector& getBody() const;

   private:
    std::string http_version_;
    int status_;
    std::string reason_phrase_;
    HeaderVector headers_;
    utils::ByteVector body_;

    Result<void> parseStatusLine_(const std::string& line);
    Result<void> parseHeaderLine_(const std::string& line);
    Result<void> parseBody_(const utils::ByteVector& raw, size_t body_start);
    Result<void> decodeChunked_(const utils::ByteVector& raw, size_t pos);
    bool isChunked_() const;
    static bool readLine_(
        const utils::ByteVector& raw, size_t* pos, std::string* line);
};

}  // namespace http

#endif
