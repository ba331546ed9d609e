#ifndef NETWORK_HTTP_TRANSPORT_HPP_
#define NETWORK_HTTP_TRANSPORT_HPP_

#include <string>

#include "http/http_request_encoder.hpp"
#include "http/http_response.hpp"
#include "network/url.hpp"
#include "utils/result.hpp"

namespace network
{

using namespace utils::result;

// 1リクエスト = 1接続の HTTP/HTTPS クライアント
// 接続はリクエストごとに開き、レスポンスを最後まで読んでから必ず閉じる。
class HttpTransport
{
   public:
    struct Options
    {
        std::string user_agent;
        bool verify_peer;           // https の証明書検証
        size_t max_response_bytes;  // 0 の場合は無制限

        Options();
    };

    explicit HttpTransport(const Options& options);
    ~HttpTransport();

    // request.host / request.target が空なら url から埋める
    Result<http::HttpResponse> roundTrip(
        const Url& url, const http::OutgoingRequest& request) const;

   private:
    Options options_;

    Result<void> checkLimit_(size_t received) const;
};

}  // namespace network

#endif
