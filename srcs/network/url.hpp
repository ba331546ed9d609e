#ifndef NETWORK_URL_HPP_
#define NETWORK_URL_HPP_

#include <string>

#include "network/port_type.hpp"
#include "utils/result.hpp"

namespace network
{

using namespace utils::result;

// http / https の絶対URL
//   scheme "://" host [ ":" port ] [ path ] [ "?" query ] [ "#" fragment ]
// host は "[::1]" のような IPv6 リテラルも受け付ける。
class Url
{
   public:
    Url();

    static Result<Url> parse(const std::string& url);

    // 文字列先頭の RFC 3986 scheme（小文字化済み）を返す。
    // scheme として成立しない場合は空文字列。
    static std::string schemeOf(const std::string& target);

    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const PortType& port() const { return port_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }

    bool isHttps() const { return scheme_ == "https"; }
    bool hasDefaultPort() const;

    // Host ヘッダーの値（既定ポート以外ならポート付き）
    std::string hostHeader() const;
    // リクエストターゲット（origin-form）。extra_query を既存クエリに追加する。
    std::string requestTarget(const std::string& extra_query) const;

   private:
    std::string scheme_;
    std::string host_;  // IPv6 の場合は角括弧なし
    PortType port_;
    std::string path_;
    std::string query_;

    static unsigned int defaultPortFor_(const std::string& scheme);
};

}  // namespace network

#endif
