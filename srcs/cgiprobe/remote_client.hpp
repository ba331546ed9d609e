#ifndef CGIPROBE_REMOTE_CLIENT_HPP_
#define CGIPROBE_REMOTE_CLIENT_HPP_

#include <string>

#include "cgiprobe/cgi_client.hpp"
#include "network/url.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// URL で指定した CGI プログラムを HTTP/HTTPS で呼び出す
//
//   RemoteClient::create("http://127.0.0.1:8080/cgi-bin/echo.cgi")
//
// GET はクエリを URL に追加し、POST はボディとして送る。
// ステータスとヘッダーは受信したレスポンスをそのまま CgiResult に写す。
class RemoteClient : public CgiClient
{
   public:
    struct Options
    {
        std::string user_agent;
        bool fail_on_error_status;  // ステータス >= 400 を kNonSuccessExit にする
        bool verify_peer;           // https の証明書とホスト名を検証する
        size_t max_response_bytes;  // 0 = 無制限

        Options();
    };

    virtual ~RemoteClient();

    // http / https 以外や不正な URL は kConfigurationError
    static Result<RemoteClient*> create(
        const std::string& url, const Options& options = Options());

    const network::Url& url() const { return url_; }

    virtual const char* backendName() const;

   protected:
    virtual Result<void> invoke_(const CgiRequest& request, CgiResult& out);

   private:
    RemoteClient(const network::Url& url, const std::string& target,
        const Options& options);
    RemoteClient();
    RemoteClient(const RemoteClient& rhs);
    RemoteClient& operator=(const RemoteClient& rhs);

    static const int kErrorStatusMin = 400;

    const network::Url url_;
    const Options options_;
};

}  // namespace cgiprobe

#endif
