#ifndef CGIPROBE_CGI_CLIENT_HPP_
#define CGIPROBE_CGI_CLIENT_HPP_

#include <string>

#include "cgiprobe/cgi_request.hpp"
#include "cgiprobe/cgi_result.hpp"
#include "cgiprobe/error_kind.hpp"
#include "http/form_fields.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// CGI プログラム呼び出しの共通インターフェース
//
// 呼び出しは同期的で、プロセス終了 / HTTP 応答の受信完了までブロックする。
// タイムアウトやキャンセルは持たない。
// 内部でロックを取らないため、同じインスタンスに対する並行呼び出しは
// サポートしない（結果は後勝ち）。
class CgiClient
{
   public:
    virtual ~CgiClient();

    // QUERY_STRING（ローカル）/ URL のクエリ（リモート）として送る
    Result<void> get(const http::FormFields& query);

    // フォームエンコードして application/x-www-form-urlencoded で送る
    Result<void> post(const http::FormFields& data);
    // data をそのままボディとして送る
    Result<void> post(const std::string& data,
        const std::string& mime = kDefaultPostMimeType);
    Result<void> post(const utils::ByteVector& data,
        const std::string& mime = kDefaultPostMimeType);

    // 直前の呼び出しの結果
    const CgiResult& result() const { return result_; }
    const std::string& target() const { return target_; }

    virtual const char* backendName() const = 0;

    static const char* const kDefaultPostMimeType;

   protected:
    explicit CgiClient(const std::string& target);

    // out は空の状態で渡される。エラー時もデコードできた分は out に残してよい。
    virtual Result<void> invoke_(const CgiRequest& request, CgiResult& out) = 0;

   private:
    CgiClient();
    CgiClient(const CgiClient& rhs);
    CgiClient& operator=(const CgiClient& rhs);

    Result<void> call_(const CgiRequest& request);

    const std::string target_;
    CgiResult result_;
};

}  // namespace cgiprobe

#endif
