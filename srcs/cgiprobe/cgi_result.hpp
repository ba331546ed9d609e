#ifndef CGIPROBE_CGI_RESULT_HPP_
#define CGIPROBE_CGI_RESULT_HPP_

#include <string>

#include "http/cgi_response.hpp"
#include "http/response_headers.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// 1回の呼び出しの結果。呼び出しごとに丸ごと置き換わる。
class CgiResult
{
   public:
    CgiResult();

    // ステータス行がなかった場合（ローカルのみ）は false
    bool hasStatus() const { return has_status_; }
    Result<int> status() const;

    const http::ResponseHeaders& headers() const { return headers_; }
    const utils::ByteVector& content() const { return content_; }
    std::string contentAsString() const { return utils::toString(content_); }
    // 子プロセスの標準エラー出力（ローカルのみ）
    const std::string& stderrText() const { return stderr_; }

    void setStatus(int status);
    void setHeaders(const http::ResponseHeaders& headers);
    void setContent(const utils::ByteVector& content);
    void setStderr(const std::string& text);
    // デコード結果（status/headers/content）を取り込む。stderr は変更しない。
    void assignResponse(const http::CgiResponse& response);
    // status/headers/content を空にする。stderr は変更しない。
    void clearResponse();

    // status/headers/content が等しいか（stderr は比較しない）
    bool sameResponseAs(const CgiResult& rhs) const;

   private:
    bool has_status_;
    int status_;
    http::ResponseHeaders headers_;
    utils::ByteVector content_;
    std::string stderr_;
};

}  // namespace cgiprobe

#endif
