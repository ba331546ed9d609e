#ifndef HTTP_CGI_RESPONSE_HPP_
#define HTTP_CGI_RESPONSE_HPP_

#include <string>
#include <vector>

#include "http/response_headers.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace http
{

using namespace utils::result;

// CGIスクリプトの標準出力（HTTP風レスポンス）のデコーダ
//
//   [HTTP/1.1 200 OK]       省略可能なステータス行
//   Name: value             0行以上のヘッダー行
//                           空行（ヘッダー終端）
//   <body>                  以降はすべてボディ（解釈しない）
//
// 行は LF 区切り。前後の空白と CR は除去してから判定する。
class CgiResponse
{
   public:
    CgiResponse();
    CgiResponse(const CgiResponse& rhs);
    CgiResponse& operator=(const CgiResponse& rhs);
    ~CgiResponse();

    // 出力全体をデコードする。失敗時は途中結果を返さない。
    static Result<CgiResponse> decode(const utils::ByteVector& raw);
    static Result<CgiResponse> decode(const std::string& raw);

    bool hasStatus() const;
    int getStatus() const;  // hasStatus() == false の場合は 0
    const ResponseHeaders& getHeaders() const;
    const utils::ByteVector& getContent() const;

   private:
    bool has_status_;
    int status_;
    ResponseHeaders headers_;
    utils::ByteVector content_;

    static std::string trim_(const std::string& s, const std::string& chars);
    static bool startsWithIgnoreCase_(
        const std::string& s, const std::string& prefix);
    static Result<int> parseStatusLine_(const std::string& line);
    Result<void> parseHeaderLine_(const std::string& line);
};

}  // namespace http

#endif
