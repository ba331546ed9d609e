#ifndef HTTP_CONSTANTS_HPP_
#define HTTP_CONSTANTS_HPP_

#include <string>

namespace http
{

// HTTPメッセージ / CGIレスポンスの構文定数
struct HttpSyntax
{
    // Message Format (RFC 7230 Section 3)
    static const std::string kCrlf;
    static const std::string kHttpVersionPrefix;  // "HTTP/"
    // CGI出力のステータス行判定に使う接頭辞（大文字小文字を区別しない）
    static const std::string kStatusLinePrefix;  // "HTTP"

    // Syntax Elements (RFC 7230 Section 3.2)
    static const std::string kOWS;  // Optional White Space
    // ステータス行のトークン区切り / 行の前後の空白
    static const std::string kWhitespace;

   private:
    HttpSyntax() {}  // インスタンス化を防止
};

}  // namespace http

#endif
