#ifndef HTTP_CGI_META_VARIABLES_HPP_
#define HTTP_CGI_META_VARIABLES_HPP_

#include <map>
#include <string>
#include <vector>

#include "http/http_method.hpp"
#include "utils/result.hpp"

namespace http
{

using namespace utils::result;

// 子プロセスへ渡す CGI メタ変数（RFC 3875 Section 4）
// 呼び出し元プロセスの環境変数は一切引き継がない。明示的に set した変数だけが
// 子プロセスの環境になる。
class CgiMetaVariables
{
   public:
    typedef std::map<std::string, std::string> VariableMap;

    CgiMetaVariables();
    // base は CGI 変数より優先度の低い追加変数（PATH など）
    explicit CgiMetaVariables(const VariableMap& base);

    void setRequestMethod(HttpMethod method);
    void setQueryString(const std::string& query_string);
    void setContentLength(unsigned long content_length);
    void setContentType(const std::string& content_type);

    void set(const std::string& name, const std::string& value);
    Result<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    const VariableMap& getAll() const;

    // execve() に渡す "NAME=value" の並び
    std::vector<std::string> toEnvEntries() const;

    // GET: REQUEST_METHOD, QUERY_STRING
    static CgiMetaVariables forGet(
        const std::string& query_string, const VariableMap& base);
    // POST: REQUEST_METHOD, CONTENT_LENGTH, CONTENT_TYPE
    static CgiMetaVariables forPost(unsigned long content_length,
        const std::string& content_type, const VariableMap& base);

   private:
    VariableMap variables_;
};

}  // namespace http

#endif
