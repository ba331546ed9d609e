#ifndef CGIPROBE_LOCAL_CLIENT_HPP_
#define CGIPROBE_LOCAL_CLIENT_HPP_

#include <string>
#include <vector>

#include "cgiprobe/cgi_client.hpp"
#include "http/cgi_meta_variables.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// コマンドラインで指定した CGI プログラムを子プロセスとして実行する
//
//   LocalClient::create("./echo.cgi --verbose")
//
// 環境変数は CGI メタ変数（と Options::base_environment）だけに置き換える。
// 標準出力は CgiResponse としてデコードし、標準エラー出力は常に保持する。
class LocalClient : public CgiClient
{
   public:
    struct Options
    {
        std::string working_directory;  // 空なら呼び出し元のカレントディレクトリ
        // CGI メタ変数より優先度の低い追加の環境変数（PATH など）
        http::CgiMetaVariables::VariableMap base_environment;
        size_t max_output_bytes;  // stdout + stderr の上限（0 = 無制限）

        Options();
    };

    virtual ~LocalClient();

    // 空のコマンドラインやクォートの不整合は kConfigurationError
    static Result<LocalClient*> create(
        const std::string& command_line, const Options& options = Options());

    const std::vector<std::string>& argv() const { return argv_; }

    virtual const char* backendName() const;

   protected:
    virtual Result<void> invoke_(const CgiRequest& request, CgiResult& out);

   private:
    LocalClient(const std::string& command_line,
        const std::vector<std::string>& argv, const Options& options);
    LocalClient();
    LocalClient(const LocalClient& rhs);
    LocalClient& operator=(const LocalClient& rhs);

    http::CgiMetaVariables buildEnvironment_(const CgiRequest& request) const;

    const std::vector<std::string> argv_;
    const Options options_;
};

}  // namespace cgiprobe

#endif
