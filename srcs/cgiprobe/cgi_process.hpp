#ifndef CGIPROBE_CGI_PROCESS_HPP_
#define CGIPROBE_CGI_PROCESS_HPP_

#include <sys/types.h>

#include <string>
#include <vector>

#include "http/cgi_meta_variables.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// 子プロセスの終了状態と出力
struct ProcessOutput
{
    bool exited;       // exit() で終了した
    int exit_status;   // exited のときの終了コード
    int term_signal;   // シグナルで終了したときのシグナル番号（それ以外 0）
    utils::ByteVector stdout_bytes;
    std::string stderr_text;

    ProcessOutput()
        : exited(false),
          exit_status(0),
          term_signal(0),
          stdout_bytes(),
          stderr_text()
    {
    }

    bool succeeded() const { return exited && exit_status == 0; }
    // "exit status 3" / "killed by signal 9"
    std::string describeStatus() const;
};

// CGI プログラムの起動（fork + pipe + execve）
// 標準入力への書き込みと標準出力/標準エラー出力の読み出しは poll() で
// 並行に行い、子プロセスの終了まで待つ。
class CgiProcess
{
   public:
    struct Options
    {
        std::string working_directory;  // 空なら chdir しない
        size_t max_output_bytes;        // stdout + stderr の上限（0 = 無制限）

        Options() : working_directory(), max_output_bytes(0) {}
    };

    // argv[0] は resolveProgram() で解決する。環境変数は env のみ
    // （呼び出し元の environ は引き継がない）。
    static Result<ProcessOutput> run(const std::vector<std::string>& argv,
        const http::CgiMetaVariables& env, const utils::ByteVector& input,
        const Options& options = Options());

    // '/' を含まないプログラム名を path_list（':' 区切り）から探す
    static Result<std::string> resolveProgram(
        const std::string& program, const std::string& path_list);

    static const char* const kDefaultPath;

   private:
    CgiProcess();
};

}  // namespace cgiprobe

#endif
