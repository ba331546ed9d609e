#ifndef CGIPROBE_SHELL_LEXER_HPP_
#define CGIPROBE_SHELL_LEXER_HPP_

#include <string>
#include <vector>

#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// POSIX シェル風のコマンドライン分割
// シェルは起動しない。展開（$VAR, *, ~）やコメントは解釈しない。
//   - 空白（SP, HT, CR, LF）で区切る
//   - '...' の中はすべてリテラル
//   - "..." の中では \" と \\ のみエスケープ
//   - クォート外の \x は x そのもの
//   - "" や '' は空の引数になる
class ShellLexer
{
   public:
    static Result<std::vector<std::string> > split(const std::string& line);

   private:
    ShellLexer();

    static bool isBlank_(char c);
};

}  // namespace cgiprobe

#endif
