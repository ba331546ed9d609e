#ifndef CGIPROBE_CLIENT_FACTORY_HPP_
#define CGIPROBE_CLIENT_FACTORY_HPP_

#include <string>

#include "cgiprobe/cgi_client.hpp"
#include "cgiprobe/local_client.hpp"
#include "cgiprobe/remote_client.hpp"
#include "utils/result.hpp"

namespace cgiprobe
{

using namespace utils::result;

// ターゲット文字列の scheme から CgiClient の実装を選ぶ
//   scheme なし       -> LocalClient（コマンドライン）
//   http / https      -> RemoteClient（URL）
//   それ以外の scheme -> kConfigurationError
// 返したインスタンスの所有権は呼び出し側に移る。
class ClientFactory
{
   public:
    struct Options
    {
        LocalClient::Options local;
        RemoteClient::Options remote;

        Options() : local(), remote() {}
    };

    static Result<CgiClient*> create(
        const std::string& target, const Options& options = Options());

   private:
    ClientFactory();
};

}  // namespace cgiprobe

#endif
