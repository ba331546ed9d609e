#ifndef NETWORK_TCP_CONNECTION_HPP_
#define NETWORK_TCP_CONNECTION_HPP_

#include <sys/types.h>

#include <string>

#include "network/port_type.hpp"
#include "utils/data_type.hpp"
#include "utils/fd_base.hpp"
#include "utils/result.hpp"

namespace network
{

using namespace utils::result;

// 接続済み TCP ソケット（ブロッキング）。破棄時に close する。
class TcpConnection : public utils::FdBase
{
   public:
    virtual ~TcpConnection();

    // getaddrinfo() の結果を順に試し、最初に接続できたものを返す
    static Result<TcpConnection*> connect(
        const std::string& host, const PortType& port);

    Result<void> sendAll(const utils::Byte* data, size_t len);
    Result<void> sendAll(const utils::ByteVector& data);
    // 0 は相手側のクローズ
    Result<size_t> receiveSome(utils::Byte* buf, size_t len);

    const std::string& getPeerName() const { return peer_name_; }

   private:
    TcpConnection(int fd, const std::string& peer_name);
    TcpConnection();
    TcpConnection(const TcpConnection& rhs);
    TcpConnection& operator=(const TcpConnection& rhs);

    std::string peer_name_;
};

}  // namespace network

#endif
