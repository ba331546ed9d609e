#include "network/tcp_connection.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace network
{

TcpConnection::TcpConnection(int fd, const std::string& peer_name)
    : FdBase(fd), peer_name_(peer_name)
{
}

TcpConnection::~TcpConnection() {}

Result<TcpConnection*> TcpConnection::connect(
    const std::string& host, const PortType& port)
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo* res = NULL;
    const int gai =
        ::getaddrinfo(host.c_str(), port.toString().c_str(), &hints, &res);
    if (gai != 0)
        return Result<TcpConnection*>(ERROR, "cannot resolve " + host + ": " +
                                                 ::gai_strerror(gai));

    std::string last_error = "no address";
    for (struct addrinfo* ai = res; ai != NULL; ai = ai->ai_next)
    {
        utils::FdBase sock(
            ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.isValid())
        {
            last_error = std::strerror(errno);
            continue;
        }

        int rc;
        do
        {
            rc = ::connect(sock.getFd(), ai->ai_addr, ai->ai_addrlen);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0)
        {
            last_error = std::strerror(errno);
            continue;
        }

        ::freeaddrinfo(res);
        return new TcpConnection(sock.release(), host + ":" + port.toString());
    }

    ::freeaddrinfo(res);
    return Result<TcpConnection*>(ERROR, "cannot connect to " + host + ":" +
                                             port.toString() + ": " +
                                             last_error);
}

Result<void> TcpConnection::sendAll(const utils::Byte* data, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        const ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return Result<void>(
                ERROR, std::string("send() failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
    return Result<void>();
}

Result<void> TcpConnection::sendAll(const utils::ByteVector& data)
{
    if (data.empty())
        return Result<void>();
    return sendAll(&data[0], data.size());
}

Result<size_t> TcpConnection::receiveSome(utils::Byte* buf, size_t len)
{
    while (true)
    {
        const ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        return Result<size_t>(
            ERROR, std::string("recv() failed: ") + std::strerror(errno));
    }
}

}  // namespace network
