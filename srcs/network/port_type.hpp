#ifndef NETWORK_PORT_TYPE_HPP_
#define NETWORK_PORT_TYPE_HPP_

#include <cstdlib>
#include <sstream>
#include <string>

#include "utils/result.hpp"

namespace network
{

using namespace utils::result;

// getaddrinfo()などの標準ライブラリのインターフェースに合わせている｡
// サービス名("http")などは受け付けず､数値での指定のみ
class PortType
{
   public:
    PortType() : port_str_(""), port_(0) {}

    // "1" 〜 "65535" の数値文字列のみ受け付ける
    static Result<PortType> parse(const std::string& port_str)
    {
        if (port_str.empty() || port_str.size() > 5)
            return Result<PortType>(ERROR, "invalid port: " + port_str);
        for (size_t i = 0; i < port_str.size(); ++i)
        {
            if (port_str[i] < '0' || port_str[i] > '9')
                return Result<PortType>(ERROR, "invalid port: " + port_str);
        }
        const long n = std::strtol(port_str.c_str(), NULL, 10);
        if (n < 1 || n > 65535)
            return Result<PortType>(ERROR, "port out of range: " + port_str);
        return PortType(static_cast<unsigned int>(n));
    }

    explicit PortType(unsigned int port) : port_str_(), port_(port)
    {
        std::ostringstream oss;
        oss << port;
        port_str_ = oss.str();
    }

    const std::string& toString() const { return port_str_; }
    unsigned int toInt() const { return port_; }

    bool empty() const { return port_str_.empty(); }

    bool operator==(const PortType& rhs) const { return port_ == rhs.port_; }
    bool operator!=(const PortType& rhs) const { return port_ != rhs.port_; }

   private:
    std::string port_str_;
    unsigned int port_;
};

}  // namespace network

#endif
