#ifndef NETWORK_TLS_SESSION_HPP_
#define NETWORK_TLS_SESSION_HPP_

#include <openssl/ssl.h>

#include <string>

#include "network/tcp_connection.hpp"
#include "utils/data_type.hpp"
#include "utils/result.hpp"

namespace network
{

using namespace utils::result;

// TcpConnection 上の TLS クライアントセッション（OpenSSL）
// 接続の所有権は呼び出し側に残る。セッションを先に破棄すること。
class TlsSession
{
   public:
    ~TlsSession();

    // ハンドシェイクまで完了させる。verify_peer=true の場合は証明書チェーンと
    // ホスト名を検証する。
    static Result<TlsSession*> handshake(
        TcpConnection& conn, const std::string& host, bool verify_peer);

    Result<void> sendAll(const utils::ByteVector& data);
    // 0 は相手側のクローズ（close_notify / EOF）
    Result<size_t> receiveSome(utils::Byte* buf, size_t len);

   private:
    TlsSession(SSL_CTX* ctx, SSL* ssl);
    TlsSession();
    TlsSession(const TlsSession& rhs);
    TlsSession& operator=(const TlsSession& rhs);

    SSL_CTX* ctx_;
    SSL* ssl_;

    static std::string lastErrorString_();
};

}  // namespace network

#endif
