#include "network/tls_session.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace network
{

TlsSession::TlsSession(SSL_CTX* ctx, SSL* ssl) : ctx_(ctx), ssl_(ssl) {}

TlsSession::~TlsSession()
{
    if (ssl_ != NULL)
    {
        ::SSL_shutdown(ssl_);
        ::SSL_free(ssl_);
    }
    if (ctx_ != NULL)
        ::SSL_CTX_free(ctx_);
}

std::string TlsSession::lastErrorString_()
{
    const unsigned long e = ::ERR_get_error();
    if (e == 0)
        return "unknown TLS error";
    char buf[256];
    ::ERR_error_string_n(e, buf, sizeof(buf));
    return std::string(buf);
}

Result<TlsSession*> TlsSession::handshake(
    TcpConnection& conn, const std::string& host, bool verify_peer)
{
    ::ERR_clear_error();

    SSL_CTX* ctx = ::SSL_CTX_new(::TLS_client_method());
    if (ctx == NULL)
        return Result<TlsSession*>(
            ERROR, "SSL_CTX_new() failed: " + lastErrorString_());
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

    if (verify_peer)
    {
        ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, NULL);
        if (::SSL_CTX_set_default_verify_paths(ctx) != 1)
        {
            const std::string err = lastErrorString_();
            ::SSL_CTX_free(ctx);
            return Result<TlsSession*>(
                ERROR, "cannot load CA certificates: " + err);
        }
    }

    SSL* ssl = ::SSL_new(ctx);
    if (ssl == NULL)
    {
        const std::string err = lastErrorString_();
        ::SSL_CTX_free(ctx);
        return Result<TlsSession*>(ERROR, "SSL_new() failed: " + err);
    }
    // 以降の失敗は session のデストラクタで解放する
    TlsSession* session = new TlsSession(ctx, ssl);

    // SNI
    SSL_set_tlsext_host_name(ssl, host.c_str());
    if (verify_peer)
    {
        X509_VERIFY_PARAM* param = ::SSL_get0_param(ssl);
        ::X509_VERIFY_PARAM_set_hostflags(
            param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (::X509_VERIFY_PARAM_set1_host(param, host.c_str(), 0) != 1)
        {
            delete session;
            return Result<TlsSession*>(
                ERROR, "cannot set host name for verification: " + host);
        }
    }

    if (::SSL_set_fd(ssl, conn.getFd()) != 1)
    {
        const std::string err = lastErrorString_();
        delete session;
        return Result<TlsSession*>(ERROR, "SSL_set_fd() failed: " + err);
    }

    if (::SSL_connect(ssl) != 1)
    {
        std::string err = lastErrorString_();
        const long verify = ::SSL_get_verify_result(ssl);
        if (verify != X509_V_OK)
            err += std::string(" (") +
                   ::X509_verify_cert_error_string(verify) + ")";
        // handshake 未完了なので close_notify は送らない
        ::SSL_set_quiet_shutdown(ssl, 1);
        delete session;
        return Result<TlsSession*>(
            ERROR, "TLS handshake with " + host + " failed: " + err);
    }

    return session;
}

Result<void> TlsSession::sendAll(const utils::ByteVector& data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        size_t written = 0;
        if (::SSL_write_ex(ssl_, &data[sent], data.size() - sent, &written) !=
            1)
            return Result<void>(
                ERROR, "SSL_write() failed: " + lastErrorString_());
        sent += written;
    }
    return Result<void>();
}

Result<size_t> TlsSession::receiveSome(utils::Byte* buf, size_t len)
{
    size_t n = 0;
    if (::SSL_read_ex(ssl_, buf, len, &n) == 1)
        return n;

    const int err = ::SSL_get_error(ssl_, 0);
    if (err == SSL_ERROR_ZERO_RETURN)
        return static_cast<size_t>(0);
    // close_notify なしで切断するサーバーが多いため EOF として扱う
    if (err == SSL_ERROR_SYSCALL || err == SSL_ERROR_SSL)
    {
        const unsigned long e = ::ERR_peek_error();
        if (e == 0 || ERR_GET_REASON(e) == SSL_R_UNEXPECTED_EOF_WHILE_READING)
        {
            ::ERR_clear_error();
            return static_cast<size_t>(0);
        }
    }
    return Result<size_t>(ERROR, "SSL_read() failed: " + lastErrorString_());
}

}  // namespace network
