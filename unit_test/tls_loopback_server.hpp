#ifndef UNIT_TEST_TLS_LOOPBACK_SERVER_HPP_
#define UNIT_TEST_TLS_LOOPBACK_SERVER_HPP_

#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

// 127.0.0.1 の空きポートで1接続だけ TLS ハンドシェイクを受け、
// 何も読まずに接続を閉じるサーバー（子プロセス）。
// 証明書は起動時に生成する自己署名のもの。
class TlsLoopbackServer
{
   public:
    TlsLoopbackServer() : port_(0), pid_(-1), key_(NULL), cert_(NULL)
    {
        if (!makeCertificate_())
            return;

        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr),
                sizeof(addr)) < 0 ||
            ::listen(fd, 1) < 0 ||
            ::getsockname(
                fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0)
        {
            ::close(fd);
            return;
        }

        pid_ = ::fork();
        if (pid_ == 0)
        {
            serve_(fd);
            ::_exit(0);
        }
        ::close(fd);
        if (pid_ > 0)
            port_ = ntohs(addr.sin_port);
    }

    ~TlsLoopbackServer()
    {
        if (pid_ > 0)
        {
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR)
            {
            }
        }
        if (cert_ != NULL)
            ::X509_free(cert_);
        if (key_ != NULL)
            ::EVP_PKEY_free(key_);
    }

    bool ok() const { return port_ != 0; }

    // path は "/" から始める
    std::string url(const std::string& path) const
    {
        std::ostringstream oss;
        oss << "https://127.0.0.1:" << port_ << path;
        return oss.str();
    }

   private:
    unsigned short port_;
    pid_t pid_;
    EVP_PKEY* key_;
    X509* cert_;

    TlsLoopbackServer(const TlsLoopbackServer&);
    TlsLoopbackServer& operator=(const TlsLoopbackServer&);

    bool makeCertificate_()
    {
        key_ = EVP_EC_gen("P-256");
        if (key_ == NULL)
            return false;
        cert_ = ::X509_new();
        if (cert_ == NULL)
            return false;
        ::X509_set_version(cert_, 2);
        ::ASN1_INTEGER_set(::X509_get_serialNumber(cert_), 1);
        ::X509_gmtime_adj(X509_getm_notBefore(cert_), 0);
        ::X509_gmtime_adj(X509_getm_notAfter(cert_), 3600);
        ::X509_set_pubkey(cert_, key_);
        X509_NAME* name = ::X509_get_subject_name(cert_);
        ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("127.0.0.1"), -1, -1, 0);
        ::X509_set_issuer_name(cert_, name);
        return ::X509_sign(cert_, key_, ::EVP_sha256()) > 0;
    }

    void serve_(int listen_fd)
    {
        const int conn = ::accept(listen_fd, NULL, NULL);
        ::close(listen_fd);
        if (conn < 0)
            return;

        SSL_CTX* ctx = ::SSL_CTX_new(::TLS_server_method());
        if (ctx == NULL || ::SSL_CTX_use_certificate(ctx, cert_) != 1 ||
            ::SSL_CTX_use_PrivateKey(ctx, key_) != 1)
        {
            ::close(conn);
            return;
        }
        SSL* ssl = ::SSL_new(ctx);
        if (ssl != NULL && ::SSL_set_fd(ssl, conn) == 1)
            ::SSL_accept(ssl);
        // 未読データを残したまま閉じるので、相手には RST が届く
        ::close(conn);
    }
};

#endif
