#include "network/http_transport.hpp"

#include <sstream>

#include "network/tcp_connection.hpp"
#include "network/tls_session.hpp"
#include "utils/log.hpp"
#include "utils/owned_ptr.hpp"
#include "utils/sigpipe_guard.hpp"

namespace network
{

HttpTransport::Options::Options()
    : user_agent(), verify_peer(true), max_response_bytes(0)
{
}

HttpTransport::HttpTransport(const Options& options) : options_(options) {}

HttpTransport::~HttpTransport() {}

Result<void> HttpTransport::checkLimit_(size_t received) const
{
    if (options_.max_response_bytes != 0 &&
        received > options_.max_response_bytes)
    {
        std::ostringstream oss;
        oss << "response exceeds " << options_.max_response_bytes << " bytes";
        return Result<void>(ERROR, oss.str());
    }
    return Result<void>();
}

Result<http::HttpResponse> HttpTransport::roundTrip(
    const Url& url, const http::OutgoingRequest& request) const
{
    // OpenSSL のソケット BIO はフラグなしの send() で書き込むため、
    // リセットされた接続への書き込み（SSL_shutdown を含む）で SIGPIPE が
    // 発生する。tls / conn の破棄が終わるまで保持する。
    utils::SigpipeGuard sigpipe_guard;

    http::OutgoingRequest req = request;
    if (req.host.empty())
        req.host = url.hostHeader();
    if (req.target.empty())
        req.target = url.requestTarget("");

    http::HttpRequestEncoder::Options enc_opts;
    enc_opts.user_agent = options_.user_agent;
    Result<utils::ByteVector> encoded =
        http::HttpRequestEncoder(enc_opts).encode(req);
    if (encoded.isError())
        return Result<http::HttpResponse>(ERROR, encoded.getErrorMessage());

    Result<TcpConnection*> connected = TcpConnection::connect(url.host(), url.port());
    if (connected.isError())
        return Result<http::HttpResponse>(ERROR, connected.getErrorMessage());
    // conn より先に tls を破棄する（宣言の逆順）
    utils::OwnedPtr<TcpConnection> conn(connected.unwrap());
    utils::OwnedPtr<TlsSession> tls;

    if (url.isHttps())
    {
        Result<TlsSession*> hs =
            TlsSession::handshake(*conn, url.host(), options_.verify_peer);
        if (hs.isError())
            return Result<http::HttpResponse>(ERROR, hs.getErrorMessage());
        tls.reset(hs.unwrap());
    }

    utils::Log::debug(std::string(req.method.c_str()) + " " + url.scheme() +
                      "://" + conn->getPeerName() + req.target);

    Result<void> sent = (tls.get() != NULL) ? tls->sendAll(encoded.unwrap())
                                            : conn->sendAll(encoded.unwrap());
    if (sent.isError())
        return Result<http::HttpResponse>(ERROR, sent.getErrorMessage());

    // Connection: close を送っているので EOF までがレスポンス
    utils::ByteVector raw;
    utils::Byte buf[utils::kPageSizeMin];
    while (true)
    {
        Result<size_t> n = (tls.get() != NULL)
                               ? tls->receiveSome(buf, sizeof(buf))
                               : conn->receiveSome(buf, sizeof(buf));
        if (n.isError())
            return Result<http::HttpResponse>(ERROR, n.getErrorMessage());
        if (n.unwrap() == 0)
            break;
        raw.insert(raw.end(), buf, buf + n.unwrap());

        Result<void> limit = checkLimit_(raw.size());
        if (limit.isError())
            return Result<http::HttpResponse>(ERROR, limit.getErrorMessage());
    }

    std::ostringstream oss;
    oss << "received " << raw.size() << " bytes from " << conn->getPeerName();
    utils::Log::debug(oss.str());

    return http::HttpResponse::parse(raw);
}

}  // namespace network
