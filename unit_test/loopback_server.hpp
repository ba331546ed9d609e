#ifndef UNIT_TEST_LOOPBACK_SERVER_HPP_
#define UNIT_TEST_LOOPBACK_SERVER_HPP_

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>

// 127.0.0.1 の空きポートで1接続だけ処理する HTTP サーバー（子プロセス）
// Responder はリクエスト全体（ヘッダー + ボディ）から送信するバイト列を作る。
// 応答を送ったら接続を閉じる。read_request=false の場合は受信を待たずに送る。
class LoopbackServer
{
   public:
    typedef std::string (*Responder)(const std::string& request);

    explicit LoopbackServer(Responder responder, bool read_request = true)
        : port_(0), pid_(-1)
    {
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
            serve_(fd, responder, read_request);
            ::_exit(0);
        }
        ::close(fd);
        if (pid_ > 0)
            port_ = ntohs(addr.sin_port);
    }

    ~LoopbackServer()
    {
        if (pid_ <= 0)
            return;
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR)
        {
        }
    }

    bool ok() const { return port_ != 0; }

    // path は "/" から始める
    std::string url(const std::string& path) const
    {
        std::ostringstream oss;
        oss << "http://127.0.0.1:" << port_ << path;
        return oss.str();
    }

    static std::string firstLine(const std::string& request)
    {
        return request.substr(0, request.find("\r\n"));
    }

    // "Content-Length: N" 付きの 200 応答
    static std::string ok200(const std::string& body)
    {
        std::ostringstream oss;
        oss << "HTTP/1.1 200 OK\r\n"
            << "Content-Type: text/plain\r\n"
            << "Content-Length: " << body.size() << "\r\n"
            << "\r\n"
            << body;
        return oss.str();
    }

   private:
    unsigned short port_;
    pid_t pid_;

    LoopbackServer();
    LoopbackServer(const LoopbackServer&);
    LoopbackServer& operator=(const LoopbackServer&);

    static size_t contentLength_(const std::string& head)
    {
        std::string lower(head);
        for (size_t i = 0; i < lower.size(); ++i)
            lower[i] = static_cast<char>(
                std::tolower(static_cast<unsigned char>(lower[i])));
        const std::string::size_type pos = lower.find("\r\ncontent-length:");
        if (pos == std::string::npos)
            return 0;
        return static_cast<size_t>(std::strtoul(
            head.c_str() + pos + std::strlen("\r\ncontent-length:"), NULL, 10));
    }

    static void serve_(int listen_fd, Responder responder, bool read_request)
    {
        const int conn = ::accept(listen_fd, NULL, NULL);
        ::close(listen_fd);
        if (conn < 0)
            return;

        std::string request;
        char buf[4096];
        std::string::size_type head_end = std::string::npos;
        while (read_request)
        {
            if (head_end == std::string::npos)
                head_end = request.find("\r\n\r\n");
            if (head_end != std::string::npos &&
                request.size() >=
                    head_end + 4 + contentLength_(request.substr(0, head_end)))
                break;
            const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
            if (n <= 0)
                break;
            request.append(buf, buf + n);
        }

        const std::string response = responder(request);
        size_t sent = 0;
        while (sent < response.size())
        {
            const ssize_t n = ::send(conn, response.data() + sent,
                response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                break;
            sent += static_cast<size_t>(n);
        }
        ::close(conn);
    }
};

#endif
