#ifndef UTILS_SIGPIPE_GUARD_HPP_
#define UTILS_SIGPIPE_GUARD_HPP_

#include <signal.h>

#include <cstring>

namespace utils
{

// 相手側が先に閉じたパイプ / ソケットへの書き込みで SIGPIPE により
// プロセスごと終了しないよう、スコープ中は SIGPIPE を無視する。
// 書き込みは EPIPE で失敗する。スコープを抜けると元のハンドラに戻す。
class SigpipeGuard
{
   public:
    SigpipeGuard() : saved_(), installed_(false)
    {
        struct sigaction ignore;
        std::memset(&ignore, 0, sizeof(ignore));
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = ::sigaction(SIGPIPE, &ignore, &saved_) == 0;
    }
    ~SigpipeGuard()
    {
        if (installed_)
            ::sigaction(SIGPIPE, &saved_, NULL);
    }

   private:
    SigpipeGuard(const SigpipeGuard&);
    SigpipeGuard& operator=(const SigpipeGuard&);

    struct sigaction saved_;
    bool installed_;
};

}  // namespace utils

#endif
