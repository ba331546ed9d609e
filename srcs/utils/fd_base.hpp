#ifndef UTILS_FD_BASE_HPP_
#define UTILS_FD_BASE_HPP_

#include <unistd.h>

namespace utils
{

// ファイルディスクリプタの単一所有者。デストラクタで close する。
class FdBase
{
   protected:
    int fd_;

   public:
    explicit FdBase(int fd = -1) : fd_(fd) {}
    virtual ~FdBase() { closeFd(); }

    int getFd() const { return fd_; }
    bool isValid() const { return fd_ >= 0; }

    void closeFd()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // 所有中の FD を閉じてから fd を引き受ける
    void reset(int fd)
    {
        if (fd == fd_)
            return;
        closeFd();
        fd_ = fd;
    }

    // FD の所有権を呼び出し側へ移譲する。
    // 以降、このオブジェクトのデストラクタでは close されない。
    int release()
    {
        const int released = fd_;
        fd_ = -1;
        return released;
    }

   private:
    FdBase(const FdBase&);             // コピー禁止
    FdBase& operator=(const FdBase&);  // 代入禁止
};

}  // namespace utils

#endif
