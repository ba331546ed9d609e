#ifndef UTILS_TIMESTAMP_HPP_
#define UTILS_TIMESTAMP_HPP_

#include <ctime>
#include <string>

namespace utils
{
class Timestamp
{
   public:
    // 現在時刻の文字列表現（YYYY-MM-DD HH:MM:SS）
    static std::string now();

    // 秒単位のエポック時刻
    static long nowEpochSeconds();

    // エポック秒をローカル時刻の YYYY-MM-DD HH:MM:SS に整形
    static std::string formatFromEpochSeconds(long epoch_seconds);

   private:
    Timestamp();
    Timestamp(const Timestamp& other);
    Timestamp& operator=(const Timestamp& other);
    ~Timestamp();
};
}  // namespace utils
#endif
