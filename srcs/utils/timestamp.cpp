#include "utils/timestamp.hpp"

#include <ctime>

namespace utils
{
std::string Timestamp::now() { return formatFromEpochSeconds(nowEpochSeconds()); }

long Timestamp::nowEpochSeconds()
{
    const std::time_t now = std::time(NULL);
    return static_cast<long>(now);
}

std::string Timestamp::formatFromEpochSeconds(long epoch_seconds)
{
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm lt;
    if (::localtime_r(&t, &lt) == NULL)
        return std::string("0000-00-00 00:00:00");

    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
    return std::string(buf, n);
}
}  // namespace utils
