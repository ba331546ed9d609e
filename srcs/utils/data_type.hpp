#ifndef UTILS_DATA_TYPE_HPP_
#define UTILS_DATA_TYPE_HPP_

#include <string>
#include <vector>

namespace utils
{
typedef unsigned char Byte;
typedef std::vector<Byte> ByteVector;

const int kPageSizeMin = 4096;  // 4KB (メモリ管理の最小単位であるページサイズ)

inline ByteVector toBytes(const std::string& s)
{
    return ByteVector(s.begin(), s.end());
}

inline std::string toString(const ByteVector& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace utils

#endif
