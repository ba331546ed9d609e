#ifndef CGIPROBE_ERROR_KIND_HPP_
#define CGIPROBE_ERROR_KIND_HPP_

#include "utils/result.hpp"

namespace cgiprobe
{

// get()/post()/create() が返すエラーの種別
// Result::getErrorCode() の値として使う。
enum ErrorKind
{
    kUnclassified = 0,
    kConfigurationError = 1,  // 対応外の scheme / 不正なターゲット
    kInvocationFailure = 2,   // 起動・接続できない
    kNonSuccessExit = 3,      // 終了コード != 0 / HTTP ステータス >= 400
    kDecodeFailure = 4        // 出力をレスポンスとして解釈できない
};

inline utils::result::ErrorCode errorCode(ErrorKind kind)
{
    return utils::result::ErrorCode(static_cast<int>(kind));
}

inline const char* errorKindName(int code)
{
    switch (code)
    {
        case kConfigurationError:
            return "configuration error";
        case kInvocationFailure:
            return "invocation failure";
        case kNonSuccessExit:
            return "non-success exit";
        case kDecodeFailure:
            return "decode failure";
        default:
            return "unclassified error";
    }
}

}  // namespace cgiprobe

#endif
