#include "utils/result.hpp"

#include <gtest/gtest.h>

#include <string>

#include "cgiprobe/error_kind.hpp"

namespace
{
using utils::result::ERROR;
using utils::result::ErrorCode;
using utils::result::Result;

Result<int> half_(int n)
{
    if (n % 2 != 0)
        return Result<int>(ERROR, ErrorCode(7), "odd number");
    return n / 2;
}

}  // namespace

TEST(Result, OkCarriesValue)
{
    Result<int> r = half_(10);
    ASSERT_TRUE(r.isOk());
    EXPECT_FALSE(r.isError());
    EXPECT_EQ(5, r.unwrap());
}

TEST(Result, ErrorCarriesMessageAndCode)
{
    Result<int> r = half_(3);
    ASSERT_TRUE(r.isError());
    EXPECT_EQ("odd number", r.getErrorMessage());
    EXPECT_EQ(7, r.getErrorCode());
}

TEST(Result, PlainErrorHasUnclassifiedCode)
{
    Result<void> r(ERROR, "failed");
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(cgiprobe::kUnclassified, r.getErrorCode());
}

TEST(Result, DummyValueConstructorKeepsCodeZero)
{
    Result<std::string> r(ERROR, std::string(), "no value");
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(0, r.getErrorCode());
    EXPECT_EQ("no value", r.getErrorMessage());
}

TEST(Result, VoidErrorWithKind)
{
    Result<void> r(ERROR, cgiprobe::errorCode(cgiprobe::kDecodeFailure), "bad");
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(cgiprobe::kDecodeFailure, r.getErrorCode());
    EXPECT_STREQ("decode failure", cgiprobe::errorKindName(r.getErrorCode()));
}

TEST(ErrorKind, NamesEveryKind)
{
    EXPECT_STREQ("configuration error",
        cgiprobe::errorKindName(cgiprobe::kConfigurationError));
    EXPECT_STREQ("invocation failure",
        cgiprobe::errorKindName(cgiprobe::kInvocationFailure));
    EXPECT_STREQ(
        "non-success exit", cgiprobe::errorKindName(cgiprobe::kNonSuccessExit));
    EXPECT_STREQ("unclassified error", cgiprobe::errorKindName(0));
}
