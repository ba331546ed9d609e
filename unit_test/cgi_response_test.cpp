#include "http/cgi_response.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{
using http::CgiResponse;
using http::HeaderValue;
using utils::result::Result;

std::string headerSingle_(const CgiResponse& r, const std::string& name)
{
    Result<HeaderValue> v = r.getHeaders().find(name);
    if (v.isError())
        return "<missing>";
    Result<std::string> s = v.unwrap().single();
    if (s.isError())
        return "<multiple>";
    return s.unwrap();
}

}  // namespace

TEST(CgiResponse, DecodesStatusLineHeadersAndBody)
{
    Result<CgiResponse> r = CgiResponse::decode(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "hello");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    CgiResponse resp = r.unwrap();
    ASSERT_TRUE(resp.hasStatus());
    EXPECT_EQ(200, resp.getStatus());
    EXPECT_EQ(1u, resp.getHeaders().size());
    EXPECT_EQ("text/plain", headerSingle_(resp, "content-type"));
    EXPECT_EQ("hello", utils::toString(resp.getContent()));
}

TEST(CgiResponse, StatusLineIsNotStoredAsHeader)
{
    Result<CgiResponse> r = CgiResponse::decode("HTTP/1.0 404 Not Found\n\n");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    CgiResponse resp = r.unwrap();
    EXPECT_EQ(404, resp.getStatus());
    EXPECT_TRUE(resp.getHeaders().empty());
    EXPECT_TRUE(resp.getContent().empty());
}

TEST(CgiResponse, StatusPrefixIsCaseInsensitive)
{
    Result<CgiResponse> r = CgiResponse::decode("http/1.1 302 Found\n\n");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();
    EXPECT_TRUE(r.unwrap().hasStatus());
    EXPECT_EQ(302, r.unwrap().getStatus());
}

TEST(CgiResponse, NoStatusLineLeavesStatusAbsent)
{
    Result<CgiResponse> r = CgiResponse::decode(
        "Content-Type: text/html\n"
        "\n"
        "<p>x</p>\n");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    CgiResponse resp = r.unwrap();
    EXPECT_FALSE(resp.hasStatus());
    EXPECT_EQ(0, resp.getStatus());
    EXPECT_EQ("text/html", headerSingle_(resp, "Content-Type"));
    EXPECT_EQ("<p>x</p>\n", utils::toString(resp.getContent()));
}

TEST(CgiResponse, RepeatedHeaderBecomesOrderedList)
{
    Result<CgiResponse> r = CgiResponse::decode(
        "Set-Cookie: name=cookie1\n"
        "Set-Cookie: name=cookie2\n"
        "X-Single: 1\n"
        "\n");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    CgiResponse resp = r.unwrap();
    Result<HeaderValue> cookies = resp.getHeaders().find("set-cookie");
    ASSERT_TRUE(cookies.isOk());
    ASSERT_TRUE(cookies.unwrap().isMultiple());
    std::vector<std::string> expected;
    expected.push_back("name=cookie1");
    expected.push_back("name=cookie2");
    EXPECT_EQ(expected, cookies.unwrap().multiple().unwrap());

    Result<HeaderValue> single = resp.getHeaders().find("x-single");
    ASSERT_TRUE(single.isOk());
    EXPECT_TRUE(single.unwrap().isSingle());
}

TEST(CgiResponse, HeaderNamesAreMatchedCaseInsensitively)
{
    Result<CgiResponse> a = CgiResponse::decode("Content-Type: a/b\n\n");
    Result<CgiResponse> b = CgiResponse::decode("CONTENT-TYPE: a/b\n\n");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    EXPECT_TRUE(a.unwrap().getHeaders() == b.unwrap().getHeaders());
    EXPECT_TRUE(a.unwrap().getHeaders().has("content-type"));
}

TEST(CgiResponse, SplitsOnFirstColonAndTrimsNameAndValue)
{
    Result<CgiResponse> r =
        CgiResponse::decode("  Location :  http://example.com:8080/x  \n\n");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();
    EXPECT_EQ("http://example.com:8080/x", headerSingle_(r.unwrap(), "location"));
}

TEST(CgiResponse, BodyIsKeptVerbatimAfterBoundary)
{
    // 空行や NUL を含んでもボディは解釈しない
    std::string body = "line1\r\n\r\nline3\n  \n";
    body.push_back('\0');
    body += "bin";
    const std::string raw = "X: y\r\n\r\n" + body;

    Result<CgiResponse> r = CgiResponse::decode(raw);
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    const std::string expected = body;
    EXPECT_EQ(expected, utils::toString(r.unwrap().getContent()));
}

TEST(CgiResponse, WithoutBoundaryContentIsEmptyAndLastLineIsHeader)
{
    Result<CgiResponse> r = CgiResponse::decode("A: 1\nB: 2");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    CgiResponse resp = r.unwrap();
    EXPECT_TRUE(resp.getContent().empty());
    EXPECT_EQ("1", headerSingle_(resp, "a"));
    EXPECT_EQ("2", headerSingle_(resp, "b"));
}

TEST(CgiResponse, EmptyOutputIsValid)
{
    Result<CgiResponse> r = CgiResponse::decode(std::string());
    ASSERT_TRUE(r.isOk());
    EXPECT_FALSE(r.unwrap().hasStatus());
    EXPECT_TRUE(r.unwrap().getHeaders().empty());
    EXPECT_TRUE(r.unwrap().getContent().empty());
}

TEST(CgiResponse, LeadingEmptyLineMakesEverythingBody)
{
    Result<CgiResponse> r = CgiResponse::decode("\nA: 1\n");
    ASSERT_TRUE(r.isOk());
    EXPECT_TRUE(r.unwrap().getHeaders().empty());
    EXPECT_EQ("A: 1\n", utils::toString(r.unwrap().getContent()));
}

TEST(CgiResponse, RejectsLineWithoutColon)
{
    EXPECT_TRUE(CgiResponse::decode("not a header\n\nbody").isError());
}

TEST(CgiResponse, RejectsEmptyHeaderName)
{
    EXPECT_TRUE(CgiResponse::decode(": value\n\n").isError());
}

TEST(CgiResponse, RejectsMissingOrNonNumericStatus)
{
    EXPECT_TRUE(CgiResponse::decode("HTTP/1.1\n\n").isError());
    EXPECT_TRUE(CgiResponse::decode("HTTP/1.1 OK\n\n").isError());
    EXPECT_TRUE(CgiResponse::decode("HTTP/1.1 20x OK\n\n").isError());
    EXPECT_TRUE(CgiResponse::decode("HTTP/1.1 99999999999 Big\n\n").isError());
}

TEST(CgiResponse, DecodesFromBytes)
{
    const std::string raw = "HTTP/1.1 201 Created\nX: 1\n\nok";
    Result<CgiResponse> r = CgiResponse::decode(utils::toBytes(raw));
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(201, r.unwrap().getStatus());
    EXPECT_EQ("ok", utils::toString(r.unwrap().getContent()));
}
