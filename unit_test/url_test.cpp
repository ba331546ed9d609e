#include "network/url.hpp"

#include <gtest/gtest.h>

using network::Url;
using utils::result::Result;

TEST(Url, ParsesHostPortPathAndQuery)
{
    Result<Url> r = Url::parse("http://example.com:8080/cgi-bin/x.cgi?a=1#frag");
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    Url url = r.unwrap();
    EXPECT_EQ("http", url.scheme());
    EXPECT_EQ("example.com", url.host());
    EXPECT_EQ(8080u, url.port().toInt());
    EXPECT_EQ("/cgi-bin/x.cgi", url.path());
    EXPECT_EQ("a=1", url.query());
    EXPECT_FALSE(url.hasDefaultPort());
    EXPECT_EQ("example.com:8080", url.hostHeader());
}

TEST(Url, AppliesDefaultPortsAndRootPath)
{
    Url plain = Url::parse("http://example.com").unwrap();
    EXPECT_EQ(80u, plain.port().toInt());
    EXPECT_EQ("/", plain.path());
    EXPECT_EQ("example.com", plain.hostHeader());

    Url secure = Url::parse("https://example.com?x=1").unwrap();
    EXPECT_TRUE(secure.isHttps());
    EXPECT_EQ(443u, secure.port().toInt());
    EXPECT_EQ("/", secure.path());
    EXPECT_EQ("x=1", secure.query());
}

TEST(Url, ParsesBracketedIpv6Host)
{
    Url url = Url::parse("http://[::1]:8000/x").unwrap();
    EXPECT_EQ("::1", url.host());
    EXPECT_EQ(8000u, url.port().toInt());
    EXPECT_EQ("[::1]:8000", url.hostHeader());
}

TEST(Url, RequestTargetJoinsExtraQuery)
{
    Url plain = Url::parse("http://h/cgi").unwrap();
    EXPECT_EQ("/cgi", plain.requestTarget(""));
    EXPECT_EQ("/cgi?param=123", plain.requestTarget("param=123"));

    Url with_query = Url::parse("http://h/cgi?x=1").unwrap();
    EXPECT_EQ("/cgi?x=1", with_query.requestTarget(""));
    EXPECT_EQ("/cgi?x=1&param=123", with_query.requestTarget("param=123"));
}

TEST(Url, RejectsUnsupportedOrMalformedUrls)
{
    EXPECT_TRUE(Url::parse("ftp://h/x").isError());
    EXPECT_TRUE(Url::parse("http:/h/x").isError());
    EXPECT_TRUE(Url::parse("http://user@h/x").isError());
    EXPECT_TRUE(Url::parse("http://h:0/x").isError());
    EXPECT_TRUE(Url::parse("http://h:http/x").isError());
    EXPECT_TRUE(Url::parse("http://h/a b").isError());
    EXPECT_TRUE(Url::parse("http://[::1/x").isError());
}

TEST(Url, SchemeOfFollowsRfc3986Syntax)
{
    EXPECT_EQ("http", Url::schemeOf("http://h/"));
    EXPECT_EQ("https", Url::schemeOf("HTTPS://h/"));
    EXPECT_EQ("svn+ssh", Url::schemeOf("svn+ssh://h/"));
    EXPECT_EQ("c", Url::schemeOf("c:/x"));
    EXPECT_EQ("", Url::schemeOf("./a:b"));
    EXPECT_EQ("", Url::schemeOf("1http://h/"));
    EXPECT_EQ("", Url::schemeOf("script.cgi"));
    EXPECT_EQ("", Url::schemeOf(""));
}
