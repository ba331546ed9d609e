#include "http/cgi_meta_variables.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using http::CgiMetaVariables;

TEST(CgiMetaVariables, ForGetSetsMethodAndQueryStringOnly)
{
    CgiMetaVariables meta =
        CgiMetaVariables::forGet("param=123", CgiMetaVariables::VariableMap());
    const CgiMetaVariables::VariableMap& env = meta.getAll();

    EXPECT_EQ(2u, env.size());
    EXPECT_EQ("GET", meta.get("REQUEST_METHOD").unwrap());
    EXPECT_EQ("param=123", meta.get("QUERY_STRING").unwrap());
    EXPECT_FALSE(meta.has("CONTENT_LENGTH"));
    EXPECT_FALSE(meta.has("CONTENT_TYPE"));
}

TEST(CgiMetaVariables, ForPostSetsLengthAndType)
{
    CgiMetaVariables meta = CgiMetaVariables::forPost(
        9, "application/x-www-form-urlencoded", CgiMetaVariables::VariableMap());

    EXPECT_EQ(3u, meta.getAll().size());
    EXPECT_EQ("POST", meta.get("REQUEST_METHOD").unwrap());
    EXPECT_EQ("9", meta.get("CONTENT_LENGTH").unwrap());
    EXPECT_EQ("application/x-www-form-urlencoded",
        meta.get("CONTENT_TYPE").unwrap());
    EXPECT_FALSE(meta.has("QUERY_STRING"));
}

TEST(CgiMetaVariables, CgiVariablesOverrideBaseEnvironment)
{
    CgiMetaVariables::VariableMap base;
    base["PATH"] = "/usr/bin";
    base["REQUEST_METHOD"] = "PUT";

    CgiMetaVariables meta = CgiMetaVariables::forGet("", base);
    EXPECT_EQ("/usr/bin", meta.get("PATH").unwrap());
    EXPECT_EQ("GET", meta.get("REQUEST_METHOD").unwrap());
    EXPECT_EQ("", meta.get("QUERY_STRING").unwrap());
}

TEST(CgiMetaVariables, UnsetVariableIsError)
{
    CgiMetaVariables meta;
    EXPECT_TRUE(meta.get("PATH").isError());
    EXPECT_TRUE(meta.getAll().empty());
}

TEST(CgiMetaVariables, ToEnvEntriesFormatsNameEqualsValue)
{
    CgiMetaVariables meta;
    meta.setRequestMethod(http::HttpMethod::POST);
    meta.setContentLength(0);
    meta.set("X", "a=b");

    std::vector<std::string> entries = meta.toEnvEntries();
    ASSERT_EQ(3u, entries.size());
    // std::map の順序（名前の昇順）
    EXPECT_EQ("CONTENT_LENGTH=0", entries[0]);
    EXPECT_EQ("REQUEST_METHOD=POST", entries[1]);
    EXPECT_EQ("X=a=b", entries[2]);
}
