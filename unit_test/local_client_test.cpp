#include "cgiprobe/local_client.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "script_file.hpp"
#include "utils/owned_ptr.hpp"

namespace
{
using cgiprobe::CgiResult;
using cgiprobe::LocalClient;
using utils::result::Result;

LocalClient::Options withPath_()
{
    LocalClient::Options options;
    options.base_environment["PATH"] = "/usr/bin:/bin";
    return options;
}

LocalClient* create_(const std::string& command_line,
    const LocalClient::Options& options = LocalClient::Options())
{
    Result<LocalClient*> r = LocalClient::create(command_line, options);
    EXPECT_TRUE(r.isOk()) << command_line;
    if (r.isError())
        return NULL;
    return r.unwrap();
}

std::string single_(const CgiResult& result, const std::string& name)
{
    Result<http::HeaderValue> v = result.headers().find(name);
    if (v.isError())
        return "<missing>";
    Result<std::string> s = v.unwrap().single();
    if (s.isError())
        return "<multiple>";
    return s.unwrap();
}

}  // namespace

TEST(LocalClient, GetPassesQueryStringAndDecodesOutput)
{
    ScriptFile script(
        "printf 'HTTP/1.1 200 OK\\r\\nContent-Type: text/plain\\r\\n\\r\\n'\n"
        "printf '%s' \"$QUERY_STRING\"\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    http::FormFields query;
    query.add("param", 123L);
    Result<void> r = client->get(query);
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();

    const CgiResult& result = client->result();
    ASSERT_TRUE(result.hasStatus());
    EXPECT_EQ(200, result.status().unwrap());
    EXPECT_EQ("text/plain", single_(result, "content-type"));
    EXPECT_EQ("param=123", result.contentAsString());
}

TEST(LocalClient, GetSetsOnlyMethodAndQueryString)
{
    ScriptFile script(
        "printf 'Content-Type: text/plain\\n\\n'\n"
        "printf '%s|%s|%s|' \"$REQUEST_METHOD\" \"${CONTENT_LENGTH-none}\" "
        "\"${CONTENT_TYPE-none}\"\n"
        "if read line; then printf 'stdin'; else printf 'eof'; fi\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    Result<void> r = client->get(http::FormFields());
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();
    EXPECT_FALSE(client->result().hasStatus());
    EXPECT_EQ("GET|none|none|eof", client->result().contentAsString());
}

TEST(LocalClient, PostFormSetsContentHeadersAndStdin)
{
    ScriptFile script(
        "printf 'Content-Type: text/plain\\n\\n'\n"
        "printf '%s|%s|%s|' \"$REQUEST_METHOD\" \"$CONTENT_TYPE\" "
        "\"$CONTENT_LENGTH\"\n"
        "cat\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path(), withPath_()));
    ASSERT_TRUE(client.get() != NULL);

    http::FormFields data;
    data.add("param", 123L);
    Result<void> r = client->post(data);
    ASSERT_TRUE(r.isOk()) << r.getErrorMessage();
    EXPECT_EQ("POST|application/x-www-form-urlencoded|9|param=123",
        client->result().contentAsString());
}

TEST(LocalClient, PostRawBodyDefaultsToTextPlain)
{
    ScriptFile script(
        "printf '\\n'\n"
        "printf '%s|%s|' \"$CONTENT_TYPE\" \"$CONTENT_LENGTH\"\n"
        "cat\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path(), withPath_()));
    ASSERT_TRUE(client.get() != NULL);

    ASSERT_TRUE(client->post(std::string("raw body")).isOk());
    EXPECT_EQ("text/plain|8|raw body", client->result().contentAsString());

    ASSERT_TRUE(client->post(std::string("{}"), "application/json").isOk());
    EXPECT_EQ("application/json|2|{}", client->result().contentAsString());
}

TEST(LocalClient, RepeatedHeadersBecomeList)
{
    ScriptFile script(
        "printf 'Set-Cookie: name=cookie1\\n'\n"
        "printf 'Set-Cookie: name=cookie2\\n\\n'\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    ASSERT_TRUE(client->get(http::FormFields()).isOk());
    Result<http::HeaderValue> cookies =
        client->result().headers().find("Set-Cookie");
    ASSERT_TRUE(cookies.isOk());
    std::vector<std::string> expected;
    expected.push_back("name=cookie1");
    expected.push_back("name=cookie2");
    EXPECT_EQ(expected, cookies.unwrap().multiple().unwrap());
}

TEST(LocalClient, PassesQuotedArgumentsWithoutShell)
{
    ScriptFile script("printf '\\n%s|%s' \"$1\" \"$2\"\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(
        create_(script.path() + " 'two words' \"$HOME\""));
    ASSERT_TRUE(client.get() != NULL);
    EXPECT_EQ(3u, client->argv().size());

    ASSERT_TRUE(client->get(http::FormFields()).isOk());
    EXPECT_EQ("two words|$HOME", client->result().contentAsString());
}

TEST(LocalClient, NonZeroExitKeepsDecodedOutputAndStderr)
{
    ScriptFile script(
        "printf 'HTTP/1.1 500 Oops\\n\\nbroken'\n"
        "printf 'trace' >&2\n"
        "exit 2\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    Result<void> r = client->get(http::FormFields());
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(cgiprobe::kNonSuccessExit, r.getErrorCode());
    EXPECT_EQ(500, client->result().status().unwrap());
    EXPECT_EQ("broken", client->result().contentAsString());
    EXPECT_EQ("trace", client->result().stderrText());
}

TEST(LocalClient, UndecodableOutputIsDecodeFailure)
{
    ScriptFile script(
        "printf 'this is not a header\\n\\nbody'\n"
        "printf 'warning' >&2\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    Result<void> r = client->get(http::FormFields());
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(cgiprobe::kDecodeFailure, r.getErrorCode());
    EXPECT_FALSE(client->result().hasStatus());
    EXPECT_TRUE(client->result().headers().empty());
    EXPECT_TRUE(client->result().content().empty());
    EXPECT_EQ("warning", client->result().stderrText());
}

TEST(LocalClient, MissingProgramIsInvocationFailure)
{
    utils::OwnedPtr<LocalClient> client(
        create_("/nonexistent/cgiprobe/script.cgi"));
    ASSERT_TRUE(client.get() != NULL);

    Result<void> r = client->get(http::FormFields());
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(cgiprobe::kInvocationFailure, r.getErrorCode());
}

TEST(LocalClient, EachCallReplacesPreviousResult)
{
    ScriptFile script(
        "if [ \"$REQUEST_METHOD\" = GET ]; then\n"
        "  printf 'HTTP/1.1 200 OK\\nX-First: 1\\n\\nfirst'\n"
        "else\n"
        "  printf 'X-Second: 2\\n\\n'\n"
        "fi\n");
    ASSERT_TRUE(script.ok());
    utils::OwnedPtr<LocalClient> client(create_(script.path()));
    ASSERT_TRUE(client.get() != NULL);

    ASSERT_TRUE(client->get(http::FormFields()).isOk());
    EXPECT_TRUE(client->result().headers().has("x-first"));

    ASSERT_TRUE(client->post(std::string()).isOk());
    EXPECT_FALSE(client->result().hasStatus());
    EXPECT_FALSE(client->result().headers().has("x-first"));
    EXPECT_TRUE(client->result().headers().has("x-second"));
    EXPECT_TRUE(client->result().content().empty());
}

TEST(LocalClient, CreateRejectsEmptyOrUnbalancedCommandLine)
{
    Result<LocalClient*> empty = LocalClient::create("   ");
    ASSERT_TRUE(empty.isError());
    EXPECT_EQ(cgiprobe::kConfigurationError, empty.getErrorCode());

    Result<LocalClient*> quote = LocalClient::create("./x.cgi 'open");
    ASSERT_TRUE(quote.isError());
    EXPECT_EQ(cgiprobe::kConfigurationError, quote.getErrorCode());
}

TEST(LocalClient, ReportsBackendAndTarget)
{
    utils::OwnedPtr<LocalClient> client(create_("/bin/true --flag"));
    ASSERT_TRUE(client.get() != NULL);
    EXPECT_EQ(std::string("local"), client->backendName());
    EXPECT_EQ("/bin/true --flag", client->target());
}
