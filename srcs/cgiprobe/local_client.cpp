#include "cgiprobe/local_client.hpp"

#include "cgiprobe/cgi_process.hpp"
#include "cgiprobe/shell_lexer.hpp"
#include "http/cgi_response.hpp"

namespace cgiprobe
{

LocalClient::Options::Options()
    : working_directory(), base_environment(), max_output_bytes(0)
{
}

LocalClient::LocalClient(const std::string& command_line,
    const std::vector<std::string>& argv, const Options& options)
    : CgiClient(command_line), argv_(argv), options_(options)
{
}

LocalClient::~LocalClient() {}

Result<LocalClient*> LocalClient::create(
    const std::string& command_line, const Options& options)
{
    Result<std::vector<std::string> > words = ShellLexer::split(command_line);
    if (words.isError())
        return Result<LocalClient*>(ERROR, errorCode(kConfigurationError),
            "invalid command line: " + words.getErrorMessage());

    const std::vector<std::string> argv = words.unwrap();
    if (argv.empty())
        return Result<LocalClient*>(
            ERROR, errorCode(kConfigurationError), "empty command line");
    return new LocalClient(command_line, argv, options);
}

const char* LocalClient::backendName() const { return "local"; }

http::CgiMetaVariables LocalClient::buildEnvironment_(
    const CgiRequest& request) const
{
    if (request.method == http::HttpMethod::GET)
        return http::CgiMetaVariables::forGet(
            request.query.encode(), options_.base_environment);
    return http::CgiMetaVariables::forPost(
        request.body.size(), request.content_type, options_.base_environment);
}

Result<void> LocalClient::invoke_(const CgiRequest& request, CgiResult& out)
{
    CgiProcess::Options process_options;
    process_options.working_directory = options_.working_directory;
    process_options.max_output_bytes = options_.max_output_bytes;

    // GET では stdin は空（即座に閉じる）
    const utils::ByteVector& input = request.method == http::HttpMethod::POST
                                         ? request.body
                                         : utils::ByteVector();
    Result<ProcessOutput> ran = CgiProcess::run(
        argv_, buildEnvironment_(request), input, process_options);
    if (ran.isError())
        return Result<void>(
            ERROR, errorCode(kInvocationFailure), ran.getErrorMessage());

    const ProcessOutput output = ran.unwrap();
    out.setStderr(output.stderr_text);

    Result<http::CgiResponse> decoded =
        http::CgiResponse::decode(output.stdout_bytes);
    if (decoded.isOk())
        out.assignResponse(decoded.unwrap());

    // 異常終了はデコード結果にかかわらず失敗（出力はベストエフォートで残す）
    if (!output.succeeded())
        return Result<void>(ERROR, errorCode(kNonSuccessExit),
            argv_[0] + " terminated with " + output.describeStatus());

    if (decoded.isError())
    {
        out.clearResponse();
        return Result<void>(ERROR, errorCode(kDecodeFailure),
            "cannot decode output of " + argv_[0] + ": " +
                decoded.getErrorMessage());
    }
    return Result<void>();
}

}  // namespace cgiprobe
