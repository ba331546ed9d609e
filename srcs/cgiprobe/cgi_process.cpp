#include "cgiprobe/cgi_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "utils/fd_base.hpp"
#include "utils/log.hpp"
#include "utils/sigpipe_guard.hpp"

namespace cgiprobe
{

const char* const CgiProcess::kDefaultPath = "/bin:/usr/bin";

std::string ProcessOutput::describeStatus() const
{
    std::ostringstream oss;
    if (exited)
        oss << "exit status " << exit_status;
    else
        oss << "killed by signal " << term_signal;
    return oss.str();
}

namespace
{

// 子プロセスが exec に至らなかった段階
enum ChildStage
{
    kStageDup = 1,
    kStageChdir = 2,
    kStageExec = 3
};

// エラーパイプに書き込む内容
struct ChildFailure
{
    int stage;
    int error_number;
};

std::string errnoMessage_(const std::string& what, int error_number)
{
    return what + ": " + std::strerror(error_number);
}

const char* stageName_(int stage)
{
    switch (stage)
    {
        case kStageDup:
            return "redirect stdio for";
        case kStageChdir:
            return "change directory for";
        case kStageExec:
            return "execute";
        default:
            return "start";
    }
}

Result<void> setNonBlocking_(int fd)
{
    if (fd < 0)
        return Result<void>(ERROR, "invalid fd");
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return Result<void>(ERROR, "fcntl(F_GETFL) failed");
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return Result<void>(ERROR, "fcntl(F_SETFL) failed");
    return Result<void>();
}

Result<void> setCloseOnExec_(int fd)
{
    const int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags < 0)
        return Result<void>(ERROR, "fcntl(F_GETFD) failed");
    if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0)
        return Result<void>(ERROR, "fcntl(F_SETFD) failed");
    return Result<void>();
}

Result<void> openPipe_(utils::FdBase& read_end, utils::FdBase& write_end)
{
    int fds[2] = {-1, -1};
    if (::pipe(fds) < 0)
        return Result<void>(ERROR, errnoMessage_("pipe() failed", errno));
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return Result<void>();
}

bool isExecutableFile_(const std::string& path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) < 0)
        return false;
    if (!S_ISREG(st.st_mode))
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// execve() 用の NULL 終端配列。strs より長く生存させないこと。
std::vector<char*> toCStrings_(const std::vector<std::string>& strs)
{
    std::vector<char*> ptrs;
    for (size_t i = 0; i < strs.size(); ++i)
        ptrs.push_back(const_cast<char*>(strs[i].c_str()));
    ptrs.push_back(NULL);
    return ptrs;
}

// 以下は fork 後の子プロセスでのみ呼ぶ（メモリ確保をしない）

void closeInChild_(int fd)
{
    if (fd > STDERR_FILENO)
        ::close(fd);
}

void reportChildFailure_(int fd, ChildStage stage)
{
    ChildFailure failure;
    failure.stage = stage;
    failure.error_number = errno;
    ssize_t n;
    do
    {
        n = ::write(fd, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::_exit(127);
}

Result<int> waitChild_(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return Result<int>(ERROR, errnoMessage_("waitpid() failed", errno));
    }
    return status;
}

// 途中で打ち切る場合。ゾンビを残さないよう回収まで行う。
void killChild_(pid_t pid)
{
    ::kill(pid, SIGKILL);
    Result<int> reaped = waitChild_(pid);
    if (reaped.isError())
        utils::Log::warning(reaped.getErrorMessage());
}

// poll() で読み込み可能になった fd から1回だけ読む。EOF なら閉じる。
Result<void> readChunk_(utils::FdBase& fd, utils::ByteVector& sink)
{
    char buf[utils::kPageSizeMin];
    const ssize_t n = ::read(fd.getFd(), buf, sizeof(buf));
    if (n > 0)
    {
        sink.insert(sink.end(), buf, buf + n);
        return Result<void>();
    }
    if (n == 0)
    {
        fd.closeFd();
        return Result<void>();
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        return Result<void>();
    return Result<void>(ERROR, errnoMessage_("read() failed", errno));
}

// 書き込めた分だけ offset を進める。全部書いたら stdin を閉じる。
Result<void> writeChunk_(
    utils::FdBase& fd, const utils::ByteVector& input, size_t& offset)
{
    const ssize_t n =
        ::write(fd.getFd(), &input[offset], input.size() - offset);
    if (n > 0)
    {
        offset += static_cast<size_t>(n);
        if (offset == input.size())
            fd.closeFd();
        return Result<void>();
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK))
        return Result<void>();
    if (n < 0 && errno == EPIPE)
    {
        // 子プロセスが入力を読み切らずに stdin を閉じた
        utils::Log::debug("child closed stdin before reading all input");
        fd.closeFd();
        return Result<void>();
    }
    return Result<void>(ERROR, errnoMessage_("write() failed", errno));
}

void fillStatus_(int wait_status, ProcessOutput& out)
{
    if (WIFEXITED(wait_status))
    {
        out.exited = true;
        out.exit_status = WEXITSTATUS(wait_status);
        out.term_signal = 0;
    }
    else if (WIFSIGNALED(wait_status))
    {
        out.exited = false;
        out.exit_status = 0;
        out.term_signal = WTERMSIG(wait_status);
    }
}

}  // namespace

Result<std::string> CgiProcess::resolveProgram(
    const std::string& program, const std::string& path_list)
{
    if (program.empty())
        return Result<std::string>(ERROR, std::string(), "empty program name");
    if (program.find('/') != std::string::npos)
        return program;

    std::string::size_type start = 0;
    while (true)
    {
        const std::string::size_type colon = path_list.find(':', start);
        std::string dir = path_list.substr(start,
            colon == std::string::npos ? std::string::npos : colon - start);
        if (dir.empty())
            dir = ".";
        if (dir[dir.size() - 1] != '/')
            dir += "/";

        const std::string candidate = dir + program;
        if (isExecutableFile_(candidate))
            return candidate;

        if (colon == std::string::npos)
            break;
        start = colon + 1;
    }
    return Result<std::string>(
        ERROR, std::string(), "command not found: " + program);
}

Result<ProcessOutput> CgiProcess::run(const std::vector<std::string>& argv,
    const http::CgiMetaVariables& env, const utils::ByteVector& input,
    const Options& options)
{
    if (argv.empty())
        return Result<ProcessOutput>(ERROR, "empty argument list");

    Result<std::string> path_value = env.get("PATH");
    Result<std::string> resolved = resolveProgram(argv[0],
        path_value.isOk() ? path_value.unwrap() : std::string(kDefaultPath));
    if (resolved.isError())
        return Result<ProcessOutput>(ERROR, resolved.getErrorMessage());
    const std::string program_path = resolved.unwrap();

    // fork 後の子プロセスでメモリ確保しないよう、先に組み立てておく
    const std::vector<std::string> env_entries = env.toEnvEntries();
    std::vector<char*> argv_ptrs = toCStrings_(argv);
    std::vector<char*> envp_ptrs = toCStrings_(env_entries);

    utils::FdBase stdin_read, stdin_write;
    utils::FdBase stdout_read, stdout_write;
    utils::FdBase stderr_read, stderr_write;
    utils::FdBase error_read, error_write;  // exec 失敗の通知用

    Result<void> prepared = openPipe_(stdin_read, stdin_write);
    if (prepared.isOk())
        prepared = openPipe_(stdout_read, stdout_write);
    if (prepared.isOk())
        prepared = openPipe_(stderr_read, stderr_write);
    if (prepared.isOk())
        prepared = openPipe_(error_read, error_write);
    // exec に成功すると error_write が閉じ、親は EOF を受け取る
    if (prepared.isOk())
        prepared = setCloseOnExec_(error_read.getFd());
    if (prepared.isOk())
        prepared = setCloseOnExec_(error_write.getFd());
    if (prepared.isError())
        return Result<ProcessOutput>(ERROR, prepared.getErrorMessage());

    // 子プロセスが先に stdin を閉じた場合も write() が EPIPE で返るようにする
    utils::SigpipeGuard sigpipe_guard;

    const pid_t pid = ::fork();
    if (pid < 0)
        return Result<ProcessOutput>(
            ERROR, errnoMessage_("fork() failed", errno));

    if (pid == 0)
    {
        // 子プロセス
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(stdin_read.getFd(), STDIN_FILENO) < 0 ||
            ::dup2(stdout_write.getFd(), STDOUT_FILENO) < 0 ||
            ::dup2(stderr_write.getFd(), STDERR_FILENO) < 0)
        {
            reportChildFailure_(error_write.getFd(), kStageDup);
        }
        closeInChild_(stdin_read.getFd());
        closeInChild_(stdin_write.getFd());
        closeInChild_(stdout_read.getFd());
        closeInChild_(stdout_write.getFd());
        closeInChild_(stderr_read.getFd());
        closeInChild_(stderr_write.getFd());
        closeInChild_(error_read.getFd());

        if (!options.working_directory.empty() &&
            ::chdir(options.working_directory.c_str()) < 0)
        {
            reportChildFailure_(error_write.getFd(), kStageChdir);
        }

        ::execve(program_path.c_str(), &argv_ptrs[0], &envp_ptrs[0]);
        reportChildFailure_(error_write.getFd(), kStageExec);
    }

    // 親プロセス
    stdin_read.closeFd();
    stdout_write.closeFd();
    stderr_write.closeFd();
    error_write.closeFd();
    utils::Log::debug("spawned " + program_path);

    ChildFailure failure;
    ssize_t failure_size;
    do
    {
        failure_size = ::read(error_read.getFd(), &failure, sizeof(failure));
    } while (failure_size < 0 && errno == EINTR);
    error_read.closeFd();
    if (failure_size == static_cast<ssize_t>(sizeof(failure)))
    {
        Result<int> reaped = waitChild_(pid);
        if (reaped.isError())
            utils::Log::warning(reaped.getErrorMessage());
        return Result<ProcessOutput>(ERROR,
            errnoMessage_(std::string("cannot ") + stageName_(failure.stage) +
                              " " + program_path,
                failure.error_number));
    }

    size_t written = 0;
    if (input.empty())
    {
        stdin_write.closeFd();
    }
    else
    {
        Result<void> nb = setNonBlocking_(stdin_write.getFd());
        if (nb.isError())
        {
            killChild_(pid);
            return Result<ProcessOutput>(ERROR, nb.getErrorMessage());
        }
    }

    ProcessOutput output;
    utils::ByteVector stderr_bytes;
    while (stdout_read.isValid() || stderr_read.isValid())
    {
        struct pollfd fds[3];
        nfds_t count = 0;
        int stdin_index = -1;
        int stdout_index = -1;
        int stderr_index = -1;
        if (stdin_write.isValid())
        {
            fds[count].fd = stdin_write.getFd();
            fds[count].events = POLLOUT;
            fds[count].revents = 0;
            stdin_index = static_cast<int>(count++);
        }
        if (stdout_read.isValid())
        {
            fds[count].fd = stdout_read.getFd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            stdout_index = static_cast<int>(count++);
        }
        if (stderr_read.isValid())
        {
            fds[count].fd = stderr_read.getFd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            stderr_index = static_cast<int>(count++);
        }

        if (::poll(fds, count, -1) < 0)
        {
            if (errno == EINTR)
                continue;
            const int poll_errno = errno;
            killChild_(pid);
            return Result<ProcessOutput>(
                ERROR, errnoMessage_("poll() failed", poll_errno));
        }

        Result<void> io;
        if (stdin_index >= 0 && fds[stdin_index].revents != 0)
            io = writeChunk_(stdin_write, input, written);
        if (io.isOk() && stdout_index >= 0 && fds[stdout_index].revents != 0)
            io = readChunk_(stdout_read, output.stdout_bytes);
        if (io.isOk() && stderr_index >= 0 && fds[stderr_index].revents != 0)
            io = readChunk_(stderr_read, stderr_bytes);
        if (io.isError())
        {
            killChild_(pid);
            return Result<ProcessOutput>(ERROR, io.getErrorMessage());
        }

        const size_t total = output.stdout_bytes.size() + stderr_bytes.size();
        if (options.max_output_bytes > 0 && total > options.max_output_bytes)
        {
            killChild_(pid);
            std::ostringstream oss;
            oss << "output exceeds " << options.max_output_bytes << " bytes";
            return Result<ProcessOutput>(ERROR, oss.str());
        }
    }
    stdin_write.closeFd();

    Result<int> wait_status = waitChild_(pid);
    if (wait_status.isError())
        return Result<ProcessOutput>(ERROR, wait_status.getErrorMessage());
    fillStatus_(wait_status.unwrap(), output);
    output.stderr_text = utils::toString(stderr_bytes);

    std::ostringstream oss;
    oss << program_path << ": " << output.describeStatus() << ", "
        << output.stdout_bytes.size() << " bytes stdout, "
        << stderr_bytes.size() << " bytes stderr";
    utils::Log::debug(oss.str());
    return output;
}

}  // namespace cgiprobe
