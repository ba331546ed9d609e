#ifndef UNIT_TEST_SCRIPT_FILE_HPP_
#define UNIT_TEST_SCRIPT_FILE_HPP_

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// テスト用の一時シェルスクリプト（実行権限付き）。破棄時に削除する。
class ScriptFile
{
   public:
    explicit ScriptFile(const std::string& body) : path_()
    {
        char tmpl[] = "/tmp/cgiprobe_test_XXXXXX";
        const int fd = ::mkstemp(tmpl);
        if (fd < 0)
            return;
        const std::string content = "#!/bin/sh\n" + body;
        const char* p = content.c_str();
        size_t left = content.size();
        while (left > 0)
        {
            const ssize_t n = ::write(fd, p, left);
            if (n <= 0)
                break;
            p += n;
            left -= static_cast<size_t>(n);
        }
        // 書き込み用に開いたままだと exec が ETXTBSY になる
        ::close(fd);
        if (left == 0 && ::chmod(tmpl, 0755) == 0)
            path_ = tmpl;
        else
            ::unlink(tmpl);
    }
    ~ScriptFile()
    {
        if (!path_.empty())
            ::unlink(path_.c_str());
    }

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

   private:
    std::string path_;

    ScriptFile();
    ScriptFile(const ScriptFile&);
    ScriptFile& operator=(const ScriptFile&);
};

#endif
