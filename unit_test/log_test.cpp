#include "utils/log.hpp"

#include <gtest/gtest.h>
#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>

namespace
{
using utils::Log;

std::string readFile_(const std::string& path)
{
    std::ifstream ifs(path.c_str());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

bool exists_(const std::string& path) { return ::access(path.c_str(), F_OK) == 0; }

// テスト中だけログ出力先を一時ディレクトリに向ける
class ScopedLogDirectory
{
   public:
    ScopedLogDirectory() : dir_()
    {
        char tmpl[] = "/tmp/cgiprobe_log_XXXXXX";
        if (::mkdtemp(tmpl) != NULL)
            dir_ = tmpl;
        Log::setDirectory(dir_);
    }
    ~ScopedLogDirectory()
    {
        if (!dir_.empty())
        {
            ::unlink(Log::getFilePath(Log::INFO).c_str());
            ::unlink(Log::getFilePath(Log::ERROR).c_str());
            ::unlink(Log::getFilePath(Log::WARNING).c_str());
            ::unlink(Log::getFilePath(Log::F_DEBUG).c_str());
            ::rmdir(dir_.c_str());
        }
        Log::setDirectory("");
    }

    const std::string& dir() const { return dir_; }

   private:
    std::string dir_;

    ScopedLogDirectory(const ScopedLogDirectory&);
    ScopedLogDirectory& operator=(const ScopedLogDirectory&);
};

}  // namespace

TEST(Log, FileLoggingIsDisabledByDefault)
{
    EXPECT_FALSE(Log::isFileLoggingEnabled());
    EXPECT_EQ("info.txt", Log::getFilePath(Log::INFO));

    Log::info("not written");
    EXPECT_FALSE(exists_("info.txt"));
}

TEST(Log, WritesLevelFilesUnderDirectory)
{
    ScopedLogDirectory scoped;
    ASSERT_FALSE(scoped.dir().empty());
    ASSERT_TRUE(Log::isFileLoggingEnabled());
    EXPECT_EQ(scoped.dir() + "/error.txt", Log::getFilePath(Log::ERROR));

    Log::clearFiles();
    Log::info("local GET ./x.cgi");
    Log::warning("non-success exit");
    Log::error("./x.cgi", "invocation failure");

    const std::string info = readFile_(Log::getFilePath(Log::INFO));
    EXPECT_EQ(0u, info.find("[INFO] "));
    EXPECT_NE(std::string::npos, info.find("local GET ./x.cgi\n"));
    EXPECT_NE(std::string::npos,
        readFile_(Log::getFilePath(Log::WARNING)).find("[WARNING] "));
    EXPECT_NE(std::string::npos, readFile_(Log::getFilePath(Log::ERROR))
                                     .find("./x.cgi invocation failure\n"));
}

TEST(Log, ClearFilesTruncates)
{
    ScopedLogDirectory scoped;
    ASSERT_FALSE(scoped.dir().empty());

    Log::info("something");
    Log::clearFiles();
    EXPECT_EQ("", readFile_(Log::getFilePath(Log::INFO)));
}
