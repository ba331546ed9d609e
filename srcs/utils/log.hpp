#ifndef UTILS_LOG_HPP_
#define UTILS_LOG_HPP_

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "utils/timestamp.hpp"

namespace utils
{

class Log
{
   public:
    enum FileType
    {
        INFO,
        ERROR,
        WARNING,
        F_DEBUG
    };

    // ログファイルの出力先ディレクトリを設定する。
    // 空文字列（デフォルト）の場合、ファイルへのログ出力は行わない。
    static void setDirectory(const std::string& dir) { directory_() = dir; }
    static const std::string& getDirectory() { return directory_(); }
    static bool isFileLoggingEnabled() { return !directory_().empty(); }

    // errorログをファイルに出力
    template <typename T1, typename T2>
    static void error(const T1& p1, const T2& p2)
    {
        if (!isFileLoggingEnabled())
            return;
        std::ofstream ofs(getFilePath(ERROR).c_str(), std::ios::app);
        if (ofs)
            log_core(ofs, "[ERROR] ", Timestamp::now(), p1, p2);
        else
            failedToOpenLogFile(ERROR);
    }

    // infoログ出力
    template <typename T1>
    static void info(const T1& p1)
    {
        if (!isFileLoggingEnabled())
            return;
        std::ofstream ofs(getFilePath(INFO).c_str(), std::ios::app);
        if (ofs)
            log_core(ofs, "[INFO] ", Timestamp::now(), p1);
        else
            failedToOpenLogFile(INFO);
    }
    // warningログ出力
    template <typename T1>
    static void warning(const T1& p1)
    {
        if (!isFileLoggingEnabled())
            return;
        std::ofstream ofs(getFilePath(WARNING).c_str(), std::ios::app);
        if (ofs)
            log_core(ofs, "[WARNING] ", Timestamp::now(), p1);
        else
            failedToOpenLogFile(WARNING);
    }
    // debugログ出力
    template <typename T1>
    static void debug(const T1& p1)
    {
#ifdef DEBUG
        if (!isFileLoggingEnabled())
            return;
        std::ofstream ofs(getFilePath(F_DEBUG).c_str(), std::ios::app);
        if (ofs)
            log_core(ofs, "[DEBUG] ", Timestamp::now(), p1);
        else
            failedToOpenLogFile(F_DEBUG);
#else
        (void)p1;
#endif
    }
    static void clearFiles();

    static std::string getFilePath(FileType type);

   private:
    Log();
    Log(const Log& other);
    Log& operator=(const Log& other);
    ~Log();

    static std::string& directory_();

    // 引数2つの実装
    template <typename T1, typename T2>
    static void log_core(
        std::ostream& os, const char* label, const T1& p1, const T2& p2)
    {
        os << label << p1 << " " << p2 << std::endl;
    }

    // 引数3つの実装
    template <typename T1, typename T2, typename T3>
    static void log_core(std::ostream& os, const char* label, const T1& p1,
        const T2& p2, const T3& p3)
    {
        os << label << p1 << " " << p2 << " " << p3 << std::endl;
    }

    static void failedToOpenLogFile(FileType type)
    {
        std::cerr << "[ERROR] Failed to open log file." << " at "
                  << getFilePath(type) << std::endl;
    }
};

}  // namespace utils

#endif
