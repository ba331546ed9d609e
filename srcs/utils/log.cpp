#include "log.hpp"

namespace utils
{

std::string& Log::directory_()
{
    static std::string dir;
    return dir;
}

std::string Log::getFilePath(FileType type)
{
    std::string dir = directory_();
    if (!dir.empty() && dir[dir.size() - 1] != '/')
        dir += "/";

    if (type == ERROR)
        return dir + "error.txt";
    if (type == INFO)
        return dir + "info.txt";
    if (type == WARNING)
        return dir + "warning.txt";
    if (type == F_DEBUG)
        return dir + "debug.txt";
    return dir + "default.txt";
}

void Log::clearFiles()
{
    if (!isFileLoggingEnabled())
        return;
    std::ofstream ofs(getFilePath(INFO).c_str(), std::ios::trunc);
    ofs.close();
    ofs.open(getFilePath(ERROR).c_str(), std::ios::trunc);
    ofs.close();
    ofs.open(getFilePath(WARNING).c_str(), std::ios::trunc);
    ofs.close();
    ofs.open(getFilePath(F_DEBUG).c_str(), std::ios::trunc);
    ofs.close();
}

}  // namespace utils
