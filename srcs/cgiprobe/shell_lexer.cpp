#include "cgiprobe/shell_lexer.hpp"

namespace cgiprobe
{

bool ShellLexer::isBlank_(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

Result<std::vector<std::string> > ShellLexer::split(const std::string& line)
{
    enum State
    {
        kBetween,
        kWord,
        kSingleQuoted,
        kDoubleQuoted
    };

    std::vector<std::string> words;
    std::string current;
    State state = kBetween;

    for (size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        switch (state)
        {
            case kBetween:
            case kWord:
                if (isBlank_(c))
                {
                    if (state == kWord)
                    {
                        words.push_back(current);
                        current.clear();
                    }
                    state = kBetween;
                }
                else if (c == '\'')
                {
                    state = kSingleQuoted;
                }
                else if (c == '"')
                {
                    state = kDoubleQuoted;
                }
                else if (c == '\\')
                {
                    if (i + 1 >= line.size())
                        return Result<std::vector<std::string> >(
                            ERROR, "no escaped character: " + line);
                    current.push_back(line[++i]);
                    state = kWord;
                }
                else
                {
                    current.push_back(c);
                    state = kWord;
                }
                break;

            case kSingleQuoted:
                if (c == '\'')
                    state = kWord;
                else
                    current.push_back(c);
                break;

            case kDoubleQuoted:
                if (c == '"')
                {
                    state = kWord;
                }
                else if (c == '\\' && i + 1 < line.size() &&
                         (line[i + 1] == '"' || line[i + 1] == '\\'))
                {
                    current.push_back(line[++i]);
                }
                else
                {
                    current.push_back(c);
                }
                break;
        }
    }

    if (state == kSingleQuoted || state == kDoubleQuoted)
        return Result<std::vector<std::string> >(
            ERROR, "no closing quotation: " + line);
    if (state == kWord)
        words.push_back(current);
    return words;
}

}  // namespace cgiprobe
