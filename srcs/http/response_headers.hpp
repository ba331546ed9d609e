#ifndef HTTP_RESPONSE_HEADERS_HPP_
#define HTTP_RESPONSE_HEADERS_HPP_

#include <map>
#include <string>
#include <vector>

#include "http/header.hpp"
#include "utils/result.hpp"

namespace http
{

using namespace utils::result;

// ヘッダー値（単一値 / 複数値）
// 1回目の追加で kSingle、2回目以降で kMultiple に昇格する。
// 要素数1の kMultiple は存在しない。
class HeaderValue
{
   public:
    enum Kind
    {
        kSingle,
        kMultiple
    };

    explicit HeaderValue(const std::string& first);

    Kind kind() const { return kind_; }
    bool isSingle() const { return kind_ == kSingle; }
    bool isMultiple() const { return kind_ == kMultiple; }

    // 同名ヘッダーの2回目以降の出現を追加する
    void append(const std::string& value);

    Result<std::string> single() const;
    Result<std::vector<std::string> > multiple() const;

    // kind に関係なく受信順の全値を返す
    const std::vector<std::string>& values() const { return values_; }

    bool operator==(const HeaderValue& rhs) const;
    bool operator!=(const HeaderValue& rhs) const { return !(*this == rhs); }

   private:
    HeaderValue();

    Kind kind_;
    std::vector<std::string> values_;
};

// 小文字化したヘッダー名 -> HeaderValue
class ResponseHeaders
{
   public:
    typedef std::map<std::string, HeaderValue> Map;
    typedef Map::const_iterator const_iterator;

    ResponseHeaders();

    // 名前を小文字化して格納する。既存の名前なら複数値へ昇格/追加する。
    void add(const std::string& name, const std::string& value);
    void addAll(const HeaderVector& headers);
    void clear();

    bool has(const std::string& name) const;
    Result<HeaderValue> find(const std::string& name) const;

    // 単一値ならその値、複数値なら最初の値を返す
    Result<std::string> first(const std::string& name) const;

    size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }
    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

    bool operator==(const ResponseHeaders& rhs) const;
    bool operator!=(const ResponseHeaders& rhs) const
    {
        return !(*this == rhs);
    }

   private:
    Map headers_;
};

}  // namespace http

#endif
