#ifndef HTTP_FORM_FIELDS_HPP_
#define HTTP_FORM_FIELDS_HPP_

#include <string>
#include <utility>
#include <vector>

namespace http
{

// application/x-www-form-urlencoded のキーと値の並び
// 同じキーを複数回 add した場合は、その順序のまま key=value を繰り返す。
class FormFields
{
   public:
    typedef std::pair<std::string, std::string> Field;
    typedef std::vector<Field> FieldVector;
    typedef FieldVector::const_iterator const_iterator;

    FormFields();

    FormFields& add(const std::string& key, const std::string& value);
    FormFields& add(const std::string& key, const char* value);
    FormFields& add(const std::string& key, long value);

    // "a=1&b=x+y" 形式にエンコードする
    std::string encode() const;

    // encode() の逆変換。'+' は空白、不正な %XX はそのまま残す。
    static FormFields parse(const std::string& encoded);

    // key に対応する値を出現順にすべて返す
    std::vector<std::string> getAll(const std::string& key) const;

    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    bool operator==(const FormFields& rhs) const
    {
        return fields_ == rhs.fields_;
    }
    bool operator!=(const FormFields& rhs) const { return !(*this == rhs); }

    static std::string percentEncode(const std::string& s);
    static std::string percentDecode(const std::string& s);

   private:
    FieldVector fields_;

    static bool isUnreservedChar_(unsigned char c);
    static int hexValue_(char c);
};

}  // namespace http

#endif
