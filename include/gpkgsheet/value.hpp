#ifndef GPKGSHEET_VALUE_HPP
#define GPKGSHEET_VALUE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

class OGRFeature;

namespace gpkgsheet {

// 属性値の意味型（OGRのネイティブ型から写像する）
enum class SemanticType {
    Integer,
    Real,
    Text,
    Boolean,
    DateTime,
    Binary,
    Geometry
};

const char* semantic_type_name(SemanticType t);

struct DateTimeValue {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    float second = 0.0f;
    int tz_flag = 0;          // OGR TZFlag: 0=unknown, 1=localtime, 100=GMT, 100±15分刻み
    bool has_date = true;
    bool has_time = true;
};

struct BinaryValue {
    std::vector<std::uint8_t> bytes;
};

// integer | real | text | boolean | datetime | binary
using FieldValue = std::variant<std::int64_t, double, std::string, bool, DateTimeValue, BinaryValue>;

SemanticType value_type(const FieldValue& v);

// 表示用の文字列（プレゼン層に渡す形）
std::string to_display_string(const FieldValue& v);

// OGRFeature の i 番目のフィールドを FieldValue に変換する。
// 呼び出し側で IsFieldSetAndNotNull を確認済みであること。
// type が Text の場合（リスト型・未知の型を含む）は OGR の文字列表現をそのまま使う。
FieldValue read_field_value(const OGRFeature& feature, int index, SemanticType type);

}  // namespace gpkgsheet

#endif  // GPKGSHEET_VALUE_HPP
