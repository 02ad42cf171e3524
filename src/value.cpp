#include "gpkgsheet/value.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "ogr_feature.h"

namespace gpkgsheet {

const char* semantic_type_name(SemanticType t) {
    switch (t) {
        case SemanticType::Integer: return "integer";
        case SemanticType::Real: return "real";
        case SemanticType::Text: return "text";
        case SemanticType::Boolean: return "boolean";
        case SemanticType::DateTime: return "datetime";
        case SemanticType::Binary: return "binary";
        case SemanticType::Geometry: return "geometry";
    }
    return "text";
}

SemanticType value_type(const FieldValue& v) {
    return std::visit([](const auto& x) -> SemanticType {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::int64_t>) return SemanticType::Integer;
        else if constexpr (std::is_same_v<T, double>) return SemanticType::Real;
        else if constexpr (std::is_same_v<T, std::string>) return SemanticType::Text;
        else if constexpr (std::is_same_v<T, bool>) return SemanticType::Boolean;
        else if constexpr (std::is_same_v<T, DateTimeValue>) return SemanticType::DateTime;
        else return SemanticType::Binary;
    }, v);
}

namespace {

std::string format_datetime(const DateTimeValue& d) {
    std::ostringstream oss;
    oss << std::setfill('0');
    if (d.has_date) {
        oss << std::setw(4) << d.year << '-' << std::setw(2) << d.month << '-' << std::setw(2) << d.day;
    }
    if (d.has_time) {
        if (d.has_date) oss << 'T';
        const int whole = static_cast<int>(d.second);
        oss << std::setw(2) << d.hour << ':' << std::setw(2) << d.minute << ':' << std::setw(2) << whole;
        const int millis = static_cast<int>((d.second - static_cast<float>(whole)) * 1000.0f + 0.5f);
        if (millis > 0 && millis < 1000) oss << '.' << std::setw(3) << millis;

        // TZFlag: 100 = UTC、それ以外の >1 は 15分刻みのオフセット
        if (d.tz_flag == 100) {
            oss << 'Z';
        } else if (d.tz_flag > 1) {
            const int offset_min = (d.tz_flag - 100) * 15;
            const int abs_min = offset_min < 0 ? -offset_min : offset_min;
            oss << (offset_min < 0 ? '-' : '+') << std::setw(2) << abs_min / 60 << ':'
                << std::setw(2) << abs_min % 60;
        }
    }
    return oss.str();
}

}  // namespace

std::string to_display_string(const FieldValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << x;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, DateTimeValue>) {
            return format_datetime(x);
        } else {
            return "<binary " + std::to_string(x.bytes.size()) + " bytes>";
        }
    }, v);
}

FieldValue read_field_value(const OGRFeature& feature, int index, SemanticType type) {
    switch (type) {
        case SemanticType::Integer:
            return static_cast<std::int64_t>(feature.GetFieldAsInteger64(index));
        case SemanticType::Boolean:
            return feature.GetFieldAsInteger64(index) != 0;
        case SemanticType::Real:
            return feature.GetFieldAsDouble(index);
        case SemanticType::DateTime: {
            DateTimeValue d;
            int year = 0, month = 0, day = 0, hour = 0, minute = 0, tz = 0;
            float second = 0.0f;
            if (!feature.GetFieldAsDateTime(index, &year, &month, &day, &hour, &minute, &second, &tz)) {
                return std::string(feature.GetFieldAsString(index));
            }
            d.year = year;
            d.month = month;
            d.day = day;
            d.hour = hour;
            d.minute = minute;
            d.second = second;
            d.tz_flag = tz;

            const OGRFieldDefn* defn = feature.GetFieldDefnRef(index);
            if (defn && defn->GetType() == OFTDate) d.has_time = false;
            if (defn && defn->GetType() == OFTTime) d.has_date = false;
            return d;
        }
        case SemanticType::Binary: {
            int n = 0;
            const GByte* p = feature.GetFieldAsBinary(index, &n);
            BinaryValue b;
            if (p && n > 0) b.bytes.assign(p, p + n);
            return b;
        }
        case SemanticType::Text:
        case SemanticType::Geometry:
            break;
    }
    return std::string(feature.GetFieldAsString(index));
}

}  // namespace gpkgsheet
