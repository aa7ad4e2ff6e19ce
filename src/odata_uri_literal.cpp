#include "odata_uri_literal.hpp"

#include <sstream>

namespace odata_writer {

static std::string Prefixed(const std::string &prefix, const std::string &text)
{
    return prefix + "'" + text + "'";
}

static std::string HexEncode(const std::string &bytes)
{
    static const char *digits = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        hex += digits[c >> 4];
        hex += digits[c & 0x0F];
    }
    return hex;
}

std::string ODataUriLiteral::QuoteString(const std::string &text)
{
    return "'" + duckdb::StringUtil::Replace(text, "'", "''") + "'";
}

std::string ODataUriLiteral::FormatDuration(const duckdb::interval_t &interval)
{
    int64_t months = interval.months;
    int64_t days = interval.days;
    int64_t micros = interval.micros;

    std::stringstream ss;
    if (months <= 0 && days <= 0 && micros <= 0 && (months < 0 || days < 0 || micros < 0)) {
        ss << "-";
        months = -months;
        days = -days;
        micros = -micros;
    }
    ss << "P";

    if (months / 12 != 0) {
        ss << months / 12 << "Y";
    }
    if (months % 12 != 0) {
        ss << months % 12 << "M";
    }
    if (days != 0) {
        ss << days << "D";
    }

    if (micros != 0) {
        ss << "T";
        auto hours = micros / duckdb::Interval::MICROS_PER_HOUR;
        micros %= duckdb::Interval::MICROS_PER_HOUR;
        auto minutes = micros / duckdb::Interval::MICROS_PER_MINUTE;
        micros %= duckdb::Interval::MICROS_PER_MINUTE;
        auto seconds = micros / duckdb::Interval::MICROS_PER_SEC;
        auto fraction = micros % duckdb::Interval::MICROS_PER_SEC;

        if (hours != 0) {
            ss << hours << "H";
        }
        if (minutes != 0) {
            ss << minutes << "M";
        }
        if (seconds != 0 || fraction != 0) {
            ss << seconds;
            if (fraction != 0) {
                auto digits = std::to_string(fraction);
                digits = std::string(6 - digits.size(), '0') + digits;
                while (!digits.empty() && digits.back() == '0') {
                    digits.pop_back();
                }
                ss << "." << digits;
            }
            ss << "S";
        }
    } else if (months == 0 && days == 0) {
        ss << "T0S";
    }

    return ss.str();
}

std::string ODataUriLiteral::FormatDateTime(const duckdb::timestamp_t &timestamp)
{
    duckdb::date_t date;
    duckdb::dtime_t time;
    duckdb::Timestamp::Convert(timestamp, date, time);
    return duckdb::Date::ToString(date) + "T" + duckdb::Time::ToString(time);
}

std::string ODataUriLiteral::FormatTime(const duckdb::dtime_t &time)
{
    return duckdb::Time::ToString(time);
}

std::string ODataUriLiteral::Format(const duckdb::Value &value, const PrimitiveType &wire_type, ODataVersion version)
{
    if (value.IsNull()) {
        return "null";
    }

    const bool v2 = version == ODataVersion::V2;

    switch (value.type().id()) {
        case duckdb::LogicalTypeId::VARCHAR:
            return QuoteString(duckdb::StringValue::Get(value));
        case duckdb::LogicalTypeId::BOOLEAN:
            return duckdb::BooleanValue::Get(value) ? "true" : "false";
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
            return value.ToString();
        case duckdb::LogicalTypeId::UINTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UBIGINT:
            return (v2 && wire_type == Int64) ? value.ToString() + "L" : value.ToString();
        case duckdb::LogicalTypeId::DECIMAL:
            return v2 ? value.ToString() + "M" : value.ToString();
        case duckdb::LogicalTypeId::DOUBLE:
            return v2 ? value.ToString() + "d" : value.ToString();
        case duckdb::LogicalTypeId::FLOAT:
            return v2 ? value.ToString() + "f" : value.ToString();
        case duckdb::LogicalTypeId::UUID:
            return v2 ? Prefixed("guid", value.ToString()) : value.ToString();
        case duckdb::LogicalTypeId::DATE: {
            auto date = value.GetValue<duckdb::date_t>();
            if (v2) {
                return Prefixed("datetime", duckdb::Date::ToString(date) + "T00:00:00");
            }
            return duckdb::Date::ToString(date);
        }
        case duckdb::LogicalTypeId::TIME: {
            auto time = value.GetValue<duckdb::dtime_t>();
            if (v2) {
                duckdb::interval_t interval;
                interval.months = 0;
                interval.days = 0;
                interval.micros = time.micros;
                return Prefixed("time", FormatDuration(interval));
            }
            return FormatTime(time);
        }
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ: {
            auto utc = value.DefaultCastAs(duckdb::LogicalType::TIMESTAMP).GetValue<duckdb::timestamp_t>();
            auto text = FormatDateTime(utc);
            if (wire_type == DateTimeOffset) {
                return v2 ? Prefixed("datetimeoffset", text + "Z") : text + "Z";
            }
            return v2 ? Prefixed("datetime", text) : text;
        }
        case duckdb::LogicalTypeId::INTERVAL: {
            auto text = FormatDuration(value.GetValue<duckdb::interval_t>());
            return v2 ? Prefixed("time", text) : Prefixed("duration", text);
        }
        case duckdb::LogicalTypeId::BLOB: {
            auto &bytes = duckdb::StringValue::Get(value);
            if (v2) {
                return Prefixed("X", HexEncode(bytes));
            }
            return Prefixed("binary", duckdb::Blob::ToBase64(duckdb::string_t(bytes)));
        }
        default:
            return QuoteString(value.ToString());
    }
}

std::string ODataUriLiteral::FormatKey(const std::vector<std::pair<std::string, std::string>> &key_literals)
{
    if (key_literals.size() == 1) {
        return "(" + key_literals[0].second + ")";
    }

    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < key_literals.size(); i++) {
        if (i > 0) {
            ss << ",";
        }
        ss << key_literals[i].first << "=" << key_literals[i].second;
    }
    ss << ")";
    return ss.str();
}

} // namespace odata_writer
