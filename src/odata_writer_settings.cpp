#include "odata_writer_settings.hpp"

namespace odata_writer {

PayloadFormat PayloadFormatFromString(const std::string &format)
{
    auto lower = duckdb::StringUtil::Lower(format);
    if (lower == "json") {
        return PayloadFormat::JSON;
    }
    if (lower == "atom" || lower == "xml") {
        return PayloadFormat::ATOM;
    }
    throw duckdb::InvalidInputException("Invalid payload format: '" + format + "'. Valid formats are json and atom");
}

std::string PayloadFormatToString(PayloadFormat format)
{
    return format == PayloadFormat::ATOM ? "atom" : "json";
}

static ODataVersion ODataVersionFromString(const std::string &version)
{
    auto lower = duckdb::StringUtil::Lower(version);
    if (lower == "auto") {
        return ODataVersion::UNKNOWN;
    }
    if (lower == "v2" || lower == "2" || lower == "2.0") {
        return ODataVersion::V2;
    }
    if (lower == "v4" || lower == "4" || lower == "4.0") {
        return ODataVersion::V4;
    }
    throw duckdb::InvalidInputException("Invalid OData version: '" + version + "'. Valid versions are auto, v2 and v4");
}

static std::string StringParameter(const std::string &name, const duckdb::Value &value)
{
    if (value.IsNull()) {
        throw duckdb::InvalidInputException("Parameter '" + name + "' must not be NULL");
    }
    return value.ToString();
}

static bool BoolParameter(const std::string &name, const duckdb::Value &value)
{
    if (value.IsNull()) {
        throw duckdb::InvalidInputException("Parameter '" + name + "' must not be NULL");
    }
    duckdb::Value result;
    std::string error;
    if (!value.DefaultTryCastAs(duckdb::LogicalType::BOOLEAN, result, &error, true)) {
        throw duckdb::InvalidInputException("Parameter '" + name + "' must be a boolean, got " + value.ToString());
    }
    return result.GetValue<bool>();
}

ODataWriterSettings ODataWriterSettings::FromNamedParameters(const duckdb::named_parameter_map_t &parameters)
{
    ODataWriterSettings settings;

    for (const auto &parameter : parameters) {
        auto name = duckdb::StringUtil::Lower(parameter.first);
        const auto &value = parameter.second;

        if (name == "service_root") {
            settings.service_root = StringParameter(name, value);
        } else if (name == "payload_format") {
            settings.payload_format = PayloadFormatFromString(StringParameter(name, value));
        } else if (name == "odata_version") {
            settings.odata_version = ODataVersionFromString(StringParameter(name, value));
        } else if (name == "indent") {
            settings.indent = BoolParameter(name, value);
        } else if (name == "ieee754_compatible") {
            settings.ieee754_compatible = BoolParameter(name, value);
        } else if (name == "trace_enabled") {
            settings.trace_enabled = BoolParameter(name, value);
        } else if (name == "trace_level") {
            settings.trace_level = TraceLevelFromString(StringParameter(name, value));
        } else if (name == "trace_output") {
            auto output = duckdb::StringUtil::Lower(StringParameter(name, value));
            if (output != "console" && output != "file" && output != "both") {
                throw duckdb::InvalidInputException("Invalid trace output: '" + output + "'. Valid outputs are console, file and both");
            }
            settings.trace_output = output;
        } else if (name == "trace_directory") {
            settings.trace_directory = StringParameter(name, value);
        } else {
            throw duckdb::InvalidInputException("Unknown writer parameter: '" + parameter.first + "'");
        }
    }

    return settings;
}

void ODataWriterSettings::ApplyTracing() const
{
    auto &tracer = ODataWriterTracer::Instance();
    tracer.SetTraceDirectory(trace_directory);
    tracer.SetOutputMode(trace_output);
    tracer.SetLevel(trace_level);
    tracer.SetEnabled(trace_enabled);
}

} // namespace odata_writer
