#pragma once

#include "duckdb.hpp"
#include "odata_edm.hpp"
#include "tracing.hpp"

#include <string>

namespace odata_writer
{

enum class PayloadFormat {
    JSON,
    ATOM
};

PayloadFormat PayloadFormatFromString(const std::string &format);
std::string PayloadFormatToString(PayloadFormat format);

// Options of one writer. Parsed from named parameters such as
//   service_root := 'https://host/svc/', payload_format := 'json', odata_version := 'v4',
//   trace_enabled := true, trace_level := 'DEBUG'
struct ODataWriterSettings
{
    std::string service_root;
    PayloadFormat payload_format = PayloadFormat::JSON;
    // UNKNOWN follows the version of the service metadata
    ODataVersion odata_version = ODataVersion::UNKNOWN;
    bool indent = false;
    // Int64 and Decimal as JSON strings (V4 IEEE754Compatible=true)
    bool ieee754_compatible = false;

    bool trace_enabled = false;
    TraceLevel trace_level = TraceLevel::INFO;
    std::string trace_output = "console";
    std::string trace_directory = ".";

    // Throws duckdb::InvalidInputException for unknown keys and bad values
    static ODataWriterSettings FromNamedParameters(const duckdb::named_parameter_map_t &parameters);

    void ApplyTracing() const;
};

} // namespace odata_writer
