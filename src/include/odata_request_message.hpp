#pragma once

#include "duckdb.hpp"

#include <cstdint>
#include <string>

namespace odata_writer
{

using HeaderMap = duckdb::case_insensitive_map_t<std::string>;

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST,
        PUT,
        _DELETE,
        PATCH,
        // OData V2 partial update
        MERGE
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    constexpr bool IsUndefined() const { return variant == UNDEFINED; }
    // PATCH and MERGE only send the supplied fields
    constexpr bool IsPartialUpdate() const { return variant == PATCH || variant == MERGE; }
    // Methods that replace, update or delete an existing entity
    constexpr bool ModifiesExisting() const { return variant == PUT || variant == PATCH || variant == MERGE || variant == _DELETE; }

    static HttpMethod FromString(const std::string &method);
    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

// One outgoing request: standalone or an operation inside a batch change set
class ODataRequestMessage
{
public:
    ODataRequestMessage(HttpMethod method, std::string url);

    void SetHeader(const std::string &name, const std::string &value);
    // Empty string when absent
    std::string GetHeader(const std::string &name) const;
    bool HasHeader(const std::string &name) const;

    void SetBody(std::string body, const std::string &content_type);

public:
    HttpMethod method;
    std::string url;
    HeaderMap headers;
    std::string body;
};

} // namespace odata_writer
