#include "odata_request_message.hpp"

#include <algorithm>

namespace odata_writer {

HttpMethod HttpMethod::FromString(const std::string &method)
{
    std::string upperMethod = method;
    std::transform(upperMethod.begin(), upperMethod.end(), upperMethod.begin(), ::toupper);

    if (upperMethod == "GET")
    {
        return HttpMethod(GET);
    }
    else if (upperMethod == "POST")
    {
        return HttpMethod(POST);
    }
    else if (upperMethod == "PUT")
    {
        return HttpMethod(PUT);
    }
    else if (upperMethod == "DELETE")
    {
        return HttpMethod(_DELETE);
    }
    else if (upperMethod == "PATCH")
    {
        return HttpMethod(PATCH);
    }
    else if (upperMethod == "MERGE")
    {
        return HttpMethod(MERGE);
    }
    else
    {
        throw duckdb::InvalidInputException(duckdb::StringUtil::Format("Invalid HTTP method: '%s'", method));
    }
}

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    case PUT:
        return "PUT";
    case _DELETE:
        return "DELETE";
    case PATCH:
        return "PATCH";
    case MERGE:
        return "MERGE";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

ODataRequestMessage::ODataRequestMessage(HttpMethod method, std::string url)
    : method(method), url(std::move(url))
{ }

void ODataRequestMessage::SetHeader(const std::string &name, const std::string &value)
{
    headers[name] = value;
}

std::string ODataRequestMessage::GetHeader(const std::string &name) const
{
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

bool ODataRequestMessage::HasHeader(const std::string &name) const
{
    return headers.find(name) != headers.end();
}

void ODataRequestMessage::SetBody(std::string body, const std::string &content_type)
{
    this->body = std::move(body);
    if (!content_type.empty()) {
        SetHeader("Content-Type", content_type);
    }
}

} // namespace odata_writer
