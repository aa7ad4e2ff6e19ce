#include "odata_payload_writer.hpp"
#include "odata_entry_encoder.hpp"
#include "odata_uri_literal.hpp"
#include "tracing.hpp"

#include <cmath>
#include <cstdlib>

namespace odata_writer {

static const char *ATOM_NAMESPACE = "http://www.w3.org/2005/Atom";

static duckdb::timestamp_t UtcTimestamp(const duckdb::Value &value)
{
    return value.DefaultCastAs(duckdb::LogicalType::TIMESTAMP).GetValue<duckdb::timestamp_t>();
}

static bool IsWire(const std::optional<PrimitiveType> &wire_type, const PrimitiveType &expected)
{
    return wire_type && *wire_type == expected;
}

static std::string FloatingText(double number)
{
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "INF" : "-INF";
    }
    return duckdb::Value::DOUBLE(number).ToString();
}

std::string PrimitiveText(const duckdb::Value &value, const std::optional<PrimitiveType> &wire_type, ODataVersion version)
{
    if (value.IsNull()) {
        return "";
    }

    switch (value.type().id()) {
        case duckdb::LogicalTypeId::VARCHAR:
            return duckdb::StringValue::Get(value);
        case duckdb::LogicalTypeId::BOOLEAN:
            return duckdb::BooleanValue::Get(value) ? "true" : "false";
        case duckdb::LogicalTypeId::DOUBLE:
        case duckdb::LogicalTypeId::FLOAT:
            return FloatingText(value.GetValue<double>());
        case duckdb::LogicalTypeId::DATE: {
            auto date = duckdb::Date::ToString(value.GetValue<duckdb::date_t>());
            return version == ODataVersion::V2 || IsWire(wire_type, DateTime) ? date + "T00:00:00" : date;
        }
        case duckdb::LogicalTypeId::TIME: {
            auto time = value.GetValue<duckdb::dtime_t>();
            if (IsWire(wire_type, Time)) {
                duckdb::interval_t interval;
                interval.months = 0;
                interval.days = 0;
                interval.micros = time.micros;
                return ODataUriLiteral::FormatDuration(interval);
            }
            return ODataUriLiteral::FormatTime(time);
        }
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ: {
            auto text = ODataUriLiteral::FormatDateTime(UtcTimestamp(value));
            return IsWire(wire_type, DateTimeOffset) ? text + "Z" : text;
        }
        case duckdb::LogicalTypeId::INTERVAL:
            return ODataUriLiteral::FormatDuration(value.GetValue<duckdb::interval_t>());
        case duckdb::LogicalTypeId::BLOB:
            return duckdb::Blob::ToBase64(duckdb::string_t(duckdb::StringValue::Get(value)));
        default:
            return value.ToString();
    }
}

// ----------------------------------------------------------------------

ODataPayloadWriter::ODataPayloadWriter(ODataWriterSettings settings)
    : settings(std::move(settings))
{ }

std::unique_ptr<ODataPayloadWriter> ODataPayloadWriter::Create(const ODataWriterSettings &settings)
{
    if (settings.payload_format == PayloadFormat::ATOM) {
        return std::make_unique<ODataAtomPayloadWriter>(settings);
    }
    return std::make_unique<ODataJsonPayloadWriter>(settings);
}

std::string ODataPayloadWriter::AbsoluteUrl(const std::string &url) const
{
    if (settings.service_root.empty() || url.rfind("$", 0) == 0 || url.find("://") != std::string::npos) {
        return url;
    }
    if (settings.service_root.back() == '/' || url.rfind("/", 0) == 0) {
        return settings.service_root + url;
    }
    return settings.service_root + "/" + url;
}

// ----------------------------------------------------------------------

static void AddMember(yyjson_mut_doc *doc, yyjson_mut_val *obj, const std::string &key, yyjson_mut_val *val)
{
    yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, key.c_str(), key.size()), val);
}

static yyjson_mut_val *JsonString(yyjson_mut_doc *doc, const std::string &text)
{
    return yyjson_mut_strncpy(doc, text.c_str(), text.size());
}

static yyjson_mut_val *JsonCoordinates(yyjson_mut_doc *doc, const duckdb::Value &value)
{
    if (value.type().id() != duckdb::LogicalTypeId::LIST) {
        return yyjson_mut_real(doc, value.GetValue<double>());
    }
    auto arr = yyjson_mut_arr(doc);
    for (const auto &child : duckdb::ListValue::GetChildren(value)) {
        yyjson_mut_arr_append(arr, JsonCoordinates(doc, child));
    }
    return arr;
}

ODataJsonPayloadWriter::ODataJsonPayloadWriter(ODataWriterSettings settings)
    : ODataPayloadWriter(std::move(settings))
{ }

std::string ODataJsonPayloadWriter::WriteDocument(yyjson_mut_doc *doc) const
{
    yyjson_write_flag flags = settings.indent ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    size_t len = 0;
    yyjson_write_err err;
    char *json = yyjson_mut_write_opts(doc, flags, nullptr, &len, &err);
    if (!json) {
        ODATA_WRITER_TRACE_ERROR("ODATA_PAYLOAD", "Failed to write JSON payload: " + std::string(err.msg ? err.msg : "unknown error"));
        throw duckdb::SerializationException("Failed to write JSON payload: " + std::string(err.msg ? err.msg : "unknown error"));
    }
    std::string result(json, len);
    free(json);
    return result;
}

std::string ODataJsonPayloadWriter::WriteEntry(const ODataEntry &entry) const
{
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    if (!entry.type_name.empty()) {
        if (IsV2()) {
            AddMember(doc.get(), root, "__metadata", WriteTypeMetadata(doc.get(), entry.type_name));
        } else {
            AddMember(doc.get(), root, "@odata.type", JsonString(doc.get(), "#" + entry.type_name));
        }
    }

    WriteProperties(doc.get(), root, entry.properties);
    for (const auto &link : entry.links) {
        WriteLink(doc.get(), root, link);
    }

    auto json = WriteDocument(doc.get());
    ODATA_WRITER_TRACE_TRACE_DATA("ODATA_PAYLOAD", "Wrote JSON entry for " + entry.type_name, json);
    return json;
}

std::string ODataJsonPayloadWriter::WriteEntityReferenceLink(const std::string &url) const
{
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    AddMember(doc.get(), root, IsV2() ? "uri" : "@odata.id", JsonString(doc.get(), AbsoluteUrl(url)));
    return WriteDocument(doc.get());
}

std::string ODataJsonPayloadWriter::ContentType() const
{
    if (IsV2()) {
        return "application/json";
    }
    std::string content_type = "application/json;odata.metadata=minimal";
    if (settings.ieee754_compatible) {
        content_type += ";IEEE754Compatible=true";
    }
    return content_type;
}

std::string ODataJsonPayloadWriter::ReferenceLinkContentType() const
{
    return ContentType();
}

yyjson_mut_val *ODataJsonPayloadWriter::WriteTypeMetadata(yyjson_mut_doc *doc, const std::string &type_name) const
{
    auto metadata = yyjson_mut_obj(doc);
    AddMember(doc, metadata, "type", JsonString(doc, type_name));
    return metadata;
}

void ODataJsonPayloadWriter::WriteProperties(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                                             const std::vector<ODataProperty> &properties) const
{
    for (const auto &property : properties) {
        if (!IsV2() && property.value.kind == ODataValue::Kind::COLLECTION) {
            AddMember(doc, obj, property.name + "@odata.type", JsonString(doc, "#" + property.value.type_name));
        }
        AddMember(doc, obj, property.name, WriteValue(doc, property.value));
    }
}

void ODataJsonPayloadWriter::WriteLink(yyjson_mut_doc *doc, yyjson_mut_val *obj, const ODataNavigationLink &link) const
{
    const bool as_array = link.is_collection || link.references.size() > 1;

    if (IsV2()) {
        auto deferred = [&](const LinkReference &reference) {
            auto metadata = yyjson_mut_obj(doc);
            AddMember(doc, metadata, "uri", JsonString(doc, AbsoluteUrl(reference.Url())));
            auto wrapper = yyjson_mut_obj(doc);
            AddMember(doc, wrapper, "__metadata", metadata);
            return wrapper;
        };

        if (as_array) {
            auto arr = yyjson_mut_arr(doc);
            for (const auto &reference : link.references) {
                yyjson_mut_arr_append(arr, deferred(reference));
            }
            AddMember(doc, obj, link.name, arr);
        } else if (!link.references.empty()) {
            AddMember(doc, obj, link.name, deferred(link.references.front()));
        }
        return;
    }

    if (as_array) {
        auto arr = yyjson_mut_arr(doc);
        for (const auto &reference : link.references) {
            yyjson_mut_arr_append(arr, JsonString(doc, reference.Url()));
        }
        AddMember(doc, obj, link.name + "@odata.bind", arr);
    } else if (!link.references.empty()) {
        AddMember(doc, obj, link.name + "@odata.bind", JsonString(doc, link.references.front().Url()));
    }
}

yyjson_mut_val *ODataJsonPayloadWriter::WriteValue(yyjson_mut_doc *doc, const ODataValue &value) const
{
    switch (value.kind) {
        case ODataValue::Kind::PRIMITIVE:
            return WritePrimitive(doc, value);
        case ODataValue::Kind::COMPLEX: {
            auto obj = yyjson_mut_obj(doc);
            if (IsV2()) {
                AddMember(doc, obj, "__metadata", WriteTypeMetadata(doc, value.type_name));
            } else {
                AddMember(doc, obj, "@odata.type", JsonString(doc, "#" + value.type_name));
            }
            WriteProperties(doc, obj, value.properties);
            return obj;
        }
        case ODataValue::Kind::COLLECTION: {
            auto arr = yyjson_mut_arr(doc);
            for (const auto &item : value.items) {
                yyjson_mut_arr_append(arr, WriteValue(doc, item));
            }
            if (!IsV2()) {
                return arr;
            }
            auto obj = yyjson_mut_obj(doc);
            AddMember(doc, obj, "__metadata", WriteTypeMetadata(doc, value.type_name));
            AddMember(doc, obj, "results", arr);
            return obj;
        }
    }
    return yyjson_mut_null(doc);
}

yyjson_mut_val *ODataJsonPayloadWriter::WritePrimitive(yyjson_mut_doc *doc, const ODataValue &odata_value) const
{
    const auto &value = odata_value.value;
    if (value.IsNull()) {
        return yyjson_mut_null(doc);
    }

    const bool numbers_as_strings = IsV2() || settings.ieee754_compatible;
    const auto version = settings.odata_version;

    switch (value.type().id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return yyjson_mut_bool(doc, duckdb::BooleanValue::Get(value));
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
            return yyjson_mut_sint(doc, value.GetValue<int64_t>());
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
            return yyjson_mut_uint(doc, value.GetValue<uint64_t>());
        case duckdb::LogicalTypeId::BIGINT:
            if (numbers_as_strings) {
                return JsonString(doc, value.ToString());
            }
            return yyjson_mut_sint(doc, value.GetValue<int64_t>());
        case duckdb::LogicalTypeId::UINTEGER:
        case duckdb::LogicalTypeId::UBIGINT:
            if (numbers_as_strings) {
                return JsonString(doc, value.ToString());
            }
            return yyjson_mut_uint(doc, value.GetValue<uint64_t>());
        case duckdb::LogicalTypeId::DECIMAL: {
            auto text = value.ToString();
            if (numbers_as_strings) {
                return JsonString(doc, text);
            }
            return yyjson_mut_rawncpy(doc, text.c_str(), text.size());
        }
        case duckdb::LogicalTypeId::DOUBLE:
        case duckdb::LogicalTypeId::FLOAT: {
            auto number = value.GetValue<double>();
            if (std::isnan(number) || std::isinf(number)) {
                return JsonString(doc, FloatingText(number));
            }
            return yyjson_mut_real(doc, number);
        }
        case duckdb::LogicalTypeId::DATE:
            if (IsV2() && !IsWire(odata_value.wire_type, DateTimeOffset)) {
                auto ms = duckdb::Date::Epoch(value.GetValue<duckdb::date_t>()) * 1000;
                return JsonString(doc, "/Date(" + std::to_string(ms) + ")/");
            }
            return JsonString(doc, PrimitiveText(value, odata_value.wire_type, version));
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ:
            if (IsV2() && !IsWire(odata_value.wire_type, DateTimeOffset)) {
                auto ms = duckdb::Timestamp::GetEpochMs(UtcTimestamp(value));
                return JsonString(doc, "/Date(" + std::to_string(ms) + ")/");
            }
            return JsonString(doc, PrimitiveText(value, odata_value.wire_type, version));
        case duckdb::LogicalTypeId::LIST:
            if (odata_value.wire_type && odata_value.wire_type->IsSpatial()) {
                return WriteSpatial(doc, value, *odata_value.wire_type);
            }
            return JsonCoordinates(doc, value);
        default:
            return JsonString(doc, PrimitiveText(value, odata_value.wire_type, version));
    }
}

yyjson_mut_val *ODataJsonPayloadWriter::WriteSpatial(yyjson_mut_doc *doc, const duckdb::Value &value,
                                                     const PrimitiveType &wire_type) const
{
    auto shape = wire_type.SpatialShape();
    if (shape.empty()) {
        return JsonString(doc, PrimitiveText(value, wire_type, settings.odata_version));
    }

    auto obj = yyjson_mut_obj(doc);
    AddMember(doc, obj, "type", JsonString(doc, shape));
    AddMember(doc, obj, "coordinates", JsonCoordinates(doc, value));
    return obj;
}

// ----------------------------------------------------------------------

ODataAtomPayloadWriter::ODataAtomPayloadWriter(ODataWriterSettings settings)
    : ODataPayloadWriter(std::move(settings))
{ }

std::string ODataAtomPayloadWriter::DataNamespace() const
{
    return IsV2() ? "http://schemas.microsoft.com/ado/2007/08/dataservices"
                  : "http://docs.oasis-open.org/odata/ns/data";
}

std::string ODataAtomPayloadWriter::MetadataNamespace() const
{
    return IsV2() ? "http://schemas.microsoft.com/ado/2007/08/dataservices/metadata"
                  : "http://docs.oasis-open.org/odata/ns/metadata";
}

std::string ODataAtomPayloadWriter::SchemeNamespace() const
{
    return IsV2() ? "http://schemas.microsoft.com/ado/2007/08/dataservices/scheme"
                  : "http://docs.oasis-open.org/odata/ns/scheme";
}

std::string ODataAtomPayloadWriter::WriteEntry(const ODataEntry &entry) const
{
    tinyxml2::XMLPrinter printer(nullptr, !settings.indent);
    printer.PushHeader(false, true);

    printer.OpenElement("entry");
    printer.PushAttribute("xmlns", ATOM_NAMESPACE);
    printer.PushAttribute("xmlns:d", DataNamespace().c_str());
    printer.PushAttribute("xmlns:m", MetadataNamespace().c_str());

    printer.OpenElement("category");
    printer.PushAttribute("term", (IsV2() ? entry.type_name : "#" + entry.type_name).c_str());
    printer.PushAttribute("scheme", SchemeNamespace().c_str());
    printer.CloseElement();

    printer.OpenElement("id");
    printer.CloseElement();
    printer.OpenElement("title");
    printer.CloseElement();
    printer.OpenElement("author");
    printer.OpenElement("name");
    printer.CloseElement();
    printer.CloseElement();

    for (const auto &link : entry.links) {
        auto rel = std::string(ODataEntryEncoder::RELATED_LINK_URL_PREFIX) + link.name;
        auto type = link.is_collection ? "application/atom+xml;type=feed" : "application/atom+xml;type=entry";
        for (const auto &reference : link.references) {
            printer.OpenElement("link");
            printer.PushAttribute("rel", rel.c_str());
            printer.PushAttribute("type", type);
            printer.PushAttribute("title", link.name.c_str());
            printer.PushAttribute("href", AbsoluteUrl(reference.Url()).c_str());
            printer.CloseElement();
        }
    }

    printer.OpenElement("content");
    printer.PushAttribute("type", "application/xml");
    printer.OpenElement("m:properties");
    for (const auto &property : entry.properties) {
        WriteProperty(printer, "d:" + property.name, property.value);
    }
    printer.CloseElement();
    printer.CloseElement();

    printer.CloseElement();

    std::string xml(printer.CStr());
    ODATA_WRITER_TRACE_TRACE_DATA("ODATA_PAYLOAD", "Wrote Atom entry for " + entry.type_name, xml);
    return xml;
}

void ODataAtomPayloadWriter::WriteProperty(tinyxml2::XMLPrinter &printer, const std::string &element_name,
                                           const ODataValue &value) const
{
    printer.OpenElement(element_name.c_str());

    if (!value.type_name.empty() && value.type_name != String.name) {
        printer.PushAttribute("m:type", value.type_name.c_str());
    }

    switch (value.kind) {
        case ODataValue::Kind::PRIMITIVE:
            if (value.value.IsNull()) {
                printer.PushAttribute("m:null", "true");
            } else {
                printer.PushText(PrimitiveText(value.value, value.wire_type, settings.odata_version).c_str());
            }
            break;
        case ODataValue::Kind::COMPLEX:
            for (const auto &property : value.properties) {
                WriteProperty(printer, "d:" + property.name, property.value);
            }
            break;
        case ODataValue::Kind::COLLECTION:
            for (const auto &item : value.items) {
                WriteProperty(printer, IsV2() ? "d:element" : "m:element", item);
            }
            break;
    }

    printer.CloseElement();
}

std::string ODataAtomPayloadWriter::WriteEntityReferenceLink(const std::string &url) const
{
    tinyxml2::XMLPrinter printer(nullptr, !settings.indent);
    printer.PushHeader(false, true);
    printer.OpenElement("uri");
    printer.PushAttribute("xmlns", DataNamespace().c_str());
    printer.PushText(AbsoluteUrl(url).c_str());
    printer.CloseElement();
    return std::string(printer.CStr());
}

std::string ODataAtomPayloadWriter::ContentType() const
{
    return "application/atom+xml;type=entry";
}

std::string ODataAtomPayloadWriter::ReferenceLinkContentType() const
{
    return "application/xml";
}

} // namespace odata_writer
