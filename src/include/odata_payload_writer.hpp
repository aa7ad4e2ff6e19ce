#pragma once

#include "odata_entry.hpp"
#include "odata_writer_settings.hpp"

#include "tinyxml2.h"
#include <yyjson.h>

#include <memory>
#include <string>

namespace odata_writer
{

// Serializes encoded entries and entity reference links into request bodies
class ODataPayloadWriter
{
public:
    explicit ODataPayloadWriter(ODataWriterSettings settings);
    virtual ~ODataPayloadWriter() = default;

    // JSON or Atom writer for the configured payload format
    static std::unique_ptr<ODataPayloadWriter> Create(const ODataWriterSettings &settings);

    virtual std::string WriteEntry(const ODataEntry &entry) const = 0;
    virtual std::string WriteEntityReferenceLink(const std::string &url) const = 0;

    virtual std::string ContentType() const = 0;
    virtual std::string ReferenceLinkContentType() const = 0;

    const ODataWriterSettings &Settings() const { return settings; }

protected:
    // Prefixes relative URLs with the service root; $<content id> stays relative
    std::string AbsoluteUrl(const std::string &url) const;
    bool IsV2() const { return settings.odata_version == ODataVersion::V2; }

    ODataWriterSettings settings;
};

// ----------------------------------------------------------------------

// V4 JSON (minimal metadata) or V2 verbose JSON
class ODataJsonPayloadWriter : public ODataPayloadWriter
{
public:
    explicit ODataJsonPayloadWriter(ODataWriterSettings settings);

    std::string WriteEntry(const ODataEntry &entry) const override;
    std::string WriteEntityReferenceLink(const std::string &url) const override;

    std::string ContentType() const override;
    std::string ReferenceLinkContentType() const override;

private:
    std::string WriteDocument(yyjson_mut_doc *doc) const;

    void WriteProperties(yyjson_mut_doc *doc, yyjson_mut_val *obj, const std::vector<ODataProperty> &properties) const;
    void WriteLink(yyjson_mut_doc *doc, yyjson_mut_val *obj, const ODataNavigationLink &link) const;
    yyjson_mut_val *WriteValue(yyjson_mut_doc *doc, const ODataValue &value) const;
    yyjson_mut_val *WritePrimitive(yyjson_mut_doc *doc, const ODataValue &value) const;
    yyjson_mut_val *WriteSpatial(yyjson_mut_doc *doc, const duckdb::Value &value, const PrimitiveType &wire_type) const;
    yyjson_mut_val *WriteTypeMetadata(yyjson_mut_doc *doc, const std::string &type_name) const;
};

// ----------------------------------------------------------------------

// Atom <entry> documents written with tinyxml2's XMLPrinter
class ODataAtomPayloadWriter : public ODataPayloadWriter
{
public:
    explicit ODataAtomPayloadWriter(ODataWriterSettings settings);

    std::string WriteEntry(const ODataEntry &entry) const override;
    std::string WriteEntityReferenceLink(const std::string &url) const override;

    std::string ContentType() const override;
    std::string ReferenceLinkContentType() const override;

private:
    void WriteProperty(tinyxml2::XMLPrinter &printer, const std::string &element_name, const ODataValue &value) const;

    std::string DataNamespace() const;
    std::string MetadataNamespace() const;
    std::string SchemeNamespace() const;
};

// Text of a primitive in Atom content and V2 JSON strings
std::string PrimitiveText(const duckdb::Value &value, const std::optional<PrimitiveType> &wire_type, ODataVersion version);

} // namespace odata_writer
