#include <catch2/catch.hpp>
#include "odata_payload_writer.hpp"

using namespace odata_writer;
using Catch::Matchers::Contains;
using duckdb::LogicalType;
using duckdb::Value;

namespace {

ODataWriterSettings Settings(ODataVersion version, PayloadFormat format = PayloadFormat::JSON)
{
    ODataWriterSettings settings;
    settings.service_root = "http://host/svc";
    settings.odata_version = version;
    settings.payload_format = format;
    return settings;
}

ODataNavigationLink Link(const std::string &name, bool is_collection, std::vector<LinkReference> references)
{
    ODataNavigationLink link;
    link.name = name;
    link.is_collection = is_collection;
    link.target_type_name = "Sales.Employee";
    link.references = std::move(references);
    return link;
}

ODataEntry OrderEntry()
{
    ODataEntry entry;
    entry.type_name = "Sales.Order";
    entry.properties.push_back({"Id", ODataValue::Primitive(Value::INTEGER(1), Int32)});
    entry.properties.push_back({"Total", ODataValue::Primitive(Value::DECIMAL(int64_t(1250), 10, 2), Decimal)});
    entry.properties.push_back({"Tags", ODataValue::Collection("Collection(Edm.String)", {
        ODataValue::Primitive(Value("b"), String),
        ODataValue::Primitive(Value("a"), String),
    })});
    return entry;
}

} // namespace

TEST_CASE("V4 JSON entries", "[odata_payload_writer]")
{
    ODataJsonPayloadWriter writer(Settings(ODataVersion::V4));

    SECTION("Partial update body")
    {
        ODataEntry entry;
        entry.type_name = "Sales.Order";
        entry.properties.push_back({"Total", ODataValue::Primitive(Value::DECIMAL(int64_t(1250), 10, 2), Decimal)});

        REQUIRE(writer.WriteEntry(entry) == R"({"@odata.type":"#Sales.Order","Total":12.50})");
    }

    SECTION("Collections are annotated with their type")
    {
        REQUIRE(writer.WriteEntry(OrderEntry()) ==
                R"({"@odata.type":"#Sales.Order","Id":1,"Total":12.50,"Tags@odata.type":"#Collection(Edm.String)","Tags":["b","a"]})");
    }

    SECTION("Complex values and nulls")
    {
        ODataEntry entry;
        entry.type_name = "Sales.Order";
        entry.properties.push_back({"ShipTo", ODataValue::Complex("Sales.Address", {
            {"City", ODataValue::Primitive(Value("Springfield"), String)},
        })});
        entry.properties.push_back({"Status", ODataValue::Primitive(Value(LogicalType::VARCHAR), String)});

        REQUIRE(writer.WriteEntry(entry) ==
                R"({"@odata.type":"#Sales.Order","ShipTo":{"@odata.type":"#Sales.Address","City":"Springfield"},"Status":null})");
    }

    SECTION("Single link binds a string")
    {
        ODataEntry entry;
        entry.type_name = "Sales.Employee";
        entry.links.push_back(Link("Manager", false, {ResolvedLinkReference {"Employees", "(3)"}}));

        REQUIRE(writer.WriteEntry(entry) == R"({"@odata.type":"#Sales.Employee","Manager@odata.bind":"Employees(3)"})");
    }

    SECTION("Collection links bind an array, pending references stay relative")
    {
        ODataEntry entry;
        entry.type_name = "Sales.Item";
        entry.links.push_back(Link("Parent", true, {PendingLinkReference {1}}));

        REQUIRE(writer.WriteEntry(entry) == R"({"@odata.type":"#Sales.Item","Parent@odata.bind":["$1"]})");
    }

    SECTION("Content types")
    {
        REQUIRE(writer.ContentType() == "application/json;odata.metadata=minimal");
        REQUIRE(writer.ReferenceLinkContentType() == writer.ContentType());
    }
}

TEST_CASE("IEEE754 compatible JSON", "[odata_payload_writer]")
{
    auto settings = Settings(ODataVersion::V4);
    settings.ieee754_compatible = true;
    ODataJsonPayloadWriter writer(settings);

    ODataEntry entry;
    entry.type_name = "Sales.Measurement";
    entry.properties.push_back({"Count", ODataValue::Primitive(Value::BIGINT(9007199254740993LL), Int64)});
    entry.properties.push_back({"Small", ODataValue::Primitive(Value::UTINYINT(7), Byte)});

    REQUIRE(writer.WriteEntry(entry) == R"({"@odata.type":"#Sales.Measurement","Count":"9007199254740993","Small":7})");
    REQUIRE(writer.ContentType() == "application/json;odata.metadata=minimal;IEEE754Compatible=true");
}

TEST_CASE("Spatial values are written as GeoJSON", "[odata_payload_writer]")
{
    ODataJsonPayloadWriter writer(Settings(ODataVersion::V4));

    ODataEntry entry;
    entry.type_name = "Sales.Measurement";
    auto point = Value::LIST(LogicalType::DOUBLE, {Value::DOUBLE(1.5), Value::DOUBLE(2.5)});
    entry.properties.push_back({"Location", ODataValue::Primitive(point, GeographyPoint)});

    REQUIRE(writer.WriteEntry(entry) ==
            R"({"@odata.type":"#Sales.Measurement","Location":{"type":"Point","coordinates":[1.5,2.5]}})");
}

TEST_CASE("V2 verbose JSON entries", "[odata_payload_writer]")
{
    ODataJsonPayloadWriter writer(Settings(ODataVersion::V2));

    ODataEntry entry;
    entry.type_name = "Catalog.Product";
    entry.properties.push_back({"ID", ODataValue::Primitive(Value::BIGINT(1), Int64)});
    entry.properties.push_back({"Price", ODataValue::Primitive(Value::DECIMAL(int64_t(12500), 12, 3), Decimal)});
    entry.properties.push_back({"Released", ODataValue::Primitive(Value::TIMESTAMP(2024, 1, 31, 10, 0, 0, 0), DateTime)});
    entry.properties.push_back({"Tags", ODataValue::Collection("Collection(Edm.String)", {
        ODataValue::Primitive(Value("x"), String),
    })});

    ODataNavigationLink category;
    category.name = "Category";
    category.target_type_name = "Catalog.Category";
    category.references.push_back(ResolvedLinkReference {"Categories", "(4)"});
    entry.links.push_back(category);

    REQUIRE(writer.WriteEntry(entry) ==
            R"({"__metadata":{"type":"Catalog.Product"},"ID":"1","Price":"12.500","Released":"/Date(1706695200000)/",)"
            R"("Tags":{"__metadata":{"type":"Collection(Edm.String)"},"results":["x"]},)"
            R"("Category":{"__metadata":{"uri":"http://host/svc/Categories(4)"}}})");
    REQUIRE(writer.ContentType() == "application/json");
}

TEST_CASE("JSON entity reference links", "[odata_payload_writer]")
{
    ODataJsonPayloadWriter v4(Settings(ODataVersion::V4));
    REQUIRE(v4.WriteEntityReferenceLink("Employees(3)") == R"({"@odata.id":"http://host/svc/Employees(3)"})");

    ODataJsonPayloadWriter v2(Settings(ODataVersion::V2));
    REQUIRE(v2.WriteEntityReferenceLink("Employees(3)") == R"({"uri":"http://host/svc/Employees(3)"})");
    REQUIRE(v2.WriteEntityReferenceLink("$2") == R"({"uri":"$2"})");
}

TEST_CASE("Atom entries", "[odata_payload_writer]")
{
    ODataAtomPayloadWriter writer(Settings(ODataVersion::V2, PayloadFormat::ATOM));

    auto entry = OrderEntry();
    entry.properties.push_back({"Note", ODataValue::Primitive(Value(LogicalType::VARCHAR), String)});
    entry.links.push_back(Link("Manager", false, {ResolvedLinkReference {"Employees", "(3)"}}));

    auto xml = writer.WriteEntry(entry);

    REQUIRE_THAT(xml, Contains("<entry xmlns=\"http://www.w3.org/2005/Atom\""));
    REQUIRE_THAT(xml, Contains("xmlns:d=\"http://schemas.microsoft.com/ado/2007/08/dataservices\""));
    REQUIRE_THAT(xml, Contains("<category term=\"Sales.Order\""));
    REQUIRE_THAT(xml, Contains("rel=\"http://schemas.microsoft.com/ado/2007/08/dataservices/related/Manager\""));
    REQUIRE_THAT(xml, Contains("href=\"http://host/svc/Employees(3)\""));
    REQUIRE_THAT(xml, Contains("<d:Id m:type=\"Edm.Int32\">1</d:Id>"));
    REQUIRE_THAT(xml, Contains("<d:Total m:type=\"Edm.Decimal\">12.50</d:Total>"));
    REQUIRE_THAT(xml, Contains("<d:Tags m:type=\"Collection(Edm.String)\"><d:element>b</d:element><d:element>a</d:element></d:Tags>"));
    REQUIRE_THAT(xml, Contains("<d:Note m:null=\"true\"/>"));

    REQUIRE(writer.ContentType() == "application/atom+xml;type=entry");
    REQUIRE(writer.ReferenceLinkContentType() == "application/xml");
}

TEST_CASE("Atom V4 namespaces and reference links", "[odata_payload_writer]")
{
    ODataAtomPayloadWriter writer(Settings(ODataVersion::V4, PayloadFormat::ATOM));

    auto xml = writer.WriteEntry(OrderEntry());
    REQUIRE_THAT(xml, Contains("xmlns:m=\"http://docs.oasis-open.org/odata/ns/metadata\""));
    REQUIRE_THAT(xml, Contains("<category term=\"#Sales.Order\""));
    REQUIRE_THAT(xml, Contains("<m:element>b</m:element>"));

    auto link = writer.WriteEntityReferenceLink("Employees(3)");
    REQUIRE_THAT(link, Contains("<uri xmlns=\"http://docs.oasis-open.org/odata/ns/data\">http://host/svc/Employees(3)</uri>"));
}

TEST_CASE("Payload writer selection", "[odata_payload_writer]")
{
    auto json = ODataPayloadWriter::Create(Settings(ODataVersion::V4));
    REQUIRE(dynamic_cast<ODataJsonPayloadWriter *>(json.get()) != nullptr);

    auto atom = ODataPayloadWriter::Create(Settings(ODataVersion::V4, PayloadFormat::ATOM));
    REQUIRE(dynamic_cast<ODataAtomPayloadWriter *>(atom.get()) != nullptr);
}

TEST_CASE("Primitive text", "[odata_payload_writer]")
{
    REQUIRE(PrimitiveText(Value::BOOLEAN(false), Boolean, ODataVersion::V4) == "false");
    REQUIRE(PrimitiveText(Value::DATE(2024, 1, 31), Date, ODataVersion::V4) == "2024-01-31");
    REQUIRE(PrimitiveText(Value::DATE(2024, 1, 31), DateTime, ODataVersion::V2) == "2024-01-31T00:00:00");
    REQUIRE(PrimitiveText(Value::TIMESTAMP(2024, 1, 31, 10, 0, 0, 0), DateTimeOffset, ODataVersion::V4) == "2024-01-31T10:00:00Z");
    REQUIRE(PrimitiveText(Value::BLOB(duckdb::const_data_ptr_cast("hi"), 2), Binary, ODataVersion::V4) == "aGk=");
    REQUIRE(PrimitiveText(Value(LogicalType::VARCHAR), String, ODataVersion::V4).empty());
}
