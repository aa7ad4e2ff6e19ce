#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "odata_edm_delta_model.hpp"
#include "odata_entry_encoder.hpp"
#include "odata_exceptions.hpp"

using namespace odata_writer;
using duckdb::LogicalType;
using duckdb::Value;

namespace {

Value Address(const std::string &street, const std::string &city)
{
    duckdb::child_list_t<Value> children;
    children.push_back({"Street", Value(street)});
    children.push_back({"City", Value(city)});
    return Value::STRUCT(std::move(children));
}

Value Strings(std::vector<std::string> texts)
{
    std::vector<Value> values;
    for (auto &text : texts) {
        values.push_back(Value(text));
    }
    return Value::LIST(LogicalType::VARCHAR, std::move(values));
}

} // namespace

TEST_CASE("Encoding a full entry", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    EntityData order{
        {"Id", Value::INTEGER(1)},
        {"total", Value::DOUBLE(12.5)},
        {"Tags", Strings({"b", "a"})},
        {"ShipTo", Address("Main St", "Springfield")},
        {"Status", Value("Open")},
    };

    auto entry = encoder.Encode(metadata->Model(), "Sales.Order", order);

    REQUIRE(entry.type_name == "Sales.Order");
    REQUIRE(entry.links.empty());
    REQUIRE(entry.properties.size() == 5);

    SECTION("Properties keep caller order and declared names")
    {
        REQUIRE(entry.properties[0].name == "Id");
        REQUIRE(entry.properties[1].name == "Total");
        REQUIRE(entry.properties[4].name == "Status");
    }

    SECTION("Primitives are coerced to their declared kind")
    {
        auto &id = entry.FindProperty("Id")->value;
        REQUIRE(id.kind == ODataValue::Kind::PRIMITIVE);
        REQUIRE(id.type_name == "Edm.Int32");
        REQUIRE(id.value.type() == LogicalType::INTEGER);

        auto &total = entry.FindProperty("Total")->value;
        REQUIRE(total.value.type() == LogicalType::DECIMAL(10, 2));
        REQUIRE(total.value.ToString() == "12.50");
    }

    SECTION("Collections keep element order")
    {
        auto &tags = entry.FindProperty("Tags")->value;
        REQUIRE(tags.kind == ODataValue::Kind::COLLECTION);
        REQUIRE(tags.type_name == "Collection(Edm.String)");
        REQUIRE(tags.items.size() == 2);
        REQUIRE(tags.items[0].value.ToString() == "b");
        REQUIRE(tags.items[1].value.ToString() == "a");
    }

    SECTION("Complex values carry their type")
    {
        auto &ship_to = entry.FindProperty("ShipTo")->value;
        REQUIRE(ship_to.kind == ODataValue::Kind::COMPLEX);
        REQUIRE(ship_to.type_name == "Sales.Address");
        REQUIRE(ship_to.properties.size() == 2);
        REQUIRE(ship_to.properties[1].name == "City");
        REQUIRE(ship_to.properties[1].value.value.ToString() == "Springfield");
    }

    SECTION("Enum members go out as supplied")
    {
        auto &status = entry.FindProperty("Status")->value;
        REQUIRE(status.type_name == "Sales.OrderStatus");
        REQUIRE(status.value.ToString() == "Open");
    }

    SECTION("Encoding is repeatable")
    {
        REQUIRE(encoder.Encode(metadata->Model(), "Sales.Order", order) == entry);
    }
}

TEST_CASE("Collections of complex values", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    auto address_type = Address("", "").type();
    EntityData order{
        {"Id", Value::INTEGER(1)},
        {"Stops", Value::LIST(address_type, {Address("A", "B"), Address("C", "D")})},
    };

    auto entry = encoder.Encode(metadata->Model(), "Order", order);
    auto &stops = entry.FindProperty("Stops")->value;
    REQUIRE(stops.type_name == "Collection(Sales.Address)");
    REQUIRE(stops.items.size() == 2);
    REQUIRE(stops.items[1].kind == ODataValue::Kind::COMPLEX);
    REQUIRE(stops.items[1].properties[0].value.value.ToString() == "C");
}

TEST_CASE("NULL values keep the declared type", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    auto entry = encoder.Encode(metadata->Model(), "Sales.Order", EntityData{{"Total", Value()}});
    auto &total = entry.FindProperty("Total")->value;
    REQUIRE(total.IsNull());
    REQUIRE(total.type_name == "Edm.Decimal");
}

TEST_CASE("Inherited properties are encoded", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    auto entry = encoder.Encode(metadata->Model(), "Sales.SpecialOrder",
                                EntityData{{"Id", Value::INTEGER(1)}, {"Priority", Value::INTEGER(9)}});
    REQUIRE(entry.type_name == "Sales.SpecialOrder");
    REQUIRE(entry.properties.size() == 2);
}

TEST_CASE("Encoding against a restricted view", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);
    auto order_type = metadata->FindEntityType("Sales.Order");

    EdmDeltaModel delta(metadata->Model(), order_type, {"Total"});

    auto entry = encoder.Encode(delta, "Sales.Order", EntityData{{"Total", Value::DOUBLE(12.5)}});
    REQUIRE(entry.type_name == "Sales.Order");
    REQUIRE(entry.properties.size() == 1);
    REQUIRE(entry.properties[0].value.value.ToString() == "12.50");

    REQUIRE_THROWS_AS(encoder.Encode(delta, "Sales.Order", EntityData{{"Tags", Strings({"x"})}}),
                      ODataSchemaMismatchException);
}

TEST_CASE("Encoding errors", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    SECTION("Undeclared field")
    {
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Order", EntityData{{"Discount", Value::INTEGER(5)}}),
                          ODataSchemaMismatchException);
    }

    SECTION("Linked entity on a structural property")
    {
        EntityData order{{"Id", EntityData::Create({{"Id", Value::INTEGER(1)}})}};
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Order", order), ODataSchemaMismatchException);
    }

    SECTION("Value that no candidate accepts")
    {
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Order", EntityData{{"Total", Value("abc")}}),
                          ODataFormatException);
    }

    SECTION("Scalar supplied for a collection")
    {
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Order", EntityData{{"Tags", Value("x")}}),
                          ODataFormatException);
    }

    SECTION("Undeclared field inside a complex value")
    {
        duckdb::child_list_t<Value> children;
        children.push_back({"Planet", Value("Earth")});
        EntityData order{{"ShipTo", Value::STRUCT(std::move(children))}};
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Order", order), ODataSchemaMismatchException);
    }
}

TEST_CASE("Qualified type names", "[odata_entry_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    REQUIRE(QualifiedTypeName(metadata->Model(), "self.Address") == "Sales.Address");
    REQUIRE(QualifiedTypeName(metadata->Model(), "Collection(self.Address)") == "Collection(Sales.Address)");
    REQUIRE(QualifiedTypeName(metadata->Model(), "Edm.String") == "Edm.String");
}
