#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "odata_exceptions.hpp"

using namespace odata_writer;
using duckdb::Value;

TEST_CASE("Entity sets are found by insensitive or singular names", "[odata_metadata]") {
    auto metadata = odata_writer_test::SalesMetadata();

    REQUIRE(metadata->Version() == ODataVersion::V4);
    REQUIRE(metadata->FindEntitySet("Employees").name == "Employees");
    REQUIRE(metadata->FindEntitySet("employee").name == "Employees");
    REQUIRE(metadata->FindEntitySet("EMPLOYEES").name == "Employees");
    REQUIRE(metadata->FindEntitySet("Order").name == "Orders");
    REQUIRE(metadata->FindEntitySet("order_lines").name == "OrderLines");
    REQUIRE_THROWS_AS(metadata->FindEntitySet("Invoices"), duckdb::InvalidInputException);

    REQUIRE(metadata->EntitySetType("Orders").FullName() == "Sales.Order");
}

TEST_CASE("Entity sets by type", "[odata_metadata]") {
    auto metadata = odata_writer_test::SalesMetadata();

    auto sets = metadata->FindEntitySetsByType("self.Order");
    REQUIRE(sets.size() == 1);
    REQUIRE(sets[0].name == "Orders");

    REQUIRE(metadata->FindEntitySetsByType("Employee").size() == 1);
    REQUIRE(metadata->FindEntitySetsByType("Sales.Invoice").empty());

    REQUIRE(metadata->TypeNamesAreEqual("Sales.Order", "self.order"));
    REQUIRE(metadata->TypeNamesAreEqual("Sales.Order", "Order"));
    REQUIRE_FALSE(metadata->TypeNamesAreEqual("Sales.Order", "Other.Order"));
}

TEST_CASE("Optimistic concurrency detection", "[odata_metadata]") {
    auto metadata = odata_writer_test::SalesMetadata();

    SECTION("Property with ConcurrencyMode Fixed") {
        REQUIRE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("Employees"));
    }

    SECTION("Inline annotation on the entity set") {
        REQUIRE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("OrderLines"));
    }

    SECTION("Out of line annotation targeting the entity set") {
        REQUIRE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("Customers"));
    }

    SECTION("No concurrency control") {
        REQUIRE_FALSE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("Orders"));
        REQUIRE_FALSE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("SpecialOrders"));
        REQUIRE_FALSE(metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck("Items"));
    }
}

TEST_CASE("Key literals", "[odata_metadata]") {
    auto metadata = odata_writer_test::SalesMetadata();

    SECTION("Single key") {
        auto order = metadata->FindEntityType("Sales.Order");
        REQUIRE(metadata->ConvertKeyToUriLiteral(order, EntityData{{"Id", Value::INTEGER(7)}}) == "(7)");
        REQUIRE(metadata->ConvertKeyToUriLiteral(order, EntityData{{"id", Value("7")}}) == "(7)");
    }

    SECTION("Composite key keeps key order") {
        auto line = metadata->FindEntityType("Sales.OrderLine");
        EntityData data{
            {"Code", Value("A'1")},
            {"OrderId", Value::INTEGER(1)},
            {"Quantity", Value::SMALLINT(2)},
        };
        REQUIRE(metadata->ConvertKeyToUriLiteral(line, data) == "(OrderId=1,Code='A''1')");
    }

    SECTION("Missing or NULL key values are rejected") {
        auto order = metadata->FindEntityType("Sales.Order");
        REQUIRE_THROWS_AS(metadata->ConvertKeyToUriLiteral(order, EntityData{{"Total", Value::DOUBLE(1.0)}}),
                          ODataSchemaMismatchException);
        REQUIRE_THROWS_AS(metadata->ConvertKeyToUriLiteral(order, EntityData{{"Id", Value()}}),
                          ODataSchemaMismatchException);
    }

    SECTION("V2 keys carry literal suffixes") {
        auto catalog = odata_writer_test::CatalogMetadata();
        REQUIRE(catalog->Version() == ODataVersion::V2);

        auto product = catalog->FindEntityType("Catalog.Product");
        REQUIRE(catalog->ConvertKeyToUriLiteral(product, EntityData{{"ID", Value::INTEGER(5)}}) == "(5L)");
    }
}
