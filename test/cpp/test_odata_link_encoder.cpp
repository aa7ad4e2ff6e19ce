#include <catch2/catch.hpp>
#include "test_fixtures.hpp"

#include "odata_edm_delta_model.hpp"
#include "odata_entry_encoder.hpp"
#include "odata_exceptions.hpp"

using namespace odata_writer;
using duckdb::LogicalType;
using duckdb::Value;

namespace {

// Departments link to people, but no entity set holds people
const char *HrMetadata()
{
    return R"(<?xml version="1.0" encoding="utf-8"?>
<edmx:Edmx Version="4.0" xmlns:edmx="http://docs.oasis-open.org/odata/ns/edmx">
  <edmx:DataServices>
    <Schema Namespace="Hr" xmlns="http://docs.oasis-open.org/odata/ns/edm">
      <EntityType Name="Dept">
        <Key><PropertyRef Name="Id" /></Key>
        <Property Name="Id" Type="Edm.Int32" Nullable="false" />
        <NavigationProperty Name="Head" Type="Hr.Person" />
      </EntityType>
      <EntityType Name="Person">
        <Key><PropertyRef Name="Id" /></Key>
        <Property Name="Id" Type="Edm.Int32" Nullable="false" />
      </EntityType>
      <EntityContainer Name="Container">
        <EntitySet Name="Depts" EntityType="Hr.Dept" />
      </EntityContainer>
    </Schema>
  </edmx:DataServices>
</edmx:Edmx>)";
}

Value IdStruct(int32_t id)
{
    duckdb::child_list_t<Value> children;
    children.push_back({"Id", Value::INTEGER(id)});
    return Value::STRUCT(std::move(children));
}

} // namespace

TEST_CASE("Links to existing entities", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    SECTION("Single link without partner")
    {
        EntityData employee{
            {"Id", Value::INTEGER(1)},
            {"Manager", EntityData::Create({{"Id", Value::INTEGER(3)}})},
        };

        auto entry = encoder.Encode(metadata->Model(), "Sales.Employee", employee);
        REQUIRE(entry.properties.size() == 1);
        REQUIRE(entry.links.size() == 1);

        auto &link = entry.links[0];
        REQUIRE(link.name == "Manager");
        REQUIRE_FALSE(link.is_collection);
        REQUIRE(link.target_type_name == "Sales.Employee");
        REQUIRE(link.url == std::string(ODataEntryEncoder::RELATED_LINK_URL_PREFIX) + "Sales.Employee");
        REQUIRE(link.references.size() == 1);
        REQUIRE_FALSE(link.references[0].IsPending());
        REQUIRE(link.references[0].Resolved().entity_set == "Employees");
        REQUIRE(link.references[0].Url() == "Employees(3)");
    }

    SECTION("Collection link keeps target order")
    {
        std::vector<EntityDataPtr> reports = {
            EntityData::Create({{"Id", Value::INTEGER(5)}}),
            EntityData::Create({{"Id", Value::INTEGER(4)}}),
        };
        EntityData employee{{"reports", reports}};

        auto entry = encoder.Encode(metadata->Model(), "Sales.Employee", employee);
        auto link = entry.FindLink("Reports");
        REQUIRE(link != nullptr);
        REQUIRE(link->is_collection);
        REQUIRE(link->references.size() == 2);
        REQUIRE(link->references[0].Url() == "Employees(5)");
        REQUIRE(link->references[1].Url() == "Employees(4)");
    }

    SECTION("STRUCT and LIST of STRUCT values become link targets")
    {
        EntityData employee{
            {"Manager", IdStruct(3)},
            {"Reports", Value::LIST(IdStruct(0).type(), {IdStruct(7), IdStruct(8)})},
        };

        auto entry = encoder.Encode(metadata->Model(), "Sales.Employee", employee);
        REQUIRE(entry.FindLink("Manager")->references[0].Url() == "Employees(3)");
        REQUIRE(entry.FindLink("Reports")->references.size() == 2);
    }

    SECTION("Null links are skipped")
    {
        EntityData employee{
            {"Id", Value::INTEGER(1)},
            {"Manager", EntityDataPtr()},
            {"Reports", std::vector<EntityDataPtr>()},
        };

        auto entry = encoder.Encode(metadata->Model(), "Sales.Employee", employee);
        REQUIRE(entry.links.empty());
    }
}

TEST_CASE("Link multiplicity follows the partner", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);

    auto item = metadata->FindEntityType("Sales.Item");
    auto parent = encoder.EncodeLink(item, "Parent", EntityData::Create({{"Id", Value::INTEGER(1)}}));
    REQUIRE(parent.is_collection);
    REQUIRE(parent.references[0].Url() == "Items(1)");

    auto customer = metadata->FindEntityType("Sales.Customer");
    auto orders = encoder.EncodeLink(customer, "Orders", EntityData::Create({{"Id", Value::INTEGER(2)}}));
    REQUIRE_FALSE(orders.is_collection);
    REQUIRE(orders.target_type_name == "Sales.Order");
    REQUIRE(orders.references[0].Url() == "Orders(2)");
}

TEST_CASE("Links resolve against the full model", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);
    auto employee_type = metadata->FindEntityType("Sales.Employee");

    EdmDeltaModel delta(metadata->Model(), employee_type, {"Manager"});

    auto entry = encoder.Encode(delta, "Sales.Employee",
                                EntityData{{"Manager", EntityData::Create({{"Id", Value::INTEGER(3)}})}});
    REQUIRE(entry.properties.empty());
    REQUIRE(entry.links.size() == 1);
    REQUIRE(entry.links[0].references[0].Url() == "Employees(3)");
}

TEST_CASE("Links to entities queued in the same batch", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();

    auto queued = EntityData::Create({{"Id", Value::INTEGER(10)}, {"Label", Value("root")}});
    auto lookup = [queued](const EntityData &data) -> std::optional<int64_t> {
        if (&data == queued.get()) {
            return 1;
        }
        return std::nullopt;
    };
    ODataEntryEncoder encoder(*metadata, lookup);

    EntityData child{
        {"Id", Value::INTEGER(11)},
        {"Parent", queued},
    };

    auto entry = encoder.Encode(metadata->Model(), "Sales.Item", child);
    auto &reference = entry.FindLink("Parent")->references[0];
    REQUIRE(reference.IsPending());
    REQUIRE(reference.Pending().content_id == 1);
    REQUIRE(reference.Url() == "$1");

    SECTION("An equal but distinct entity is not pending")
    {
        EntityData other{{"Parent", EntityData::Create({{"Id", Value::INTEGER(10)}, {"Label", Value("root")}})}};
        auto other_entry = encoder.Encode(metadata->Model(), "Sales.Item", other);
        REQUIRE(other_entry.links[0].references[0].Url() == "Items(10)");
    }
}

TEST_CASE("Link errors", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::SalesMetadata();
    ODataEntryEncoder encoder(*metadata);
    auto employee_type = metadata->FindEntityType("Sales.Employee");

    SECTION("Target without key value")
    {
        EntityData employee{{"Manager", EntityData::Create({{"Name", Value("Ann")}})}};
        REQUIRE_THROWS_AS(encoder.Encode(metadata->Model(), "Sales.Employee", employee), ODataSchemaMismatchException);
    }

    SECTION("Undeclared link")
    {
        REQUIRE_THROWS_AS(encoder.EncodeLink(employee_type, "Mentor", EntityData::Create({{"Id", Value::INTEGER(1)}})),
                          ODataSchemaMismatchException);
    }

    SECTION("Scalar supplied as link target")
    {
        REQUIRE_THROWS_AS(encoder.EncodeLink(employee_type, "Manager", Value::INTEGER(3)), ODataFormatException);
    }

    SECTION("No entity set holds the target type")
    {
        auto hr = ODataMetadata::FromXml(HrMetadata());
        ODataEntryEncoder hr_encoder(*hr);
        EntityData dept{{"Id", Value::INTEGER(1)}, {"Head", EntityData::Create({{"Id", Value::INTEGER(2)}})}};
        REQUIRE_THROWS_AS(hr_encoder.Encode(hr->Model(), "Hr.Dept", dept), ODataMissingNavigationTargetException);
    }
}

TEST_CASE("V2 links", "[odata_link_encoder]")
{
    auto metadata = odata_writer_test::CatalogMetadata();
    ODataEntryEncoder encoder(*metadata);

    EntityData product{
        {"ID", Value::BIGINT(1)},
        {"Category", EntityData::Create({{"ID", Value::INTEGER(4)}})},
    };

    auto entry = encoder.Encode(metadata->Model(), "Catalog.Product", product);
    auto link = entry.FindLink("Category");
    REQUIRE(link != nullptr);
    REQUIRE(link->target_type_name == "Catalog.Category");
    REQUIRE(link->references[0].Url() == "Categories(4)");
}
