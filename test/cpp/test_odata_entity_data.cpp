#include <catch2/catch.hpp>
#include "odata_entity_data.hpp"

using namespace odata_writer;
using duckdb::Value;

TEST_CASE("EntityData keeps caller order", "[odata_entity_data]") {
    EntityData data{
        {"Id", Value::INTEGER(3)},
        {"Name", Value("Bob")},
    };

    REQUIRE(data.Size() == 2);
    REQUIRE(data.Names() == std::vector<std::string>{"Id", "Name"});

    SECTION("Set replaces an existing field in place") {
        data.Set("Id", Value::INTEGER(4)).Set("Version", Value::BIGINT(1));
        REQUIRE(data.Names() == std::vector<std::string>{"Id", "Name", "Version"});
        REQUIRE(std::get<Value>(*data.Find("Id")).GetValue<int32_t>() == 4);
    }

    SECTION("Find is exact unless a matcher is given") {
        REQUIRE(data.Find("name") == nullptr);

        ODataNameMatcher matcher;
        auto found = data.Find("NAME", matcher);
        REQUIRE(found != nullptr);
        REQUIRE(std::get<Value>(*found).ToString() == "Bob");
    }

    SECTION("ToString renders nested entities") {
        data.Set("Manager", EntityData::Create({{"Id", Value::INTEGER(1)}}));
        REQUIRE(data.ToString() == "{Id: 3, Name: Bob, Manager: {Id: 1}}");
    }
}

TEST_CASE("EntityData from a STRUCT value", "[odata_entity_data]") {
    duckdb::child_list_t<Value> children;
    children.push_back({"Street", Value("Main St")});
    children.push_back({"City", Value("Springfield")});
    auto address = Value::STRUCT(std::move(children));

    auto data = EntityData::FromStruct(address);
    REQUIRE(data.Names() == std::vector<std::string>{"Street", "City"});
    REQUIRE(std::get<Value>(*data.Find("City")).ToString() == "Springfield");

    REQUIRE_THROWS_AS(EntityData::FromStruct(Value::INTEGER(1)), duckdb::InvalidInputException);
}

TEST_CASE("Null entity values", "[odata_entity_data]") {
    REQUIRE(IsNullEntityValue(EntityValue(Value())));
    REQUIRE(IsNullEntityValue(EntityValue(EntityDataPtr())));
    REQUIRE(IsNullEntityValue(EntityValue(std::vector<EntityDataPtr>())));

    REQUIRE_FALSE(IsNullEntityValue(EntityValue(Value::INTEGER(0))));
    REQUIRE_FALSE(IsNullEntityValue(EntityValue(std::make_shared<EntityData>())));

    REQUIRE(EntityValueToString(EntityValue(EntityDataPtr())) == "NULL");
    std::vector<EntityDataPtr> two = {EntityData::Create({{"Id", Value::INTEGER(1)}}), nullptr};
    REQUIRE(EntityValueToString(EntityValue(two)) == "[{Id: 1}, NULL]");
}
