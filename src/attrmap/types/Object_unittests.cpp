#include "attrmap/types/Object.hpp"

#include "attrmap/Context.hpp"
#include "attrmap/types/Collection.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace attrmap { namespace types {

TEST_CASE("ObjectType") {
    Context context;
    std::string error;
    ObjectType personType({{"name", std::make_shared<StringType>()}, {"age", std::make_shared<Int64Type>()}});
    auto wirePerson = wire::Value::makeObject({{"name", wire::Type::string()}, {"age", wire::Type::number()}},
                                              {{"name", wire::Value::makeString("Ana")},
                                               {"age", wire::Value::makeNumber(30)}});

    SUBCASE("wire type") {
        CHECK_EQ(personType.wireType(&context), wirePerson.type());
        CHECK_EQ(personType.toString(), "ObjectType[\"age\":Int64Type, \"name\":StringType]");
    }
    SUBCASE("value round trip") {
        auto value = std::dynamic_pointer_cast<const ObjectValue>(personType.valueFromWire(&context, wirePerson, error));
        REQUIRE(value);
        auto age = std::dynamic_pointer_cast<const Int64Value>(value->attribute("age"));
        REQUIRE(age);
        CHECK_EQ(age->valueInt64(), 30);
        CHECK_FALSE(value->attribute("height"));
        wire::Value wireValue;
        REQUIRE(value->toWireValue(&context, wireValue, error));
        CHECK_EQ(wireValue, wirePerson);
    }
    SUBCASE("attribute errors") {
        auto wrong = wire::Value::makeObject({{"name", wire::Type::string()}, {"age", wire::Type::number()}},
                                             {{"name", wire::Value::makeString("Ana")},
                                              {"age", wire::Value::makeNumber(30.5)}});
        CHECK_FALSE(personType.valueFromWire(&context, wrong, error));
        CHECK_EQ(error, "attribute \"age\": value 30.5 is not an integer");
    }
    SUBCASE("missing attribute type") {
        ObjectType broken({{"name", nullptr}});
        CHECK_FALSE(broken.valueFromWire(&context, wirePerson, error));
        CHECK_EQ(error, "ObjectType has no type for attribute \"name\"");
    }
    SUBCASE("null object") {
        auto value = personType.valueFromWire(&context, wire::Value::null(wirePerson.type()), error);
        REQUIRE(value);
        CHECK(value->isNull());
        CHECK(value->equal(ObjectValue::null(personType.attributeTypes())));
    }
    SUBCASE("withAttributeTypes") {
        auto type = personType.withAttributeTypes({{"tags", std::make_shared<ListType>(std::make_shared<StringType>())}});
        CHECK_EQ(type->toString(), "ObjectType[\"tags\":ListType[StringType]]");
        CHECK_FALSE(type->equal(personType));
    }
}

TEST_CASE("typeFromWireType") {
    auto type = typeFromWireType(wire::Type::object({{"scores", wire::Type::map(wire::Type::number())},
                                                     {"tags", wire::Type::set(wire::Type::string())},
                                                     {"ok", wire::Type::boolean()}}));
    REQUIRE(type);
    CHECK_EQ(type->toString(),
             "ObjectType[\"ok\":BoolType, \"scores\":MapType[NumberType], \"tags\":SetType[StringType]]");
}

} // namespace types
} // namespace attrmap
