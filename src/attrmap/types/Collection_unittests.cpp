#include "attrmap/types/Collection.hpp"

#include "attrmap/Context.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace attrmap { namespace types {

TEST_CASE("Collection types") {
    Context context;
    std::string error;
    auto stringType = std::make_shared<StringType>();
    SUBCASE("list round trip") {
        ListType type(stringType);
        auto wireList = wire::Value::makeList(wire::Type::string(),
                                              {wire::Value::makeString("a"), wire::Value::makeString("b")});
        auto value = type.valueFromWire(&context, wireList, error);
        auto listValue = std::dynamic_pointer_cast<const ListValue>(value);
        REQUIRE(listValue);
        CHECK_EQ(listValue->elements().size(), 2);
        CHECK_EQ(listValue->toString(), "[\"a\",\"b\"]");
        wire::Value wireValue;
        REQUIRE(listValue->toWireValue(&context, wireValue, error));
        CHECK_EQ(wireValue, wireList);
    }
    SUBCASE("exact wire type") {
        ListType type(stringType);
        CHECK_FALSE(type.valueFromWire(&context, wire::Value::makeSet(wire::Type::string(), {}), error));
        CHECK_EQ(error, "can't build ListType[StringType] from a Set[String] value, expected List[String]");
    }
    SUBCASE("missing element type") {
        MapType type(nullptr);
        CHECK_EQ(type.toString(), "MapType[<missing>]");
        CHECK_FALSE(type.valueFromWire(&context, wire::Value::makeMap(wire::Type::string(), {}), error));
        CHECK_EQ(error, "MapType has no element type");
        wire::Value wireValue;
        CHECK_FALSE(MapValue().toWireValue(&context, wireValue, error));
        CHECK_EQ(error, "map value has no element type");
    }
    SUBCASE("duplicate set elements") {
        SetValue value(stringType, {std::make_shared<StringValue>("a"), std::make_shared<StringValue>("a")});
        wire::Value wireValue;
        CHECK_FALSE(value.toWireValue(&context, wireValue, error));
        CHECK_EQ(error, "value[1] duplicates value[0] in a set");
    }
    SUBCASE("set equality ignores order") {
        SetValue a(stringType, {std::make_shared<StringValue>("a"), std::make_shared<StringValue>("b")});
        SetValue b(stringType, {std::make_shared<StringValue>("b"), std::make_shared<StringValue>("a")});
        CHECK(a.equal(b));
        CHECK_FALSE(a.equal(ListValue(stringType, a.elements())));
    }
    SUBCASE("map") {
        MapType type(std::make_shared<NumberType>());
        auto wireMap = wire::Value::makeMap(wire::Type::number(), {{"x", wire::Value::makeNumber(1)}});
        auto value = std::dynamic_pointer_cast<const MapValue>(type.valueFromWire(&context, wireMap, error));
        REQUIRE(value);
        CHECK_EQ(value->toString(), "{\"x\":1}");
        CHECK(value->type(&context)->equal(type));
        CHECK_FALSE(value->type(&context)->equal(MapType(stringType)));
    }
    SUBCASE("withElementType") {
        auto type = ListType(stringType).withElementType(std::make_shared<BoolType>());
        CHECK_EQ(type->toString(), "ListType[BoolType]");
    }
}

} // namespace types
} // namespace attrmap
