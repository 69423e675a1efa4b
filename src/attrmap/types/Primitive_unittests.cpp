#include "attrmap/types/Primitive.hpp"

#include "attrmap/Context.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace attrmap { namespace types {

TEST_CASE("Primitive valueFromWire") {
    Context context;
    std::string error;
    SUBCASE("string") {
        auto value = StringType().valueFromWire(&context, wire::Value::makeString("Ana"), error);
        auto stringValue = std::dynamic_pointer_cast<const StringValue>(value);
        REQUIRE(stringValue);
        CHECK_EQ(stringValue->valueString(), "Ana");
        CHECK_EQ(stringValue->toString(), "\"Ana\"");
    }
    SUBCASE("null and unknown") {
        auto null = NumberType().valueFromWire(&context, wire::Value::null(wire::Type::number()), error);
        REQUIRE(null);
        CHECK(null->isNull());
        CHECK(null->equal(NumberValue::null()));
        auto unknown = BoolType().valueFromWire(&context, wire::Value::unknown(wire::Type::boolean()), error);
        REQUIRE(unknown);
        CHECK(unknown->isUnknown());
        CHECK_EQ(unknown->toString(), "<unknown>");
    }
    SUBCASE("wrong kind") {
        CHECK_FALSE(BoolType().valueFromWire(&context, wire::Value::makeString("true"), error));
        CHECK_EQ(error, "can't build BoolType from a String value");
    }
    SUBCASE("int64 range") {
        auto value = Int64Type().valueFromWire(&context, wire::Value::makeNumber(-42), error);
        auto intValue = std::dynamic_pointer_cast<const Int64Value>(value);
        REQUIRE(intValue);
        CHECK_EQ(intValue->valueInt64(), -42);
        CHECK_FALSE(Int64Type().valueFromWire(&context, wire::Value::makeNumber(1.5), error));
        CHECK_EQ(error, "value 1.5 is not an integer");
        CHECK_FALSE(Int64Type().valueFromWire(&context, wire::Value::makeNumber(9223372036854775808.0), error));
    }
}

TEST_CASE("Primitive values") {
    Context context;
    std::string error;
    SUBCASE("toWireValue") {
        wire::Value value;
        REQUIRE(Int64Value(7).toWireValue(&context, value, error));
        CHECK_EQ(value, wire::Value::makeNumber(7));
        REQUIRE(StringValue::unknown().toWireValue(&context, value, error));
        CHECK_EQ(value, wire::Value::unknown(wire::Type::string()));
        REQUIRE(BoolValue().toWireValue(&context, value, error));
        CHECK_EQ(value, wire::Value::null(wire::Type::boolean()));
    }
    SUBCASE("equality") {
        CHECK(StringValue("a").equal(StringValue("a")));
        CHECK_FALSE(StringValue("a").equal(StringValue("b")));
        CHECK_FALSE(StringValue().equal(StringValue::unknown()));
        CHECK_FALSE(NumberValue(1).equal(Int64Value(1)));
    }
    SUBCASE("types") {
        CHECK(Int64Value(1).type(&context)->equal(Int64Type()));
        CHECK_FALSE(Int64Type().equal(NumberType()));
        CHECK_EQ(Int64Type().wireType(&context), NumberType().wireType(&context));
    }
}

} // namespace types
} // namespace attrmap
