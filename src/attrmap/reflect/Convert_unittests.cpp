#include "attrmap/reflect/Convert.hpp"

#include "attrmap/types/Collection.hpp"
#include "attrmap/types/Object.hpp"
#include "attrmap/types/Primitive.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace attrmap;

bool detailContains(const Diagnostics& diagnostics, const std::string& text) {
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.detail.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Only accepts positive numbers.
class PositiveNumberType : public types::NumberType, public attr::TypeWithValidate {
public:
    PositiveNumberType() = default;
    virtual ~PositiveNumberType() = default;

    Diagnostics validate(Context* /* context */, const wire::Value& value, const Path& path) const override {
        Diagnostics diagnostics;
        if (value.isKnown() && !value.isNull() && value.getNumber() <= 0) {
            diagnostics.addAttributeError(path, "Not Positive", fmt::format("{} is not positive", value.getNumber()));
        }
        return diagnostics;
    }
};

struct Point {
    int64_t x;
    int64_t y;
};

void describeRecord(reflect::RecordBuilder<Point>& record) {
    record.named("Point").field("x", &Point::x).field("y", &Point::y);
}

} // namespace

namespace attrmap { namespace reflect {

TEST_CASE("into primitives") {
    Context context;
    types::NumberType numberType;

    SUBCASE("bool") {
        bool flag = false;
        REQUIRE(into(&context, types::BoolType(), wire::Value::makeBool(true), flag).empty());
        CHECK(flag);
        auto diagnostics = into(&context, types::BoolType(), wire::Value::makeString("true"), flag);
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "Cannot convert String<\"true\"> into bool: expected a Bool value"));
    }
    SUBCASE("integers") {
        int32_t small = 0;
        REQUIRE(into(&context, numberType, wire::Value::makeNumber(-7), small).empty());
        CHECK_EQ(small, -7);
        CHECK(into(&context, numberType, wire::Value::makeNumber(2147483648.0), small).hasError());
        CHECK_EQ(small, -7);
        REQUIRE(into(&context, numberType, wire::Value::makeNumber(-2147483648.0), small).empty());
        CHECK_EQ(small, std::numeric_limits<int32_t>::min());

        uint8_t byte = 0;
        REQUIRE(into(&context, numberType, wire::Value::makeNumber(255), byte).empty());
        CHECK_EQ(byte, 255);
        auto diagnostics = into(&context, numberType, wire::Value::makeNumber(256), byte);
        CHECK(detailContains(diagnostics, "value is out of the range of uint8_t"));
        CHECK(into(&context, numberType, wire::Value::makeNumber(-1), byte).hasError());
        CHECK_EQ(byte, 255);

        int64_t big = 0;
        diagnostics = into(&context, numberType, wire::Value::makeNumber(2.5), big);
        CHECK(detailContains(diagnostics, "value is not an integer"));
        CHECK(into(&context, numberType, wire::Value::makeNumber(std::numeric_limits<double>::infinity()), big)
                  .hasError());
    }
    SUBCASE("floating point") {
        double d = 0;
        REQUIRE(into(&context, numberType, wire::Value::makeNumber(1.25), d).empty());
        CHECK_EQ(d, 1.25);
        float f = 0;
        REQUIRE(into(&context, numberType, wire::Value::makeNumber(0.5), f).empty());
        CHECK_EQ(f, 0.5f);
        auto diagnostics = into(&context, numberType, wire::Value::makeNumber(1e39), f);
        CHECK(detailContains(diagnostics, "value is out of the range of float"));
    }
    SUBCASE("string") {
        std::string s;
        REQUIRE(into(&context, types::StringType(), wire::Value::makeString("hello"), s).empty());
        CHECK_EQ(s, "hello");
        CHECK(into(&context, types::StringType(), wire::Value::makeNumber(1), s).hasError());
    }
    SUBCASE("errors carry the path") {
        int64_t n = 0;
        auto diagnostics = into(&context, numberType, wire::Value::makeBool(true), n, Path().atName("count"));
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("count"));
        CHECK_EQ(diagnostics[0].summary, "Value Conversion Error");
    }
}

TEST_CASE("into containers") {
    Context context;
    auto stringType = std::make_shared<types::StringType>();

    SUBCASE("list") {
        std::vector<std::string> names;
        auto value = wire::Value::makeList(wire::Type::string(),
                                           {wire::Value::makeString("a"), wire::Value::makeString("b")});
        REQUIRE(into(&context, types::ListType(stringType), value, names).empty());
        CHECK_EQ(names, (std::vector<std::string>{"a", "b"}));
    }
    SUBCASE("set element paths use the element value") {
        std::vector<int64_t> numbers;
        auto value = wire::Value::makeSet(wire::Type::number(),
                                          {wire::Value::makeNumber(1), wire::Value::makeNumber(1.5)});
        auto diagnostics = into(&context, types::SetType(std::make_shared<types::NumberType>()), value, numbers,
                                Path().atName("ids"));
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("ids").atSetValue("Number<1.5>"));
        CHECK(numbers.empty());
    }
    SUBCASE("map") {
        std::map<std::string, bool> flags;
        auto value = wire::Value::makeMap(wire::Type::boolean(), {{"on", wire::Value::makeBool(true)},
                                                                  {"off", wire::Value::makeBool(false)}});
        REQUIRE(into(&context, types::MapType(std::make_shared<types::BoolType>()), value, flags).empty());
        CHECK_EQ(flags.size(), 2);
        CHECK(flags["on"]);
        CHECK_FALSE(flags["off"]);
    }
    SUBCASE("map element errors carry the key") {
        std::map<std::string, std::string> labels;
        auto value = wire::Value::makeMap(wire::Type::string(), {{"k", wire::Value::null(wire::Type::string())}});
        auto diagnostics = into(&context, types::MapType(stringType), value, labels);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atMapKey("k"));
    }
    SUBCASE("collection type without element type") {
        std::vector<std::string> names;
        auto value = wire::Value::makeList(wire::Type::string(), {});
        auto diagnostics = into(&context, types::StringType(), value, names);
        CHECK(detailContains(diagnostics, "schema type StringType does not describe the type of its elements"));
    }
    SUBCASE("optional") {
        std::optional<std::string> name = "old";
        REQUIRE(into(&context, types::StringType(), wire::Value::null(wire::Type::string()), name).empty());
        CHECK_FALSE(name.has_value());
        REQUIRE(into(&context, types::StringType(), wire::Value::makeString("new"), name).empty());
        CHECK_EQ(name, std::optional<std::string>("new"));
        CHECK(into(&context, types::StringType(), wire::Value::unknown(wire::Type::string()), name).hasError());
    }
    SUBCASE("null collections") {
        std::vector<std::string> names{"kept"};
        auto null = wire::Value::null(wire::Type::list(wire::Type::string()));
        auto diagnostics = into(&context, types::ListType(stringType), null, names);
        CHECK(detailContains(diagnostics, "Received null value"));
        CHECK_EQ(names.size(), 1);

        Options options;
        options.unhandledNullAsEmpty = true;
        Context lenient(options);
        REQUIRE(into(&lenient, types::ListType(stringType), null, names).empty());
        CHECK(names.empty());
    }
}

TEST_CASE("into schema values") {
    Context context;

    SUBCASE("unknown values are kept") {
        types::StringValue value("old");
        REQUIRE(into(&context, types::StringType(), wire::Value::unknown(wire::Type::string()), value).empty());
        CHECK(value.isUnknown());
    }
    SUBCASE("null values are kept") {
        types::ListValue value;
        auto stringType = std::make_shared<types::StringType>();
        REQUIRE(into(&context, types::ListType(stringType), wire::Value::null(wire::Type::list(wire::Type::string())),
                     value)
                    .empty());
        CHECK(value.isNull());
        CHECK(value.elementType());
    }
    SUBCASE("schema builds a different value class") {
        types::Int64Value value;
        auto diagnostics = into(&context, types::NumberType(), wire::Value::makeNumber(3), value);
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "Cannot use a value of NumberType as schema value"));
    }
    SUBCASE("schema rejects the value") {
        types::Int64Value value;
        auto diagnostics = into(&context, types::Int64Type(), wire::Value::makeNumber(3.5), value);
        CHECK(detailContains(diagnostics, "value 3.5 is not an integer"));
    }
}

TEST_CASE("fromValue") {
    Context context;
    attr::ValuePtr result;

    SUBCASE("primitives") {
        REQUIRE(fromValue(&context, types::BoolType(), true, Path(), result).empty());
        CHECK(result->equal(types::BoolValue(true)));
        REQUIRE(fromValue(&context, types::Int64Type(), uint16_t(9), Path(), result).empty());
        CHECK(result->equal(types::Int64Value(9)));
        REQUIRE(fromValue(&context, types::NumberType(), 0.25, Path(), result).empty());
        CHECK(result->equal(types::NumberValue(0.25)));
        REQUIRE(fromValue(&context, types::StringType(), std::string("x"), Path(), result).empty());
        CHECK(result->equal(types::StringValue("x")));
    }
    SUBCASE("wrong schema kind") {
        auto diagnostics = fromValue(&context, types::BoolType(), std::string("x"), Path().atName("a"), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("a"));
        CHECK(detailContains(diagnostics, "can't build BoolType from a String value"));
        CHECK_FALSE(result);
    }
    SUBCASE("non-finite numbers") {
        auto diagnostics =
            fromValue(&context, types::NumberType(), std::numeric_limits<double>::quiet_NaN(), Path(), result);
        CHECK(detailContains(diagnostics, "can't encode the non-finite number"));
    }
    SUBCASE("validation hook") {
        PositiveNumberType type;
        auto diagnostics = fromValue(&context, type, -3, Path().atName("size"), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, "Not Positive");
        CHECK_EQ(diagnostics[0].path, Path().atName("size"));
        CHECK_FALSE(result);
        REQUIRE(fromValue(&context, type, 3, Path(), result).empty());
        CHECK(result->equal(types::NumberValue(3)));
    }
    SUBCASE("list and set") {
        auto numberType = std::make_shared<types::NumberType>();
        std::vector<int> numbers{3, 1, 2};
        REQUIRE(fromValue(&context, types::ListType(numberType), numbers, Path(), result).empty());
        CHECK_EQ(result->toString(), "[3,1,2]");
        REQUIRE(fromValue(&context, types::SetType(numberType), numbers, Path(), result).empty());
        CHECK(result->equal(types::SetValue(numberType, {std::make_shared<types::NumberValue>(1),
                                                         std::make_shared<types::NumberValue>(2),
                                                         std::make_shared<types::NumberValue>(3)})));
    }
    SUBCASE("duplicate set elements") {
        result = nullptr;
        std::vector<std::string> names{"a", "a"};
        auto diagnostics =
            fromValue(&context, types::SetType(std::make_shared<types::StringType>()), names, Path(), result);
        CHECK(detailContains(diagnostics, "duplicates"));
        CHECK_FALSE(result);
    }
    SUBCASE("element errors carry the index") {
        std::vector<std::string> names{"a", "b"};
        auto diagnostics = fromValue(&context, types::ListType(std::make_shared<types::BoolType>()), names,
                                     Path().atName("names"), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("names").atListIndex(0));
    }
    SUBCASE("map") {
        std::map<std::string, std::string> labels{{"env", "prod"}};
        REQUIRE(fromValue(&context, types::MapType(std::make_shared<types::StringType>()), labels, Path(), result)
                    .empty());
        CHECK_EQ(result->toString(), "{\"env\":\"prod\"}");
    }
    SUBCASE("optional") {
        std::optional<bool> flag;
        REQUIRE(fromValue(&context, types::BoolType(), flag, Path(), result).empty());
        CHECK(result->isNull());
        flag = false;
        REQUIRE(fromValue(&context, types::BoolType(), flag, Path(), result).empty());
        CHECK(result->equal(types::BoolValue(false)));
    }
    SUBCASE("schema values") {
        REQUIRE(fromValue(&context, types::StringType(), types::StringValue::unknown(), Path(), result).empty());
        CHECK(result->isUnknown());
        auto diagnostics = fromValue(&context, types::NumberType(), types::Int64Value(3), Path(), result);
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "Cannot use a value of Int64Type as schema value"));
    }
    SUBCASE("schema values go through the validation hook") {
        auto diagnostics = fromValue(&context, PositiveNumberType(), types::NumberValue(-1), Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, "Not Positive");
    }
    SUBCASE("records need an object schema type") {
        auto diagnostics = fromValue(&context, types::StringType(), Point{1, 2}, Path(), result);
        CHECK(detailContains(diagnostics, "can't encode record Point as StringType"));
        CHECK_FALSE(result);
    }
}

TEST_CASE("records nest in containers") {
    Context context;
    auto pointType = std::make_shared<types::ObjectType>(
        attr::AttributeTypes{{"x", std::make_shared<types::Int64Type>()}, {"y", std::make_shared<types::Int64Type>()}});
    types::ListType pathType(pointType);
    std::vector<Point> points{{1, 2}, {3, 4}};

    attr::ValuePtr result;
    REQUIRE(fromValue(&context, pathType, points, Path(), result).empty());
    wire::Value wireValue;
    std::string error;
    REQUIRE(result->toWireValue(&context, wireValue, error));
    CHECK_EQ(wireValue.getElements().size(), 2);

    std::vector<Point> decoded;
    REQUIRE(into(&context, pathType, wireValue, decoded).empty());
    REQUIRE_EQ(decoded.size(), 2);
    CHECK_EQ(decoded[1].x, 3);
    CHECK_EQ(decoded[1].y, 4);
}

} // namespace reflect
} // namespace attrmap
