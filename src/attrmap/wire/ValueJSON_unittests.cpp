#include "attrmap/wire/ValueJSON.hpp"

#include "doctest/doctest.h"

#include <limits>
#include <string>

namespace attrmap { namespace wire {

TEST_CASE("parseTypeJSON") {
    std::string error;
    SUBCASE("primitives") {
        Type type;
        REQUIRE(parseTypeJSON("\"number\"", type, error));
        CHECK_EQ(type, Type::number());
        REQUIRE(parseTypeJSON("\"bool\"", type, error));
        CHECK_EQ(type, Type::boolean());
    }
    SUBCASE("nested") {
        Type type;
        REQUIRE(parseTypeJSON(R"(["object", {"name": "string", "tags": ["set", "string"], "scores": ["map", "number"]}])",
                              type, error));
        CHECK_EQ(type,
                 Type::object({{"name", Type::string()},
                               {"tags", Type::set(Type::string())},
                               {"scores", Type::map(Type::number())}}));
    }
    SUBCASE("errors") {
        Type type;
        CHECK_FALSE(parseTypeJSON("\"integer\"", type, error));
        CHECK_EQ(error, "unknown primitive type \"integer\"");
        CHECK_FALSE(parseTypeJSON(R"(["tuple", "string"])", type, error));
        CHECK_EQ(error, "unknown collection type \"tuple\"");
        CHECK_FALSE(parseTypeJSON(R"(["list"])", type, error));
        CHECK_FALSE(parseTypeJSON("{", type, error));
        CHECK_FALSE(error.empty());
    }
    SUBCASE("repeated attribute name") {
        Type type;
        CHECK_FALSE(parseTypeJSON(R"(["object", {"name": "string", "name": "number"}])", type, error));
        CHECK_EQ(error, "object type has more than one attribute named \"name\"");
    }
    SUBCASE("nesting limit") {
        std::string shallow = "\"string\"";
        for (size_t i = 0; i < kMaxJSONDepth; ++i) {
            shallow = "[\"list\", " + shallow + "]";
        }
        Type type;
        CHECK(parseTypeJSON(shallow, type, error));
        std::string deep = "[\"list\", " + shallow + "]";
        CHECK_FALSE(parseTypeJSON(deep, type, error));
        CHECK_EQ(error, "type nesting is deeper than 64 levels");
    }
}

TEST_CASE("parseValueJSON") {
    std::string error;
    auto personType = Type::object({{"name", Type::string()}, {"age", Type::number()}});
    SUBCASE("object") {
        Value value;
        REQUIRE(parseValueJSON(R"({"name": "Ana", "age": 30})", personType, value, error));
        CHECK_EQ(value, Value::makeObject(personType.attributeTypes(),
                                          {{"name", Value::makeString("Ana")}, {"age", Value::makeNumber(30)}}));
    }
    SUBCASE("missing attributes are null") {
        Value value;
        REQUIRE(parseValueJSON(R"({"name": "Ana"})", personType, value, error));
        CHECK(value.getMap().at("age").isNull());
        CHECK_EQ(value.validate(), "");
    }
    SUBCASE("null at the root") {
        Value value;
        REQUIRE(parseValueJSON("null", personType, value, error));
        CHECK(value.isNull());
        CHECK_EQ(value.type(), personType);
    }
    SUBCASE("unsupported attribute") {
        Value value;
        CHECK_FALSE(parseValueJSON(R"({"name": "Ana", "extra": 1})", personType, value, error));
        CHECK_EQ(error, "value: unsupported attribute \"extra\"");
    }
    SUBCASE("wrong kind") {
        Value value;
        CHECK_FALSE(parseValueJSON(R"({"name": 5})", personType, value, error));
        CHECK_EQ(error, "value.name: expected a JSON string");
    }
    SUBCASE("duplicate set elements") {
        Value value;
        CHECK_FALSE(parseValueJSON(R"(["a", "b", "a"])", Type::set(Type::string()), value, error));
        CHECK_EQ(error, "value[2] duplicates value[0] in a set");
    }
    SUBCASE("repeated attribute") {
        Value value;
        CHECK_FALSE(parseValueJSON(R"({"name": "Ana", "name": "Bo"})", personType, value, error));
        CHECK_EQ(error, "value.name: duplicate attribute");
    }
    SUBCASE("repeated map key") {
        Value value;
        CHECK_FALSE(parseValueJSON(R"({"a": 1, "a": 2})", Type::map(Type::number()), value, error));
        CHECK_EQ(error, "value[\"a\"]: duplicate map key");
    }
    SUBCASE("nesting limit") {
        Type type = Type::number();
        std::string json = "1";
        for (size_t i = 0; i <= kMaxJSONDepth; ++i) {
            type = Type::list(type);
            json = "[" + json + "]";
        }
        Value value;
        CHECK_FALSE(parseValueJSON(json, type, value, error));
        CHECK(error.find("nesting is deeper than 64 levels") != std::string::npos);
    }
}

TEST_CASE("ValueDumpJSON") {
    ValueDumpJSON dump;
    SUBCASE("object") {
        auto value = Value::makeObject({{"name", Type::string()}, {"age", Type::number()}, {"ok", Type::boolean()}},
                                       {{"name", Value::makeString("Ana")},
                                        {"age", Value::makeNumber(30)},
                                        {"ok", Value::null(Type::boolean())}});
        REQUIRE(dump.dump(value, false));
        CHECK_EQ(dump.json(), R"({"age":30,"name":"Ana","ok":null})");
    }
    SUBCASE("fractional numbers") {
        REQUIRE(dump.dump(Value::makeList(Type::number(), {Value::makeNumber(1.5), Value::makeNumber(-2)}), false));
        CHECK_EQ(dump.json(), "[1.5,-2]");
    }
    SUBCASE("unknown values fail") {
        auto value = Value::makeMap(Type::string(), {{"k", Value::unknown(Type::string())}});
        CHECK_FALSE(dump.dump(value, false));
        CHECK_EQ(dump.error(), "value[\"k\"]: unknown values have no JSON form");
    }
    SUBCASE("non-finite numbers fail") {
        CHECK_FALSE(dump.dump(Value::makeNumber(std::numeric_limits<double>::infinity()), false));
        CHECK_FALSE(dump.error().empty());
    }
    SUBCASE("types") {
        REQUIRE(dump.dumpType(Type::object({{"tags", Type::list(Type::string())}}), false));
        CHECK_EQ(dump.json(), R"(["object",{"tags":["list","string"]}])");
    }
    SUBCASE("dumps parse back") {
        auto type = Type::map(Type::set(Type::number()));
        std::string error;
        Value value;
        REQUIRE(parseValueJSON(R"({"a": [1, 2], "b": []})", type, value, error));
        REQUIRE(dump.dump(value, false));
        Value reparsed;
        REQUIRE(parseValueJSON(dump.json(), type, reparsed, error));
        CHECK_EQ(reparsed, value);
    }
}

} // namespace wire
} // namespace attrmap
