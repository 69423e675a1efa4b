#include "attrmap/wire/Value.hpp"

#include "doctest/doctest.h"

#include <limits>

namespace attrmap { namespace wire {

TEST_CASE("Type basics") {
    SUBCASE("primitives") {
        CHECK(Type().is(TypeKind::kString));
        CHECK(Type::number().isPrimitive());
        CHECK_FALSE(Type::number().isCollection());
        CHECK_EQ(Type::boolean().toString(), "Bool");
    }
    SUBCASE("nested types") {
        auto type = Type::list(Type::map(Type::number()));
        CHECK(type.isCollection());
        CHECK_EQ(type.elementType(), Type::map(Type::number()));
        CHECK_EQ(type.toString(), "List[Map[Number]]");
        CHECK_NE(type, Type::set(Type::map(Type::number())));
    }
    SUBCASE("objects") {
        auto type = Type::object({{"name", Type::string()}, {"age", Type::number()}});
        CHECK_EQ(type.attributeTypes().size(), 2);
        CHECK_EQ(type.toString(), "Object[\"age\":Number, \"name\":String]");
        CHECK_EQ(type, Type::object({{"age", Type::number()}, {"name", Type::string()}}));
        CHECK_NE(type, Type::object({{"age", Type::number()}}));
    }
}

TEST_CASE("Value states") {
    SUBCASE("default value is a null string") {
        Value value;
        CHECK(value.isNull());
        CHECK(value.isKnown());
        CHECK(value.type().is(TypeKind::kString));
    }
    SUBCASE("unknown") {
        auto value = Value::unknown(Type::number());
        CHECK_FALSE(value.isKnown());
        CHECK_FALSE(value.isNull());
        CHECK_FALSE(value.isFullyKnown());
        CHECK_EQ(value.toString(), "Number<unknown>");
    }
    SUBCASE("nested unknown") {
        auto value = Value::makeList(Type::string(), {Value::makeString("a"), Value::unknown(Type::string())});
        CHECK(value.isKnown());
        CHECK_FALSE(value.isFullyKnown());
    }
    SUBCASE("null and unknown differ") {
        CHECK_NE(Value::null(Type::boolean()), Value::unknown(Type::boolean()));
        CHECK_EQ(Value::null(Type::boolean()), Value::null(Type::boolean()));
        CHECK_NE(Value::null(Type::boolean()), Value::null(Type::string()));
    }
}

TEST_CASE("Value equality") {
    SUBCASE("primitives") {
        CHECK_EQ(Value::makeString("Ana"), Value::makeString("Ana"));
        CHECK_NE(Value::makeString("Ana"), Value::makeString("Bo"));
        CHECK_EQ(Value::makeNumber(30), Value::makeNumber(30.0));
        CHECK_NE(Value::makeNumber(1), Value::makeBool(true));
    }
    SUBCASE("lists are ordered") {
        auto a = Value::makeList(Type::number(), {Value::makeNumber(1), Value::makeNumber(2)});
        auto b = Value::makeList(Type::number(), {Value::makeNumber(2), Value::makeNumber(1)});
        CHECK_NE(a, b);
    }
    SUBCASE("sets are not") {
        auto a = Value::makeSet(Type::number(), {Value::makeNumber(1), Value::makeNumber(2)});
        auto b = Value::makeSet(Type::number(), {Value::makeNumber(2), Value::makeNumber(1)});
        CHECK_EQ(a, b);
    }
    SUBCASE("objects") {
        AttributeTypeMap types{{"name", Type::string()}};
        CHECK_EQ(Value::makeObject(types, {{"name", Value::makeString("Ana")}}),
                 Value::makeObject(types, {{"name", Value::makeString("Ana")}}));
        CHECK_NE(Value::makeObject(types, {{"name", Value::makeString("Ana")}}),
                 Value::makeObject(types, {{"name", Value::null(Type::string())}}));
    }
}

TEST_CASE("Value validate") {
    SUBCASE("well formed values") {
        CHECK_EQ(Value::makeNumber(std::numeric_limits<double>::max()).validate(), "");
        CHECK_EQ(Value::makeMap(Type::boolean(), {}).validate(), "");
    }
    SUBCASE("mistyped list element") {
        auto value = Value::makeList(Type::string(), {Value::makeString("a"), Value::makeNumber(1)});
        CHECK_EQ(value.validate(), "value[1] has type Number, expected String");
    }
    SUBCASE("duplicate set element") {
        auto value = Value::makeSet(Type::string(), {Value::makeString("a"), Value::makeString("a")});
        CHECK_EQ(value.validate(), "value[1] duplicates value[0] in a set");
    }
    SUBCASE("object missing an attribute") {
        auto value = Value::makeObject({{"a", Type::string()}, {"b", Type::string()}}, {{"a", Value::makeString("")}});
        CHECK_EQ(value.validate(), "value is missing attribute \"b\"");
    }
    SUBCASE("object with an extra attribute") {
        auto value = Value::makeObject({}, {{"a", Value::makeString("")}});
        CHECK_EQ(value.validate(), "value has no attribute \"a\" in its type");
    }
    SUBCASE("nested mismatch") {
        auto value = Value::makeObject({{"tags", Type::map(Type::number())}},
                                       {{"tags", Value::makeMap(Type::number(), {{"k", Value::makeBool(true)}})}});
        CHECK_EQ(value.validate(), "value.tags[\"k\"] has type Bool, expected Number");
    }
}

TEST_CASE("Value toString") {
    CHECK_EQ(Value::makeString("Ana").toString(), "String<\"Ana\">");
    CHECK_EQ(Value::makeNumber(30).toString(), "Number<30>");
    CHECK_EQ(Value::makeBool(true).toString(), "Bool<true>");
    CHECK_EQ(Value::null(Type::list(Type::string())).toString(), "List[String]<null>");
    CHECK_EQ(Value::makeList(Type::boolean(), {Value::makeBool(false)}).toString(), "List[Bool]<Bool<false>>");
}

} // namespace wire
} // namespace attrmap
