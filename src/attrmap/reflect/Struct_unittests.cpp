#include "attrmap/reflect/Struct.hpp"

#include "attrmap/types/Collection.hpp"
#include "attrmap/types/Object.hpp"
#include "attrmap/types/Primitive.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace attrmap;

struct Person {
    std::string name;
    int64_t age;
};

void describeRecord(reflect::RecordBuilder<Person>& record) {
    record.named("Person").field("name", &Person::name).field("age", &Person::age);
}

struct Named {
    std::string name;
};

void describeRecord(reflect::RecordBuilder<Named>& record) {
    record.named("Named").field("name", &Named::name);
}

struct Note {
    std::string title;
    std::string cached;
};

void describeRecord(reflect::RecordBuilder<Note>& record) {
    record.named("Note").field("title", &Note::title).ignore(&Note::cached);
}

struct Account {
    std::string name;
    std::string secret;
};

void describeRecord(reflect::RecordBuilder<Account>& record) {
    record.named("Account").field("name", &Account::name);
}

struct Team {
    std::string name;
    std::vector<Person> members;
};

void describeRecord(reflect::RecordBuilder<Team>& record) {
    record.named("Team").field("name", &Team::name).field("members", &Team::members);
}

struct Location {
    std::string street;
    std::string city;
};

void describeRecord(reflect::RecordBuilder<Location>& record) {
    record.named("Location").field("street", &Location::street).field("city", &Location::city);
}

struct Shop {
    std::string name;
    Location location;
};

void describeRecord(reflect::RecordBuilder<Shop>& record) {
    record.named("Shop").field("name", &Shop::name).embed(&Shop::location);
}

struct MaybeAged {
    std::string name;
    std::optional<int64_t> age;
};

void describeRecord(reflect::RecordBuilder<MaybeAged>& record) {
    record.named("MaybeAged").field("name", &MaybeAged::name).field("age", &MaybeAged::age);
}

// Rejects objects with an empty "name" attribute.
class NamedObjectType : public types::ObjectType, public attr::TypeWithValidate {
public:
    explicit NamedObjectType(attr::AttributeTypes attributeTypes): types::ObjectType(std::move(attributeTypes)) {}
    virtual ~NamedObjectType() = default;

    Diagnostics validate(Context* /* context */, const wire::Value& value, const Path& path) const override {
        Diagnostics diagnostics;
        if (!value.isKnown() || value.isNull()) {
            return diagnostics;
        }
        auto name = value.getMap().find("name");
        if (name != value.getMap().end() && name->second.isKnown() && !name->second.isNull() &&
            name->second.getString().empty()) {
            diagnostics.addAttributeError(path.atName("name"), "Invalid Name", "Name must not be empty.");
        }
        return diagnostics;
    }

    attr::TypePtr withAttributeTypes(attr::AttributeTypes attributeTypes) const override {
        return std::make_shared<NamedObjectType>(std::move(attributeTypes));
    }
};

// Accepts nothing from the wire.
class ReadOnlyObjectType : public types::ObjectType {
public:
    explicit ReadOnlyObjectType(attr::AttributeTypes attributeTypes): types::ObjectType(std::move(attributeTypes)) {}
    virtual ~ReadOnlyObjectType() = default;

    attr::ValuePtr valueFromWire(Context* /* context */, const wire::Value& /* value */,
                                 std::string& error) const override {
        error = "objects of this type are read only";
        return nullptr;
    }

    attr::TypePtr withAttributeTypes(attr::AttributeTypes attributeTypes) const override {
        return std::make_shared<ReadOnlyObjectType>(std::move(attributeTypes));
    }
};

attr::AttributeTypes personAttributes() {
    return attr::AttributeTypes{{"name", std::make_shared<types::StringType>()},
                                {"age", std::make_shared<types::Int64Type>()}};
}

wire::AttributeTypeMap personWireTypes() {
    return wire::AttributeTypeMap{{"name", wire::Type::string()}, {"age", wire::Type::number()}};
}

wire::Value personObject(std::string name, double age) {
    return wire::Value::makeObject(personWireTypes(), {{"name", wire::Value::makeString(std::move(name))},
                                                       {"age", wire::Value::makeNumber(age)}});
}

bool detailContains(const Diagnostics& diagnostics, const std::string& text) {
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.detail.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace attrmap { namespace reflect {

TEST_CASE("decodeStruct") {
    Context context;
    types::ObjectType personType(personAttributes());

    SUBCASE("matching object") {
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, personObject("Ana", 30), person, Path());
        CHECK(diagnostics.empty());
        CHECK_EQ(person.name, "Ana");
        CHECK_EQ(person.age, 30);
    }
    SUBCASE("extra object attribute") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()},
                                {"extra", std::make_shared<types::StringType>()}});
        auto object = wire::Value::makeObject(
            {{"name", wire::Type::string()}, {"extra", wire::Type::string()}},
            {{"name", wire::Value::makeString("Ana")}, {"extra", wire::Value::makeString("x")}});
        Named named{"unchanged"};
        auto diagnostics = decodeStruct(&context, type, object, named, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, kValueConversionError);
        CHECK(detailContains(diagnostics,
                             "mismatch between struct and object: Object defines fields not found in struct: extra."));
        CHECK_EQ(named.name, "unchanged");
    }
    SUBCASE("missing object attribute") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()}});
        auto object = wire::Value::makeObject({{"name", wire::Type::string()}},
                                              {{"name", wire::Value::makeString("Ana")}});
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, type, object, person, Path().atName("owner"));
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("owner"));
        CHECK(detailContains(diagnostics,
                             "mismatch between struct and object: Struct defines fields not found in object: age."));
        CHECK_EQ(person.name, "Bo");
    }
    SUBCASE("ignored members are left alone") {
        types::ObjectType type({{"title", std::make_shared<types::StringType>()}});
        auto object = wire::Value::makeObject({{"title", wire::Type::string()}},
                                              {{"title", wire::Value::makeString("Groceries")}});
        Note note{"old", "cache"};
        REQUIRE(decodeStruct(&context, type, object, note, Path()).empty());
        CHECK_EQ(note.title, "Groceries");
        // The record is rebuilt from scratch, so ignored members are value-initialized.
        CHECK_EQ(note.cached, "");
    }
    SUBCASE("first failing field stops the conversion") {
        types::ObjectType teamType(
            {{"name", std::make_shared<types::StringType>()},
             {"members", std::make_shared<types::ListType>(std::make_shared<types::ObjectType>(personAttributes()))}});
        auto members = wire::Value::makeList(wire::Type::object(personWireTypes()),
                                             {personObject("Ana", 30), personObject("Bo", 1.5),
                                              personObject("Cy", 2.5)});
        auto object = wire::Value::makeObject(
            {{"name", wire::Type::string()}, {"members", wire::Type::list(wire::Type::object(personWireTypes()))}},
            {{"name", wire::Value::makeString("Core")}, {"members", members}});
        Team team;
        team.name = "before";
        auto diagnostics = decodeStruct(&context, teamType, object, team, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("members").atListIndex(1).atName("age"));
        CHECK(detailContains(diagnostics, "Cannot convert Number<1.5> into int64_t: value is not an integer"));
        CHECK_EQ(team.name, "before");
        CHECK(team.members.empty());
    }
    SUBCASE("embedded record fields are flattened") {
        types::ObjectType shopType({{"name", std::make_shared<types::StringType>()},
                                    {"street", std::make_shared<types::StringType>()},
                                    {"city", std::make_shared<types::StringType>()}});
        auto object = wire::Value::makeObject(
            {{"name", wire::Type::string()}, {"street", wire::Type::string()}, {"city", wire::Type::string()}},
            {{"name", wire::Value::makeString("Corner")},
             {"street", wire::Value::makeString("Main St")},
             {"city", wire::Value::makeString("Springfield")}});
        Shop shop;
        REQUIRE(decodeStruct(&context, shopType, object, shop, Path()).empty());
        CHECK_EQ(shop.name, "Corner");
        CHECK_EQ(shop.location.street, "Main St");
        CHECK_EQ(shop.location.city, "Springfield");
    }
    SUBCASE("non-object value") {
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, wire::Value::makeString("Ana"), person, Path());
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "can't decode a record from a non-object value"));
    }
    SUBCASE("schema type without attributes") {
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, types::StringType(), personObject("Ana", 30), person, Path());
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "schema type StringType does not describe the types of its attributes"));
    }
    SUBCASE("object attributes that differ from its own type") {
        auto object = wire::Value::makeObject(
            {{"name", wire::Type::string()}},
            {{"name", wire::Value::makeString("Ana")}, {"age", wire::Value::makeNumber(30)}});
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, object, person, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, kValueConversionError);
        CHECK(detailContains(diagnostics, "value has no attribute \"age\" in its type"));
        CHECK_EQ(person.name, "Bo");
        CHECK_EQ(person.age, 5);
    }
    SUBCASE("unknown object") {
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, wire::Value::unknown(wire::Type::object(personWireTypes())),
                                        person, Path());
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "can't read the attributes of an unknown Object"));
    }
    SUBCASE("null object has no attributes") {
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, wire::Value::null(wire::Type::object(personWireTypes())),
                                        person, Path());
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "Struct defines fields not found in object: age, name."));
    }
    SUBCASE("missing attribute type") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()}, {"age", nullptr}});
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, type, personObject("Ana", 30), person, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("age"));
        CHECK(detailContains(diagnostics, "Could not find type information for attribute"));
        CHECK_EQ(person.name, "Bo");
    }
}

TEST_CASE("decodeStruct null and unknown attributes") {
    types::ObjectType personType(personAttributes());
    auto nullAge = wire::Value::makeObject(personWireTypes(), {{"name", wire::Value::makeString("Ana")},
                                                               {"age", wire::Value::null(wire::Type::number())}});
    auto unknownAge = wire::Value::makeObject(personWireTypes(),
                                              {{"name", wire::Value::makeString("Ana")},
                                               {"age", wire::Value::unknown(wire::Type::number())}});

    SUBCASE("null is an error by default") {
        Context context;
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, nullAge, person, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("age"));
        CHECK(detailContains(diagnostics, "Received null value"));
    }
    SUBCASE("null as empty") {
        Options options;
        options.unhandledNullAsEmpty = true;
        Context context(options);
        Person person{"Bo", 5};
        REQUIRE(decodeStruct(&context, personType, nullAge, person, Path()).empty());
        CHECK_EQ(person.name, "Ana");
        CHECK_EQ(person.age, 0);
    }
    SUBCASE("unknown is an error by default") {
        Context context;
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, unknownAge, person, Path());
        REQUIRE(diagnostics.hasError());
        CHECK(detailContains(diagnostics, "Received unknown value"));
    }
    SUBCASE("unknown as empty") {
        Options options;
        options.unhandledUnknownAsEmpty = true;
        Context context(options);
        Person person{"Bo", 5};
        REQUIRE(decodeStruct(&context, personType, unknownAge, person, Path()).empty());
        CHECK_EQ(person.age, 0);
    }
    SUBCASE("optional fields take null") {
        Context context;
        MaybeAged person{"Bo", 5};
        REQUIRE(decodeStruct(&context, personType, nullAge, person, Path()).empty());
        CHECK_EQ(person.name, "Ana");
        CHECK_FALSE(person.age.has_value());
    }
}

TEST_CASE("encodeStruct") {
    Context context;
    types::ObjectType personType(personAttributes());

    SUBCASE("matching attributes") {
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, personType, Person{"Ana", 30}, Path(), result);
        REQUIRE(diagnostics.empty());
        auto object = std::dynamic_pointer_cast<const types::ObjectValue>(result);
        REQUIRE(object);
        CHECK(object->type(&context)->equal(personType));
        wire::Value wireValue;
        std::string error;
        REQUIRE(object->toWireValue(&context, wireValue, error));
        CHECK_EQ(wireValue, personObject("Ana", 30));
    }
    SUBCASE("decoding the encoded value gives back the record") {
        attr::ValuePtr result;
        REQUIRE(encodeStruct(&context, personType, Person{"Ana", 30}, Path(), result).empty());
        wire::Value wireValue;
        std::string error;
        REQUIRE(result->toWireValue(&context, wireValue, error));
        Person person{"", 0};
        REQUIRE(decodeStruct(&context, personType, wireValue, person, Path()).empty());
        CHECK_EQ(person.name, "Ana");
        CHECK_EQ(person.age, 30);
    }
    SUBCASE("record field missing from the attributes") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()}});
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Person{"Ana", 30}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK(detailContains(
            diagnostics, "mismatch between struct and attributes: Struct defines fields not found in attributes: age."));
        CHECK_FALSE(result);
    }
    SUBCASE("attribute missing from the record") {
        auto attributes = personAttributes();
        attributes.emplace("extra", std::make_shared<types::BoolType>());
        types::ObjectType type(attributes);
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Person{"Ana", 30}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK(detailContains(diagnostics, "Attributes define fields not found in struct: extra."));
        CHECK_FALSE(result);
    }
    SUBCASE("members missing from the record description") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()}});
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Account{"a", "hunter2"}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, kValueConversionError);
        CHECK(detailContains(diagnostics, "need a name tag or ignore() on every member"));
        CHECK_FALSE(result);
    }
    SUBCASE("ignored members are not encoded") {
        types::ObjectType type({{"title", std::make_shared<types::StringType>()}});
        attr::ValuePtr result;
        REQUIRE(encodeStruct(&context, type, Note{"Groceries", "cache"}, Path(), result).empty());
        auto object = std::dynamic_pointer_cast<const types::ObjectValue>(result);
        REQUIRE(object);
        CHECK_EQ(object->attributes().size(), 1);
        CHECK_EQ(object->toString(), "{\"title\":\"Groceries\"}");
    }
    SUBCASE("embedded record fields are flattened") {
        types::ObjectType shopType({{"name", std::make_shared<types::StringType>()},
                                    {"street", std::make_shared<types::StringType>()},
                                    {"city", std::make_shared<types::StringType>()}});
        Shop shop{"Corner", {"Main St", "Springfield"}};
        attr::ValuePtr result;
        REQUIRE(encodeStruct(&context, shopType, shop, Path(), result).empty());
        CHECK_EQ(result->toString(), "{\"city\":\"Springfield\",\"name\":\"Corner\",\"street\":\"Main St\"}");
    }
    SUBCASE("first failing field stops the conversion") {
        types::ObjectType teamType(
            {{"name", std::make_shared<types::StringType>()},
             {"members", std::make_shared<types::ListType>(std::make_shared<types::ObjectType>(
                             attr::AttributeTypes{{"name", std::make_shared<types::StringType>()}}))}});
        Team team{"Core", {Person{"Ana", 30}, Person{"Bo", 31}}};
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, teamType, team, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("members").atListIndex(0));
        CHECK_FALSE(result);
    }
    SUBCASE("validation hook") {
        NamedObjectType type(personAttributes());
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Person{"", 30}, Path().atName("owner"), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, "Invalid Name");
        CHECK_EQ(diagnostics[0].path, Path().atName("owner").atName("name"));
        CHECK_FALSE(result);

        REQUIRE(encodeStruct(&context, type, Person{"Ana", 30}, Path(), result).empty());
        REQUIRE(result);
        CHECK(result->type(&context)->equal(types::ObjectType(personAttributes())));
    }
    SUBCASE("reconstruction failure") {
        ReadOnlyObjectType type(personAttributes());
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Person{"Ana", 30}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, kValueConversionError);
        CHECK(detailContains(diagnostics, "objects of this type are read only"));
        CHECK_FALSE(result);
    }
    SUBCASE("missing attribute type") {
        types::ObjectType type({{"name", std::make_shared<types::StringType>()}, {"age", nullptr}});
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, type, Person{"Ana", 30}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].path, Path().atName("age"));
        CHECK_FALSE(result);
    }
    SUBCASE("empty optional encodes as null") {
        attr::ValuePtr result;
        REQUIRE(encodeStruct(&context, personType, MaybeAged{"Ana", std::nullopt}, Path(), result).empty());
        auto object = std::dynamic_pointer_cast<const types::ObjectValue>(result);
        REQUIRE(object);
        REQUIRE(object->attribute("age"));
        CHECK(object->attribute("age")->isNull());
    }
}

TEST_CASE("struct conversions stop when cancelled") {
    types::ObjectType personType(personAttributes());

    SUBCASE("decode") {
        Context context;
        context.cancel();
        Person person{"Bo", 5};
        auto diagnostics = decodeStruct(&context, personType, personObject("Ana", 30), person, Path());
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, "Conversion Cancelled");
        CHECK_EQ(diagnostics[0].path, Path().atName("name"));
        CHECK(detailContains(diagnostics, "context canceled"));
        CHECK_EQ(person.name, "Bo");
    }
    SUBCASE("encode") {
        Context context;
        context.setDeadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
        attr::ValuePtr result;
        auto diagnostics = encodeStruct(&context, personType, Person{"Ana", 30}, Path(), result);
        REQUIRE_EQ(diagnostics.size(), 1);
        CHECK_EQ(diagnostics[0].summary, "Conversion Cancelled");
        CHECK(detailContains(diagnostics, "context deadline exceeded"));
        CHECK_FALSE(result);
    }
}

TEST_CASE("struct conversions are depth limited") {
    Options options;
    options.maxDepth = 1;
    Context context(options);
    types::ObjectType teamType(
        {{"name", std::make_shared<types::StringType>()},
         {"members", std::make_shared<types::ListType>(std::make_shared<types::ObjectType>(personAttributes()))}});
    auto object = wire::Value::makeObject(
        {{"name", wire::Type::string()}, {"members", wire::Type::list(wire::Type::object(personWireTypes()))}},
        {{"name", wire::Value::makeString("Core")},
         {"members", wire::Value::makeList(wire::Type::object(personWireTypes()), {personObject("Ana", 30)})}});

    Team team;
    auto diagnostics = decodeStruct(&context, teamType, object, team, Path());
    REQUIRE_EQ(diagnostics.size(), 1);
    CHECK_EQ(diagnostics[0].path, Path().atName("members").atListIndex(0));
    CHECK(detailContains(diagnostics, "nested more than the maximum of 1 levels"));

    attr::ValuePtr result;
    diagnostics = encodeStruct(&context, teamType, Team{"Core", {Person{"Ana", 30}}}, Path(), result);
    REQUIRE(diagnostics.hasError());
    CHECK(detailContains(diagnostics, "nested more than the maximum of 1 levels"));
    CHECK_FALSE(result);
}

} // namespace reflect
} // namespace attrmap
