#include "attrmap/reflect/Convert.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace {

struct Address {
    std::string street;
    std::string city;
};

void describeRecord(attrmap::reflect::RecordBuilder<Address>& record) {
    record.named("Address").field("street", &Address::street).field("city", &Address::city);
}

struct Customer {
    std::string name;
    Address address;
    int64_t visits;
    std::string scratch;
};

void describeRecord(attrmap::reflect::RecordBuilder<Customer>& record) {
    record.named("Customer")
        .field("name", &Customer::name)
        .embed(&Customer::address)
        .field("visits", &Customer::visits)
        .ignore(&Customer::scratch);
}

struct Untagged {
    std::string a;
    std::string b;
};

void describeRecord(attrmap::reflect::RecordBuilder<Untagged>& record) {
    record.named("Untagged").field("a", &Untagged::a).field("", &Untagged::b);
}

struct Account {
    std::string name;
    std::string secret;
};

void describeRecord(attrmap::reflect::RecordBuilder<Account>& record) {
    record.named("Account").field("name", &Account::name);
}

struct Repeated {
    std::string a;
};

void describeRecord(attrmap::reflect::RecordBuilder<Repeated>& record) {
    record.named("Repeated").field("a", &Repeated::a).ignore(&Repeated::a);
}

struct BadName {
    std::string a;
};

void describeRecord(attrmap::reflect::RecordBuilder<BadName>& record) {
    record.named("BadName").field("Full Name", &BadName::a);
}

struct Shadowing {
    Address address;
    std::string city;
};

void describeRecord(attrmap::reflect::RecordBuilder<Shadowing>& record) {
    record.named("Shadowing").embed(&Shadowing::address).field("city", &Shadowing::city);
}

struct BrokenEmbed {
    BadName inner;
};

void describeRecord(attrmap::reflect::RecordBuilder<BrokenEmbed>& record) {
    record.named("BrokenEmbed").embed(&BrokenEmbed::inner);
}

struct Unnamed {
    bool flag;
};

void describeRecord(attrmap::reflect::RecordBuilder<Unnamed>& record) {
    record.field("flag", &Unnamed::flag);
}

} // namespace

namespace attrmap { namespace reflect {

static_assert(IsRecord<Address>::value, "records are detected");
static_assert(!IsRecord<std::string>::value, "strings are not records");
static_assert(!IsRecord<std::vector<Address>>::value, "containers of records are not records");

static_assert(memberCount<Address>() == 2, "string members are counted");
static_assert(memberCount<Customer>() == 4, "record members count once");
static_assert(memberCount<Unnamed>() == 1, "single member");

TEST_CASE("isValidFieldName") {
    CHECK(isValidFieldName("name"));
    CHECK(isValidFieldName("a1_b2"));
    CHECK(isValidFieldName("x"));
    CHECK_FALSE(isValidFieldName(""));
    CHECK_FALSE(isValidFieldName("_name"));
    CHECK_FALSE(isValidFieldName("1name"));
    CHECK_FALSE(isValidFieldName("Name"));
    CHECK_FALSE(isValidFieldName("first-name"));
    CHECK_FALSE(isValidFieldName("first name"));
}

TEST_CASE("typeFields") {
    std::string error;
    SUBCASE("declaration order") {
        RecordFields<Address> record;
        REQUIRE(typeFields(record, error));
        CHECK_EQ(record.recordName, "Address");
        CHECK_EQ(record.names(), (std::vector<std::string>{"street", "city"}));
        CHECK_EQ(record.fields[0].index, (std::vector<size_t>{0}));
        CHECK_EQ(record.fields[1].index, (std::vector<size_t>{1}));
    }
    SUBCASE("embedded fields are promoted in place") {
        RecordFields<Customer> record;
        REQUIRE(typeFields(record, error));
        REQUIRE_EQ(record.fields.size(), 4);
        CHECK_EQ(record.names(), (std::vector<std::string>{"name", "street", "city", "visits"}));
        CHECK_EQ(record.fields[1].index, (std::vector<size_t>{1, 0}));
        CHECK_EQ(record.fields[2].index, (std::vector<size_t>{1, 1}));
        CHECK_EQ(record.fields[3].index, (std::vector<size_t>{2}));
    }
    SUBCASE("untagged member") {
        RecordFields<Untagged> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK_EQ(error, "record Untagged: need a name tag on the member at position 1");
    }
    SUBCASE("unlisted member") {
        RecordFields<Account> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK_EQ(error, "record Account: need a name tag or ignore() on every member, 1 of 2 are listed");
        CHECK(record.fields.empty());
    }
    SUBCASE("member listed twice") {
        RecordFields<Repeated> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK_EQ(error, "record Repeated: need a name tag or ignore() on every member, 2 of 1 are listed");
    }
    SUBCASE("invalid name") {
        RecordFields<BadName> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK_EQ(error, "record BadName: invalid name tag \"Full Name\", must only use lowercase letters, underscores, "
                        "and numbers, and must start with a letter");
    }
    SUBCASE("embedded name collision") {
        RecordFields<Shadowing> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK_EQ(error, "record Shadowing: more than one field is named \"city\"");
    }
    SUBCASE("broken embedded record") {
        RecordFields<BrokenEmbed> record;
        CHECK_FALSE(typeFields(record, error));
        CHECK(error.find("record BrokenEmbed: embedded record at member 0: record BadName:") == 0);
    }
    SUBCASE("records without a display name still map") {
        RecordFields<Unnamed> record;
        REQUIRE(typeFields(record, error));
        CHECK_EQ(record.names(), (std::vector<std::string>{"flag"}));
        CHECK_FALSE(record.recordName.empty());
    }
}

} // namespace reflect
} // namespace attrmap
