#ifndef SRC_ATTRMAP_REFLECT_RECORD_HPP_
#define SRC_ATTRMAP_REFLECT_RECORD_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/Diagnostics.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/wire/Value.hpp"

#include "fmt/format.h"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

// Native records are plain structs that describe their members to the conversions with a free function found by
// argument-dependent lookup, declared in the record's own namespace:
//
//     struct Person {
//         std::string name;
//         int64_t age;
//         std::string cachedGreeting;
//     };
//
//     void describeRecord(attrmap::reflect::RecordBuilder<Person>& record) {
//         record.named("Person")
//             .field("name", &Person::name)
//             .field("age", &Person::age)
//             .ignore(&Person::cachedGreeting);
//     }
//
// Every member must be listed, either with its external name, with ignore(), or with embed() for a member that is
// itself a record whose fields are promoted into this one. Records must be aggregates without base classes or array
// members, and movable.
namespace attrmap {

class Context;

namespace reflect {

template <typename T> class RecordBuilder;

template <typename T, typename = void> struct IsRecord : std::false_type {};
template <typename T>
struct IsRecord<T, std::void_t<decltype(describeRecord(std::declval<RecordBuilder<T>&>()))>> : std::true_type {};

// The per-type conversion dispatch, defined in Convert.hpp.
template <typename T>
Diagnostics buildValue(Context* context, const attr::Type& type, const wire::Value& value, T& target,
                       const Path& path);
template <typename T>
Diagnostics fromValue(Context* context, const attr::Type& type, const T& value, const Path& path,
                      attr::ValuePtr& result);

// Converts to any member type, so that T{AnyMember{0}, ..., AnyMember{N - 1}} compiles exactly when aggregate T has
// at least N members.
struct AnyMember {
    size_t position;
    template <typename U> operator U() const;
};

template <typename T, size_t... I>
constexpr auto bracesFit(std::index_sequence<I...>, int) -> decltype(void(T{AnyMember{I}...}), true) {
    return true;
}
template <typename T, size_t... I> constexpr bool bracesFit(std::index_sequence<I...>, long) { return false; }

// Number of members declared by aggregate T.
template <typename T, size_t N = 0> constexpr size_t memberCount() {
    if constexpr (bracesFit<T>(std::make_index_sequence<N + 1>{}, 0)) {
        return memberCount<T, N + 1>();
    } else {
        return N;
    }
}

// Type-erased read and write access to one field of a record of type T.
template <typename T> class FieldAccess {
public:
    virtual ~FieldAccess() = default;

    virtual Diagnostics decode(Context* context, const attr::Type& type, const wire::Value& value, T& record,
                               const Path& path) const = 0;
    virtual Diagnostics encode(Context* context, const attr::Type& type, const T& record, const Path& path,
                               attr::ValuePtr& result) const = 0;
};

template <typename T, typename M> class MemberAccess : public FieldAccess<T> {
public:
    explicit MemberAccess(M T::*member): m_member(member) {}
    virtual ~MemberAccess() = default;

    Diagnostics decode(Context* context, const attr::Type& type, const wire::Value& value, T& record,
                       const Path& path) const override {
        return buildValue(context, type, value, record.*m_member, path);
    }
    Diagnostics encode(Context* context, const attr::Type& type, const T& record, const Path& path,
                       attr::ValuePtr& result) const override {
        return fromValue(context, type, record.*m_member, path, result);
    }

private:
    M T::*m_member;
};

// Reaches a field of the embedded record E through the member of T that holds it.
template <typename T, typename E> class EmbeddedAccess : public FieldAccess<T> {
public:
    EmbeddedAccess(E T::*member, std::shared_ptr<const FieldAccess<E>> inner):
        m_member(member), m_inner(std::move(inner)) {}
    virtual ~EmbeddedAccess() = default;

    Diagnostics decode(Context* context, const attr::Type& type, const wire::Value& value, T& record,
                       const Path& path) const override {
        return m_inner->decode(context, type, value, record.*m_member, path);
    }
    Diagnostics encode(Context* context, const attr::Type& type, const T& record, const Path& path,
                       attr::ValuePtr& result) const override {
        return m_inner->encode(context, type, record.*m_member, path, result);
    }

private:
    E T::*m_member;
    std::shared_ptr<const FieldAccess<E>> m_inner;
};

template <typename T> struct FieldDescriptor {
    // External name, matched against attribute names.
    std::string name;
    // Position of the member within its record, preceded by the positions of the embedding members, if any.
    std::vector<size_t> index;
    std::shared_ptr<const FieldAccess<T>> access;
};

template <typename T> struct RecordFields {
    std::string recordName;
    std::vector<FieldDescriptor<T>> fields;

    std::vector<std::string> names() const {
        std::vector<std::string> fieldNames;
        fieldNames.reserve(fields.size());
        for (const auto& field : fields) {
            fieldNames.emplace_back(field.name);
        }
        return fieldNames;
    }
};

// Names must start with a lowercase letter, followed by lowercase letters, digits, and underscores.
bool isValidFieldName(std::string_view name);

template <typename T> bool typeFields(RecordFields<T>& record, std::string& error);

template <typename T> class RecordBuilder {
public:
    RecordBuilder(): m_name(typeid(T).name()), m_position(0) {}
    ~RecordBuilder() = default;

    // Sets the record name used in diagnostics.
    RecordBuilder& named(std::string name) {
        m_name = std::move(name);
        return *this;
    }

    template <typename M> RecordBuilder& field(std::string name, M T::*member) {
        m_fields.emplace_back(FieldDescriptor<T>{std::move(name), std::vector<size_t>{m_position},
                                                 std::make_shared<MemberAccess<T, M>>(member)});
        ++m_position;
        return *this;
    }

    // Marks |member| as not part of the schema.
    template <typename M> RecordBuilder& ignore(M T::* /* member */) {
        ++m_position;
        return *this;
    }

    template <typename E> RecordBuilder& embed(E T::*member) {
        static_assert(IsRecord<E>::value, "embedded members must be records with a describeRecord() function");
        RecordFields<E> embedded;
        std::string error;
        if (!typeFields<E>(embedded, error)) {
            m_errors.emplace_back(fmt::format("embedded record at member {}: {}", m_position, error));
        } else {
            for (auto& field : embedded.fields) {
                std::vector<size_t> index{m_position};
                index.insert(index.end(), field.index.begin(), field.index.end());
                m_fields.emplace_back(FieldDescriptor<T>{
                    std::move(field.name), std::move(index),
                    std::make_shared<EmbeddedAccess<T, E>>(member, std::move(field.access))});
            }
        }
        ++m_position;
        return *this;
    }

    const std::string& name() const { return m_name; }

    // Checks the description and produces the field list. Returns false and fills |error| if a member is not listed
    // or listed twice, a field is untagged, has an invalid name, or shares its name with another field.
    bool build(RecordFields<T>& record, std::string& error) const {
        if (!m_errors.empty()) {
            error = fmt::format("record {}: {}", m_name, m_errors.front());
            return false;
        }
        constexpr size_t kMemberCount = memberCount<T>();
        if (m_position != kMemberCount) {
            error = fmt::format("record {}: need a name tag or ignore() on every member, {} of {} are listed", m_name,
                                m_position, kMemberCount);
            return false;
        }
        std::set<std::string> names;
        for (const auto& field : m_fields) {
            if (field.name.empty()) {
                error = fmt::format("record {}: need a name tag on the member at position {}", m_name,
                                    field.index.front());
                return false;
            }
            if (!isValidFieldName(field.name)) {
                error = fmt::format("record {}: invalid name tag \"{}\", must only use lowercase letters, "
                                    "underscores, and numbers, and must start with a letter",
                                    m_name, field.name);
                return false;
            }
            if (!names.insert(field.name).second) {
                error = fmt::format("record {}: more than one field is named \"{}\"", m_name, field.name);
                return false;
            }
        }
        record.recordName = m_name;
        record.fields = m_fields;
        return true;
    }

private:
    std::string m_name;
    size_t m_position;
    std::vector<FieldDescriptor<T>> m_fields;
    std::vector<std::string> m_errors;
};

// The Field Mapper. Describes record type T as its list of fields in declaration order, with the fields of embedded
// records promoted in place of the embedding member. Computed anew on every call.
template <typename T> bool typeFields(RecordFields<T>& record, std::string& error) {
    static_assert(IsRecord<T>::value, "records need a describeRecord() function");
    static_assert(std::is_aggregate_v<T>, "records must be aggregates");
    RecordBuilder<T> builder;
    describeRecord(builder);
    return builder.build(record, error);
}

template <typename T> std::string recordName() {
    RecordBuilder<T> builder;
    describeRecord(builder);
    return builder.name();
}

} // namespace reflect
} // namespace attrmap

#endif // SRC_ATTRMAP_REFLECT_RECORD_HPP_
