#ifndef SRC_ATTRMAP_ATTR_TYPE_HPP_
#define SRC_ATTRMAP_ATTR_TYPE_HPP_

#include "attrmap/Diagnostics.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/wire/Type.hpp"
#include "attrmap/wire/Value.hpp"

#include <map>
#include <memory>
#include <string>

namespace attrmap {

class Context;

namespace attr {

class Type;
class Value;
using TypePtr = std::shared_ptr<const Type>;
using ValuePtr = std::shared_ptr<const Value>;
using AttributeTypes = std::map<std::string, TypePtr>;

// A schema-level type. Each Type knows its canonical wire::Type and how to build its own Value objects out of wire
// Values. Types are immutable and may be shared between threads.
class Type {
public:
    virtual ~Type() = default;

    virtual wire::Type wireType(Context* context) const = 0;

    // Builds a Value of this Type from |value|. Returns nullptr and fills |error| if |value| does not fit this Type.
    virtual ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const = 0;

    virtual bool equal(const Type& other) const = 0;
    virtual std::string toString() const = 0;
};

// Types describing Objects expose the Types of their attributes. This is the attribute type directory used by the
// struct conversions.
class TypeWithAttributeTypes : public Type {
public:
    virtual ~TypeWithAttributeTypes() = default;

    virtual AttributeTypes attributeTypes() const = 0;
    // Returns a Type of the same kind as this one, with the supplied attribute types.
    virtual TypePtr withAttributeTypes(AttributeTypes attributeTypes) const = 0;
};

// Types describing Lists, Sets and Maps expose the Type of their elements.
class TypeWithElementType : public Type {
public:
    virtual ~TypeWithElementType() = default;

    virtual TypePtr elementType() const = 0;
    virtual TypePtr withElementType(TypePtr elementType) const = 0;
};

// Optional capability. Types implementing this get a chance to reject a wire Value, with diagnostics at |path|,
// before a Value of theirs is built from it during encoding.
class TypeWithValidate {
public:
    virtual ~TypeWithValidate() = default;

    virtual Diagnostics validate(Context* context, const wire::Value& value, const Path& path) const = 0;
};

} // namespace attr
} // namespace attrmap

#endif // SRC_ATTRMAP_ATTR_TYPE_HPP_
