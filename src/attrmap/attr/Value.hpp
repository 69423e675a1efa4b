#ifndef SRC_ATTRMAP_ATTR_VALUE_HPP_
#define SRC_ATTRMAP_ATTR_VALUE_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/wire/Value.hpp"

#include <string>

namespace attrmap {

class Context;

namespace attr {

// A schema-level value, the typed counterpart of a wire::Value.
class Value {
public:
    virtual ~Value() = default;

    virtual TypePtr type(Context* context) const = 0;

    // Produces the canonical wire form of this Value. Returns false and fills |error| on failure.
    virtual bool toWireValue(Context* context, wire::Value& value, std::string& error) const = 0;

    virtual bool equal(const Value& other) const = 0;
    virtual bool isNull() const = 0;
    virtual bool isUnknown() const = 0;
    virtual std::string toString() const = 0;
};

} // namespace attr
} // namespace attrmap

#endif // SRC_ATTRMAP_ATTR_VALUE_HPP_
