#ifndef SRC_ATTRMAP_WIRE_VALUE_HPP_
#define SRC_ATTRMAP_WIRE_VALUE_HPP_

#include "attrmap/wire/Type.hpp"

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace attrmap { namespace wire {

class Value;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

// The canonical, self-describing form of a value as exchanged with the configuration system. Every Value is tagged
// with its Type and is either null, unknown (not yet determined), or known. Values are immutable, copies share their
// nested elements.
class Value {
public:
    // A null String.
    Value();
    Value(const Value&) = default;
    Value& operator=(const Value&) = default;
    ~Value() = default;

    static Value null(const Type& type);
    static Value unknown(const Type& type);

    static Value makeString(std::string s);
    static Value makeNumber(double d);
    static Value makeBool(bool b);
    static Value makeList(const Type& elementType, ValueList elements);
    static Value makeSet(const Type& elementType, ValueList elements);
    static Value makeMap(const Type& elementType, ValueMap elements);
    static Value makeObject(AttributeTypeMap attributeTypes, ValueMap attributes);

    const Type& type() const { return m_type; }
    bool isNull() const { return m_state == kNull; }
    bool isKnown() const { return m_state != kUnknown; }
    // True if neither this value nor any value nested in it is unknown.
    bool isFullyKnown() const;

    // Accessors for known values, the type must match.
    const std::string& getString() const;
    double getNumber() const;
    bool getBool() const;
    // List and Set elements.
    const ValueList& getElements() const;
    // Map elements and Object attributes.
    const ValueMap& getMap() const;

    // Checks recursively that the contents of this Value match its Type. Returns an empty string if they do, otherwise
    // a description of the first mismatch found. Set elements must also be unique.
    std::string validate() const;

    // Deep equality, set elements compare without regard to order.
    bool operator==(const Value& v) const;
    bool operator!=(const Value& v) const { return !(*this == v); }

    // e.g. "String<\"Ana\">", "Number<null>", "List[Bool]<Bool<true>>".
    std::string toString() const;

private:
    enum State { kNull, kUnknown, kKnown };
    using Payload = std::variant<std::monostate, bool, double, std::string, std::shared_ptr<const ValueList>,
                                 std::shared_ptr<const ValueMap>>;

    Value(Type type, State state, Payload payload);

    std::string validateAt(const std::string& where) const;

    Type m_type;
    State m_state;
    Payload m_payload;
};

} // namespace wire
} // namespace attrmap

#endif // SRC_ATTRMAP_WIRE_VALUE_HPP_
