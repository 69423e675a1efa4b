#ifndef SRC_ATTRMAP_TYPES_OBJECT_HPP_
#define SRC_ATTRMAP_TYPES_OBJECT_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/attr/Value.hpp"
#include "attrmap/types/Primitive.hpp"

#include <map>
#include <string>

namespace attrmap { namespace types {

// An Object with a fixed set of named attributes, each with its own Type.
class ObjectType : public attr::TypeWithAttributeTypes {
public:
    ObjectType() = default;
    explicit ObjectType(attr::AttributeTypes attributeTypes): m_attributeTypes(std::move(attributeTypes)) {}
    virtual ~ObjectType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override;

    attr::AttributeTypes attributeTypes() const override { return m_attributeTypes; }
    attr::TypePtr withAttributeTypes(attr::AttributeTypes attributeTypes) const override;

protected:
    attr::AttributeTypes m_attributeTypes;
};

class ObjectValue : public attr::Value {
public:
    ObjectValue(): m_state(ValueState::kNull) {}
    ObjectValue(attr::AttributeTypes attributeTypes, std::map<std::string, attr::ValuePtr> attributes):
        m_state(ValueState::kKnown),
        m_attributeTypes(std::move(attributeTypes)),
        m_attributes(std::move(attributes)) {}
    virtual ~ObjectValue() = default;

    static ObjectValue null(attr::AttributeTypes attributeTypes) {
        return ObjectValue(ValueState::kNull, std::move(attributeTypes));
    }
    static ObjectValue unknown(attr::AttributeTypes attributeTypes) {
        return ObjectValue(ValueState::kUnknown, std::move(attributeTypes));
    }

    const attr::AttributeTypes& attributeTypes() const { return m_attributeTypes; }
    const std::map<std::string, attr::ValuePtr>& attributes() const { return m_attributes; }
    // Returns nullptr if there is no attribute named |name|.
    attr::ValuePtr attribute(const std::string& name) const;

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    bool isNull() const override { return m_state == ValueState::kNull; }
    bool isUnknown() const override { return m_state == ValueState::kUnknown; }
    std::string toString() const override;

private:
    ObjectValue(ValueState state, attr::AttributeTypes attributeTypes):
        m_state(state), m_attributeTypes(std::move(attributeTypes)) {}

    ValueState m_state;
    attr::AttributeTypes m_attributeTypes;
    std::map<std::string, attr::ValuePtr> m_attributes;
};

// Builds the default schema Type for a wire Type, e.g. ListType[StringType] for List[String]. Numbers map to
// NumberType.
attr::TypePtr typeFromWireType(const wire::Type& type);

} // namespace types
} // namespace attrmap

#endif // SRC_ATTRMAP_TYPES_OBJECT_HPP_
