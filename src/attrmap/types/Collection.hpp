#ifndef SRC_ATTRMAP_TYPES_COLLECTION_HPP_
#define SRC_ATTRMAP_TYPES_COLLECTION_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/attr/Value.hpp"
#include "attrmap/types/Primitive.hpp"

#include <map>
#include <string>
#include <vector>

namespace attrmap { namespace types {

// The element type must be set before wireType() is called.
class ListType : public attr::TypeWithElementType {
public:
    ListType() = delete;
    explicit ListType(attr::TypePtr elementType): m_elementType(std::move(elementType)) {}
    virtual ~ListType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override;

    attr::TypePtr elementType() const override { return m_elementType; }
    attr::TypePtr withElementType(attr::TypePtr elementType) const override;

private:
    attr::TypePtr m_elementType;
};

// Like ListType, but element order carries no meaning and elements must be unique.
class SetType : public attr::TypeWithElementType {
public:
    SetType() = delete;
    explicit SetType(attr::TypePtr elementType): m_elementType(std::move(elementType)) {}
    virtual ~SetType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override;

    attr::TypePtr elementType() const override { return m_elementType; }
    attr::TypePtr withElementType(attr::TypePtr elementType) const override;

private:
    attr::TypePtr m_elementType;
};

class MapType : public attr::TypeWithElementType {
public:
    MapType() = delete;
    explicit MapType(attr::TypePtr elementType): m_elementType(std::move(elementType)) {}
    virtual ~MapType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override;

    attr::TypePtr elementType() const override { return m_elementType; }
    attr::TypePtr withElementType(attr::TypePtr elementType) const override;

private:
    attr::TypePtr m_elementType;
};

// Common storage for ListValue and SetValue. A default-constructed value is null and has no element type, so it can
// only be assigned to, not converted.
class ElementsValue : public attr::Value {
public:
    virtual ~ElementsValue() = default;

    bool isNull() const override { return m_state == ValueState::kNull; }
    bool isUnknown() const override { return m_state == ValueState::kUnknown; }

    const attr::TypePtr& elementType() const { return m_elementType; }
    const std::vector<attr::ValuePtr>& elements() const { return m_elements; }

protected:
    ElementsValue(): m_state(ValueState::kNull) {}
    ElementsValue(ValueState state, attr::TypePtr elementType, std::vector<attr::ValuePtr> elements):
        m_state(state), m_elementType(std::move(elementType)), m_elements(std::move(elements)) {}

    bool elementsToWire(Context* context, wire::ValueList& elements, std::string& error) const;
    bool equalElements(const ElementsValue& other) const;
    std::string elementsString() const;

    ValueState m_state;
    attr::TypePtr m_elementType;
    std::vector<attr::ValuePtr> m_elements;
};

class ListValue : public ElementsValue {
public:
    ListValue() = default;
    ListValue(attr::TypePtr elementType, std::vector<attr::ValuePtr> elements):
        ElementsValue(ValueState::kKnown, std::move(elementType), std::move(elements)) {}
    virtual ~ListValue() = default;

    static ListValue null(attr::TypePtr elementType) { return ListValue(ValueState::kNull, std::move(elementType)); }
    static ListValue unknown(attr::TypePtr elementType) {
        return ListValue(ValueState::kUnknown, std::move(elementType));
    }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override { return elementsString(); }

private:
    ListValue(ValueState state, attr::TypePtr elementType):
        ElementsValue(state, std::move(elementType), std::vector<attr::ValuePtr>()) {}
};

class SetValue : public ElementsValue {
public:
    SetValue() = default;
    SetValue(attr::TypePtr elementType, std::vector<attr::ValuePtr> elements):
        ElementsValue(ValueState::kKnown, std::move(elementType), std::move(elements)) {}
    virtual ~SetValue() = default;

    static SetValue null(attr::TypePtr elementType) { return SetValue(ValueState::kNull, std::move(elementType)); }
    static SetValue unknown(attr::TypePtr elementType) {
        return SetValue(ValueState::kUnknown, std::move(elementType));
    }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override { return elementsString(); }

private:
    SetValue(ValueState state, attr::TypePtr elementType):
        ElementsValue(state, std::move(elementType), std::vector<attr::ValuePtr>()) {}
};

class MapValue : public attr::Value {
public:
    MapValue(): m_state(ValueState::kNull) {}
    MapValue(attr::TypePtr elementType, std::map<std::string, attr::ValuePtr> elements):
        m_state(ValueState::kKnown), m_elementType(std::move(elementType)), m_elements(std::move(elements)) {}
    virtual ~MapValue() = default;

    static MapValue null(attr::TypePtr elementType) { return MapValue(ValueState::kNull, std::move(elementType)); }
    static MapValue unknown(attr::TypePtr elementType) {
        return MapValue(ValueState::kUnknown, std::move(elementType));
    }

    const attr::TypePtr& elementType() const { return m_elementType; }
    const std::map<std::string, attr::ValuePtr>& elements() const { return m_elements; }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    bool isNull() const override { return m_state == ValueState::kNull; }
    bool isUnknown() const override { return m_state == ValueState::kUnknown; }
    std::string toString() const override;

private:
    MapValue(ValueState state, attr::TypePtr elementType): m_state(state), m_elementType(std::move(elementType)) {}

    ValueState m_state;
    attr::TypePtr m_elementType;
    std::map<std::string, attr::ValuePtr> m_elements;
};

} // namespace types
} // namespace attrmap

#endif // SRC_ATTRMAP_TYPES_COLLECTION_HPP_
