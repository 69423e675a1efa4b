#include "attrmap/types/Object.hpp"

#include "attrmap/types/Collection.hpp"

#include "fmt/format.h"

namespace attrmap { namespace types {

wire::Type ObjectType::wireType(Context* context) const {
    wire::AttributeTypeMap attributeTypes;
    for (const auto& attributeType : m_attributeTypes) {
        attributeTypes.emplace(attributeType.first, attributeType.second->wireType(context));
    }
    return wire::Type::object(std::move(attributeTypes));
}

attr::ValuePtr ObjectType::valueFromWire(Context* context, const wire::Value& value, std::string& error) const {
    for (const auto& attributeType : m_attributeTypes) {
        if (!attributeType.second) {
            error = fmt::format("ObjectType has no type for attribute \"{}\"", attributeType.first);
            return nullptr;
        }
    }

    auto expected = wireType(context);
    if (value.type() != expected) {
        error = fmt::format("expected {}, got {}", expected.toString(), value.type().toString());
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<ObjectValue>(ObjectValue::unknown(m_attributeTypes));
    }
    if (value.isNull()) {
        return std::make_shared<ObjectValue>(ObjectValue::null(m_attributeTypes));
    }

    std::map<std::string, attr::ValuePtr> attributes;
    error = value.validate();
    if (!error.empty()) {
        return nullptr;
    }
    for (const auto& wireAttribute : value.getMap()) {
        auto typeIter = m_attributeTypes.find(wireAttribute.first);
        if (typeIter == m_attributeTypes.end()) {
            error = fmt::format("unexpected attribute \"{}\"", wireAttribute.first);
            return nullptr;
        }
        auto attribute = typeIter->second->valueFromWire(context, wireAttribute.second, error);
        if (!attribute) {
            error = fmt::format("attribute \"{}\": {}", wireAttribute.first, error);
            return nullptr;
        }
        attributes.emplace(wireAttribute.first, std::move(attribute));
    }
    return std::make_shared<ObjectValue>(m_attributeTypes, std::move(attributes));
}

bool ObjectType::equal(const attr::Type& other) const {
    auto otherObject = dynamic_cast<const ObjectType*>(&other);
    if (!otherObject || m_attributeTypes.size() != otherObject->m_attributeTypes.size()) {
        return false;
    }
    for (const auto& attributeType : m_attributeTypes) {
        auto iter = otherObject->m_attributeTypes.find(attributeType.first);
        if (iter == otherObject->m_attributeTypes.end() || !attributeType.second || !iter->second ||
            !attributeType.second->equal(*iter->second)) {
            return false;
        }
    }
    return true;
}

std::string ObjectType::toString() const {
    std::string attributes;
    for (const auto& attributeType : m_attributeTypes) {
        if (!attributes.empty()) {
            attributes += ", ";
        }
        attributes += fmt::format("\"{}\":{}", attributeType.first,
                                  attributeType.second ? attributeType.second->toString() : "<missing>");
    }
    return fmt::format("ObjectType[{}]", attributes);
}

attr::TypePtr ObjectType::withAttributeTypes(attr::AttributeTypes attributeTypes) const {
    return std::make_shared<ObjectType>(std::move(attributeTypes));
}

attr::ValuePtr ObjectValue::attribute(const std::string& name) const {
    auto iter = m_attributes.find(name);
    if (iter == m_attributes.end()) {
        return nullptr;
    }
    return iter->second;
}

attr::TypePtr ObjectValue::type(Context* /* context */) const {
    return std::make_shared<ObjectType>(m_attributeTypes);
}

bool ObjectValue::toWireValue(Context* context, wire::Value& value, std::string& error) const {
    wire::AttributeTypeMap attributeTypes;
    for (const auto& attributeType : m_attributeTypes) {
        if (!attributeType.second) {
            error = fmt::format("object value has no type for attribute \"{}\"", attributeType.first);
            return false;
        }
        attributeTypes.emplace(attributeType.first, attributeType.second->wireType(context));
    }
    if (m_state == ValueState::kNull) {
        value = wire::Value::null(wire::Type::object(std::move(attributeTypes)));
        return true;
    }
    if (m_state == ValueState::kUnknown) {
        value = wire::Value::unknown(wire::Type::object(std::move(attributeTypes)));
        return true;
    }

    wire::ValueMap attributes;
    for (const auto& attribute : m_attributes) {
        if (!attribute.second) {
            error = fmt::format("object value is missing a value for attribute \"{}\"", attribute.first);
            return false;
        }
        wire::Value wireAttribute;
        if (!attribute.second->toWireValue(context, wireAttribute, error)) {
            return false;
        }
        attributes.emplace(attribute.first, std::move(wireAttribute));
    }
    auto object = wire::Value::makeObject(std::move(attributeTypes), std::move(attributes));
    error = object.validate();
    if (!error.empty()) {
        return false;
    }
    value = std::move(object);
    return true;
}

bool ObjectValue::equal(const attr::Value& other) const {
    auto otherObject = dynamic_cast<const ObjectValue*>(&other);
    if (!otherObject || m_state != otherObject->m_state) {
        return false;
    }
    if (!ObjectType(m_attributeTypes).equal(ObjectType(otherObject->m_attributeTypes))) {
        return false;
    }
    if (m_state != ValueState::kKnown) {
        return true;
    }
    if (m_attributes.size() != otherObject->m_attributes.size()) {
        return false;
    }
    for (const auto& attribute : m_attributes) {
        auto iter = otherObject->m_attributes.find(attribute.first);
        if (iter == otherObject->m_attributes.end() || !attribute.second || !iter->second ||
            !attribute.second->equal(*iter->second)) {
            return false;
        }
    }
    return true;
}

std::string ObjectValue::toString() const {
    if (m_state == ValueState::kNull) {
        return "<null>";
    }
    if (m_state == ValueState::kUnknown) {
        return "<unknown>";
    }
    std::string attributes;
    for (const auto& attribute : m_attributes) {
        if (!attributes.empty()) {
            attributes += ",";
        }
        attributes +=
            fmt::format("\"{}\":{}", attribute.first, attribute.second ? attribute.second->toString() : "<missing>");
    }
    return fmt::format("{{{}}}", attributes);
}

attr::TypePtr typeFromWireType(const wire::Type& type) {
    switch (type.kind()) {
    case wire::TypeKind::kString:
        return std::make_shared<StringType>();
    case wire::TypeKind::kNumber:
        return std::make_shared<NumberType>();
    case wire::TypeKind::kBool:
        return std::make_shared<BoolType>();
    case wire::TypeKind::kList:
        return std::make_shared<ListType>(typeFromWireType(type.elementType()));
    case wire::TypeKind::kSet:
        return std::make_shared<SetType>(typeFromWireType(type.elementType()));
    case wire::TypeKind::kMap:
        return std::make_shared<MapType>(typeFromWireType(type.elementType()));
    case wire::TypeKind::kObject: {
        attr::AttributeTypes attributeTypes;
        for (const auto& attributeType : type.attributeTypes()) {
            attributeTypes.emplace(attributeType.first, typeFromWireType(attributeType.second));
        }
        return std::make_shared<ObjectType>(std::move(attributeTypes));
    }
    }
    return nullptr;
}

} // namespace types
} // namespace attrmap
