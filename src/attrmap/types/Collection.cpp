#include "attrmap/types/Collection.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace {

using namespace attrmap;

// Checks that |value| has exactly the wire type |type| describes. Returns false and fills |error| otherwise.
bool checkWireType(Context* context, const attr::Type& type, const wire::Value& value, std::string& error) {
    auto expected = type.wireType(context);
    if (value.type() != expected) {
        error = fmt::format("can't build {} from a {} value, expected {}", type.toString(), value.type().toString(),
                            expected.toString());
        return false;
    }
    return true;
}

bool elementsFromWire(Context* context, const attr::Type& elementType, const wire::ValueList& wireElements,
                      std::vector<attr::ValuePtr>& elements, std::string& error) {
    elements.reserve(wireElements.size());
    for (const auto& wireElement : wireElements) {
        auto element = elementType.valueFromWire(context, wireElement, error);
        if (!element) {
            return false;
        }
        elements.emplace_back(std::move(element));
    }
    return true;
}

std::string elementTypeString(const attr::TypePtr& elementType) {
    return elementType ? elementType->toString() : "<missing>";
}

bool sameElementType(const attr::TypePtr& a, const attr::TypePtr& b) {
    if (!a || !b) {
        return a == b;
    }
    return a->equal(*b);
}

} // namespace

namespace attrmap { namespace types {

////////////////
// ListType
wire::Type ListType::wireType(Context* context) const {
    return wire::Type::list(m_elementType->wireType(context));
}

attr::ValuePtr ListType::valueFromWire(Context* context, const wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "ListType has no element type";
        return nullptr;
    }
    if (!checkWireType(context, *this, value, error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<ListValue>(ListValue::unknown(m_elementType));
    }
    if (value.isNull()) {
        return std::make_shared<ListValue>(ListValue::null(m_elementType));
    }
    std::vector<attr::ValuePtr> elements;
    if (!elementsFromWire(context, *m_elementType, value.getElements(), elements, error)) {
        return nullptr;
    }
    return std::make_shared<ListValue>(m_elementType, std::move(elements));
}

bool ListType::equal(const attr::Type& other) const {
    auto otherList = dynamic_cast<const ListType*>(&other);
    return otherList && sameElementType(m_elementType, otherList->m_elementType);
}

std::string ListType::toString() const {
    return fmt::format("ListType[{}]", elementTypeString(m_elementType));
}

attr::TypePtr ListType::withElementType(attr::TypePtr elementType) const {
    return std::make_shared<ListType>(std::move(elementType));
}

////////////////
// SetType
wire::Type SetType::wireType(Context* context) const {
    return wire::Type::set(m_elementType->wireType(context));
}

attr::ValuePtr SetType::valueFromWire(Context* context, const wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "SetType has no element type";
        return nullptr;
    }
    if (!checkWireType(context, *this, value, error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<SetValue>(SetValue::unknown(m_elementType));
    }
    if (value.isNull()) {
        return std::make_shared<SetValue>(SetValue::null(m_elementType));
    }
    std::vector<attr::ValuePtr> elements;
    if (!elementsFromWire(context, *m_elementType, value.getElements(), elements, error)) {
        return nullptr;
    }
    return std::make_shared<SetValue>(m_elementType, std::move(elements));
}

bool SetType::equal(const attr::Type& other) const {
    auto otherSet = dynamic_cast<const SetType*>(&other);
    return otherSet && sameElementType(m_elementType, otherSet->m_elementType);
}

std::string SetType::toString() const {
    return fmt::format("SetType[{}]", elementTypeString(m_elementType));
}

attr::TypePtr SetType::withElementType(attr::TypePtr elementType) const {
    return std::make_shared<SetType>(std::move(elementType));
}

////////////////
// MapType
wire::Type MapType::wireType(Context* context) const {
    return wire::Type::map(m_elementType->wireType(context));
}

attr::ValuePtr MapType::valueFromWire(Context* context, const wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "MapType has no element type";
        return nullptr;
    }
    if (!checkWireType(context, *this, value, error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<MapValue>(MapValue::unknown(m_elementType));
    }
    if (value.isNull()) {
        return std::make_shared<MapValue>(MapValue::null(m_elementType));
    }
    std::map<std::string, attr::ValuePtr> elements;
    for (const auto& wireElement : value.getMap()) {
        auto element = m_elementType->valueFromWire(context, wireElement.second, error);
        if (!element) {
            return nullptr;
        }
        elements.emplace(wireElement.first, std::move(element));
    }
    return std::make_shared<MapValue>(m_elementType, std::move(elements));
}

bool MapType::equal(const attr::Type& other) const {
    auto otherMap = dynamic_cast<const MapType*>(&other);
    return otherMap && sameElementType(m_elementType, otherMap->m_elementType);
}

std::string MapType::toString() const {
    return fmt::format("MapType[{}]", elementTypeString(m_elementType));
}

attr::TypePtr MapType::withElementType(attr::TypePtr elementType) const {
    return std::make_shared<MapType>(std::move(elementType));
}

////////////////
// ElementsValue
bool ElementsValue::elementsToWire(Context* context, wire::ValueList& elements, std::string& error) const {
    elements.reserve(m_elements.size());
    for (const auto& element : m_elements) {
        if (!element) {
            error = "collection contains a missing element";
            return false;
        }
        wire::Value wireElement;
        if (!element->toWireValue(context, wireElement, error)) {
            return false;
        }
        elements.emplace_back(std::move(wireElement));
    }
    return true;
}

bool ElementsValue::equalElements(const ElementsValue& other) const {
    if (m_state != other.m_state || !sameElementType(m_elementType, other.m_elementType)) {
        return false;
    }
    if (m_state != ValueState::kKnown) {
        return true;
    }
    if (m_elements.size() != other.m_elements.size()) {
        return false;
    }
    for (size_t i = 0; i < m_elements.size(); ++i) {
        if (!m_elements[i] || !other.m_elements[i] || !m_elements[i]->equal(*other.m_elements[i])) {
            return false;
        }
    }
    return true;
}

std::string ElementsValue::elementsString() const {
    if (m_state == ValueState::kNull) {
        return "<null>";
    }
    if (m_state == ValueState::kUnknown) {
        return "<unknown>";
    }
    std::string elements;
    for (const auto& element : m_elements) {
        if (!elements.empty()) {
            elements += ",";
        }
        elements += element ? element->toString() : "<missing>";
    }
    return fmt::format("[{}]", elements);
}

////////////////
// ListValue
attr::TypePtr ListValue::type(Context* /* context */) const {
    return std::make_shared<ListType>(m_elementType);
}

bool ListValue::toWireValue(Context* context, wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "list value has no element type";
        return false;
    }
    auto elementWireType = m_elementType->wireType(context);
    if (m_state == ValueState::kNull) {
        value = wire::Value::null(wire::Type::list(elementWireType));
        return true;
    }
    if (m_state == ValueState::kUnknown) {
        value = wire::Value::unknown(wire::Type::list(elementWireType));
        return true;
    }
    wire::ValueList elements;
    if (!elementsToWire(context, elements, error)) {
        return false;
    }
    auto list = wire::Value::makeList(elementWireType, std::move(elements));
    error = list.validate();
    if (!error.empty()) {
        return false;
    }
    value = std::move(list);
    return true;
}

bool ListValue::equal(const attr::Value& other) const {
    auto otherList = dynamic_cast<const ListValue*>(&other);
    return otherList && equalElements(*otherList);
}

////////////////
// SetValue
attr::TypePtr SetValue::type(Context* /* context */) const {
    return std::make_shared<SetType>(m_elementType);
}

bool SetValue::toWireValue(Context* context, wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "set value has no element type";
        return false;
    }
    auto elementWireType = m_elementType->wireType(context);
    if (m_state == ValueState::kNull) {
        value = wire::Value::null(wire::Type::set(elementWireType));
        return true;
    }
    if (m_state == ValueState::kUnknown) {
        value = wire::Value::unknown(wire::Type::set(elementWireType));
        return true;
    }
    wire::ValueList elements;
    if (!elementsToWire(context, elements, error)) {
        return false;
    }
    auto set = wire::Value::makeSet(elementWireType, std::move(elements));
    error = set.validate();
    if (!error.empty()) {
        return false;
    }
    value = std::move(set);
    return true;
}

bool SetValue::equal(const attr::Value& other) const {
    auto otherSet = dynamic_cast<const SetValue*>(&other);
    if (!otherSet || m_state != otherSet->m_state || m_elements.size() != otherSet->m_elements.size()) {
        return false;
    }
    if (m_state != ValueState::kKnown) {
        return sameElementType(m_elementType, otherSet->m_elementType);
    }
    const auto& others = otherSet->m_elements;
    return std::all_of(m_elements.begin(), m_elements.end(), [&others](const attr::ValuePtr& element) {
        return std::any_of(others.begin(), others.end(), [&element](const attr::ValuePtr& other) {
            return element && other && element->equal(*other);
        });
    });
}

////////////////
// MapValue
attr::TypePtr MapValue::type(Context* /* context */) const {
    return std::make_shared<MapType>(m_elementType);
}

bool MapValue::toWireValue(Context* context, wire::Value& value, std::string& error) const {
    if (!m_elementType) {
        error = "map value has no element type";
        return false;
    }
    auto elementWireType = m_elementType->wireType(context);
    if (m_state == ValueState::kNull) {
        value = wire::Value::null(wire::Type::map(elementWireType));
        return true;
    }
    if (m_state == ValueState::kUnknown) {
        value = wire::Value::unknown(wire::Type::map(elementWireType));
        return true;
    }
    wire::ValueMap elements;
    for (const auto& element : m_elements) {
        if (!element.second) {
            error = fmt::format("map value has a missing element at key \"{}\"", element.first);
            return false;
        }
        wire::Value wireElement;
        if (!element.second->toWireValue(context, wireElement, error)) {
            return false;
        }
        elements.emplace(element.first, std::move(wireElement));
    }
    auto map = wire::Value::makeMap(elementWireType, std::move(elements));
    error = map.validate();
    if (!error.empty()) {
        return false;
    }
    value = std::move(map);
    return true;
}

bool MapValue::equal(const attr::Value& other) const {
    auto otherMap = dynamic_cast<const MapValue*>(&other);
    if (!otherMap || m_state != otherMap->m_state || !sameElementType(m_elementType, otherMap->m_elementType)) {
        return false;
    }
    if (m_state != ValueState::kKnown) {
        return true;
    }
    if (m_elements.size() != otherMap->m_elements.size()) {
        return false;
    }
    for (const auto& element : m_elements) {
        auto iter = otherMap->m_elements.find(element.first);
        if (iter == otherMap->m_elements.end() || !element.second || !iter->second ||
            !element.second->equal(*iter->second)) {
            return false;
        }
    }
    return true;
}

std::string MapValue::toString() const {
    if (m_state == ValueState::kNull) {
        return "<null>";
    }
    if (m_state == ValueState::kUnknown) {
        return "<unknown>";
    }
    std::string elements;
    for (const auto& element : m_elements) {
        if (!elements.empty()) {
            elements += ",";
        }
        elements += fmt::format("\"{}\":{}", element.first, element.second ? element.second->toString() : "<missing>");
    }
    return fmt::format("{{{}}}", elements);
}

} // namespace types
} // namespace attrmap
