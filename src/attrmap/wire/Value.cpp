#include "attrmap/wire/Value.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cassert>

namespace attrmap { namespace wire {

Value::Value(): m_type(Type::string()), m_state(kNull) {}

Value::Value(Type type, State state, Payload payload):
    m_type(std::move(type)), m_state(state), m_payload(std::move(payload)) {}

Value Value::null(const Type& type) {
    return Value(type, kNull, Payload());
}

Value Value::unknown(const Type& type) {
    return Value(type, kUnknown, Payload());
}

Value Value::makeString(std::string s) {
    return Value(Type::string(), kKnown, Payload(std::move(s)));
}

Value Value::makeNumber(double d) {
    return Value(Type::number(), kKnown, Payload(d));
}

Value Value::makeBool(bool b) {
    return Value(Type::boolean(), kKnown, Payload(b));
}

Value Value::makeList(const Type& elementType, ValueList elements) {
    return Value(Type::list(elementType), kKnown, Payload(std::make_shared<const ValueList>(std::move(elements))));
}

Value Value::makeSet(const Type& elementType, ValueList elements) {
    return Value(Type::set(elementType), kKnown, Payload(std::make_shared<const ValueList>(std::move(elements))));
}

Value Value::makeMap(const Type& elementType, ValueMap elements) {
    return Value(Type::map(elementType), kKnown, Payload(std::make_shared<const ValueMap>(std::move(elements))));
}

Value Value::makeObject(AttributeTypeMap attributeTypes, ValueMap attributes) {
    return Value(Type::object(std::move(attributeTypes)), kKnown,
                 Payload(std::make_shared<const ValueMap>(std::move(attributes))));
}

bool Value::isFullyKnown() const {
    if (m_state == kUnknown) {
        return false;
    }
    if (m_state == kNull) {
        return true;
    }
    switch (m_type.kind()) {
    case TypeKind::kList:
    case TypeKind::kSet:
        return std::all_of(getElements().begin(), getElements().end(), [](const Value& v) { return v.isFullyKnown(); });
    case TypeKind::kMap:
    case TypeKind::kObject:
        return std::all_of(getMap().begin(), getMap().end(),
                           [](const ValueMap::value_type& v) { return v.second.isFullyKnown(); });
    default:
        return true;
    }
}

const std::string& Value::getString() const {
    assert(m_state == kKnown && m_type.is(TypeKind::kString));
    return std::get<std::string>(m_payload);
}

double Value::getNumber() const {
    assert(m_state == kKnown && m_type.is(TypeKind::kNumber));
    return std::get<double>(m_payload);
}

bool Value::getBool() const {
    assert(m_state == kKnown && m_type.is(TypeKind::kBool));
    return std::get<bool>(m_payload);
}

const ValueList& Value::getElements() const {
    assert(m_state == kKnown && (m_type.is(TypeKind::kList) || m_type.is(TypeKind::kSet)));
    return *std::get<std::shared_ptr<const ValueList>>(m_payload);
}

const ValueMap& Value::getMap() const {
    assert(m_state == kKnown && (m_type.is(TypeKind::kMap) || m_type.is(TypeKind::kObject)));
    return *std::get<std::shared_ptr<const ValueMap>>(m_payload);
}

std::string Value::validate() const {
    return validateAt("value");
}

std::string Value::validateAt(const std::string& where) const {
    if (m_state != kKnown) {
        return std::string();
    }

    switch (m_type.kind()) {
    case TypeKind::kString:
    case TypeKind::kNumber:
    case TypeKind::kBool:
        return std::string();

    case TypeKind::kList:
    case TypeKind::kSet: {
        const auto& elements = getElements();
        for (size_t i = 0; i < elements.size(); ++i) {
            auto elementWhere = fmt::format("{}[{}]", where, i);
            if (elements[i].type() != m_type.elementType()) {
                return fmt::format("{} has type {}, expected {}", elementWhere, elements[i].type().toString(),
                                   m_type.elementType().toString());
            }
            auto error = elements[i].validateAt(elementWhere);
            if (!error.empty()) {
                return error;
            }
            if (m_type.is(TypeKind::kSet)) {
                for (size_t j = 0; j < i; ++j) {
                    if (elements[j] == elements[i]) {
                        return fmt::format("{} duplicates {}[{}] in a set", elementWhere, where, j);
                    }
                }
            }
        }
        return std::string();
    }

    case TypeKind::kMap:
        for (const auto& element : getMap()) {
            auto elementWhere = fmt::format("{}[\"{}\"]", where, element.first);
            if (element.second.type() != m_type.elementType()) {
                return fmt::format("{} has type {}, expected {}", elementWhere, element.second.type().toString(),
                                   m_type.elementType().toString());
            }
            auto error = element.second.validateAt(elementWhere);
            if (!error.empty()) {
                return error;
            }
        }
        return std::string();

    case TypeKind::kObject: {
        const auto& attributeTypes = m_type.attributeTypes();
        const auto& attributes = getMap();
        for (const auto& attributeType : attributeTypes) {
            if (attributes.find(attributeType.first) == attributes.end()) {
                return fmt::format("{} is missing attribute \"{}\"", where, attributeType.first);
            }
        }
        for (const auto& attribute : attributes) {
            auto attributeWhere = fmt::format("{}.{}", where, attribute.first);
            auto typeIter = attributeTypes.find(attribute.first);
            if (typeIter == attributeTypes.end()) {
                return fmt::format("{} has no attribute \"{}\" in its type", where, attribute.first);
            }
            if (attribute.second.type() != typeIter->second) {
                return fmt::format("{} has type {}, expected {}", attributeWhere, attribute.second.type().toString(),
                                   typeIter->second.toString());
            }
            auto error = attribute.second.validateAt(attributeWhere);
            if (!error.empty()) {
                return error;
            }
        }
        return std::string();
    }
    }

    return std::string();
}

bool Value::operator==(const Value& v) const {
    if (m_state != v.m_state || m_type != v.m_type) {
        return false;
    }
    if (m_state != kKnown) {
        return true;
    }

    switch (m_type.kind()) {
    case TypeKind::kString:
        return getString() == v.getString();
    case TypeKind::kNumber:
        return getNumber() == v.getNumber();
    case TypeKind::kBool:
        return getBool() == v.getBool();
    case TypeKind::kList:
        return getElements() == v.getElements();
    case TypeKind::kSet: {
        const auto& elements = getElements();
        const auto& others = v.getElements();
        if (elements.size() != others.size()) {
            return false;
        }
        return std::all_of(elements.begin(), elements.end(), [&others](const Value& element) {
            return std::find(others.begin(), others.end(), element) != others.end();
        });
    }
    case TypeKind::kMap:
    case TypeKind::kObject:
        return getMap() == v.getMap();
    }
    return false;
}

std::string Value::toString() const {
    if (m_state == kNull) {
        return fmt::format("{}<null>", m_type.toString());
    }
    if (m_state == kUnknown) {
        return fmt::format("{}<unknown>", m_type.toString());
    }

    switch (m_type.kind()) {
    case TypeKind::kString:
        return fmt::format("String<\"{}\">", getString());
    case TypeKind::kNumber:
        return fmt::format("Number<{}>", getNumber());
    case TypeKind::kBool:
        return fmt::format("Bool<{}>", getBool());
    case TypeKind::kList:
    case TypeKind::kSet: {
        std::string elements;
        for (const auto& element : getElements()) {
            if (!elements.empty()) {
                elements += ", ";
            }
            elements += element.toString();
        }
        return fmt::format("{}<{}>", m_type.toString(), elements);
    }
    case TypeKind::kMap:
    case TypeKind::kObject: {
        std::string elements;
        for (const auto& element : getMap()) {
            if (!elements.empty()) {
                elements += ", ";
            }
            elements += fmt::format("\"{}\":{}", element.first, element.second.toString());
        }
        return fmt::format("{}<{}>", m_type.toString(), elements);
    }
    }
    return std::string();
}

} // namespace wire
} // namespace attrmap
