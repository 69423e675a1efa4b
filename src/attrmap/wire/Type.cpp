#include "attrmap/wire/Type.hpp"

#include "fmt/format.h"

#include <cassert>

namespace attrmap { namespace wire {

Type Type::list(const Type& elementType) {
    Type type(TypeKind::kList);
    type.m_elementType = std::make_shared<const Type>(elementType);
    return type;
}

Type Type::set(const Type& elementType) {
    Type type(TypeKind::kSet);
    type.m_elementType = std::make_shared<const Type>(elementType);
    return type;
}

Type Type::map(const Type& elementType) {
    Type type(TypeKind::kMap);
    type.m_elementType = std::make_shared<const Type>(elementType);
    return type;
}

Type Type::object(AttributeTypeMap attributeTypes) {
    Type type(TypeKind::kObject);
    type.m_attributeTypes = std::make_shared<const AttributeTypeMap>(std::move(attributeTypes));
    return type;
}

const Type& Type::elementType() const {
    assert(isCollection());
    return *m_elementType;
}

const AttributeTypeMap& Type::attributeTypes() const {
    assert(m_kind == TypeKind::kObject);
    return *m_attributeTypes;
}

bool Type::operator==(const Type& t) const {
    if (m_kind != t.m_kind) {
        return false;
    }
    if (isCollection()) {
        return *m_elementType == *t.m_elementType;
    }
    if (m_kind == TypeKind::kObject) {
        return m_attributeTypes == t.m_attributeTypes || *m_attributeTypes == *t.m_attributeTypes;
    }
    return true;
}

std::string Type::toString() const {
    switch (m_kind) {
    case TypeKind::kString:
        return "String";
    case TypeKind::kNumber:
        return "Number";
    case TypeKind::kBool:
        return "Bool";
    case TypeKind::kList:
        return fmt::format("List[{}]", m_elementType->toString());
    case TypeKind::kSet:
        return fmt::format("Set[{}]", m_elementType->toString());
    case TypeKind::kMap:
        return fmt::format("Map[{}]", m_elementType->toString());
    case TypeKind::kObject: {
        std::string attributes;
        for (const auto& attribute : *m_attributeTypes) {
            if (!attributes.empty()) {
                attributes += ", ";
            }
            attributes += fmt::format("\"{}\":{}", attribute.first, attribute.second.toString());
        }
        return fmt::format("Object[{}]", attributes);
    }
    }
    return std::string();
}

} // namespace wire
} // namespace attrmap
