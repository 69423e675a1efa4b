#ifndef SRC_ATTRMAP_WIRE_TYPE_HPP_
#define SRC_ATTRMAP_WIRE_TYPE_HPP_

#include <map>
#include <memory>
#include <string>

namespace attrmap { namespace wire {

enum class TypeKind { kString, kNumber, kBool, kList, kSet, kMap, kObject };

class Type;
using AttributeTypeMap = std::map<std::string, Type>;

// The type of a wire Value. Collection types carry an element type, Object types carry the types of their named
// attributes. Types are immutable and cheap to copy, nested types are shared.
class Type {
public:
    // Default-constructed Types are String.
    Type(): m_kind(TypeKind::kString) {}
    Type(const Type&) = default;
    Type& operator=(const Type&) = default;
    ~Type() = default;

    static Type string() { return Type(TypeKind::kString); }
    static Type number() { return Type(TypeKind::kNumber); }
    static Type boolean() { return Type(TypeKind::kBool); }
    static Type list(const Type& elementType);
    static Type set(const Type& elementType);
    static Type map(const Type& elementType);
    static Type object(AttributeTypeMap attributeTypes);

    TypeKind kind() const { return m_kind; }
    bool is(TypeKind kind) const { return m_kind == kind; }
    bool isPrimitive() const {
        return m_kind == TypeKind::kString || m_kind == TypeKind::kNumber || m_kind == TypeKind::kBool;
    }
    bool isCollection() const {
        return m_kind == TypeKind::kList || m_kind == TypeKind::kSet || m_kind == TypeKind::kMap;
    }

    // Only valid for List, Set, and Map types.
    const Type& elementType() const;
    // Only valid for Object types.
    const AttributeTypeMap& attributeTypes() const;

    bool operator==(const Type& t) const;
    bool operator!=(const Type& t) const { return !(*this == t); }

    // e.g. "List[String]" or "Object[\"age\":Number, \"name\":String]".
    std::string toString() const;

private:
    explicit Type(TypeKind kind): m_kind(kind) {}

    TypeKind m_kind;
    std::shared_ptr<const Type> m_elementType;
    std::shared_ptr<const AttributeTypeMap> m_attributeTypes;
};

} // namespace wire
} // namespace attrmap

#endif // SRC_ATTRMAP_WIRE_TYPE_HPP_
