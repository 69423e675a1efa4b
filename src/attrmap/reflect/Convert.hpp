#ifndef SRC_ATTRMAP_REFLECT_CONVERT_HPP_
#define SRC_ATTRMAP_REFLECT_CONVERT_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/attr/Value.hpp"
#include "attrmap/Context.hpp"
#include "attrmap/Diagnostics.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/reflect/Diags.hpp"
#include "attrmap/reflect/Record.hpp"
#include "attrmap/reflect/Struct.hpp"
#include "attrmap/wire/Value.hpp"

#include "fmt/format.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Conversions between wire Values and native C++ values. The supported native types are bool, the integral and
// floating point types, std::string, std::vector, std::map with std::string keys, std::optional, records with a
// describeRecord() function, and the schema value classes derived from attr::Value. Containers nest freely.
namespace attrmap { namespace reflect {

// Checks |value| and hands it to the validation hook of |type|, if any, then builds the schema value for it into
// |result|.
Diagnostics buildAttrValue(Context* context, const attr::Type& type, const wire::Value& value, const Path& path,
                           attr::ValuePtr& result);

template <typename T> struct UnsupportedType : std::false_type {};

// Per-type conversion rules. Each specialization provides typeName(), into() which is only called with null or
// unknown values when kHandlesNull or kHandlesUnknown say so, and from().
template <typename T, typename Enable = void> struct Reflector {
    static_assert(UnsupportedType<T>::value, "no conversion to or from wire values for this type");
};

template <> struct Reflector<bool> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return "bool"; }

    static Diagnostics into(Context* /* context */, const attr::Type& /* type */, const wire::Value& value,
                            bool& target, const Path& path) {
        Diagnostics diagnostics;
        if (!value.type().is(wire::TypeKind::kBool)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a Bool value"));
            return diagnostics;
        }
        target = value.getBool();
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, bool value, const Path& path,
                            attr::ValuePtr& result) {
        return buildAttrValue(context, type, wire::Value::makeBool(value), path, result);
    }
};

template <typename T> struct Reflector<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() {
        return fmt::format("{}int{}_t", std::is_signed<T>::value ? "" : "u", sizeof(T) * 8);
    }

    static Diagnostics into(Context* /* context */, const attr::Type& /* type */, const wire::Value& value, T& target,
                            const Path& path) {
        Diagnostics diagnostics;
        if (!value.type().is(wire::TypeKind::kNumber)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a Number value"));
            return diagnostics;
        }
        auto number = value.getNumber();
        if (!std::isfinite(number) || std::trunc(number) != number) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "value is not an integer"));
            return diagnostics;
        }
        // Bounds are powers of two, so they are exact as doubles. The upper one is exclusive.
        auto upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
        auto lower = std::is_signed<T>::value ? -upper : 0.0;
        if (number < lower || number >= upper) {
            diagnostics.append(incompatibleTypeDiag(
                path, value, typeName(), fmt::format("value is out of the range of {}", typeName())));
            return diagnostics;
        }
        target = static_cast<T>(number);
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, T value, const Path& path,
                            attr::ValuePtr& result) {
        return buildAttrValue(context, type, wire::Value::makeNumber(static_cast<double>(value)), path, result);
    }
};

template <typename T> struct Reflector<T, std::enable_if_t<std::is_floating_point<T>::value>> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return sizeof(T) == sizeof(float) ? "float" : "double"; }

    static Diagnostics into(Context* /* context */, const attr::Type& /* type */, const wire::Value& value, T& target,
                            const Path& path) {
        Diagnostics diagnostics;
        if (!value.type().is(wire::TypeKind::kNumber)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a Number value"));
            return diagnostics;
        }
        auto number = value.getNumber();
        if (std::isfinite(number) && std::fabs(number) > static_cast<double>(std::numeric_limits<T>::max())) {
            diagnostics.append(incompatibleTypeDiag(
                path, value, typeName(), fmt::format("value is out of the range of {}", typeName())));
            return diagnostics;
        }
        target = static_cast<T>(number);
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, T value, const Path& path,
                            attr::ValuePtr& result) {
        if (!std::isfinite(value)) {
            Diagnostics diagnostics;
            diagnostics.append(conversionErrorDiag(path, fmt::format("can't encode the non-finite number {}", value)));
            return diagnostics;
        }
        return buildAttrValue(context, type, wire::Value::makeNumber(static_cast<double>(value)), path, result);
    }
};

template <> struct Reflector<std::string> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return "std::string"; }

    static Diagnostics into(Context* /* context */, const attr::Type& /* type */, const wire::Value& value,
                            std::string& target, const Path& path) {
        Diagnostics diagnostics;
        if (!value.type().is(wire::TypeKind::kString)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a String value"));
            return diagnostics;
        }
        target = value.getString();
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, const std::string& value, const Path& path,
                            attr::ValuePtr& result) {
        return buildAttrValue(context, type, wire::Value::makeString(value), path, result);
    }
};

// Returns the element type of |type|, or nullptr after appending a diagnostic to |diagnostics| if it has none.
inline attr::TypePtr collectionElementType(const attr::Type& type, const Path& path, Diagnostics& diagnostics) {
    auto collectionType = dynamic_cast<const attr::TypeWithElementType*>(&type);
    if (!collectionType) {
        diagnostics.append(conversionErrorDiag(
            path, fmt::format("schema type {} does not describe the type of its elements", type.toString())));
        return nullptr;
    }
    auto elementType = collectionType->elementType();
    if (!elementType) {
        diagnostics.append(conversionErrorDiag(path, fmt::format("schema type {} has no element type", type.toString())));
    }
    return elementType;
}

// Lists and Sets both decode into vectors, the schema type decides which one a vector encodes to.
template <typename E> struct Reflector<std::vector<E>> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return fmt::format("std::vector<{}>", Reflector<E>::typeName()); }

    static Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value,
                            std::vector<E>& target, const Path& path) {
        Diagnostics diagnostics;
        bool isSet = value.type().is(wire::TypeKind::kSet);
        if (!isSet && !value.type().is(wire::TypeKind::kList)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a List or Set value"));
            return diagnostics;
        }
        auto elementType = collectionElementType(type, path, diagnostics);
        if (!elementType) {
            return diagnostics;
        }

        const auto& elements = value.getElements();
        std::vector<E> result;
        result.reserve(elements.size());
        for (size_t i = 0; i < elements.size(); ++i) {
            auto elementPath = isSet ? path.atSetValue(elements[i].toString())
                                     : path.atListIndex(static_cast<int64_t>(i));
            E element{};
            diagnostics.append(buildValue(context, *elementType, elements[i], element, elementPath));
            if (diagnostics.hasError()) {
                return diagnostics;
            }
            result.emplace_back(std::move(element));
        }
        target = std::move(result);
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, const std::vector<E>& value, const Path& path,
                            attr::ValuePtr& result) {
        Diagnostics diagnostics;
        auto elementType = collectionElementType(type, path, diagnostics);
        if (!elementType) {
            return diagnostics;
        }

        wire::ValueList elements;
        elements.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            auto elementPath = path.atListIndex(static_cast<int64_t>(i));
            attr::ValuePtr element;
            diagnostics.append(fromValue<E>(context, *elementType, value[i], elementPath, element));
            if (diagnostics.hasError()) {
                return diagnostics;
            }
            wire::Value wireElement;
            std::string error;
            if (!element || !element->toWireValue(context, wireElement, error)) {
                diagnostics.append(toWireValueErrorDiag(elementPath, error));
                return diagnostics;
            }
            elements.emplace_back(std::move(wireElement));
        }

        auto wireType = type.wireType(context);
        if (wireType.is(wire::TypeKind::kList)) {
            diagnostics.append(buildAttrValue(context, type, wire::Value::makeList(wireType.elementType(),
                                                                                   std::move(elements)),
                                              path, result));
        } else if (wireType.is(wire::TypeKind::kSet)) {
            diagnostics.append(buildAttrValue(context, type, wire::Value::makeSet(wireType.elementType(),
                                                                                  std::move(elements)),
                                              path, result));
        } else {
            diagnostics.append(conversionErrorDiag(
                path, fmt::format("can't encode {} as {}", typeName(), wireType.toString())));
        }
        return diagnostics;
    }
};

template <typename E> struct Reflector<std::map<std::string, E>> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return fmt::format("std::map<std::string, {}>", Reflector<E>::typeName()); }

    static Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value,
                            std::map<std::string, E>& target, const Path& path) {
        Diagnostics diagnostics;
        if (!value.type().is(wire::TypeKind::kMap)) {
            diagnostics.append(incompatibleTypeDiag(path, value, typeName(), "expected a Map value"));
            return diagnostics;
        }
        auto elementType = collectionElementType(type, path, diagnostics);
        if (!elementType) {
            return diagnostics;
        }

        std::map<std::string, E> result;
        for (const auto& wireElement : value.getMap()) {
            E element{};
            diagnostics.append(
                buildValue(context, *elementType, wireElement.second, element, path.atMapKey(wireElement.first)));
            if (diagnostics.hasError()) {
                return diagnostics;
            }
            result.emplace(wireElement.first, std::move(element));
        }
        target = std::move(result);
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, const std::map<std::string, E>& value,
                            const Path& path, attr::ValuePtr& result) {
        Diagnostics diagnostics;
        auto elementType = collectionElementType(type, path, diagnostics);
        if (!elementType) {
            return diagnostics;
        }

        wire::ValueMap elements;
        for (const auto& element : value) {
            auto elementPath = path.atMapKey(element.first);
            attr::ValuePtr elementValue;
            diagnostics.append(fromValue<E>(context, *elementType, element.second, elementPath, elementValue));
            if (diagnostics.hasError()) {
                return diagnostics;
            }
            wire::Value wireElement;
            std::string error;
            if (!elementValue || !elementValue->toWireValue(context, wireElement, error)) {
                diagnostics.append(toWireValueErrorDiag(elementPath, error));
                return diagnostics;
            }
            elements.emplace(element.first, std::move(wireElement));
        }

        auto wireType = type.wireType(context);
        if (!wireType.is(wire::TypeKind::kMap)) {
            diagnostics.append(conversionErrorDiag(
                path, fmt::format("can't encode {} as {}", typeName(), wireType.toString())));
            return diagnostics;
        }
        diagnostics.append(
            buildAttrValue(context, type, wire::Value::makeMap(wireType.elementType(), std::move(elements)), path,
                           result));
        return diagnostics;
    }
};

// An empty optional is a null value.
template <typename E> struct Reflector<std::optional<E>> {
    static constexpr bool kHandlesNull = true;
    static constexpr bool kHandlesUnknown = Reflector<E>::kHandlesUnknown;

    static std::string typeName() { return fmt::format("std::optional<{}>", Reflector<E>::typeName()); }

    static Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value,
                            std::optional<E>& target, const Path& path) {
        if (value.isNull()) {
            target.reset();
            return Diagnostics();
        }
        E element{};
        auto diagnostics = Reflector<E>::into(context, type, value, element, path);
        if (!diagnostics.hasError()) {
            target = std::move(element);
        }
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, const std::optional<E>& value,
                            const Path& path, attr::ValuePtr& result) {
        if (!value) {
            return buildAttrValue(context, type, wire::Value::null(type.wireType(context)), path, result);
        }
        return Reflector<E>::from(context, type, *value, path, result);
    }
};

template <typename T> struct Reflector<T, std::enable_if_t<IsRecord<T>::value>> {
    static constexpr bool kHandlesNull = false;
    static constexpr bool kHandlesUnknown = false;

    static std::string typeName() { return recordName<T>(); }

    static Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value, T& target,
                            const Path& path) {
        return decodeStruct(context, type, value, target, path);
    }

    static Diagnostics from(Context* context, const attr::Type& type, const T& value, const Path& path,
                            attr::ValuePtr& result) {
        auto objectType = dynamic_cast<const attr::TypeWithAttributeTypes*>(&type);
        if (!objectType) {
            Diagnostics diagnostics;
            diagnostics.append(conversionErrorDiag(
                path, fmt::format("can't encode record {} as {}, it does not describe the types of its attributes",
                                  typeName(), type.toString())));
            return diagnostics;
        }
        return encodeStruct(context, *objectType, value, path, result);
    }
};

// Schema values carry their own null and unknown states, so they take any wire value the schema type accepts.
template <typename T> struct Reflector<T, std::enable_if_t<std::is_base_of<attr::Value, T>::value>> {
    static constexpr bool kHandlesNull = true;
    static constexpr bool kHandlesUnknown = true;

    static std::string typeName() { return "schema value"; }

    static Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value, T& target,
                            const Path& path) {
        Diagnostics diagnostics;
        std::string error;
        auto built = type.valueFromWire(context, value, error);
        if (!built) {
            diagnostics.append(valueFromWireErrorDiag(path, error));
            return diagnostics;
        }
        auto typed = std::dynamic_pointer_cast<const T>(built);
        if (!typed) {
            auto builtType = built->type(context);
            diagnostics.append(wrongValueTypeDiag(path, builtType ? builtType->toString() : built->toString(),
                                                  typeName(), type.toString()));
            return diagnostics;
        }
        target = *typed;
        return diagnostics;
    }

    static Diagnostics from(Context* context, const attr::Type& type, const T& value, const Path& path,
                            attr::ValuePtr& result) {
        Diagnostics diagnostics;
        auto valueType = value.type(context);
        if (!valueType || !valueType->equal(type)) {
            diagnostics.append(wrongValueTypeDiag(path, valueType ? valueType->toString() : value.toString(),
                                                  typeName(), type.toString()));
            return diagnostics;
        }
        wire::Value wireValue;
        std::string error;
        if (!value.toWireValue(context, wireValue, error)) {
            diagnostics.append(toWireValueErrorDiag(path, error));
            return diagnostics;
        }
        auto validator = dynamic_cast<const attr::TypeWithValidate*>(&type);
        if (validator) {
            diagnostics.append(validator->validate(context, wireValue, path));
            if (diagnostics.hasError()) {
                return diagnostics;
            }
        }
        result = std::make_shared<T>(value);
        return diagnostics;
    }
};

// Converts |value| into |target| at |path|, checking the nesting depth and the null and unknown states first. On
// failure |target| may be partially written, use into() for all-or-nothing assignment.
template <typename T>
Diagnostics buildValue(Context* context, const attr::Type& type, const wire::Value& value, T& target,
                       const Path& path) {
    Diagnostics diagnostics;
    const auto& options = context->options();
    if (static_cast<int64_t>(path.size()) > options.maxDepth) {
        diagnostics.append(depthExceededDiag(path, options.maxDepth));
        return diagnostics;
    }

    if (!value.isKnown() && !Reflector<T>::kHandlesUnknown) {
        if (options.unhandledUnknownAsEmpty) {
            target = T{};
        } else {
            diagnostics.append(unhandledUnknownDiag(path, Reflector<T>::typeName()));
        }
        return diagnostics;
    }
    if (value.isNull() && !Reflector<T>::kHandlesNull) {
        if (options.unhandledNullAsEmpty) {
            target = T{};
        } else {
            diagnostics.append(unhandledNullDiag(path, Reflector<T>::typeName()));
        }
        return diagnostics;
    }

    return Reflector<T>::into(context, type, value, target, path);
}

// Converts the native |value| into a schema value of |type| in |result|. |result| is left untouched on failure.
template <typename T>
Diagnostics fromValue(Context* context, const attr::Type& type, const T& value, const Path& path,
                      attr::ValuePtr& result) {
    Diagnostics diagnostics;
    auto maxDepth = context->options().maxDepth;
    if (static_cast<int64_t>(path.size()) > maxDepth) {
        diagnostics.append(depthExceededDiag(path, maxDepth));
        return diagnostics;
    }
    return Reflector<T>::from(context, type, value, path, result);
}

// Decodes |value| of schema |type| into |target|, which is only assigned if the conversion succeeds.
template <typename T>
Diagnostics into(Context* context, const attr::Type& type, const wire::Value& value, T& target,
                 const Path& path = Path()) {
    T result{};
    auto diagnostics = buildValue(context, type, value, result, path);
    if (!diagnostics.hasError()) {
        target = std::move(result);
    }
    return diagnostics;
}

} // namespace reflect
} // namespace attrmap

#endif // SRC_ATTRMAP_REFLECT_CONVERT_HPP_
