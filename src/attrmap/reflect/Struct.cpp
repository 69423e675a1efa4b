#include "attrmap/reflect/Struct.hpp"

namespace attrmap { namespace reflect {

bool objectFields(const wire::Value& value, std::map<std::string, wire::Value>& attributes, std::string& error) {
    if (!value.type().is(wire::TypeKind::kObject)) {
        error = fmt::format("expected an Object value, got {}", value.type().toString());
        return false;
    }
    if (!value.isKnown()) {
        error = "can't read the attributes of an unknown Object";
        return false;
    }
    attributes.clear();
    if (value.isNull()) {
        return true;
    }
    auto invalid = value.validate();
    if (!invalid.empty()) {
        error = invalid;
        return false;
    }
    attributes = value.getMap();
    return true;
}

bool checkContext(Context* context, const Path& path, Diagnostics& diagnostics) {
    auto reason = context->err();
    if (reason.empty()) {
        return true;
    }
    SPDLOG_DEBUG("Conversion stopped at '{}': {}", path.toString(), reason);
    diagnostics.append(cancelledDiag(path, reason));
    return false;
}

Diagnostics assembleObject(Context* context, const attr::TypeWithAttributeTypes& type,
                           const attr::AttributeTypes& attributeTypes, wire::AttributeTypeMap wireTypes,
                           wire::ValueMap wireValues, const Path& path, attr::ValuePtr& result) {
    Diagnostics diagnostics;
    auto object = wire::Value::makeObject(std::move(wireTypes), std::move(wireValues));
    auto error = object.validate();
    if (!error.empty()) {
        diagnostics.append(toWireValueErrorDiag(path, error));
        return diagnostics;
    }

    auto validator = dynamic_cast<const attr::TypeWithValidate*>(&type);
    if (validator) {
        diagnostics.append(validator->validate(context, object, path));
        if (diagnostics.hasError()) {
            return diagnostics;
        }
    }

    auto objectType = type.withAttributeTypes(attributeTypes);
    if (!objectType) {
        diagnostics.append(conversionErrorDiag(
            path, fmt::format("schema type {} returned no type for its attribute types", type.toString())));
        return diagnostics;
    }
    auto value = objectType->valueFromWire(context, object, error);
    if (!value) {
        diagnostics.append(valueFromWireErrorDiag(path, error));
        return diagnostics;
    }
    result = std::move(value);
    return diagnostics;
}

} // namespace reflect
} // namespace attrmap
