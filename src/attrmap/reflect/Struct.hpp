#ifndef SRC_ATTRMAP_REFLECT_STRUCT_HPP_
#define SRC_ATTRMAP_REFLECT_STRUCT_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/attr/Value.hpp"
#include "attrmap/Context.hpp"
#include "attrmap/Diagnostics.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/reflect/Diags.hpp"
#include "attrmap/reflect/Reconcile.hpp"
#include "attrmap/reflect/Record.hpp"
#include "attrmap/wire/Value.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace attrmap { namespace reflect {

// Copies the attributes of Object |value| into |attributes|. A null Object has no attributes. Returns false and fills
// |error| if |value| is not an Object, is unknown, or does not match its own type.
bool objectFields(const wire::Value& value, std::map<std::string, wire::Value>& attributes, std::string& error);

// Returns false, and appends a cancellation diagnostic at |path| to |diagnostics|, if |context| has been cancelled or
// its deadline has passed.
bool checkContext(Context* context, const Path& path, Diagnostics& diagnostics);

// Final step of encoding a record. Builds the Object from the converted attributes, offers it to the validation hook
// of |type| if it has one, then has a Type with |attributeTypes| build the schema value for it into |result|.
Diagnostics assembleObject(Context* context, const attr::TypeWithAttributeTypes& type,
                           const attr::AttributeTypes& attributeTypes, wire::AttributeTypeMap wireTypes,
                           wire::ValueMap wireValues, const Path& path, attr::ValuePtr& result);

// Decodes the Object |object|, described by schema |type|, into the record |target|. The names of the record fields
// and of the Object attributes must match exactly. Conversion stops at the first field that fails, and |target| is
// only assigned once every field has converted.
template <typename T>
Diagnostics decodeStruct(Context* context, const attr::Type& type, const wire::Value& object, T& target,
                         const Path& path) {
    static_assert(IsRecord<T>::value, "decodeStruct needs a record type with a describeRecord() function");
    SPDLOG_TRACE("Decoding record {} at '{}'", recordName<T>(), path.toString());

    Diagnostics diagnostics;
    if (!object.type().is(wire::TypeKind::kObject)) {
        diagnostics.append(
            incompatibleTypeDiag(path, object, recordName<T>(), "can't decode a record from a non-object value"));
        return diagnostics;
    }
    auto objectType = dynamic_cast<const attr::TypeWithAttributeTypes*>(&type);
    if (!objectType) {
        diagnostics.append(incompatibleTypeDiag(
            path, object, recordName<T>(),
            fmt::format("schema type {} does not describe the types of its attributes", type.toString())));
        return diagnostics;
    }

    std::map<std::string, wire::Value> attributes;
    std::string error;
    if (!objectFields(object, attributes, error)) {
        diagnostics.append(incompatibleTypeDiag(path, object, recordName<T>(), error));
        return diagnostics;
    }
    RecordFields<T> record;
    if (!typeFields<T>(record, error)) {
        diagnostics.append(incompatibleTypeDiag(path, object, recordName<T>(), error));
        return diagnostics;
    }

    std::vector<std::string> objectNames;
    objectNames.reserve(attributes.size());
    for (const auto& attribute : attributes) {
        objectNames.emplace_back(attribute.first);
    }
    error = reconcileFields(record.names(), objectNames, ReconcileTarget::kObject);
    if (!error.empty()) {
        SPDLOG_DEBUG("Decoding record {} at '{}' failed: {}", record.recordName, path.toString(), error);
        diagnostics.append(incompatibleTypeDiag(path, object, record.recordName, error));
        return diagnostics;
    }

    auto attributeTypes = objectType->attributeTypes();
    T result{};
    for (const auto& field : record.fields) {
        auto fieldPath = path.atName(field.name);
        if (!checkContext(context, fieldPath, diagnostics)) {
            return diagnostics;
        }
        auto typeIter = attributeTypes.find(field.name);
        if (typeIter == attributeTypes.end() || !typeIter->second) {
            diagnostics.append(conversionErrorDiag(
                fieldPath, fmt::format("Could not find type information for attribute in supplied type {}",
                                       type.toString())));
            return diagnostics;
        }
        auto attribute = attributes.find(field.name);
        diagnostics.append(field.access->decode(context, *typeIter->second, attribute->second, result, fieldPath));
        if (diagnostics.hasError()) {
            SPDLOG_DEBUG("Decoding record {} stopped at field '{}'", record.recordName, fieldPath.toString());
            return diagnostics;
        }
    }

    target = std::move(result);
    return diagnostics;
}

// Encodes |value| into a schema value of |type| in |result|. The record field names and the attribute names of |type|
// must match exactly. |result| is left untouched on failure.
template <typename T>
Diagnostics encodeStruct(Context* context, const attr::TypeWithAttributeTypes& type, const T& value, const Path& path,
                         attr::ValuePtr& result) {
    static_assert(IsRecord<T>::value, "encodeStruct needs a record type with a describeRecord() function");
    SPDLOG_TRACE("Encoding record {} at '{}'", recordName<T>(), path.toString());

    Diagnostics diagnostics;
    RecordFields<T> record;
    std::string error;
    if (!typeFields<T>(record, error)) {
        diagnostics.append(conversionErrorDiag(path, error));
        return diagnostics;
    }

    auto attributeTypes = type.attributeTypes();
    std::vector<std::string> attributeNames;
    attributeNames.reserve(attributeTypes.size());
    for (const auto& attributeType : attributeTypes) {
        attributeNames.emplace_back(attributeType.first);
    }
    error = reconcileFields(record.names(), attributeNames, ReconcileTarget::kAttributes);
    if (!error.empty()) {
        SPDLOG_DEBUG("Encoding record {} at '{}' failed: {}", record.recordName, path.toString(), error);
        diagnostics.append(conversionErrorDiag(path, error));
        return diagnostics;
    }

    wire::AttributeTypeMap wireTypes;
    wire::ValueMap wireValues;
    for (const auto& field : record.fields) {
        auto fieldPath = path.atName(field.name);
        if (!checkContext(context, fieldPath, diagnostics)) {
            return diagnostics;
        }
        auto typeIter = attributeTypes.find(field.name);
        if (!typeIter->second) {
            diagnostics.append(conversionErrorDiag(
                fieldPath, fmt::format("Could not find type information for attribute in supplied type {}",
                                       type.toString())));
            return diagnostics;
        }

        attr::ValuePtr attribute;
        diagnostics.append(field.access->encode(context, *typeIter->second, value, fieldPath, attribute));
        if (diagnostics.hasError()) {
            SPDLOG_DEBUG("Encoding record {} stopped at field '{}'", record.recordName, fieldPath.toString());
            return diagnostics;
        }
        if (!attribute) {
            diagnostics.append(conversionErrorDiag(fieldPath, "field conversion produced no value"));
            return diagnostics;
        }

        wire::Value wireAttribute;
        if (!attribute->toWireValue(context, wireAttribute, error)) {
            diagnostics.append(toWireValueErrorDiag(fieldPath, error));
            return diagnostics;
        }
        wireTypes.emplace(field.name, typeIter->second->wireType(context));
        wireValues.emplace(field.name, std::move(wireAttribute));
    }

    diagnostics.append(assembleObject(context, type, attributeTypes, std::move(wireTypes), std::move(wireValues), path,
                                      result));
    return diagnostics;
}

} // namespace reflect
} // namespace attrmap

// The field conversions the engines dispatch to. Included last, as it depends on the declarations above.
#include "attrmap/reflect/Convert.hpp"

#endif // SRC_ATTRMAP_REFLECT_STRUCT_HPP_
