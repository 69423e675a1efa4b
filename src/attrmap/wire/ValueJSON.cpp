#include "attrmap/wire/ValueJSON.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <cmath>

namespace {

using attrmap::wire::AttributeTypeMap;
using attrmap::wire::Type;
using attrmap::wire::TypeKind;
using attrmap::wire::Value;
using attrmap::wire::ValueList;
using attrmap::wire::ValueMap;

bool decodeType(const rapidjson::Value& json, size_t depth, Type& type, std::string& error) {
    if (depth > attrmap::wire::kMaxJSONDepth) {
        error = fmt::format("type nesting is deeper than {} levels", attrmap::wire::kMaxJSONDepth);
        return false;
    }
    if (json.IsString()) {
        std::string_view name(json.GetString(), json.GetStringLength());
        if (name == "string") {
            type = Type::string();
        } else if (name == "number") {
            type = Type::number();
        } else if (name == "bool") {
            type = Type::boolean();
        } else {
            error = fmt::format("unknown primitive type \"{}\"", name);
            return false;
        }
        return true;
    }

    if (!json.IsArray() || json.Size() != 2 || !json[rapidjson::SizeType(0)].IsString()) {
        error = "type must be a primitive type name or a two-element array";
        return false;
    }

    std::string_view kind(json[rapidjson::SizeType(0)].GetString(), json[rapidjson::SizeType(0)].GetStringLength());
    const rapidjson::Value& argument = json[rapidjson::SizeType(1)];

    if (kind == "object") {
        if (!argument.IsObject()) {
            error = "object type attributes must be a JSON object";
            return false;
        }
        AttributeTypeMap attributeTypes;
        for (auto member = argument.MemberBegin(); member != argument.MemberEnd(); ++member) {
            std::string name(member->name.GetString(), member->name.GetStringLength());
            Type attributeType;
            if (!decodeType(member->value, depth + 1, attributeType, error)) {
                return false;
            }
            if (!attributeTypes.emplace(name, attributeType).second) {
                error = fmt::format("object type has more than one attribute named \"{}\"", name);
                return false;
            }
        }
        type = Type::object(std::move(attributeTypes));
        return true;
    }

    Type elementType;
    if (!decodeType(argument, depth + 1, elementType, error)) {
        return false;
    }
    if (kind == "list") {
        type = Type::list(elementType);
    } else if (kind == "set") {
        type = Type::set(elementType);
    } else if (kind == "map") {
        type = Type::map(elementType);
    } else {
        error = fmt::format("unknown collection type \"{}\"", kind);
        return false;
    }
    return true;
}

bool decodeValue(const rapidjson::Value& json, const Type& type, const std::string& where, size_t depth, Value& value,
                 std::string& error) {
    if (depth > attrmap::wire::kMaxJSONDepth) {
        error = fmt::format("{}: nesting is deeper than {} levels", where, attrmap::wire::kMaxJSONDepth);
        return false;
    }
    if (json.IsNull()) {
        value = Value::null(type);
        return true;
    }

    switch (type.kind()) {
    case TypeKind::kString:
        if (!json.IsString()) {
            error = fmt::format("{}: expected a JSON string", where);
            return false;
        }
        value = Value::makeString(std::string(json.GetString(), json.GetStringLength()));
        return true;

    case TypeKind::kNumber:
        if (!json.IsNumber()) {
            error = fmt::format("{}: expected a JSON number", where);
            return false;
        }
        value = Value::makeNumber(json.GetDouble());
        return true;

    case TypeKind::kBool:
        if (!json.IsBool()) {
            error = fmt::format("{}: expected a JSON boolean", where);
            return false;
        }
        value = Value::makeBool(json.GetBool());
        return true;

    case TypeKind::kList:
    case TypeKind::kSet: {
        if (!json.IsArray()) {
            error = fmt::format("{}: expected a JSON array", where);
            return false;
        }
        ValueList elements;
        elements.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            Value element;
            if (!decodeValue(json[i], type.elementType(), fmt::format("{}[{}]", where, i), depth + 1, element, error)) {
                return false;
            }
            elements.emplace_back(std::move(element));
        }
        value = type.is(TypeKind::kList) ? Value::makeList(type.elementType(), std::move(elements)) :
                                           Value::makeSet(type.elementType(), std::move(elements));
        return true;
    }

    case TypeKind::kMap: {
        if (!json.IsObject()) {
            error = fmt::format("{}: expected a JSON object", where);
            return false;
        }
        ValueMap elements;
        for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
            std::string key(member->name.GetString(), member->name.GetStringLength());
            auto elementWhere = fmt::format("{}[\"{}\"]", where, key);
            Value element;
            if (!decodeValue(member->value, type.elementType(), elementWhere, depth + 1, element, error)) {
                return false;
            }
            if (!elements.emplace(std::move(key), std::move(element)).second) {
                error = fmt::format("{}: duplicate map key", elementWhere);
                return false;
            }
        }
        value = Value::makeMap(type.elementType(), std::move(elements));
        return true;
    }

    case TypeKind::kObject: {
        if (!json.IsObject()) {
            error = fmt::format("{}: expected a JSON object", where);
            return false;
        }
        const auto& attributeTypes = type.attributeTypes();
        ValueMap attributes;
        for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
            std::string name(member->name.GetString(), member->name.GetStringLength());
            auto typeIter = attributeTypes.find(name);
            if (typeIter == attributeTypes.end()) {
                error = fmt::format("{}: unsupported attribute \"{}\"", where, name);
                return false;
            }
            auto attributeWhere = fmt::format("{}.{}", where, name);
            Value attribute;
            if (!decodeValue(member->value, typeIter->second, attributeWhere, depth + 1, attribute, error)) {
                return false;
            }
            if (!attributes.emplace(std::move(name), std::move(attribute)).second) {
                error = fmt::format("{}: duplicate attribute", attributeWhere);
                return false;
            }
        }
        // Attributes left out of the JSON object are null.
        for (const auto& attributeType : attributeTypes) {
            if (attributes.find(attributeType.first) == attributes.end()) {
                attributes.emplace(attributeType.first, Value::null(attributeType.second));
            }
        }
        value = Value::makeObject(attributeTypes, std::move(attributes));
        return true;
    }
    }

    error = fmt::format("{}: unsupported type {}", where, type.toString());
    return false;
}

} // namespace

namespace attrmap { namespace wire {

bool parseTypeJSON(std::string_view json, Type& type, std::string& error) {
    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse<rapidjson::kParseIterativeFlag>(json.data(), json.size());
    if (!parseResult) {
        error = fmt::format("JSON parse error at offset {}: {}", parseResult.Offset(),
                            rapidjson::GetParseError_En(parseResult.Code()));
        return false;
    }
    return decodeType(document, 0, type, error);
}

bool parseValueJSON(std::string_view json, const Type& type, Value& value, std::string& error) {
    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse<rapidjson::kParseIterativeFlag>(json.data(), json.size());
    if (!parseResult) {
        error = fmt::format("JSON parse error at offset {}: {}", parseResult.Offset(),
                            rapidjson::GetParseError_En(parseResult.Code()));
        return false;
    }
    if (!decodeValue(document, type, "value", 0, value, error)) {
        return false;
    }
    // Catches duplicate set elements, which the JSON decoding alone does not.
    error = value.validate();
    return error.empty();
}

class ValueDumpJSON::Impl {
public:
    ~Impl() = default;

    bool dump(const Value& value, bool prettyPrint) {
        m_doc.SetNull();
        m_buffer.Clear();
        m_error.clear();
        if (!encodeValue(value, "value", m_doc)) {
            return false;
        }
        return write(prettyPrint);
    }

    bool dumpType(const Type& type, bool prettyPrint) {
        m_doc.SetNull();
        m_buffer.Clear();
        m_error.clear();
        encodeType(type, m_doc);
        return write(prettyPrint);
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }
    const std::string& error() const { return m_error; }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;
    std::string m_error;

    bool write(bool prettyPrint) {
        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        if (!result) {
            m_error = "JSON writer rejected the document";
        }
        return result;
    }

    void encodeType(const Type& type, rapidjson::Value& json) {
        auto& alloc = m_doc.GetAllocator();

        switch (type.kind()) {
        case TypeKind::kString:
            json.SetString("string", alloc);
            return;
        case TypeKind::kNumber:
            json.SetString("number", alloc);
            return;
        case TypeKind::kBool:
            json.SetString("bool", alloc);
            return;
        case TypeKind::kList:
        case TypeKind::kSet:
        case TypeKind::kMap: {
            json.SetArray();
            const char* kind = type.is(TypeKind::kList) ? "list" : (type.is(TypeKind::kSet) ? "set" : "map");
            json.PushBack(rapidjson::Value(kind, alloc), alloc);
            rapidjson::Value element;
            encodeType(type.elementType(), element);
            json.PushBack(element, alloc);
            return;
        }
        case TypeKind::kObject: {
            json.SetArray();
            json.PushBack(rapidjson::Value("object", alloc), alloc);
            rapidjson::Value attributes;
            attributes.SetObject();
            for (const auto& attributeType : type.attributeTypes()) {
                rapidjson::Value attribute;
                encodeType(attributeType.second, attribute);
                attributes.AddMember(rapidjson::Value(attributeType.first.data(), attributeType.first.size(), alloc),
                                     attribute, alloc);
            }
            json.PushBack(attributes, alloc);
            return;
        }
        }
    }

    bool encodeValue(const Value& value, const std::string& where, rapidjson::Value& json) {
        auto& alloc = m_doc.GetAllocator();

        if (!value.isKnown()) {
            m_error = fmt::format("{}: unknown values have no JSON form", where);
            return false;
        }
        if (value.isNull()) {
            json.SetNull();
            return true;
        }

        switch (value.type().kind()) {
        case TypeKind::kString:
            json.SetString(value.getString().data(), value.getString().size(), alloc);
            return true;

        case TypeKind::kNumber: {
            // rapidjson silently fails to encode NaN and inf doubles.
            auto number = value.getNumber();
            if (!std::isfinite(number)) {
                m_error = fmt::format("{}: non-finite number {} has no JSON form", where, number);
                return false;
            }
            if (std::trunc(number) == number && std::fabs(number) < 9007199254740992.0) {
                json.SetInt64(static_cast<int64_t>(number));
            } else {
                json.SetDouble(number);
            }
            return true;
        }

        case TypeKind::kBool:
            json.SetBool(value.getBool());
            return true;

        case TypeKind::kList:
        case TypeKind::kSet: {
            json.SetArray();
            const auto& elements = value.getElements();
            for (size_t i = 0; i < elements.size(); ++i) {
                rapidjson::Value element;
                if (!encodeValue(elements[i], fmt::format("{}[{}]", where, i), element)) {
                    return false;
                }
                json.PushBack(element, alloc);
            }
            return true;
        }

        case TypeKind::kMap:
        case TypeKind::kObject: {
            json.SetObject();
            bool isObject = value.type().is(TypeKind::kObject);
            for (const auto& element : value.getMap()) {
                rapidjson::Value member;
                auto memberWhere = isObject ? fmt::format("{}.{}", where, element.first) :
                                              fmt::format("{}[\"{}\"]", where, element.first);
                if (!encodeValue(element.second, memberWhere, member)) {
                    return false;
                }
                json.AddMember(rapidjson::Value(element.first.data(), element.first.size(), alloc), member, alloc);
            }
            return true;
        }
        }

        m_error = fmt::format("{}: unsupported type {}", where, value.type().toString());
        return false;
    }
};

ValueDumpJSON::ValueDumpJSON(): m_impl(std::make_unique<ValueDumpJSON::Impl>()) {}

ValueDumpJSON::~ValueDumpJSON() {}

bool ValueDumpJSON::dump(const Value& value, bool prettyPrint) {
    if (!m_impl->dump(value, prettyPrint)) {
        SPDLOG_DEBUG("JSON dump failed: {}", m_impl->error());
        return false;
    }
    return true;
}

bool ValueDumpJSON::dumpType(const Type& type, bool prettyPrint) {
    return m_impl->dumpType(type, prettyPrint);
}

std::string_view ValueDumpJSON::json() const {
    return m_impl->json();
}

const std::string& ValueDumpJSON::error() const {
    return m_impl->error();
}

} // namespace wire
} // namespace attrmap
