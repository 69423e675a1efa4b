#include "attrmap/types/Primitive.hpp"

#include "fmt/format.h"

#include <cmath>

namespace {

using attrmap::types::ValueState;

// Common preamble of valueFromWire() for the primitive types. Returns false if |value| is not of |expected| kind.
bool checkWireKind(const attrmap::wire::Value& value, attrmap::wire::TypeKind expected, const char* typeName,
                   std::string& error) {
    if (!value.type().is(expected)) {
        error = fmt::format("can't build {} from a {} value", typeName, value.type().toString());
        return false;
    }
    return true;
}

std::string stateString(ValueState state) {
    return state == ValueState::kNull ? "<null>" : "<unknown>";
}

} // namespace

namespace attrmap { namespace types {

////////////////
// StringType
wire::Type StringType::wireType(Context* /* context */) const {
    return wire::Type::string();
}

attr::ValuePtr StringType::valueFromWire(Context* /* context */, const wire::Value& value, std::string& error) const {
    if (!checkWireKind(value, wire::TypeKind::kString, "StringType", error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<StringValue>(StringValue::unknown());
    }
    if (value.isNull()) {
        return std::make_shared<StringValue>(StringValue::null());
    }
    return std::make_shared<StringValue>(value.getString());
}

bool StringType::equal(const attr::Type& other) const {
    return dynamic_cast<const StringType*>(&other) != nullptr;
}

////////////////
// NumberType
wire::Type NumberType::wireType(Context* /* context */) const {
    return wire::Type::number();
}

attr::ValuePtr NumberType::valueFromWire(Context* /* context */, const wire::Value& value, std::string& error) const {
    if (!checkWireKind(value, wire::TypeKind::kNumber, "NumberType", error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<NumberValue>(NumberValue::unknown());
    }
    if (value.isNull()) {
        return std::make_shared<NumberValue>(NumberValue::null());
    }
    return std::make_shared<NumberValue>(value.getNumber());
}

bool NumberType::equal(const attr::Type& other) const {
    return dynamic_cast<const NumberType*>(&other) != nullptr;
}

////////////////
// Int64Type
wire::Type Int64Type::wireType(Context* /* context */) const {
    return wire::Type::number();
}

attr::ValuePtr Int64Type::valueFromWire(Context* /* context */, const wire::Value& value, std::string& error) const {
    if (!checkWireKind(value, wire::TypeKind::kNumber, "Int64Type", error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<Int64Value>(Int64Value::unknown());
    }
    if (value.isNull()) {
        return std::make_shared<Int64Value>(Int64Value::null());
    }
    double number = value.getNumber();
    if (std::trunc(number) != number) {
        error = fmt::format("value {} is not an integer", number);
        return nullptr;
    }
    // 2^63 is exactly representable as a double, the largest int64 is not.
    if (number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
        error = fmt::format("value {} cannot be represented as a 64-bit integer", number);
        return nullptr;
    }
    return std::make_shared<Int64Value>(static_cast<int64_t>(number));
}

bool Int64Type::equal(const attr::Type& other) const {
    return dynamic_cast<const Int64Type*>(&other) != nullptr;
}

////////////////
// BoolType
wire::Type BoolType::wireType(Context* /* context */) const {
    return wire::Type::boolean();
}

attr::ValuePtr BoolType::valueFromWire(Context* /* context */, const wire::Value& value, std::string& error) const {
    if (!checkWireKind(value, wire::TypeKind::kBool, "BoolType", error)) {
        return nullptr;
    }
    if (!value.isKnown()) {
        return std::make_shared<BoolValue>(BoolValue::unknown());
    }
    if (value.isNull()) {
        return std::make_shared<BoolValue>(BoolValue::null());
    }
    return std::make_shared<BoolValue>(value.getBool());
}

bool BoolType::equal(const attr::Type& other) const {
    return dynamic_cast<const BoolType*>(&other) != nullptr;
}

////////////////
// StringValue
attr::TypePtr StringValue::type(Context* /* context */) const {
    return std::make_shared<StringType>();
}

bool StringValue::toWireValue(Context* /* context */, wire::Value& value, std::string& /* error */) const {
    switch (m_state) {
    case ValueState::kNull:
        value = wire::Value::null(wire::Type::string());
        break;
    case ValueState::kUnknown:
        value = wire::Value::unknown(wire::Type::string());
        break;
    case ValueState::kKnown:
        value = wire::Value::makeString(m_value);
        break;
    }
    return true;
}

bool StringValue::equal(const attr::Value& other) const {
    auto otherString = dynamic_cast<const StringValue*>(&other);
    return otherString && equalState(*otherString);
}

std::string StringValue::toString() const {
    return m_state == ValueState::kKnown ? fmt::format("\"{}\"", m_value) : stateString(m_state);
}

////////////////
// NumberValue
attr::TypePtr NumberValue::type(Context* /* context */) const {
    return std::make_shared<NumberType>();
}

bool NumberValue::toWireValue(Context* /* context */, wire::Value& value, std::string& /* error */) const {
    switch (m_state) {
    case ValueState::kNull:
        value = wire::Value::null(wire::Type::number());
        break;
    case ValueState::kUnknown:
        value = wire::Value::unknown(wire::Type::number());
        break;
    case ValueState::kKnown:
        value = wire::Value::makeNumber(m_value);
        break;
    }
    return true;
}

bool NumberValue::equal(const attr::Value& other) const {
    auto otherNumber = dynamic_cast<const NumberValue*>(&other);
    return otherNumber && equalState(*otherNumber);
}

std::string NumberValue::toString() const {
    return m_state == ValueState::kKnown ? fmt::format("{}", m_value) : stateString(m_state);
}

////////////////
// Int64Value
attr::TypePtr Int64Value::type(Context* /* context */) const {
    return std::make_shared<Int64Type>();
}

bool Int64Value::toWireValue(Context* /* context */, wire::Value& value, std::string& /* error */) const {
    switch (m_state) {
    case ValueState::kNull:
        value = wire::Value::null(wire::Type::number());
        break;
    case ValueState::kUnknown:
        value = wire::Value::unknown(wire::Type::number());
        break;
    case ValueState::kKnown:
        value = wire::Value::makeNumber(static_cast<double>(m_value));
        break;
    }
    return true;
}

bool Int64Value::equal(const attr::Value& other) const {
    auto otherInt = dynamic_cast<const Int64Value*>(&other);
    return otherInt && equalState(*otherInt);
}

std::string Int64Value::toString() const {
    return m_state == ValueState::kKnown ? fmt::format("{}", m_value) : stateString(m_state);
}

////////////////
// BoolValue
attr::TypePtr BoolValue::type(Context* /* context */) const {
    return std::make_shared<BoolType>();
}

bool BoolValue::toWireValue(Context* /* context */, wire::Value& value, std::string& /* error */) const {
    switch (m_state) {
    case ValueState::kNull:
        value = wire::Value::null(wire::Type::boolean());
        break;
    case ValueState::kUnknown:
        value = wire::Value::unknown(wire::Type::boolean());
        break;
    case ValueState::kKnown:
        value = wire::Value::makeBool(m_value);
        break;
    }
    return true;
}

bool BoolValue::equal(const attr::Value& other) const {
    auto otherBool = dynamic_cast<const BoolValue*>(&other);
    return otherBool && equalState(*otherBool);
}

std::string BoolValue::toString() const {
    return m_state == ValueState::kKnown ? (m_value ? "true" : "false") : stateString(m_state);
}

} // namespace types
} // namespace attrmap
