#ifndef SRC_ATTRMAP_TYPES_PRIMITIVE_HPP_
#define SRC_ATTRMAP_TYPES_PRIMITIVE_HPP_

#include "attrmap/attr/Type.hpp"
#include "attrmap/attr/Value.hpp"

#include <cstdint>
#include <string>

namespace attrmap { namespace types {

enum class ValueState { kNull, kUnknown, kKnown };

class StringType : public attr::Type {
public:
    StringType() = default;
    virtual ~StringType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override { return "StringType"; }
};

// A Number with arbitrary fractional part.
class NumberType : public attr::Type {
public:
    NumberType() = default;
    virtual ~NumberType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override { return "NumberType"; }
};

// A Number restricted to integers representable in 64 bits.
class Int64Type : public attr::Type {
public:
    Int64Type() = default;
    virtual ~Int64Type() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override { return "Int64Type"; }
};

class BoolType : public attr::Type {
public:
    BoolType() = default;
    virtual ~BoolType() = default;

    wire::Type wireType(Context* context) const override;
    attr::ValuePtr valueFromWire(Context* context, const wire::Value& value, std::string& error) const override;
    bool equal(const attr::Type& other) const override;
    std::string toString() const override { return "BoolType"; }
};

// Shared state handling for the primitive values. Default-constructed values are null.
template <typename T> class PrimitiveValue : public attr::Value {
public:
    virtual ~PrimitiveValue() = default;

    bool isNull() const override { return m_state == ValueState::kNull; }
    bool isUnknown() const override { return m_state == ValueState::kUnknown; }
    ValueState state() const { return m_state; }

protected:
    PrimitiveValue(): m_state(ValueState::kNull), m_value() {}
    PrimitiveValue(ValueState state, T value): m_state(state), m_value(std::move(value)) {}

    bool equalState(const PrimitiveValue<T>& other) const {
        if (m_state != other.m_state) {
            return false;
        }
        return m_state != ValueState::kKnown || m_value == other.m_value;
    }

    ValueState m_state;
    T m_value;
};

class StringValue : public PrimitiveValue<std::string> {
public:
    StringValue() = default;
    explicit StringValue(std::string value): PrimitiveValue<std::string>(ValueState::kKnown, std::move(value)) {}
    virtual ~StringValue() = default;

    static StringValue null() { return StringValue(); }
    static StringValue unknown() { return StringValue(ValueState::kUnknown); }

    // Empty for null and unknown values.
    const std::string& valueString() const { return m_value; }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override;

private:
    explicit StringValue(ValueState state): PrimitiveValue<std::string>(state, std::string()) {}
};

class NumberValue : public PrimitiveValue<double> {
public:
    NumberValue() = default;
    explicit NumberValue(double value): PrimitiveValue<double>(ValueState::kKnown, value) {}
    virtual ~NumberValue() = default;

    static NumberValue null() { return NumberValue(); }
    static NumberValue unknown() { return NumberValue(ValueState::kUnknown, 0.0); }

    double valueDouble() const { return m_value; }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override;

private:
    NumberValue(ValueState state, double value): PrimitiveValue<double>(state, value) {}
};

class Int64Value : public PrimitiveValue<int64_t> {
public:
    Int64Value() = default;
    explicit Int64Value(int64_t value): PrimitiveValue<int64_t>(ValueState::kKnown, value) {}
    virtual ~Int64Value() = default;

    static Int64Value null() { return Int64Value(); }
    static Int64Value unknown() { return Int64Value(ValueState::kUnknown, 0); }

    int64_t valueInt64() const { return m_value; }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override;

private:
    Int64Value(ValueState state, int64_t value): PrimitiveValue<int64_t>(state, value) {}
};

class BoolValue : public PrimitiveValue<bool> {
public:
    BoolValue() = default;
    explicit BoolValue(bool value): PrimitiveValue<bool>(ValueState::kKnown, value) {}
    virtual ~BoolValue() = default;

    static BoolValue null() { return BoolValue(); }
    static BoolValue unknown() { return BoolValue(ValueState::kUnknown, false); }

    bool valueBool() const { return m_value; }

    attr::TypePtr type(Context* context) const override;
    bool toWireValue(Context* context, wire::Value& value, std::string& error) const override;
    bool equal(const attr::Value& other) const override;
    std::string toString() const override;

private:
    BoolValue(ValueState state, bool value): PrimitiveValue<bool>(state, value) {}
};

} // namespace types
} // namespace attrmap

#endif // SRC_ATTRMAP_TYPES_PRIMITIVE_HPP_
