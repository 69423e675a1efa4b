#include "attrmap/reflect/Diags.hpp"

#include "fmt/format.h"

namespace {

const char* kProgrammingError = "This is always an error in the code calling the conversion, please report it to "
                                "its developers:";

attrmap::Diagnostic makeError(const attrmap::Path& path, std::string summary, std::string detail) {
    return attrmap::Diagnostic{attrmap::Severity::kError, std::move(summary), std::move(detail), path};
}

} // namespace

namespace attrmap { namespace reflect {

Diagnostic incompatibleTypeDiag(const Path& path, const wire::Value& value, std::string_view targetType,
                                std::string_view reason) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert from value. {}\n\n"
                                 "Cannot convert {} into {}: {}",
                                 kProgrammingError, value.toString(), targetType, reason));
}

Diagnostic wrongValueTypeDiag(const Path& path, std::string_view valueType, std::string_view targetType,
                              std::string_view schemaType) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert into a value. {}\n\n"
                                 "Cannot use a value of {} as {}, only values built by {} are supported because it "
                                 "is the type in the schema.",
                                 kProgrammingError, valueType, targetType, schemaType));
}

Diagnostic toWireValueErrorDiag(const Path& path, std::string_view error) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert into its wire form. {}\n\n{}",
                                 kProgrammingError, error));
}

Diagnostic valueFromWireErrorDiag(const Path& path, std::string_view error) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert the wire form into a "
                                 "value. {}\n\n{}",
                                 kProgrammingError, error));
}

Diagnostic unhandledNullDiag(const Path& path, std::string_view targetType) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to build a value. {}\n\n"
                                 "Received null value, however the target type cannot handle null values. Use "
                                 "std::optional, a schema value type, or set Options::unhandledNullAsEmpty.\n\n"
                                 "Path: {}\nTarget Type: {}",
                                 kProgrammingError, path.toString(), targetType));
}

Diagnostic unhandledUnknownDiag(const Path& path, std::string_view targetType) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to build a value. {}\n\n"
                                 "Received unknown value, however the target type cannot handle unknown values. Use "
                                 "a schema value type, or set Options::unhandledUnknownAsEmpty.\n\n"
                                 "Path: {}\nTarget Type: {}",
                                 kProgrammingError, path.toString(), targetType));
}

Diagnostic cancelledDiag(const Path& path, std::string_view reason) {
    return makeError(path, "Conversion Cancelled",
                     fmt::format("The conversion stopped before completing: {}", reason));
}

Diagnostic depthExceededDiag(const Path& path, int32_t maxDepth) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert a value. {}\n\n"
                                 "Value is nested more than the maximum of {} levels.",
                                 kProgrammingError, maxDepth));
}

Diagnostic conversionErrorDiag(const Path& path, std::string_view error) {
    return makeError(path, kValueConversionError,
                     fmt::format("An unexpected error was encountered trying to convert a value. {}\n\n{}",
                                 kProgrammingError, error));
}

} // namespace reflect
} // namespace attrmap
