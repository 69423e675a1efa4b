#ifndef SRC_ATTRMAP_REFLECT_DIAGS_HPP_
#define SRC_ATTRMAP_REFLECT_DIAGS_HPP_

#include "attrmap/Diagnostics.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/wire/Value.hpp"

#include <cstdint>
#include <string_view>

// Builders for the diagnostics reported by the reflect conversions. All of them are errors attributed to |path|.
namespace attrmap { namespace reflect {

static constexpr const char* kValueConversionError = "Value Conversion Error";

// |value| cannot be stored in a native |targetType|, for the stated |reason|.
Diagnostic incompatibleTypeDiag(const Path& path, const wire::Value& value, std::string_view targetType,
                                std::string_view reason);

// The schema built a value of a different class than the native target.
Diagnostic wrongValueTypeDiag(const Path& path, std::string_view valueType, std::string_view targetType,
                              std::string_view schemaType);

Diagnostic toWireValueErrorDiag(const Path& path, std::string_view error);
Diagnostic valueFromWireErrorDiag(const Path& path, std::string_view error);
Diagnostic unhandledNullDiag(const Path& path, std::string_view targetType);
Diagnostic unhandledUnknownDiag(const Path& path, std::string_view targetType);
Diagnostic cancelledDiag(const Path& path, std::string_view reason);
Diagnostic depthExceededDiag(const Path& path, int32_t maxDepth);

// Catch-all for conversion failures that are programming errors in the calling code, like a missing type.
Diagnostic conversionErrorDiag(const Path& path, std::string_view error);

} // namespace reflect
} // namespace attrmap

#endif // SRC_ATTRMAP_REFLECT_DIAGS_HPP_
