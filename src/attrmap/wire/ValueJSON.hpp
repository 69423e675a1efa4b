#ifndef SRC_ATTRMAP_WIRE_VALUE_JSON_HPP_
#define SRC_ATTRMAP_WIRE_VALUE_JSON_HPP_

#include "attrmap/wire/Type.hpp"
#include "attrmap/wire/Value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace attrmap { namespace wire {

// Types and values nested deeper than this fail to parse.
constexpr size_t kMaxJSONDepth = 64;

// Parses a type description in JSON. Primitive types are the strings "string", "number", and "bool". Collections are
// two-element arrays ["list", T], ["set", T], ["map", T], and objects are ["object", {"name": T, ...}]. Returns false
// and fills |error| on failure, including when an object type repeats an attribute name.
bool parseTypeJSON(std::string_view json, Type& type, std::string& error);

// Parses plain JSON into a Value of |type|. JSON null becomes a null Value at any depth. Returns false and fills
// |error| on failure, including when the JSON does not conform to |type| or repeats a member name.
bool parseValueJSON(std::string_view json, const Type& type, Value& value, std::string& error);

// To avoid copying strings around this class wraps the string and provides access to it via the json() accessor.
class ValueDumpJSON {
public:
    ValueDumpJSON();
    ~ValueDumpJSON();

    // Unknown values and non-finite numbers have no JSON form, dumping them fails and error() explains why.
    bool dump(const Value& value, bool prettyPrint);
    bool dumpType(const Type& type, bool prettyPrint);

    std::string_view json() const;
    const std::string& error() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace wire
} // namespace attrmap

#endif // SRC_ATTRMAP_WIRE_VALUE_JSON_HPP_
