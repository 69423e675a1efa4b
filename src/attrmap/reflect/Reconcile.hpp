#ifndef SRC_ATTRMAP_REFLECT_RECONCILE_HPP_
#define SRC_ATTRMAP_REFLECT_RECONCILE_HPP_

#include <string>
#include <vector>

namespace attrmap { namespace reflect {

// The names present on only one side of a record and an Object or attribute type directory, both sorted.
struct Reconciliation {
    std::vector<std::string> recordOnly;
    std::vector<std::string> otherOnly;

    bool matches() const { return recordOnly.empty() && otherOnly.empty(); }
};

Reconciliation reconcileNames(const std::vector<std::string>& recordNames, const std::vector<std::string>& otherNames);

enum class ReconcileTarget {
    kObject,     // decoding, names come from an Object value
    kAttributes  // encoding, names come from the attribute types of the schema
};

// Returns an empty string if |recordNames| and |otherNames| are the same set, otherwise the mismatch message naming
// the fields missing on each side.
std::string reconcileFields(const std::vector<std::string>& recordNames, const std::vector<std::string>& otherNames,
                            ReconcileTarget target);

} // namespace reflect
} // namespace attrmap

#endif // SRC_ATTRMAP_REFLECT_RECONCILE_HPP_
