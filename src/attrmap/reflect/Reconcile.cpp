#include "attrmap/reflect/Reconcile.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace attrmap { namespace reflect {

Reconciliation reconcileNames(const std::vector<std::string>& recordNames, const std::vector<std::string>& otherNames) {
    std::set<std::string> recordSet(recordNames.begin(), recordNames.end());
    std::set<std::string> otherSet(otherNames.begin(), otherNames.end());

    Reconciliation reconciliation;
    std::set_difference(recordSet.begin(), recordSet.end(), otherSet.begin(), otherSet.end(),
                        std::back_inserter(reconciliation.recordOnly));
    std::set_difference(otherSet.begin(), otherSet.end(), recordSet.begin(), recordSet.end(),
                        std::back_inserter(reconciliation.otherOnly));
    return reconciliation;
}

std::string reconcileFields(const std::vector<std::string>& recordNames, const std::vector<std::string>& otherNames,
                            ReconcileTarget target) {
    auto reconciliation = reconcileNames(recordNames, otherNames);
    if (reconciliation.matches()) {
        return std::string();
    }

    bool isObject = target == ReconcileTarget::kObject;
    std::string message = isObject ? "mismatch between struct and object:" : "mismatch between struct and attributes:";
    if (!reconciliation.recordOnly.empty()) {
        message += fmt::format(" Struct defines fields not found in {}: {}.", isObject ? "object" : "attributes",
                               fmt::join(reconciliation.recordOnly, ", "));
    }
    if (!reconciliation.otherOnly.empty()) {
        message += fmt::format(" {} fields not found in struct: {}.",
                               isObject ? "Object defines" : "Attributes define",
                               fmt::join(reconciliation.otherOnly, ", "));
    }
    return message;
}

} // namespace reflect
} // namespace attrmap
