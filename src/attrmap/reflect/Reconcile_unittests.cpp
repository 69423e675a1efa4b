#include "attrmap/reflect/Reconcile.hpp"

#include "doctest/doctest.h"

namespace attrmap { namespace reflect {

TEST_CASE("reconcileNames") {
    SUBCASE("same names in any order") {
        auto reconciliation = reconcileNames({"name", "age"}, {"age", "name"});
        CHECK(reconciliation.matches());
    }
    SUBCASE("both directions are sorted") {
        auto reconciliation = reconcileNames({"zeta", "name", "alpha"}, {"name", "omega", "beta"});
        CHECK_FALSE(reconciliation.matches());
        CHECK_EQ(reconciliation.recordOnly, (std::vector<std::string>{"alpha", "zeta"}));
        CHECK_EQ(reconciliation.otherOnly, (std::vector<std::string>{"beta", "omega"}));
    }
    SUBCASE("empty sides") {
        CHECK(reconcileNames({}, {}).matches());
        CHECK_EQ(reconcileNames({}, {"a"}).otherOnly, (std::vector<std::string>{"a"}));
    }
}

TEST_CASE("reconcileFields messages") {
    SUBCASE("match") {
        CHECK_EQ(reconcileFields({"a"}, {"a"}, ReconcileTarget::kObject), "");
    }
    SUBCASE("object only") {
        CHECK_EQ(reconcileFields({"name"}, {"name", "extra"}, ReconcileTarget::kObject),
                 "mismatch between struct and object: Object defines fields not found in struct: extra.");
    }
    SUBCASE("record only") {
        CHECK_EQ(reconcileFields({"name", "b", "a"}, {"name"}, ReconcileTarget::kObject),
                 "mismatch between struct and object: Struct defines fields not found in object: a, b.");
    }
    SUBCASE("both directions") {
        CHECK_EQ(reconcileFields({"a", "b"}, {"c"}, ReconcileTarget::kObject),
                 "mismatch between struct and object: Struct defines fields not found in object: a, b. Object "
                 "defines fields not found in struct: c.");
        CHECK_EQ(reconcileFields({"a"}, {"c"}, ReconcileTarget::kAttributes),
                 "mismatch between struct and attributes: Struct defines fields not found in attributes: a. "
                 "Attributes define fields not found in struct: c.");
    }
}

} // namespace reflect
} // namespace attrmap
