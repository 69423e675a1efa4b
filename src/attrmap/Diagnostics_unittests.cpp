#include "attrmap/Diagnostics.hpp"

#include "doctest/doctest.h"

namespace attrmap {

TEST_CASE("Diagnostics append") {
    SUBCASE("empty collection has no error") {
        Diagnostics diagnostics;
        CHECK(diagnostics.empty());
        CHECK_FALSE(diagnostics.hasError());
        CHECK_EQ(diagnostics.errorCount(), 0);
    }
    SUBCASE("duplicates are dropped") {
        Diagnostics diagnostics;
        diagnostics.addError("summary", "detail");
        diagnostics.addError("summary", "detail");
        CHECK_EQ(diagnostics.size(), 1);
        diagnostics.addAttributeError(Path().atName("a"), "summary", "detail");
        CHECK_EQ(diagnostics.size(), 2);
        diagnostics.addAttributeError(Path().atName("b"), "summary", "detail");
        CHECK_EQ(diagnostics.size(), 3);
        diagnostics.addAttributeError(Path().atName("a"), "summary", "detail");
        CHECK_EQ(diagnostics.size(), 3);
    }
    SUBCASE("warnings do not fail") {
        Diagnostics diagnostics;
        diagnostics.addWarning("careful", "something odd");
        diagnostics.addAttributeWarning(Path().atName("x"), "careful", "something odd");
        CHECK_EQ(diagnostics.size(), 2);
        CHECK_FALSE(diagnostics.hasError());
        CHECK_EQ(diagnostics.warningCount(), 2);
        diagnostics.addError("broken", "very");
        CHECK(diagnostics.hasError());
        CHECK_EQ(diagnostics.errorCount(), 1);
        CHECK_EQ(diagnostics.warningCount(), 2);
    }
    SUBCASE("appending collections keeps order and drops duplicates") {
        Diagnostics first;
        first.addError("one", "1");
        first.addError("two", "2");
        Diagnostics second;
        second.addError("two", "2");
        second.addError("three", "3");
        first.append(second);
        REQUIRE_EQ(first.size(), 3);
        CHECK_EQ(first[0].summary, "one");
        CHECK_EQ(first[1].summary, "two");
        CHECK_EQ(first[2].summary, "three");
    }
}

TEST_CASE("Diagnostic toString") {
    Diagnostic global{Severity::kError, "Broken", "It broke.", std::nullopt};
    CHECK_EQ(global.toString(), "Error: Broken: It broke.");
    Diagnostic attribute{Severity::kWarning, "Odd", "Look here.", Path().atName("a").atListIndex(2)};
    CHECK_EQ(attribute.toString(), "Warning: Odd (at a[2]): Look here.");
}

} // namespace attrmap
