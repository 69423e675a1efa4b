#include "attrmap/Path.hpp"

#include "doctest/doctest.h"

namespace attrmap {

TEST_CASE("Path rendering") {
    SUBCASE("empty path") {
        Path path;
        CHECK(path.empty());
        CHECK_EQ(path.size(), 0);
        CHECK_EQ(path.toString(), "");
    }
    SUBCASE("attribute names") {
        auto path = Path().atName("person").atName("address");
        CHECK_EQ(path.size(), 2);
        CHECK_EQ(path.toString(), "person.address");
    }
    SUBCASE("element keys") {
        auto path = Path().atName("tags").atListIndex(3).atMapKey("home").atSetValue("String<\"a\">");
        CHECK_EQ(path.toString(), "tags[3][\"home\"][Value(String<\"a\">)]");
    }
    SUBCASE("leading element key") {
        CHECK_EQ(Path().atListIndex(0).atName("name").toString(), "[0].name");
    }
}

TEST_CASE("Path immutability") {
    SUBCASE("appending leaves the original untouched") {
        auto parent = Path().atName("a");
        auto left = parent.atName("b");
        auto right = parent.atListIndex(1);
        CHECK_EQ(parent.size(), 1);
        CHECK_EQ(left.toString(), "a.b");
        CHECK_EQ(right.toString(), "a[1]");
    }
    SUBCASE("parent path") {
        auto path = Path().atName("a").atMapKey("k");
        CHECK_EQ(path.parentPath(), Path().atName("a"));
        CHECK_EQ(path.parentPath().parentPath(), Path());
        CHECK_EQ(Path().parentPath(), Path());
    }
    SUBCASE("equality compares step kinds") {
        CHECK_NE(Path().atName("1"), Path().atMapKey("1"));
        CHECK_NE(Path().atListIndex(1), Path().atMapKey("1"));
        CHECK_EQ(Path().atListIndex(1), Path().atListIndex(1));
    }
}

} // namespace attrmap
