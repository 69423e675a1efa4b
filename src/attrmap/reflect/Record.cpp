#include "attrmap/reflect/Record.hpp"

namespace attrmap { namespace reflect {

bool isValidFieldName(std::string_view name) {
    if (name.empty() || name[0] < 'a' || name[0] > 'z') {
        return false;
    }
    for (auto c : name) {
        if ((c < 'a' || c > 'z') && (c < '0' || c > '9') && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace reflect
} // namespace attrmap
