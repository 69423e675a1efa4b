#include "attrmap/Path.hpp"

#include "fmt/format.h"

namespace attrmap {

std::string PathStep::toString(bool isFirst) const {
    switch (m_kind) {
    case kAttributeName:
        return isFirst ? m_name : fmt::format(".{}", m_name);
    case kElementKeyInt:
        return fmt::format("[{}]", m_index);
    case kElementKeyString:
        return fmt::format("[\"{}\"]", m_name);
    case kElementKeyValue:
        return fmt::format("[Value({})]", m_name);
    }
    return std::string();
}

Path Path::atName(std::string name) const {
    return append(PathStep::attributeName(std::move(name)));
}

Path Path::atListIndex(int64_t index) const {
    return append(PathStep::elementKeyInt(index));
}

Path Path::atMapKey(std::string key) const {
    return append(PathStep::elementKeyString(std::move(key)));
}

Path Path::atSetValue(std::string value) const {
    return append(PathStep::elementKeyValue(std::move(value)));
}

Path Path::parentPath() const {
    Path parent(*this);
    if (!parent.m_steps.empty()) {
        parent.m_steps.pop_back();
    }
    return parent;
}

std::string Path::toString() const {
    std::string result;
    for (size_t i = 0; i < m_steps.size(); ++i) {
        result += m_steps[i].toString(i == 0);
    }
    return result;
}

Path Path::append(PathStep step) const {
    Path child;
    child.m_steps.reserve(m_steps.size() + 1);
    child.m_steps = m_steps;
    child.m_steps.emplace_back(std::move(step));
    return child;
}

} // namespace attrmap
