#ifndef SRC_ATTRMAP_PATH_HPP_
#define SRC_ATTRMAP_PATH_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace attrmap {

// One step from a value to one of its children.
class PathStep {
public:
    enum Kind { kAttributeName, kElementKeyInt, kElementKeyString, kElementKeyValue };

    static PathStep attributeName(std::string name) { return PathStep(kAttributeName, std::move(name), 0); }
    static PathStep elementKeyInt(int64_t index) { return PathStep(kElementKeyInt, std::string(), index); }
    static PathStep elementKeyString(std::string key) { return PathStep(kElementKeyString, std::move(key), 0); }
    // Set elements have no key of their own, so they are identified by the string form of their value.
    static PathStep elementKeyValue(std::string value) { return PathStep(kElementKeyValue, std::move(value), 0); }

    Kind kind() const { return m_kind; }
    const std::string& name() const { return m_name; }
    int64_t index() const { return m_index; }

    bool operator==(const PathStep& s) const {
        return m_kind == s.m_kind && m_name == s.m_name && m_index == s.m_index;
    }
    bool operator!=(const PathStep& s) const { return !(*this == s); }

    // Renders this step as it appears following |isFirst| or not, i.e. "name", ".name", "[3]", "[\"key\"]".
    std::string toString(bool isFirst) const;

private:
    PathStep(Kind kind, std::string name, int64_t index): m_kind(kind), m_name(std::move(name)), m_index(index) {}

    Kind m_kind;
    std::string m_name;
    int64_t m_index;
};

// Immutable location of a value relative to the root of a conversion. Appending returns a new Path and leaves this one
// untouched, so a Path can be shared freely between sibling conversions.
class Path {
public:
    Path() = default;
    ~Path() = default;

    Path atName(std::string name) const;
    Path atListIndex(int64_t index) const;
    Path atMapKey(std::string key) const;
    Path atSetValue(std::string value) const;

    // Returns the path with the last step removed. The parent of the empty path is the empty path.
    Path parentPath() const;

    const std::vector<PathStep>& steps() const { return m_steps; }
    size_t size() const { return m_steps.size(); }
    bool empty() const { return m_steps.empty(); }

    bool operator==(const Path& p) const { return m_steps == p.m_steps; }
    bool operator!=(const Path& p) const { return m_steps != p.m_steps; }

    std::string toString() const;

private:
    Path append(PathStep step) const;

    std::vector<PathStep> m_steps;
};

} // namespace attrmap

#endif // SRC_ATTRMAP_PATH_HPP_
