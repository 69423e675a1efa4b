#ifndef SRC_ATTRMAP_DIAGNOSTICS_HPP_
#define SRC_ATTRMAP_DIAGNOSTICS_HPP_

#include "attrmap/Path.hpp"

#include <optional>
#include <string>
#include <vector>

namespace attrmap {

enum class Severity { kError, kWarning };

struct Diagnostic {
    Severity severity;
    std::string summary;
    std::string detail;
    // Empty for diagnostics that apply to a whole conversion rather than to an attribute within it.
    std::optional<Path> path;

    bool operator==(const Diagnostic& d) const {
        return severity == d.severity && summary == d.summary && detail == d.detail && path == d.path;
    }
    bool operator!=(const Diagnostic& d) const { return !(*this == d); }

    std::string toString() const;
};

// Ordered collection of Diagnostic records accumulated over a conversion. Conversions return these rather than throw,
// and a collection with any error in it means the conversion failed.
class Diagnostics {
public:
    Diagnostics() = default;
    ~Diagnostics() = default;

    // Appending a diagnostic identical to one already present does nothing.
    void append(const Diagnostic& diagnostic);
    void append(const Diagnostics& diagnostics);

    void addError(std::string summary, std::string detail);
    void addWarning(std::string summary, std::string detail);
    void addAttributeError(const Path& path, std::string summary, std::string detail);
    void addAttributeWarning(const Path& path, std::string summary, std::string detail);

    bool hasError() const;
    size_t errorCount() const;
    size_t warningCount() const;
    bool contains(const Diagnostic& diagnostic) const;

    size_t size() const { return m_diagnostics.size(); }
    bool empty() const { return m_diagnostics.empty(); }
    const Diagnostic& operator[](size_t i) const { return m_diagnostics[i]; }
    std::vector<Diagnostic>::const_iterator begin() const { return m_diagnostics.begin(); }
    std::vector<Diagnostic>::const_iterator end() const { return m_diagnostics.end(); }

private:
    std::vector<Diagnostic> m_diagnostics;
};

} // namespace attrmap

#endif // SRC_ATTRMAP_DIAGNOSTICS_HPP_
