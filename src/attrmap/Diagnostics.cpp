#include "attrmap/Diagnostics.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace attrmap {

std::string Diagnostic::toString() const {
    auto severityName = severity == Severity::kError ? "Error" : "Warning";
    if (path && !path->empty()) {
        return fmt::format("{}: {} (at {}): {}", severityName, summary, path->toString(), detail);
    }
    return fmt::format("{}: {}: {}", severityName, summary, detail);
}

void Diagnostics::append(const Diagnostic& diagnostic) {
    if (contains(diagnostic)) {
        return;
    }
    if (diagnostic.severity == Severity::kError) {
        SPDLOG_DEBUG("diagnostic added: {}", diagnostic.toString());
    }
    m_diagnostics.emplace_back(diagnostic);
}

void Diagnostics::append(const Diagnostics& diagnostics) {
    for (const auto& diagnostic : diagnostics) {
        append(diagnostic);
    }
}

void Diagnostics::addError(std::string summary, std::string detail) {
    append(Diagnostic{Severity::kError, std::move(summary), std::move(detail), std::nullopt});
}

void Diagnostics::addWarning(std::string summary, std::string detail) {
    append(Diagnostic{Severity::kWarning, std::move(summary), std::move(detail), std::nullopt});
}

void Diagnostics::addAttributeError(const Path& path, std::string summary, std::string detail) {
    append(Diagnostic{Severity::kError, std::move(summary), std::move(detail), path});
}

void Diagnostics::addAttributeWarning(const Path& path, std::string summary, std::string detail) {
    append(Diagnostic{Severity::kWarning, std::move(summary), std::move(detail), path});
}

bool Diagnostics::hasError() const {
    return std::any_of(m_diagnostics.begin(), m_diagnostics.end(),
                       [](const Diagnostic& d) { return d.severity == Severity::kError; });
}

size_t Diagnostics::errorCount() const {
    return std::count_if(m_diagnostics.begin(), m_diagnostics.end(),
                         [](const Diagnostic& d) { return d.severity == Severity::kError; });
}

size_t Diagnostics::warningCount() const {
    return m_diagnostics.size() - errorCount();
}

bool Diagnostics::contains(const Diagnostic& diagnostic) const {
    return std::find(m_diagnostics.begin(), m_diagnostics.end(), diagnostic) != m_diagnostics.end();
}

} // namespace attrmap
