#include "common/Diagnostics.h"
#include "common/Logger.h"
#include <algorithm>

namespace PEX {

void Diagnostics::info(DiagnosticCategory category, const std::string &instanceId, const std::string &message) {
    add(DiagnosticSeverity::Info, category, instanceId, message);
}

void Diagnostics::warning(DiagnosticCategory category, const std::string &instanceId, const std::string &message) {
    add(DiagnosticSeverity::Warning, category, instanceId, message);
}

void Diagnostics::error(DiagnosticCategory category, const std::string &instanceId, const std::string &message) {
    add(DiagnosticSeverity::Error, category, instanceId, message);
}

bool Diagnostics::hasErrors() const {
    return count(DiagnosticSeverity::Error) > 0;
}

size_t Diagnostics::count(DiagnosticCategory category) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [category](const Diagnostic &d) { return d.category == category; }));
}

size_t Diagnostics::count(DiagnosticSeverity severity) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [severity](const Diagnostic &d) { return d.severity == severity; }));
}

std::vector<std::string> Diagnostics::getErrorMessages() const {
    return collectMessages(DiagnosticSeverity::Error);
}

std::vector<std::string> Diagnostics::getWarningMessages() const {
    return collectMessages(DiagnosticSeverity::Warning);
}

const char *Diagnostics::categoryName(DiagnosticCategory category) {
    switch (category) {
    case DiagnosticCategory::MalformedInput:
        return "malformed-input";
    case DiagnosticCategory::UnknownComponent:
        return "unknown-component";
    case DiagnosticCategory::AssetFetchFailure:
        return "asset-fetch-failure";
    case DiagnosticCategory::AssetNameCollision:
        return "asset-name-collision";
    case DiagnosticCategory::ExportConstraint:
        return "export-constraint";
    case DiagnosticCategory::TreeInvariant:
        return "tree-invariant";
    }
    return "unknown";
}

void Diagnostics::add(DiagnosticSeverity severity, DiagnosticCategory category, const std::string &instanceId,
                      const std::string &message) {
    const std::string where = instanceId.empty() ? "" : " [" + instanceId + "]";
    switch (severity) {
    case DiagnosticSeverity::Info:
        LOG_DEBUG("Diagnostics: {}{}: {}", categoryName(category), where, message);
        break;
    case DiagnosticSeverity::Warning:
        LOG_WARN("Diagnostics: {}{}: {}", categoryName(category), where, message);
        break;
    case DiagnosticSeverity::Error:
        LOG_ERROR("Diagnostics: {}{}: {}", categoryName(category), where, message);
        break;
    }
    entries_.push_back(Diagnostic{severity, category, instanceId, message});
}

std::vector<std::string> Diagnostics::collectMessages(DiagnosticSeverity severity) const {
    std::vector<std::string> messages;
    for (const auto &entry : entries_) {
        if (entry.severity != severity) {
            continue;
        }
        std::string text = entry.message;
        if (!entry.instanceId.empty()) {
            text = entry.instanceId + ": " + text;
        }
        messages.push_back(std::string(categoryName(entry.category)) + ": " + text);
    }
    return messages;
}

}  // namespace PEX
