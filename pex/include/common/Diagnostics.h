#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace PEX {

enum class DiagnosticSeverity { Info, Warning, Error };

enum class DiagnosticCategory {
    MalformedInput,      // unparseable embedded JSON, dangling parentId, missing ids
    UnknownComponent,    // no built-in or registered emitter for the kind
    AssetFetchFailure,   // URL could not be downloaded, left unrewritten
    AssetNameCollision,  // two URLs sanitized to the same file name
    ExportConstraint,    // feature the chosen target cannot express
    TreeInvariant        // duplicate instanceId or parent cycle, export aborted
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Info;
    DiagnosticCategory category = DiagnosticCategory::MalformedInput;
    std::string instanceId;
    std::string message;
};

/**
 * @brief Generation-time diagnostics for one export run
 *
 * Every report is logged when it is added. Not thread-safe: only the exporting
 * thread writes to it, asset fetch results are reported after they are joined.
 */
class Diagnostics {
public:
    void info(DiagnosticCategory category, const std::string &instanceId, const std::string &message);
    void warning(DiagnosticCategory category, const std::string &instanceId, const std::string &message);
    void error(DiagnosticCategory category, const std::string &instanceId, const std::string &message);

    const std::vector<Diagnostic> &getAll() const {
        return entries_;
    }

    bool hasErrors() const;
    size_t count(DiagnosticCategory category) const;
    size_t count(DiagnosticSeverity severity) const;

    std::vector<std::string> getErrorMessages() const;
    std::vector<std::string> getWarningMessages() const;

    void clear() {
        entries_.clear();
    }

    static const char *categoryName(DiagnosticCategory category);

private:
    void add(DiagnosticSeverity severity, DiagnosticCategory category, const std::string &instanceId,
             const std::string &message);
    std::vector<std::string> collectMessages(DiagnosticSeverity severity) const;

    std::vector<Diagnostic> entries_;
};

}  // namespace PEX
