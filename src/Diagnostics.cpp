#include "Diagnostics.h"

#include <algorithm>
#include <ostream>

bool hasErrors(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
        return d.level == DiagnosticLevel::Error;
    });
}

void printDiagnostics(std::ostream& out, const std::string& source,
                      const std::vector<Diagnostic>& diagnostics) {
    for (const auto& diag : diagnostics) {
        switch (diag.level) {
        case DiagnosticLevel::Error: out << "Error: "; break;
        case DiagnosticLevel::Warning: out << "Warning: "; break;
        case DiagnosticLevel::Info: out << "Info: "; break;
        }
        out << diag.message;
        // Строка 0 - сообщение не привязано к позиции
        if (diag.line > 0) {
            out << " at " << source << ":" << diag.line;
            if (diag.column > 0) {
                out << ", column " << diag.column;
            }
        } else if (!source.empty()) {
            out << " (" << source << ")";
        }
        out << std::endl;
    }
}
