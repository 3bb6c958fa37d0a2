// diagnostics.hpp - expansion diagnostics collected per top-level form
#pragma once
#include "ntup/form.hpp"
#include "ntup/errors.hpp"
#include <string>
#include <vector>

namespace ntup {

struct Note { std::string message; int line=-1; int col=-1; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };

struct ExpandResult {
    bool success = true;
    std::vector<node_ptr> forms;        // expanded top-level forms (failed forms are omitted)
    std::vector<Diagnostic> errors;
};

// Convert a thrown expansion failure into a diagnostic with hints and suggestions.
Diagnostic to_diagnostic(const expand_error& e);

// Levenshtein distance, used to suggest near-miss field names.
int edit_distance(const std::string& a, const std::string& b);
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);

} // namespace ntup
