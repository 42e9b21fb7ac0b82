#include "terminator.hpp"

// An empty prefix or suffix matches any source.
bool Terminator::matches(const std::string& source) const {
    switch (kind) {
    case TerminatorKind::PREFIX:
        return source.compare(0, text.size(), text) == 0;
    case TerminatorKind::SUFFIX:
        return source.size() >= text.size() &&
               source.compare(source.size() - text.size(), text.size(), text) == 0;
    case TerminatorKind::CONTAINS:
        return source.find(text) != std::string::npos;
    }
    return false;
}

std::vector<Terminator> parse_terminators(const std::vector<std::string>& patterns) {
    std::vector<Terminator> terminators;
    for (const auto& candidate : patterns) {
        if (candidate.empty()) continue;

        bool prefix = candidate.front() == '^';
        bool suffix = candidate.back() == '$';

        if (prefix) {
            terminators.push_back({TerminatorKind::PREFIX, candidate.substr(1)});
        }
        if (suffix) {
            terminators.push_back({TerminatorKind::SUFFIX,
                                   candidate.substr(0, candidate.size() - 1)});
        }
        if (!prefix && !suffix) {
            terminators.push_back({TerminatorKind::CONTAINS, candidate});
        }
    }
    return terminators;
}

bool has_terminator(const std::string& source, const std::vector<Terminator>& terminators) {
    for (const auto& t : terminators) {
        if (t.matches(source)) return true;
    }
    return false;
}

bool has_terminator(const std::string& source, const std::vector<std::string>& patterns) {
    return has_terminator(source, parse_terminators(patterns));
}
