/**
 * @file HeuristicBoundaryDetector.cpp
 * @brief Implementation of HeuristicBoundaryDetector.
 */

#include "infrastructure/HeuristicBoundaryDetector.hpp"
#include "domain/TokenEstimate.hpp"
#include "domain/services/PathHeuristics.hpp"
#include "domain/services/TextLines.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace batchplanner::infrastructure {

using domain::BoundaryType;
using domain::services::PathHeuristics;
using domain::services::TextLines;

namespace {

enum class BlockKind { Namespace, Class, Interface, Function, Other };

struct LexState {
    bool inBlockComment = false;
};

struct ScanResult {
    std::vector<BoundaryType> boundaries;
    std::vector<bool> comments;
};

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

void Raise(BoundaryType& slot, BoundaryType candidate) {
    if (domain::BoundaryPriority(candidate) > domain::BoundaryPriority(slot)) {
        slot = candidate;
    }
}

// Code of one line with comments dropped and string literal bodies removed.
std::string StripCode(const std::string& line, const std::string& lineComment, bool blockComments,
                      LexState& state, bool& hadComment) {
    std::string code;
    code.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (state.inBlockComment) {
            hadComment = true;
            size_t end = line.find("*/", i);
            if (end == std::string::npos) return code;
            state.inBlockComment = false;
            i = end + 2;
            continue;
        }
        if (line.compare(i, lineComment.size(), lineComment) == 0) {
            hadComment = true;
            return code;
        }
        if (blockComments && line.compare(i, 2, "/*") == 0) {
            hadComment = true;
            state.inBlockComment = true;
            i += 2;
            continue;
        }
        char c = line[i];
        if (c == '"' || c == '\'' || c == '`') {
            size_t j = i + 1;
            while (j < line.size() && line[j] != c) {
                if (line[j] == '\\') ++j;
                ++j;
            }
            // Unterminated quotes (lifetimes, multi-line templates) are kept as code.
            if (j < line.size()) {
                code += c;
                code += c;
                i = j + 1;
                continue;
            }
        }
        code += c;
        ++i;
    }
    return code;
}

std::vector<std::string> Words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            current += c;
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

bool HasAny(const std::vector<std::string>& words, const std::set<std::string>& keywords) {
    for (const auto& word : words) {
        if (keywords.count(word)) return true;
    }
    return false;
}

bool IsQualifierTail(const std::string& tail) {
    for (char c : tail) {
        if (std::isalnum(static_cast<unsigned char>(c))) continue;
        if (std::string(" \t_:<>,.&*[]?-=").find(c) != std::string::npos) continue;
        return false;
    }
    return true;
}

BlockKind ClassifyHeader(const std::string& header) {
    static const std::set<std::string> interfaceWords = {"interface", "trait", "protocol"};
    static const std::set<std::string> classWords = {"class", "struct", "enum", "union", "impl", "record"};
    static const std::set<std::string> controlWords = {
        "if", "else", "for", "while", "do", "switch", "try", "catch", "finally", "with",
        "synchronized", "foreach", "lock", "unsafe", "loop", "match", "return", "case"};
    static const std::set<std::string> functionWords = {"function", "fn", "func", "def", "fun"};

    std::vector<std::string> words = Words(header);
    if (words.empty()) return BlockKind::Other;

    bool isNamespace = std::find(words.begin(), words.end(), "namespace") != words.end() ||
                       words.front() == "extern" ||
                       ((words.front() == "declare" || words.front() == "module") &&
                        std::find(words.begin(), words.end(), "module") != words.end() &&
                        std::find(words.begin(), words.end(), "exports") == words.end());
    if (isNamespace) return BlockKind::Namespace;
    if (HasAny(words, interfaceWords)) return BlockKind::Interface;
    if (HasAny(words, classWords)) return BlockKind::Class;
    if (HasAny(words, controlWords)) return BlockKind::Other;
    if (HasAny(words, functionWords) || header.find("=>") != std::string::npos) return BlockKind::Function;

    size_t open = header.find('(');
    size_t close = header.rfind(')');
    if (open != std::string::npos && close != std::string::npos && close > open &&
        IsQualifierTail(header.substr(close + 1))) {
        return BlockKind::Function;
    }
    return BlockKind::Other;
}

BoundaryType BoundaryForClose(BlockKind closed, const std::vector<BlockKind>& stack) {
    int depth = 0;
    BlockKind parent = BlockKind::Namespace;
    for (BlockKind kind : stack) {
        if (kind != BlockKind::Namespace) {
            ++depth;
            parent = kind;
        }
    }

    switch (closed) {
        case BlockKind::Class:
            return depth == 0 ? BoundaryType::ClassEnd : BoundaryType::None;
        case BlockKind::Interface:
            return depth == 0 ? BoundaryType::InterfaceEnd : BoundaryType::None;
        case BlockKind::Function:
            if (depth == 0 || parent == BlockKind::Class || parent == BlockKind::Interface) {
                return BoundaryType::FunctionEnd;
            }
            return BoundaryType::None;
        case BlockKind::Other:
        case BlockKind::Namespace:
            return depth == 0 ? BoundaryType::BlockEnd : BoundaryType::None;
    }
    return BoundaryType::None;
}

int CountOpenParens(const std::string& text) {
    int balance = 0;
    for (char c : text) {
        if (c == '(') ++balance;
        else if (c == ')') --balance;
    }
    return balance;
}

void ScanBraces(const std::vector<std::string>& lines, const LanguageRules& rules, ScanResult& scan) {
    LexState lex;
    std::vector<BlockKind> stack;
    std::string header;

    auto structuralDepth = [&stack]() {
        return std::count_if(stack.begin(), stack.end(),
                             [](BlockKind kind) { return kind != BlockKind::Namespace; });
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        bool hadComment = false;
        std::string code = StripCode(lines[i], rules.lineComment, true, lex, hadComment);
        scan.comments[i] = hadComment;

        std::string trimmedCode = Trim(code);
        if (Trim(lines[i]).empty()) {
            if (structuralDepth() == 0) Raise(scan.boundaries[i], BoundaryType::BlankLine);
            continue;
        }
        if (trimmedCode.empty()) continue;

        // Signatures may span lines; anything else starts a fresh header.
        std::string trimmedHeader = Trim(header);
        bool continuesHeader = StartsWith(trimmedCode, "{") || StartsWith(trimmedCode, ":") ||
                               CountOpenParens(header) > 0 ||
                               (!trimmedHeader.empty() && trimmedHeader.back() == ',');
        if (!continuesHeader) header.clear();

        for (char c : code) {
            if (c == '{') {
                stack.push_back(ClassifyHeader(header));
                header.clear();
            } else if (c == '}') {
                if (!stack.empty()) {
                    BlockKind closed = stack.back();
                    stack.pop_back();
                    Raise(scan.boundaries[i], BoundaryForClose(closed, stack));
                }
                header.clear();
            } else if (c == ';') {
                header.clear();
            } else {
                header += c;
            }
        }
        header += ' ';
    }
}

int IndentWidth(const std::string& line) {
    int width = 0;
    for (char c : line) {
        if (c == ' ') width += 1;
        else if (c == '\t') width += 4;
        else break;
    }
    return width;
}

void ScanIndentation(const std::vector<std::string>& lines, const LanguageRules& rules, ScanResult& scan) {
    struct OpenBlock {
        int indent;
        BlockKind kind;
    };

    LexState lex;
    std::vector<OpenBlock> stack;
    int lastCode = -1;
    int bracketDepth = 0;

    auto closeTop = [&]() {
        OpenBlock closed = stack.back();
        stack.pop_back();
        if (lastCode < 0) return;
        bool parentIsClass = !stack.empty() && stack.back().kind == BlockKind::Class;
        if (closed.kind == BlockKind::Class && stack.empty()) {
            Raise(scan.boundaries[lastCode], BoundaryType::ClassEnd);
        } else if (closed.kind == BlockKind::Function && (stack.empty() || parentIsClass)) {
            Raise(scan.boundaries[lastCode], BoundaryType::FunctionEnd);
        }
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string trimmed = Trim(lines[i]);
        if (trimmed.empty()) {
            if (stack.empty() && bracketDepth == 0) Raise(scan.boundaries[i], BoundaryType::BlankLine);
            continue;
        }

        bool hadComment = false;
        std::string code = Trim(StripCode(lines[i], rules.lineComment, false, lex, hadComment));
        scan.comments[i] = hadComment;
        if (code.empty()) continue;

        bool continuation = bracketDepth > 0;
        for (char c : code) {
            if (c == '(' || c == '[' || c == '{') ++bracketDepth;
            else if (c == ')' || c == ']' || c == '}') bracketDepth = std::max(0, bracketDepth - 1);
        }
        if (continuation) {
            lastCode = static_cast<int>(i);
            continue;
        }

        int indent = IndentWidth(lines[i]);
        while (!stack.empty() && stack.back().indent >= indent) {
            closeTop();
        }

        if (StartsWith(code, "class ")) {
            stack.push_back({indent, BlockKind::Class});
        } else if (StartsWith(code, "def ") || StartsWith(code, "async def ")) {
            stack.push_back({indent, BlockKind::Function});
        }
        lastCode = static_cast<int>(i);
    }

    while (!stack.empty()) {
        closeTop();
    }
}

ScanResult Scan(const std::vector<std::string>& lines, const LanguageRules& rules) {
    ScanResult scan;
    scan.boundaries.assign(lines.size(), BoundaryType::None);
    scan.comments.assign(lines.size(), false);
    if (rules.indentationScoped) {
        ScanIndentation(lines, rules, scan);
    } else {
        ScanBraces(lines, rules, scan);
    }
    return scan;
}

void ApplySummary(const std::optional<domain::StructuralSummary>& summary, std::vector<BoundaryType>& boundaries) {
    if (!summary.has_value()) return;

    auto mark = [&boundaries](const std::vector<domain::CodeSymbol>& symbols, BoundaryType type) {
        for (const auto& symbol : symbols) {
            if (symbol.endLine >= 1 && symbol.endLine <= static_cast<int>(boundaries.size())) {
                Raise(boundaries[symbol.endLine - 1], type);
            }
        }
    };
    mark(summary->functions, BoundaryType::FunctionEnd);
    mark(summary->interfaces, BoundaryType::InterfaceEnd);
    mark(summary->classes, BoundaryType::ClassEnd);
}

bool IsImportLine(const std::string& trimmed, const LanguageRules& rules) {
    for (const auto& prefix : rules.importPrefixes) {
        if (StartsWith(trimmed, prefix)) return true;
    }
    return trimmed.find("require(") != std::string::npos && trimmed.find('=') != std::string::npos;
}

bool IsPreambleLine(const std::string& trimmed, const LanguageRules& rules) {
    return StartsWith(trimmed, rules.lineComment) || StartsWith(trimmed, "/*") || StartsWith(trimmed, "*") ||
           StartsWith(trimmed, "#!") || trimmed == "'use strict';" || trimmed == "\"use strict\";" ||
           StartsWith(trimmed, "#pragma");
}

// Import lines of the file head, before the first line of real code.
std::vector<int> LeadingImportLines(const std::vector<std::string>& lines, const LanguageRules& rules) {
    std::vector<int> imports;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string trimmed = Trim(lines[i]);
        if (trimmed.empty()) continue;
        if (IsImportLine(trimmed, rules)) {
            imports.push_back(static_cast<int>(i));
            continue;
        }
        if (IsPreambleLine(trimmed, rules)) continue;
        break;
    }
    return imports;
}

std::string ChunkTypeFor(BoundaryType strongest) {
    switch (strongest) {
        case BoundaryType::ClassEnd: return "class-focused";
        case BoundaryType::InterfaceEnd: return "interface-focused";
        case BoundaryType::FunctionEnd: return "function-focused";
        case BoundaryType::BlockEnd: return "module-focused";
        case BoundaryType::BlankLine: return "generic";
        default: return "mixed";
    }
}

} // namespace

LanguageRules LanguageRules::For(const std::string& language) {
    LanguageRules rules;
    rules.name = language.empty() ? "unknown" : language;

    if (language == "python") {
        rules.lineComment = "#";
        rules.indentationScoped = true;
        rules.importPrefixes = {"import ", "from "};
    } else if (language == "ruby") {
        rules.lineComment = "#";
        rules.importPrefixes = {"require ", "require_relative ", "load "};
    } else if (language == "c" || language == "cpp") {
        rules.importPrefixes = {"#include", "import ", "using "};
    } else if (language == "rust") {
        rules.importPrefixes = {"use ", "pub use ", "extern crate ", "mod "};
    } else if (language == "go") {
        rules.importPrefixes = {"import ", "package "};
    } else if (language == "php") {
        rules.importPrefixes = {"use ", "require", "include", "namespace "};
    } else {
        rules.importPrefixes = {"import ", "import{", "export * from", "package ", "using "};
    }
    return rules;
}

DetectorSettings DetectorSettings::FromConfig(const domain::PlannerConfig& config) {
    DetectorSettings settings;
    settings.boundaryTolerance = config.boundaryTolerance;
    settings.minChunkFillRatio = config.minChunkFillRatio;
    settings.chunkOverlapTokens = config.chunkOverlapTokens;
    settings.carryForwardImports = config.carryForwardImports;
    return settings;
}

HeuristicBoundaryDetector::HeuristicBoundaryDetector(std::shared_ptr<domain::TokenEstimator> estimator,
                                                     DetectorSettings settings)
    : m_estimator(std::move(estimator)), m_settings(settings) {}

std::vector<long long> HeuristicBoundaryDetector::lineTokens(const std::vector<std::string>& lines,
                                                             long long fileTokens) const {
    std::vector<long long> weights(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        weights[i] = m_estimator->estimate(lines[i] + "\n");
    }
    if (fileTokens <= 0) return weights;
    return domain::DistributeTokens(weights, fileTokens);
}

std::vector<BoundaryType> HeuristicBoundaryDetector::classifyLines(
    const std::vector<std::string>& lines,
    const LanguageRules& rules,
    const std::optional<domain::StructuralSummary>& summary) const {
    ScanResult scan = Scan(lines, rules);
    ApplySummary(summary, scan.boundaries);
    return scan.boundaries;
}

std::vector<HeuristicBoundaryDetector::LineRange> HeuristicBoundaryDetector::segment(
    const std::vector<long long>& tokens,
    const std::vector<BoundaryType>& boundaries,
    long long targetTokens) const {
    std::vector<LineRange> ranges;
    const int lineCount = static_cast<int>(tokens.size());
    const double limit = static_cast<double>(targetTokens) * (1.0 + m_settings.boundaryTolerance);
    const double minFill = static_cast<double>(targetTokens) * m_settings.minChunkFillRatio;

    int start = 0;
    while (start < lineCount) {
        long long accumulated = 0;
        int next = start;
        // A single oversized line still forms a chunk of its own.
        while (next < lineCount && (next == start || accumulated + tokens[next] <= limit)) {
            accumulated += tokens[next];
            ++next;
        }

        if (next == lineCount) {
            ranges.push_back({start, lineCount - 1, false});
            break;
        }

        int best = -1;
        int bestPriority = 0;
        long long running = 0;
        for (int line = start; line < next; ++line) {
            running += tokens[line];
            int priority = domain::BoundaryPriority(boundaries[line]);
            if (priority > 0 && static_cast<double>(running) >= minFill && priority >= bestPriority) {
                best = line;
                bestPriority = priority;
            }
        }

        if (best >= 0) {
            ranges.push_back({start, best, false});
            start = best + 1;
        } else {
            ranges.push_back({start, next - 1, true});
            start = next;
        }
    }
    return ranges;
}

domain::DetectionResult HeuristicBoundaryDetector::detect(const std::string& path,
                                                          const std::string& content,
                                                          const std::optional<domain::StructuralSummary>& summary,
                                                          long long targetTokens,
                                                          long long fileTokens) const {
    domain::DetectionResult result;
    result.language = summary.has_value() && !summary->language.empty() && summary->language != "unknown"
                          ? summary->language
                          : PathHeuristics::LanguageForExtension(PathHeuristics::Extension(path));

    if (targetTokens <= 0) {
        result.error = "target token size must be positive";
        return result;
    }

    std::vector<std::string> lines = TextLines::Split(content);
    if (lines.empty()) {
        result.error = "file has no content";
        return result;
    }

    LanguageRules rules = LanguageRules::For(result.language);
    ScanResult scan = Scan(lines, rules);
    ApplySummary(summary, scan.boundaries);

    const std::vector<long long> tokens = lineTokens(lines, fileTokens);
    std::vector<LineRange> ranges = segment(tokens, scan.boundaries, targetTokens);
    std::vector<int> importLines = LeadingImportLines(lines, rules);
    std::set<int> importSet(importLines.begin(), importLines.end());

    // Carried-forward imports, capped by the overlap budget.
    std::string carriedImports;
    long long carriedTokens = 0;
    if (m_settings.carryForwardImports) {
        for (int line : importLines) {
            if (carriedTokens + tokens[line] > m_settings.chunkOverlapTokens) break;
            carriedImports += lines[line] + "\n";
            carriedTokens += tokens[line];
        }
    }
    const int lastImportLine = importLines.empty() ? -1 : importLines.back();

    const int total = static_cast<int>(ranges.size());
    for (int k = 0; k < total; ++k) {
        const LineRange& range = ranges[k];
        domain::DetectedChunk chunk;
        chunk.startLine = range.first + 1;
        chunk.endLine = range.last + 1;

        BoundaryType strongest = BoundaryType::None;
        for (int line = range.first; line <= range.last; ++line) {
            chunk.estimatedTokens += tokens[line];
            Raise(strongest, scan.boundaries[line]);
            if (scan.comments[line]) chunk.hasComments = true;
            if (importSet.count(line)) chunk.hasImports = true;

            int priority = domain::BoundaryPriority(scan.boundaries[line]);
            if (priority >= domain::BoundaryPriority(BoundaryType::BlockEnd)) {
                chunk.boundaries.push_back({line + 1, scan.boundaries[line], priority});
            }
        }
        chunk.type = range.forced ? "mixed" : ChunkTypeFor(strongest);

        std::string body;
        body += rules.lineComment + " Chunk " + std::to_string(k + 1) + "/" + std::to_string(total) + " of " + path +
                " (lines " + std::to_string(chunk.startLine) + "-" + std::to_string(chunk.endLine) + ", " +
                chunk.type + ")\n";
        chunk.hasChunkMarker = true;

        if (k > 0 && !carriedImports.empty() && range.first > lastImportLine) {
            body += rules.lineComment + " Required imports\n";
            body += carriedImports;
            body += rules.lineComment + " End of required imports\n";
            chunk.hasCarriedImports = true;
            chunk.hasImports = true;
            chunk.carriedContextTokens = carriedTokens;
        }

        for (int line = range.first; line <= range.last; ++line) {
            body += lines[line];
            body += '\n';
        }
        chunk.content = std::move(body);
        result.chunks.push_back(std::move(chunk));
    }

    result.success = true;
    std::cout << "[HeuristicBoundaryDetector] " << path << ": " << lines.size() << " lines -> "
              << result.chunks.size() << " chunks (" << result.language << ")" << std::endl;
    return result;
}

} // namespace batchplanner::infrastructure
