/**
 * @file PathHeuristics.hpp
 * @brief Domain service for path-derived facts used by the strategies.
 *
 * Paths are planner keys with '/' separators (project-relative in practice).
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace batchplanner::domain::services {

class PathHeuristics {
public:
    /// "src/a/b.js" -> "src/a"; top-level files -> "".
    static std::string Directory(const std::string& path) {
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? std::string() : path.substr(0, pos);
    }

    /// Last directory segment, "" at the root.
    static std::string DirectoryName(const std::string& path) {
        return FileName(Directory(path));
    }

    /// Grandparent directory: "src/a/b.js" -> "src".
    static std::string Module(const std::string& path) {
        return Directory(Directory(path));
    }

    static std::string FileName(const std::string& path) {
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

    /// File name up to the first dot: "user.service.ts" -> "user".
    static std::string BaseName(const std::string& path) {
        std::string name = FileName(path);
        auto dot = name.find('.');
        return dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
    }

    /// Last extension with the dot, lower-cased: "a/B.JS" -> ".js".
    static std::string Extension(const std::string& path) {
        std::string name = FileName(path);
        auto dot = name.find_last_of('.');
        if (dot == std::string::npos || dot == 0) return "";
        return ToLower(name.substr(dot));
    }

    static std::string ToLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    static bool Contains(const std::string& haystack, const std::string& needle) {
        return !needle.empty() && haystack.find(needle) != std::string::npos;
    }

    static bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
        for (const auto& needle : needles) {
            if (Contains(haystack, needle)) return true;
        }
        return false;
    }

    /// Lower-cased path with a leading '/' so segment checks like "/src/" match at the root.
    static std::string SegmentPath(const std::string& path) {
        std::string lower = ToLower(path);
        if (lower.empty() || lower.front() != '/') lower.insert(lower.begin(), '/');
        return lower;
    }

    static std::string LanguageForExtension(const std::string& extension) {
        static const std::vector<std::pair<std::string, std::string>> table = {
            {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
            {".ts", "typescript"}, {".tsx", "typescript"},
            {".py", "python"},
            {".java", "java"}, {".kt", "kotlin"}, {".swift", "swift"},
            {".c", "c"}, {".h", "c"},
            {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"}, {".hh", "cpp"},
            {".cs", "csharp"}, {".go", "go"}, {".rs", "rust"}, {".php", "php"}, {".rb", "ruby"},
        };
        for (const auto& entry : table) {
            if (entry.first == extension) return entry.second;
        }
        return "unknown";
    }

    static size_t EditDistance(const std::string& a, const std::string& b) {
        std::vector<size_t> previous(b.size() + 1);
        std::vector<size_t> current(b.size() + 1);
        for (size_t j = 0; j <= b.size(); ++j) previous[j] = j;

        for (size_t i = 1; i <= a.size(); ++i) {
            current[0] = i;
            for (size_t j = 1; j <= b.size(); ++j) {
                size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
                current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
            }
            std::swap(previous, current);
        }
        return previous[b.size()];
    }

    /// 1 - distance / longer length, in [0, 1]. Two empty names are not similar.
    static double NameSimilarity(const std::string& a, const std::string& b) {
        size_t longer = std::max(a.size(), b.size());
        if (longer == 0) return 0.0;
        return static_cast<double>(longer - EditDistance(a, b)) / static_cast<double>(longer);
    }

    /// 17000 -> "17,000".
    static std::string FormatThousands(long long value) {
        std::string digits = std::to_string(value < 0 ? -value : value);
        std::string out;
        int count = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
            out.insert(out.begin(), *it);
            ++count;
        }
        return value < 0 ? "-" + out : out;
    }
};

} // namespace batchplanner::domain::services
