/**
 * @file TextLines.hpp
 * @brief Line splitting shared by boundary detection and the fallback split.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace batchplanner::domain::services {

class TextLines {
public:
    /// Splits on '\n' and drops a trailing '\r'. A final newline adds no empty line.
    static std::vector<std::string> Split(const std::string& content) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start < content.size()) {
            size_t end = content.find('\n', start);
            if (end == std::string::npos) end = content.size();
            std::string line = content.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            start = end + 1;
        }
        return lines;
    }
};

} // namespace batchplanner::domain::services
