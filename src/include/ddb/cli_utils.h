#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace ddb {
namespace cli_utils {

// Number of single-character insertions, deletions and substitutions
// needed to turn `a` into `b`.
inline int edit_distance(const std::string& a, const std::string& b) {
    std::vector<int> row(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) row[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        int diagonal = row[0];
        row[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int above = row[j];
            if (a[i - 1] == b[j - 1])
                row[j] = diagonal;
            else
                row[j] = 1 + std::min({above, row[j - 1], diagonal});
            diagonal = above;
        }
    }
    return row[b.size()];
}

// Closest candidate to `word`, or an empty string when nothing is close
// enough to be a plausible typo (3 edits, or 40% of the word for long ones).
inline std::string closest_match(const std::string& word, const std::vector<std::string>& candidates) {
    int best = std::numeric_limits<int>::max();
    std::string match;
    for (auto const& c : candidates) {
        int d = edit_distance(word, c);
        if (d < best) {
            best = d;
            match = c;
        }
    }
    int threshold = std::max(3, static_cast<int>(word.length() * 0.4));
    return best <= threshold ? match : std::string();
}

// "Unknown <what>: <word>" plus a "Did you mean" line when a candidate is close.
inline std::string unknown_word_error(const std::string& what, const std::string& word,
                                      const std::vector<std::string>& candidates) {
    std::string error = "Unknown " + what + ": " + word;
    std::string suggestion = closest_match(word, candidates);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

}  // namespace cli_utils
}  // namespace ddb
