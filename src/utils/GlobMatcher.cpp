#include "utils/GlobMatcher.h"
#include "core/FsError.h"
#include <cstring>

namespace {
    bool isRegexSpecial(char c) {
        return std::strchr(".^$|()[]{}*+?\\", c) != nullptr;
    }

    void appendLiteral(std::string& out, char c) {
        if (isRegexSpecial(c)) out += '\\';
        out += c;
    }
}

std::string GlobMatcher::toRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    int braceDepth = 0;

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '\\') {
            if (i + 1 >= glob.size()) {
                throw FsError::invalidParams("dangling escape at end of pattern: " + glob);
            }
            appendLiteral(out, glob[++i]);
        } else if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                ++i;
                if (i + 1 < glob.size() && glob[i + 1] == '/') {
                    ++i;
                    out += "(?:.*/)?";
                } else {
                    out += ".*";
                }
            } else {
                out += "[^/]*";
            }
        } else if (c == '?') {
            out += "[^/]";
        } else if (c == '[') {
            size_t j = i + 1;
            bool negated = false;
            if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
                negated = true;
                ++j;
            }
            std::string cls;
            // 紧跟在 [ 或 [! 之后的 ] 是字面量
            if (j < glob.size() && glob[j] == ']') {
                cls += "\\]";
                ++j;
            }
            while (j < glob.size() && glob[j] != ']') {
                char cc = glob[j];
                if (cc == '\\' || cc == '^' || cc == '[') {
                    cls += '\\';
                }
                cls += cc;
                ++j;
            }
            if (j >= glob.size()) {
                throw FsError::invalidParams("unterminated character class in pattern: " + glob);
            }
            out += negated ? "[^/" : "(?!/)[";
            out += cls;
            out += ']';
            i = j;
        } else if (c == '{') {
            ++braceDepth;
            out += "(?:";
        } else if (c == ',' && braceDepth > 0) {
            out += '|';
        } else if (c == '}' && braceDepth > 0) {
            --braceDepth;
            out += ')';
        } else {
            appendLiteral(out, c);
        }
    }

    if (braceDepth != 0) {
        throw FsError::invalidParams("unterminated '{' in pattern: " + glob);
    }
    return out;
}

GlobMatcher::GlobMatcher(const std::string& pattern)
    : source(pattern), pathMode(pattern.find('/') != std::string::npos) {
    if (pattern.empty()) {
        throw FsError::invalidParams("pattern must be non-empty");
    }
    try {
        compiled = std::regex(toRegex(pattern), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw FsError::invalidParams("invalid pattern '" + pattern + "': " + e.what());
    }
}

bool GlobMatcher::matches(const std::string& name, const std::string& relativePath) const {
    return std::regex_match(pathMode ? relativePath : name, compiled);
}
