#include "utils/UnifiedDiff.h"
#include <algorithm>
#include <sstream>

namespace UnifiedDiff {

namespace {
    // 超过这个编辑距离就不再回溯最短路径,直接整段删除 + 插入
    constexpr int kMaxEditDistance = 2000;

    using Kind = DiffOp::Kind;

    // a[aBegin, aEnd) 与 b[bBegin, bEnd) 之间的 Myers 最短编辑脚本
    void myers(const std::vector<std::string>& a, size_t aBegin, size_t aEnd,
               const std::vector<std::string>& b, size_t bBegin, size_t bEnd,
               std::vector<DiffOp>& out) {
        const int n = static_cast<int>(aEnd - aBegin);
        const int m = static_cast<int>(bEnd - bBegin);
        const int max = n + m;
        const int limit = std::min(max, kMaxEditDistance);
        const int offset = max + 1;

        std::vector<int> v(2 * max + 3, 0);
        std::vector<std::vector<int>> trace;
        int found = -1;

        for (int d = 0; d <= limit && found < 0; ++d) {
            for (int k = -d; k <= d; k += 2) {
                int x;
                if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
                    x = v[offset + k + 1];
                } else {
                    x = v[offset + k - 1] + 1;
                }
                int y = x - k;
                while (x < n && y < m && a[aBegin + x] == b[bBegin + y]) {
                    ++x;
                    ++y;
                }
                v[offset + k] = x;
                if (x >= n && y >= m) {
                    found = d;
                    break;
                }
            }
            trace.emplace_back(v.begin() + offset - d, v.begin() + offset + d + 1);
        }

        if (found < 0) {
            for (int i = 0; i < n; ++i) out.push_back({Kind::Delete, aBegin + i, 0});
            for (int j = 0; j < m; ++j) out.push_back({Kind::Insert, 0, bBegin + j});
            return;
        }

        std::vector<DiffOp> reversed;
        int x = n;
        int y = m;
        for (int d = found; d > 0; --d) {
            const std::vector<int>& prev = trace[d - 1];
            auto at = [&](int k) { return prev[k + (d - 1)]; };
            const int k = x - y;
            int prevK;
            if (k == -d || (k != d && at(k - 1) < at(k + 1))) {
                prevK = k + 1;
            } else {
                prevK = k - 1;
            }
            const int prevX = at(prevK);
            const int prevY = prevX - prevK;
            while (x > prevX && y > prevY) {
                --x;
                --y;
                reversed.push_back({Kind::Equal, aBegin + x, bBegin + y});
            }
            if (prevK == k + 1) {
                reversed.push_back({Kind::Insert, 0, bBegin + prevY});
            } else {
                reversed.push_back({Kind::Delete, aBegin + prevX, 0});
            }
            x = prevX;
            y = prevY;
        }
        while (x > 0 && y > 0) {
            --x;
            --y;
            reversed.push_back({Kind::Equal, aBegin + x, bBegin + y});
        }
        out.insert(out.end(), reversed.rbegin(), reversed.rend());
    }

    std::string rangeHeader(size_t start, size_t count) {
        // GNU 约定: 长度为 1 时省略 ",1"; 长度为 0 时起始行号指向前一行
        std::ostringstream oss;
        if (count == 0) {
            oss << start << ",0";
        } else if (count == 1) {
            oss << start + 1;
        } else {
            oss << start + 1 << "," << count;
        }
        return oss.str();
    }

    void emitLine(std::ostringstream& out, char prefix, const std::string& line) {
        out << prefix;
        if (!line.empty() && line.back() == '\n') {
            out << line;
        } else {
            out << line << "\n\\ No newline at end of file\n";
        }
    }
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::vector<DiffOp> diffLines(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<DiffOp> ops;
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ops.push_back({Kind::Equal, prefix, prefix});
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    myers(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, ops);

    for (size_t i = 0; i < suffix; ++i) {
        ops.push_back({Kind::Equal, a.size() - suffix + i, b.size() - suffix + i});
    }
    return ops;
}

std::string generate(const std::string& oldText, const std::string& newText,
                     const std::string& oldLabel, const std::string& newLabel,
                     size_t context) {
    if (oldText == newText) {
        return "";
    }
    const std::vector<std::string> a = splitLines(oldText);
    const std::vector<std::string> b = splitLines(newText);
    const std::vector<DiffOp> ops = diffLines(a, b);

    std::ostringstream out;
    out << "--- " << oldLabel << "\n";
    out << "+++ " << newLabel << "\n";

    size_t i = 0;
    while (i < ops.size()) {
        // 找到下一处变更
        while (i < ops.size() && ops[i].kind == Kind::Equal) ++i;
        if (i >= ops.size()) break;

        size_t hunkStart = i >= context ? i - context : 0;
        size_t hunkEnd = i;
        // 向后扩展: 相邻变更之间的相同行不超过 2*context 时并入同一个 hunk
        while (hunkEnd < ops.size()) {
            if (ops[hunkEnd].kind != Kind::Equal) {
                ++hunkEnd;
                continue;
            }
            size_t run = hunkEnd;
            while (run < ops.size() && ops[run].kind == Kind::Equal) ++run;
            if (run >= ops.size() || run - hunkEnd > 2 * context) {
                hunkEnd = std::min(hunkEnd + context, run);
                break;
            }
            hunkEnd = run;
        }

        size_t oldStart = 0, newStart = 0, oldCount = 0, newCount = 0;
        bool oldStartSet = false, newStartSet = false;
        // 起始行号: 取 hunk 中第一条涉及该侧的操作
        for (size_t j = hunkStart; j < hunkEnd; ++j) {
            const DiffOp& op = ops[j];
            if (op.kind != Kind::Insert) {
                if (!oldStartSet) { oldStart = op.oldIndex; oldStartSet = true; }
                ++oldCount;
            }
            if (op.kind != Kind::Delete) {
                if (!newStartSet) { newStart = op.newIndex; newStartSet = true; }
                ++newCount;
            }
        }
        // 某一侧为空时,起始行号取该侧在 hunk 之前已消费的行数
        if (!oldStartSet || !newStartSet) {
            size_t consumedOld = 0, consumedNew = 0;
            for (size_t j = 0; j < hunkStart; ++j) {
                if (ops[j].kind != Kind::Insert) ++consumedOld;
                if (ops[j].kind != Kind::Delete) ++consumedNew;
            }
            if (!oldStartSet) oldStart = consumedOld;
            if (!newStartSet) newStart = consumedNew;
        }

        out << "@@ -" << rangeHeader(oldStart, oldCount)
            << " +" << rangeHeader(newStart, newCount) << " @@\n";
        for (size_t j = hunkStart; j < hunkEnd; ++j) {
            const DiffOp& op = ops[j];
            switch (op.kind) {
                case Kind::Equal: emitLine(out, ' ', a[op.oldIndex]); break;
                case Kind::Delete: emitLine(out, '-', a[op.oldIndex]); break;
                case Kind::Insert: emitLine(out, '+', b[op.newIndex]); break;
            }
        }
        i = hunkEnd;
    }
    return out.str();
}

}
