#include "diff/unified_diff.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace tidemark {

namespace fs = std::filesystem;

namespace {

enum class EditOp {
    Equal,
    Delete,
    Insert
};

struct Opcode {
    char tag = 'e'; // e(qual), d(elete), i(nsert), r(eplace)
    int i1 = 0;
    int i2 = 0;
    int j1 = 0;
    int j2 = 0;
};

// Myers' O(ND) algorithm. Only the diagonals reachable at each step are
// kept in the trace, so memory grows with the square of the edit distance.
std::vector<EditOp> shortestEditScript(const std::vector<std::string> &a,
                                       const std::vector<std::string> &b)
{
    const int n = static_cast<int>(a.size());
    const int m = static_cast<int>(b.size());
    const int max = n + m;
    const int offset = max + 1;

    std::vector<int> v(2 * max + 3, 0);
    std::vector<std::vector<int>> trace;

    int distance = 0;
    bool done = false;
    for (int d = 0; d <= max && !done; ++d) {
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
        for (int k = -d; k <= d; k += 2) {
            int x = 0;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
                x = v[offset + k + 1];
            } else {
                x = v[offset + k - 1] + 1;
            }
            int y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                distance = d;
                done = true;
                break;
            }
        }
    }

    std::vector<EditOp> script;
    int x = n;
    int y = m;
    for (int d = distance; d >= 0; --d) {
        const std::vector<int> &slice = trace[d];
        auto at = [&slice, d](int k) { return slice[k + d + 1]; };

        const int k = x - y;
        int prevK = 0;
        if (k == -d || (k != d && at(k - 1) < at(k + 1))) {
            prevK = k + 1;
        } else {
            prevK = k - 1;
        }
        const int prevX = at(prevK);
        const int prevY = prevX - prevK;

        while (x > prevX && y > prevY) {
            script.push_back(EditOp::Equal);
            --x;
            --y;
        }
        if (d > 0) {
            if (x == prevX) {
                script.push_back(EditOp::Insert);
            } else {
                script.push_back(EditOp::Delete);
            }
        }
        x = prevX;
        y = prevY;
    }
    std::reverse(script.begin(), script.end());
    return script;
}

std::vector<Opcode> toOpcodes(const std::vector<EditOp> &script)
{
    std::vector<Opcode> opcodes;
    int i = 0;
    int j = 0;
    std::size_t pos = 0;
    while (pos < script.size()) {
        Opcode op;
        op.i1 = i;
        op.j1 = j;
        if (script[pos] == EditOp::Equal) {
            while (pos < script.size() && script[pos] == EditOp::Equal) {
                ++i;
                ++j;
                ++pos;
            }
            op.tag = 'e';
        } else {
            bool deleted = false;
            bool inserted = false;
            while (pos < script.size() && script[pos] != EditOp::Equal) {
                if (script[pos] == EditOp::Delete) {
                    ++i;
                    deleted = true;
                } else {
                    ++j;
                    inserted = true;
                }
                ++pos;
            }
            op.tag = deleted && inserted ? 'r' : (deleted ? 'd' : 'i');
        }
        op.i2 = i;
        op.j2 = j;
        opcodes.push_back(op);
    }
    return opcodes;
}

// Splits the opcodes into hunks with at most `context` unchanged lines
// around each change.
std::vector<std::vector<Opcode>> groupOpcodes(std::vector<Opcode> codes, int context)
{
    std::vector<std::vector<Opcode>> groups;
    if (codes.empty()) {
        return groups;
    }

    if (codes.front().tag == 'e') {
        Opcode &first = codes.front();
        first.i1 = std::max(first.i1, first.i2 - context);
        first.j1 = std::max(first.j1, first.j2 - context);
    }
    if (codes.back().tag == 'e') {
        Opcode &last = codes.back();
        last.i2 = std::min(last.i2, last.i1 + context);
        last.j2 = std::min(last.j2, last.j1 + context);
    }

    const int span = context * 2;
    std::vector<Opcode> group;
    for (Opcode op : codes) {
        if (op.tag == 'e' && op.i2 - op.i1 > span) {
            Opcode head = op;
            head.i2 = std::min(op.i2, op.i1 + context);
            head.j2 = std::min(op.j2, op.j1 + context);
            group.push_back(head);
            groups.push_back(std::move(group));
            group.clear();
            op.i1 = std::max(op.i1, op.i2 - context);
            op.j1 = std::max(op.j1, op.j2 - context);
        }
        group.push_back(op);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == 'e')) {
        groups.push_back(std::move(group));
    }
    return groups;
}

std::string formatRange(int start, int stop)
{
    int beginning = start + 1;
    const int length = stop - start;
    if (length == 1) {
        return std::to_string(beginning);
    }
    if (length == 0) {
        --beginning;
    }
    return std::to_string(beginning) + "," + std::to_string(length);
}

enum class ReadOutcome {
    Missing,
    Ok,
    Binary,
    Failed
};

ReadOutcome readSide(const std::optional<fs::path> &path,
                     std::string &content,
                     std::string &error)
{
    if (!path.has_value()) {
        return ReadOutcome::Missing;
    }
    std::error_code ec;
    if (!fs::exists(*path, ec)) {
        return ReadOutcome::Missing;
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        error = path->string() + ": " + std::strerror(errno);
        return ReadOutcome::Failed;
    }
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = path->string() + ": read error";
        return ReadOutcome::Failed;
    }

    const std::size_t sniffed = std::min(content.size(), kBinarySniffBytes);
    if (std::memchr(content.data(), '\0', sniffed) != nullptr) {
        return ReadOutcome::Binary;
    }
    return ReadOutcome::Ok;
}

} // namespace

std::vector<std::string> splitLines(const std::string &content)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string unifiedDiff(const std::vector<std::string> &oldLines,
                        const std::vector<std::string> &newLines,
                        const std::string &fromLabel,
                        const std::string &toLabel,
                        int context)
{
    const auto groups = groupOpcodes(toOpcodes(shortestEditScript(oldLines, newLines)),
                                     std::max(context, 0));
    if (groups.empty()) {
        return {};
    }

    std::ostringstream out;
    out << "--- " << fromLabel << "\n";
    out << "+++ " << toLabel << "\n";
    for (const auto &group : groups) {
        out << "@@ -" << formatRange(group.front().i1, group.back().i2)
            << " +" << formatRange(group.front().j1, group.back().j2) << " @@\n";
        for (const Opcode &op : group) {
            if (op.tag == 'e') {
                for (int i = op.i1; i < op.i2; ++i) {
                    out << ' ' << oldLines[i] << "\n";
                }
                continue;
            }
            if (op.tag == 'r' || op.tag == 'd') {
                for (int i = op.i1; i < op.i2; ++i) {
                    out << '-' << oldLines[i] << "\n";
                }
            }
            if (op.tag == 'r' || op.tag == 'i') {
                for (int j = op.j1; j < op.j2; ++j) {
                    out << '+' << newLines[j] << "\n";
                }
            }
        }
    }
    return out.str();
}

FileDiff diffFiles(const std::optional<fs::path> &checkpointFile,
                   const fs::path &currentFile,
                   const std::string &relPath)
{
    FileDiff result;

    std::string oldContent;
    std::string newContent;
    const ReadOutcome oldSide = readSide(checkpointFile, oldContent, result.error);
    const ReadOutcome newSide = readSide(currentFile, newContent, result.error);

    if (oldSide == ReadOutcome::Failed || newSide == ReadOutcome::Failed) {
        result.state = DiffState::Unreadable;
        return result;
    }
    if (oldSide == ReadOutcome::Binary || newSide == ReadOutcome::Binary) {
        result.state = DiffState::Binary;
        return result;
    }
    if (oldSide == ReadOutcome::Missing && newSide == ReadOutcome::Missing) {
        result.state = DiffState::MissingBoth;
        return result;
    }

    const auto oldLines = splitLines(oldContent);
    const auto newLines = splitLines(newContent);
    result.text = unifiedDiff(oldLines, newLines,
                              "checkpoint/" + relPath,
                              "current/" + relPath,
                              kDefaultDiffContext);
    if (result.text.empty()) {
        result.state = DiffState::Identical;
        return result;
    }

    result.state = DiffState::Text;
    std::istringstream lines(result.text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(lines, line)) {
        // The first two lines are the file headers.
        if (++lineNumber <= 2) {
            continue;
        }
        if (!line.empty() && line.front() == '+') {
            ++result.added;
        } else if (!line.empty() && line.front() == '-') {
            ++result.removed;
        }
    }
    return result;
}

std::string toDiffStateString(DiffState state)
{
    switch (state) {
    case DiffState::Text:
        return "text";
    case DiffState::Identical:
        return "identical";
    case DiffState::Binary:
        return "binary";
    case DiffState::MissingBoth:
        return "missing";
    case DiffState::Unreadable:
        return "unreadable";
    }
    return "unreadable";
}

} // namespace tidemark
