#include "fs/Editor.h"
#include "fs/Reader.h"
#include "utils/UnifiedDiff.h"
#include <cerrno>
#include <fstream>

namespace {
    constexpr size_t kSnippetLength = 80;

    std::string snippet(const std::string& text) {
        if (text.size() <= kSnippetLength) return "\"" + text + "\"";
        return "\"" + text.substr(0, kSnippetLength) + "...\"";
    }
}

Editor::Editor(const PathGuard& guard, const Config& config) : guard(guard), config(config) {}

size_t Editor::countOccurrences(const std::string& content, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = content.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = content.find(needle, pos + needle.size());
    }
    return count;
}

std::string Editor::applyEdits(const std::string& content, const std::vector<TextEdit>& edits) {
    if (edits.empty()) {
        throw FsError::invalidParams("edits must contain at least one edit");
    }

    std::string current = content;
    for (size_t i = 0; i < edits.size(); ++i) {
        const TextEdit& edit = edits[i];
        const std::string step = "edit " + std::to_string(i + 1) + ": ";
        if (edit.oldText.empty()) {
            throw FsError::invalidParams(step + "oldText must be non-empty");
        }

        size_t count = countOccurrences(current, edit.oldText);
        if (count == 0) {
            throw FsError(ErrorKind::NoMatch, step + "oldText not found: " + snippet(edit.oldText));
        }
        if (count > 1) {
            throw FsError(ErrorKind::AmbiguousMatch,
                          step + "oldText matches " + std::to_string(count) +
                          " locations (must be unique): " + snippet(edit.oldText));
        }
        current.replace(current.find(edit.oldText), edit.oldText.size(), edit.newText);
    }
    return current;
}

EditResult Editor::edit(const std::string& path, const std::vector<TextEdit>& edits, bool dryRun) const {
    EditResult result;
    result.path = guard.requireFile(path);
    result.dryRun = dryRun;

    std::error_code ec;
    auto size = fs::file_size(result.path, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }
    if (size > config.maxReadSize) {
        throw FsError::tooLarge(path, size, config.maxReadSize);
    }

    const std::string original = Reader::readBytes(result.path, path);
    if (Reader::isBinary(original)) {
        throw FsError::binaryFile(path);
    }

    const std::string updated = applyEdits(original, edits);
    result.applied = edits.size();
    result.diff = UnifiedDiff::generate(original, updated, path, path);

    if (dryRun) {
        return result;
    }

    std::ofstream out(result.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw FsError::fromErrorCode(std::error_code(errno, std::generic_category()), path);
    }
    out << updated;
    out.close();
    if (out.fail()) {
        throw FsError(ErrorKind::Internal, "Failed to write file: " + path);
    }
    return result;
}
