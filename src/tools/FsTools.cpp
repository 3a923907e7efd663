#include "FsTools.h"
#include "utils/Format.h"
#include <algorithm>

namespace {
    // ---------------------------------------------------------------------
    // 参数解析
    // ---------------------------------------------------------------------

    const nlohmann::json& objectArgs(const nlohmann::json& args) {
        static const nlohmann::json empty = nlohmann::json::object();
        if (args.is_null()) return empty;
        if (!args.is_object()) {
            throw FsError::invalidParams("arguments must be a JSON object");
        }
        return args;
    }

    std::string requireString(const nlohmann::json& args, const char* key) {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) {
            throw FsError::invalidParams(std::string("Missing required parameter: ") + key);
        }
        if (!it->is_string()) {
            throw FsError::invalidParams(std::string("'") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    std::optional<size_t> optionalCount(const nlohmann::json& args, const char* key) {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) return std::nullopt;
        if (it->is_number_unsigned()) {
            return it->get<size_t>();
        }
        if (it->is_number_integer()) {
            if (it->get<long long>() < 0) {
                throw FsError::invalidParams(std::string("'") + key + "' must be a non-negative integer");
            }
            return static_cast<size_t>(it->get<long long>());
        }
        throw FsError::invalidParams(std::string("'") + key + "' must be a non-negative integer");
    }

    bool optionalBool(const nlohmann::json& args, const char* key, bool fallback) {
        auto it = args.find(key);
        if (it == args.end() || it->is_null()) return fallback;
        if (!it->is_boolean()) {
            throw FsError::invalidParams(std::string("'") + key + "' must be a boolean");
        }
        return it->get<bool>();
    }

    nlohmann::json pathSchema(const std::string& description) {
        return {
            {"type", "object"},
            {"properties", {
                {"path", {
                    {"type", "string"},
                    {"description", description}
                }}
            }},
            {"required", nlohmann::json::array({"path"})}
        };
    }

    std::string optionalDate(const std::optional<std::chrono::system_clock::time_point>& tp) {
        return tp ? FormatUtils::formatDate(*tp) : "unknown";
    }

    nlohmann::json optionalTimestamp(const std::optional<std::chrono::system_clock::time_point>& tp) {
        if (!tp) return nullptr;
        return FormatUtils::formatTimestamp(*tp);
    }

    nlohmann::json treeToJson(const TreeNode& node) {
        nlohmann::json j;
        j["name"] = node.name;
        j["type"] = toString(node.kind);
        if (node.kind == EntryKind::File) {
            j["size"] = node.size;
        }
        if (node.kind == EntryKind::Directory) {
            nlohmann::json children = nlohmann::json::array();
            for (const auto& child : node.children) {
                children.push_back(treeToJson(child));
            }
            j["children"] = children;
        }
        return j;
    }

    std::string readHeader(const FileContent& content) {
        if (content.empty) {
            return "File: " + content.path.u8string() + " (" + FormatUtils::formatSize(content.size) + ")";
        }
        // limit 为 0 时窗口为空: lastLine == firstLine - 1
        if (content.lastLine < content.firstLine) {
            return "File: " + content.path.u8string() + " (No lines selected at line " +
                   std::to_string(content.firstLine) + " of " + std::to_string(content.totalLines) +
                   " total, " + FormatUtils::formatSize(content.size) + ")";
        }
        return "File: " + content.path.u8string() + " (Lines " + std::to_string(content.firstLine) + "-" +
               std::to_string(content.lastLine) + " of " + std::to_string(content.totalLines) +
               " total, " + FormatUtils::formatSize(content.size) + ")";
    }
}

size_t registerFilesystemTools(ToolRegistry& registry, FilesystemContext& context) {
    size_t registered = 0;
    auto add = [&](std::unique_ptr<ITool> tool) {
        if (registry.registerTool(std::move(tool))) ++registered;
    };

    add(std::make_unique<ListAllowedDirectoriesTool>(context));
    add(std::make_unique<ListDirectoryTool>(context));
    add(std::make_unique<ReadFileTool>(context));
    add(std::make_unique<ReadMultipleFilesTool>(context));
    add(std::make_unique<GetFileInfoTool>(context));
    add(std::make_unique<DirectoryTreeTool>(context));
    add(std::make_unique<SearchFilesTool>(context));

    add(std::make_unique<WriteFileTool>(context));
    add(std::make_unique<EditFileTool>(context));
    add(std::make_unique<CreateDirectoryTool>(context));

    add(std::make_unique<DeleteFileTool>(context));
    add(std::make_unique<DeleteDirectoryTool>(context));
    add(std::make_unique<MoveFileTool>(context));
    return registered;
}

// ============================================================================
// list_allowed_directories
// ============================================================================

std::string ListAllowedDirectoriesTool::getDescription() const {
    return "Lists all directories that this server is allowed to access. "
           "Returns each allowed directory on its own line as a fully canonicalized path.";
}

nlohmann::json ListAllowedDirectoriesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

nlohmann::json ListAllowedDirectoriesTool::execute(const nlohmann::json& args) {
    objectArgs(args);

    std::string text;
    nlohmann::json directories = nlohmann::json::array();
    for (const auto& root : ctx.reader.listAllowedDirectories()) {
        if (!text.empty()) text += "\n";
        text += root.u8string();
        directories.push_back(root.u8string());
    }

    nlohmann::json result = ToolRegistry::textResult(text);
    result["directories"] = directories;
    return result;
}

// ============================================================================
// list_directory
// ============================================================================

std::string ListDirectoryTool::getDescription() const {
    return "Lists the contents of a directory. Returns entries sorted with directories first, then files, "
           "each alphabetically. Each entry shows type, name, and for files, size and modification date.";
}

nlohmann::json ListDirectoryTool::getSchema() const {
    return pathSchema("Absolute path to the directory to list");
}

nlohmann::json ListDirectoryTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    DirListing listing = ctx.reader.listDirectory(requireString(params, "path"));

    std::string text;
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : listing.entries) {
        std::string line;
        switch (entry.kind) {
            case EntryKind::Directory:
                line = "[DIR]  " + entry.name + "/";
                break;
            case EntryKind::File:
                line = "[FILE] " + entry.name + " (" + FormatUtils::formatSize(entry.size) + ", " +
                       optionalDate(entry.modified) + ")";
                break;
            case EntryKind::Symlink:
                line = "[LINK] " + entry.name;
                break;
            case EntryKind::Other:
                line = "[OTHER] " + entry.name;
                break;
        }
        if (!text.empty()) text += "\n";
        text += line;

        nlohmann::json item = {{"name", entry.name}, {"type", toString(entry.kind)}};
        if (entry.kind == EntryKind::File) {
            item["size"] = entry.size;
            item["modified"] = optionalTimestamp(entry.modified);
        }
        entries.push_back(item);
    }

    if (listing.entries.empty()) {
        text = "(empty directory)";
    } else if (listing.truncated) {
        text += "\n\n(Showing first " + std::to_string(Reader::kMaxDirEntries) + " of " +
                std::to_string(listing.total) + " entries. Use search_files to find specific files.)";
    }

    nlohmann::json result = ToolRegistry::textResult(text);
    result["entries"] = entries;
    result["total"] = listing.total;
    result["truncated"] = listing.truncated;
    return result;
}

// ============================================================================
// read_file
// ============================================================================

std::string ReadFileTool::getDescription() const {
    return "Reads a file and returns its contents. Supports reading specific line ranges using offset (0-based) "
           "and limit parameters. Returns a header with file path and line information.";
}

nlohmann::json ReadFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path to the file to read"}
            }},
            {"offset", {
                {"type", "integer"},
                {"minimum", 0},
                {"description", "Line offset (0-based) to start reading from"}
            }},
            {"limit", {
                {"type", "integer"},
                {"minimum", 0},
                {"description", "Maximum number of lines to read"}
            }}
        }},
        {"required", nlohmann::json::array({"path"})}
    };
}

nlohmann::json ReadFileTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string path = requireString(params, "path");
    std::optional<size_t> offset = optionalCount(params, "offset");
    std::optional<size_t> limit = optionalCount(params, "limit");

    FileContent content = ctx.reader.readFile(path, offset, limit);

    std::string text = readHeader(content) + "\n\n" + (content.empty ? "(empty file)" : content.text);
    nlohmann::json result = ToolRegistry::textResult(text);
    result["file"] = {
        {"path", content.path.u8string()},
        {"firstLine", content.firstLine},
        {"lastLine", content.lastLine},
        {"totalLines", content.totalLines},
        {"size", content.size},
        {"empty", content.empty}
    };
    return result;
}

// ============================================================================
// read_multiple_files
// ============================================================================

std::string ReadMultipleFilesTool::getDescription() const {
    return "Reads multiple files and returns their contents with clear separators between each file. "
           "If any file fails to read, the error is included inline and remaining files are still processed.";
}

nlohmann::json ReadMultipleFilesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"paths", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "List of absolute file paths to read"}
            }}
        }},
        {"required", nlohmann::json::array({"paths"})}
    };
}

nlohmann::json ReadMultipleFilesTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    auto it = params.find("paths");
    if (it == params.end() || !it->is_array()) {
        throw FsError::invalidParams("'paths' must be an array of strings");
    }
    std::vector<std::string> paths;
    for (const auto& p : *it) {
        if (!p.is_string()) {
            throw FsError::invalidParams("'paths' must be an array of strings");
        }
        paths.push_back(p.get<std::string>());
    }

    std::string text;
    nlohmann::json results = nlohmann::json::array();
    for (const auto& item : ctx.reader.readMultiple(paths)) {
        if (!text.empty()) text += "\n\n";
        nlohmann::json entry = {{"path", item.requestedPath}};
        if (item.content) {
            const FileContent& content = *item.content;
            text += "=== " + content.path.u8string() + " (" + std::to_string(content.totalLines) +
                    " lines, " + FormatUtils::formatSize(content.size) + ") ===\n" + content.text;
            entry["ok"] = true;
            entry["totalLines"] = content.totalLines;
            entry["size"] = content.size;
        } else {
            text += "=== " + item.requestedPath + " ===\nError: " + item.error->what();
            entry["ok"] = false;
            entry["error"] = item.error->what();
            entry["errorKind"] = toString(item.error->kind());
        }
        results.push_back(entry);
    }

    nlohmann::json result = ToolRegistry::textResult(text);
    result["results"] = results;
    return result;
}

// ============================================================================
// get_file_info
// ============================================================================

std::string GetFileInfoTool::getDescription() const {
    return "Returns detailed metadata about a file or directory including size, type, MIME type, "
           "timestamps, and permissions.";
}

nlohmann::json GetFileInfoTool::getSchema() const {
    return pathSchema("Absolute path to the file or directory");
}

nlohmann::json GetFileInfoTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    FileInfo info = ctx.reader.fileInfo(requireString(params, "path"));

    std::string mime = info.kind == EntryKind::File ? info.mimeType : "N/A";
    std::string text = "Path: " + info.path.u8string() +
                       "\nType: " + toString(info.kind) +
                       "\nSize: " + FormatUtils::formatSize(info.size) +
                       "\nMIME: " + mime +
                       "\nModified: " + optionalDate(info.modified) +
                       "\nCreated: " + optionalDate(info.created) +
                       "\nAccessed: " + optionalDate(info.accessed) +
                       "\nPermissions: " + info.permissions;

    nlohmann::json result = ToolRegistry::textResult(text);
    result["info"] = {
        {"path", info.path.u8string()},
        {"type", toString(info.kind)},
        {"size", info.size},
        {"mimeType", info.kind == EntryKind::File ? nlohmann::json(info.mimeType) : nlohmann::json(nullptr)},
        {"modified", optionalTimestamp(info.modified)},
        {"created", optionalTimestamp(info.created)},
        {"accessed", optionalTimestamp(info.accessed)},
        {"permissions", info.permissions}
    };
    return result;
}

// ============================================================================
// directory_tree
// ============================================================================

std::string DirectoryTreeTool::getDescription() const {
    return "Displays a visual tree of directory structure with box-drawing characters. Shows directories first "
           "(sorted), then files with sizes. Hidden files/directories (starting with '.') are skipped unless "
           "include_hidden is set. Output is capped at " + std::to_string(TreeWalker::kMaxTreeEntries) + " entries.";
}

nlohmann::json DirectoryTreeTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path to the root directory"}
            }},
            {"max_depth", {
                {"type", "integer"},
                {"minimum", 0},
                {"description", "Maximum depth to descend (clamped to the server's configured maximum)"}
            }},
            {"include_hidden", {
                {"type", "boolean"},
                {"description", "Include entries whose names start with '.' (default false)"}
            }}
        }},
        {"required", nlohmann::json::array({"path"})}
    };
}

nlohmann::json DirectoryTreeTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string path = requireString(params, "path");
    std::optional<size_t> requested = optionalCount(params, "max_depth");
    bool includeHidden = optionalBool(params, "include_hidden", false);

    const size_t configured = static_cast<size_t>(ctx.config.maxDepth);
    int depth = static_cast<int>(std::min(requested.value_or(configured), configured));

    TreeResult tree = ctx.walker.walk(path, depth, includeHidden);

    nlohmann::json result = ToolRegistry::textResult(TreeWalker::render(tree));
    nlohmann::json root = treeToJson(tree.root);
    root["path"] = tree.rootPath.u8string();
    result["tree"] = root;
    result["count"] = tree.count;
    result["truncated"] = tree.truncated;
    return result;
}

// ============================================================================
// search_files
// ============================================================================

std::string SearchFilesTool::getDescription() const {
    return "Searches for files and directories matching a glob pattern within a directory tree. "
           "A pattern without '/' matches entry names at any depth (e.g. '*.rs'); a pattern with '/' matches "
           "the path relative to the search root (e.g. 'src/**/*.h'). Matching is case-sensitive. "
           "Returns at most max_results matches (default 50, max 200).";
}

nlohmann::json SearchFilesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path to the directory to search in"}
            }},
            {"pattern", {
                {"type", "string"},
                {"description", "Glob pattern (*, **, ?, [abc], {a,b})"}
            }},
            {"max_results", {
                {"type", "integer"},
                {"minimum", 1},
                {"maximum", static_cast<int>(Searcher::kMaxSearchResults)},
                {"description", "Maximum number of results (default 50)"}
            }}
        }},
        {"required", nlohmann::json::array({"path", "pattern"})}
    };
}

nlohmann::json SearchFilesTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string path = requireString(params, "path");
    std::string pattern = requireString(params, "pattern");
    std::optional<size_t> maxResults = optionalCount(params, "max_results");

    SearchResult search = ctx.searcher.search(path, pattern, maxResults);

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& match : search.matches) {
        nlohmann::json item = {
            {"path", match.path.u8string()},
            {"relativePath", match.relativePath},
            {"type", toString(match.kind)}
        };
        if (match.kind == EntryKind::File) {
            item["size"] = match.size;
        }
        matches.push_back(item);
    }

    nlohmann::json result = ToolRegistry::textResult(Searcher::render(search));
    result["matches"] = matches;
    result["truncated"] = search.truncated;
    return result;
}

// ============================================================================
// write_file
// ============================================================================

std::string WriteFileTool::getDescription() const {
    return "Creates a new file or overwrites an existing file with the provided content. "
           "Parent directory must already exist.";
}

nlohmann::json WriteFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path of the file to write"}
            }},
            {"content", {
                {"type", "string"},
                {"description", "Full content to write"}
            }}
        }},
        {"required", nlohmann::json::array({"path", "content"})}
    };
}

nlohmann::json WriteFileTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string path = requireString(params, "path");
    std::string content = requireString(params, "content");

    WriteResult written = ctx.mutator.writeFile(path, content);

    nlohmann::json result = ToolRegistry::textResult(
        "Wrote " + FormatUtils::formatSize(written.bytesWritten) + " to " + written.path.u8string());
    result["path"] = written.path.u8string();
    result["bytesWritten"] = written.bytesWritten;
    result["created"] = written.created;
    return result;
}

// ============================================================================
// edit_file
// ============================================================================

std::string EditFileTool::getDescription() const {
    return "Applies a sequence of exact-text replacements to a file. Each edit must match exactly one location "
           "in the content produced by the previous edits. Nothing is written unless every edit succeeds. "
           "Returns a unified diff of all changes. Set dry_run to preview the diff without writing.";
}

nlohmann::json EditFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path of the file to edit"}
            }},
            {"edits", {
                {"type", "array"},
                {"items", {
                    {"type", "object"},
                    {"properties", {
                        {"oldText", {{"type", "string"}, {"description", "Exact text to replace; must be unique"}}},
                        {"newText", {{"type", "string"}, {"description", "Replacement text"}}}
                    }},
                    {"required", nlohmann::json::array({"oldText", "newText"})}
                }},
                {"description", "Ordered list of replacements"}
            }},
            {"dry_run", {
                {"type", "boolean"},
                {"description", "Preview the diff without modifying the file (default false)"}
            }}
        }},
        {"required", nlohmann::json::array({"path", "edits"})}
    };
}

std::vector<TextEdit> EditFileTool::parseEdits(const nlohmann::json& edits) {
    if (!edits.is_array()) {
        throw FsError::invalidParams("'edits' must be an array");
    }

    auto pick = [](const nlohmann::json& edit, const char* camel, const char* snake, size_t index) {
        auto it = edit.find(camel);
        if (it == edit.end()) it = edit.find(snake);
        if (it == edit.end() || !it->is_string()) {
            throw FsError::invalidParams("edit " + std::to_string(index + 1) + ": '" + camel +
                                         "' must be a string");
        }
        return it->get<std::string>();
    };

    std::vector<TextEdit> parsed;
    for (size_t i = 0; i < edits.size(); ++i) {
        const nlohmann::json& edit = edits[i];
        if (!edit.is_object()) {
            throw FsError::invalidParams("edit " + std::to_string(i + 1) + " must be an object");
        }
        parsed.push_back(TextEdit{pick(edit, "oldText", "old_text", i), pick(edit, "newText", "new_text", i)});
    }
    return parsed;
}

nlohmann::json EditFileTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string path = requireString(params, "path");
    auto it = params.find("edits");
    if (it == params.end()) {
        throw FsError::invalidParams("Missing required parameter: edits");
    }
    std::vector<TextEdit> edits = parseEdits(*it);
    bool dryRun = optionalBool(params, "dry_run", false);

    EditResult edited = ctx.editor.edit(path, edits, dryRun);

    std::string summary = dryRun
        ? "Dry run: " + std::to_string(edited.applied) + " edit(s) would be applied to " +
          edited.path.u8string() + " (file not modified)"
        : "Applied " + std::to_string(edited.applied) + " edit(s) to " + edited.path.u8string();

    nlohmann::json result = ToolRegistry::textResult(summary + "\n\n" + edited.diff);
    result["diff"] = edited.diff;
    result["applied"] = edited.applied;
    result["dryRun"] = edited.dryRun;
    return result;
}

// ============================================================================
// create_directory
// ============================================================================

std::string CreateDirectoryTool::getDescription() const {
    return "Creates a directory and any necessary parent directories (like mkdir -p). "
           "Succeeds silently if the directory already exists.";
}

nlohmann::json CreateDirectoryTool::getSchema() const {
    return pathSchema("Absolute path of the directory to create");
}

nlohmann::json CreateDirectoryTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    CreateDirectoryResult created = ctx.mutator.createDirectory(requireString(params, "path"));

    std::string text = created.created
        ? "Created directory " + created.path.u8string()
        : "Directory already exists: " + created.path.u8string();
    nlohmann::json result = ToolRegistry::textResult(text);
    result["path"] = created.path.u8string();
    result["created"] = created.created;
    return result;
}

// ============================================================================
// delete_file / delete_directory / move_file
// ============================================================================

std::string DeleteFileTool::getDescription() const {
    return "Deletes a single file. Does not delete directories.";
}

nlohmann::json DeleteFileTool::getSchema() const {
    return pathSchema("Absolute path of the file to delete");
}

nlohmann::json DeleteFileTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    fs::path deleted = ctx.mutator.deleteFile(requireString(params, "path"));

    nlohmann::json result = ToolRegistry::textResult("Deleted file " + deleted.u8string());
    result["path"] = deleted.u8string();
    return result;
}

std::string DeleteDirectoryTool::getDescription() const {
    return "Deletes an empty directory. Fails if the directory is not empty; never deletes recursively. "
           "Allowed root directories cannot be deleted.";
}

nlohmann::json DeleteDirectoryTool::getSchema() const {
    return pathSchema("Absolute path of the empty directory to delete");
}

nlohmann::json DeleteDirectoryTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    fs::path deleted = ctx.mutator.deleteDirectory(requireString(params, "path"));

    nlohmann::json result = ToolRegistry::textResult("Deleted directory " + deleted.u8string());
    result["path"] = deleted.u8string();
    return result;
}

std::string MoveFileTool::getDescription() const {
    return "Moves or renames a file or directory. Both source and destination must be inside allowed "
           "directories. Fails if the destination already exists.";
}

nlohmann::json MoveFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"source", {
                {"type", "string"},
                {"description", "Absolute path of the file or directory to move"}
            }},
            {"destination", {
                {"type", "string"},
                {"description", "Absolute destination path; must not exist"}
            }}
        }},
        {"required", nlohmann::json::array({"source", "destination"})}
    };
}

nlohmann::json MoveFileTool::execute(const nlohmann::json& args) {
    const nlohmann::json& params = objectArgs(args);
    std::string source = requireString(params, "source");
    std::string destination = requireString(params, "destination");

    MoveResult moved = ctx.mutator.moveFile(source, destination);

    nlohmann::json result = ToolRegistry::textResult(
        "Moved " + moved.source.u8string() + " to " + moved.destination.u8string());
    result["source"] = moved.source.u8string();
    result["destination"] = moved.destination.u8string();
    return result;
}
