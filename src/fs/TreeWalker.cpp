#include "fs/TreeWalker.h"
#include "utils/Format.h"
#include <algorithm>

namespace {
    struct Child {
        fs::path path;
        std::string name;
        EntryKind kind;
        std::uintmax_t size;
    };

    std::vector<Child> readChildren(const fs::path& dir, bool includeHidden, std::error_code& ec) {
        std::vector<Child> children;
        fs::directory_iterator it(dir, ec);
        if (ec) return children;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                ec.clear();
                break;
            }
            std::string name = it->path().filename().u8string();
            if (!includeHidden && !name.empty() && name[0] == '.') continue;

            std::error_code entryEc;
            fs::file_status status = it->symlink_status(entryEc);
            if (entryEc) continue;

            Child child{it->path(), name, entryKindOf(status), 0};
            if (child.kind == EntryKind::File) {
                child.size = it->file_size(entryEc);
                if (entryEc) child.size = 0;
            }
            children.push_back(std::move(child));
        }

        std::sort(children.begin(), children.end(), [](const Child& a, const Child& b) {
            bool aDir = a.kind == EntryKind::Directory;
            bool bDir = b.kind == EntryKind::Directory;
            if (aDir != bDir) return aDir;
            return a.name < b.name;
        });
        return children;
    }

    class TreeBuilder {
    public:
        TreeBuilder(bool includeHidden, TreeResult& result)
            : includeHidden(includeHidden), result(result) {}

        // @return false 表示已达到条目上限
        bool build(const fs::path& dir, TreeNode& node, int depthLeft) {
            std::error_code ec;
            std::vector<Child> children = readChildren(dir, includeHidden, ec);
            for (auto& child : children) {
                if (result.count >= TreeWalker::kMaxTreeEntries) {
                    result.truncated = true;
                    return false;
                }
                ++result.count;
                node.children.push_back(TreeNode{child.name, child.kind, child.size, {}});
                if (child.kind == EntryKind::Directory && depthLeft > 0) {
                    if (!build(child.path, node.children.back(), depthLeft - 1)) {
                        return false;
                    }
                }
            }
            return true;
        }

    private:
        bool includeHidden;
        TreeResult& result;
    };

    class Visiting {
    public:
        Visiting(bool includeHidden, const TreeWalker::Visitor& visitor)
            : includeHidden(includeHidden), visitor(visitor) {}

        bool run(const fs::path& dir, const std::string& relativeDir, int depth, int maxDepth) {
            std::error_code ec;
            std::vector<Child> children = readChildren(dir, includeHidden, ec);
            for (auto& child : children) {
                VisitEntry entry;
                entry.path = child.path;
                entry.name = child.name;
                entry.relativePath = relativeDir.empty() ? child.name : relativeDir + "/" + child.name;
                entry.kind = child.kind;
                entry.size = child.size;
                entry.depth = depth;
                if (!visitor(entry)) return false;

                if (child.kind == EntryKind::Directory && depth < maxDepth) {
                    if (!run(child.path, entry.relativePath, depth + 1, maxDepth)) return false;
                }
            }
            return true;
        }

    private:
        bool includeHidden;
        const TreeWalker::Visitor& visitor;
    };

    void renderChildren(const TreeNode& node, const std::string& prefix, std::string& out) {
        for (size_t i = 0; i < node.children.size(); ++i) {
            const TreeNode& child = node.children[i];
            bool last = i + 1 == node.children.size();
            out += prefix;
            out += last ? "└── " : "├── ";
            out += child.name;
            switch (child.kind) {
                case EntryKind::Directory: out += "/"; break;
                case EntryKind::File: out += " (" + FormatUtils::formatSize(child.size) + ")"; break;
                case EntryKind::Symlink: out += " (symlink)"; break;
                case EntryKind::Other: break;
            }
            out += "\n";
            if (!child.children.empty()) {
                renderChildren(child, prefix + (last ? "    " : "│   "), out);
            }
        }
    }
}

TreeWalker::TreeWalker(const PathGuard& guard) : guard(guard) {}

TreeResult TreeWalker::walk(const std::string& path, int maxDepth, bool includeHidden) const {
    TreeResult result;
    result.rootPath = guard.requireDirectory(path);
    result.root.name = result.rootPath.filename().u8string();
    result.root.kind = EntryKind::Directory;

    std::error_code ec;
    fs::directory_iterator probe(result.rootPath, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, path);
    }

    TreeBuilder builder(includeHidden, result);
    builder.build(result.rootPath, result.root, std::max(0, maxDepth));
    return result;
}

void TreeWalker::visit(const fs::path& root, int maxDepth, bool includeHidden, const Visitor& visitor) const {
    std::error_code ec;
    fs::directory_iterator probe(root, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, root.u8string());
    }
    Visiting visiting(includeHidden, visitor);
    visiting.run(root, "", 0, std::max(0, maxDepth));
}

std::string TreeWalker::render(const TreeResult& result) {
    std::string out = result.rootPath.u8string() + "/\n";
    renderChildren(result.root, "", out);
    if (result.truncated) {
        out += "... (truncated, exceeded " + std::to_string(kMaxTreeEntries) +
               " entries. Use search_files to find specific files.)\n";
    }
    return out;
}
