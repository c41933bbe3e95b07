#include "tree_extractor.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

#include <tree_sitter/api.h>

extern "C" {
    const TSLanguage* tree_sitter_python(void);
}

namespace {

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

// Deletes a tree cursor when the conversion walk leaves scope
class CursorGuard {
public:
    explicit CursorGuard(TSTreeCursor* cursor) : cursor_(cursor) {}
    ~CursorGuard() { ts_tree_cursor_delete(cursor_); }
    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

private:
    TSTreeCursor* cursor_;
};

SyntaxNode makeNode(TSNode node, const char* fieldName) {
    SyntaxNode result;
    result.type = ts_node_type(node);
    result.kind = nodeKindFromType(result.type);
    result.field = fieldName ? fieldName : "";
    result.named = ts_node_is_named(node);
    result.missing = ts_node_is_missing(node);
    result.startByte = ts_node_start_byte(node);
    result.endByte = ts_node_end_byte(node);
    result.startLine = static_cast<int>(ts_node_start_point(node).row) + 1;
    result.endLine = static_cast<int>(ts_node_end_point(node).row) + 1;
    result.children.reserve(ts_node_child_count(node));
    return result;
}

// Iterative walk so deeply nested expressions cannot exhaust the stack.
// Only the ancestors of the current node are held by pointer, and nothing is
// appended to an ancestor's sibling list while it is on the stack.
SyntaxNode convertTree(const TSTree* tree) {
    TSTreeCursor cursor = ts_tree_cursor_new(ts_tree_root_node(tree));
    CursorGuard guard(&cursor);

    SyntaxNode root = makeNode(ts_tree_cursor_current_node(&cursor), nullptr);
    if (!ts_tree_cursor_goto_first_child(&cursor)) {
        return root;
    }

    std::vector<SyntaxNode*> stack{&root};
    while (true) {
        SyntaxNode* parent = stack.back();
        parent->children.push_back(makeNode(ts_tree_cursor_current_node(&cursor),
                                            ts_tree_cursor_current_field_name(&cursor)));

        if (ts_tree_cursor_goto_first_child(&cursor)) {
            stack.push_back(&parent->children.back());
            continue;
        }

        while (!ts_tree_cursor_goto_next_sibling(&cursor)) {
            if (!ts_tree_cursor_goto_parent(&cursor)) {
                return root;
            }
            stack.pop_back();
            if (stack.empty()) {
                return root;
            }
        }
    }
}

// Python 2 statements that tree-sitter-python accepts but Python 3 rejects
bool isLegacyStatement(const SyntaxNode& node) {
    return node.type == "print_statement" || node.type == "exec_statement";
}

// First node in document order that makes the file unparseable
const SyntaxNode* findFirstError(const SyntaxNode& root) {
    std::vector<const SyntaxNode*> pending{&root};
    while (!pending.empty()) {
        const SyntaxNode* node = pending.back();
        pending.pop_back();

        if (node->kind == NodeKind::Error || node->missing || isLegacyStatement(*node)) {
            return node;
        }
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
    return nullptr;
}

std::string failureReason(const SyntaxNode* error) {
    if (!error || error->startLine <= 0) {
        return "syntax error";
    }
    const std::string line = std::to_string(error->startLine);
    if (isLegacyStatement(*error)) {
        const std::string keyword = error->type.substr(0, error->type.find('_'));
        return "syntax error at line " + line + ": Python 2 " + keyword + " statement";
    }
    return "syntax error at line " + line;
}

} // namespace

struct TreeExtractor::TreeSitterImpl {
    std::unique_ptr<TSParser, void (*)(TSParser*)> parser{nullptr, ts_parser_delete};

    TreeSitterImpl() {
        parser.reset(ts_parser_new());
        if (!parser) {
            throw std::runtime_error("Failed to create tree-sitter parser");
        }
        if (!ts_parser_set_language(parser.get(), tree_sitter_python())) {
            throw std::runtime_error("tree-sitter-python grammar is incompatible with the tree-sitter runtime");
        }
    }
};

TreeExtractor::TreeExtractor()
    : impl_(std::make_unique<TreeSitterImpl>()) {}

TreeExtractor::~TreeExtractor() = default;

ExtractResult TreeExtractor::extract(const std::string& path, const std::string& content) const {
    ExtractResult result;

    if (!isValidUtf8(content)) {
        result.failure = ParseFailure{path, "file is not valid UTF-8"};
        return result;
    }

    try {
        TreePtr tree(ts_parser_parse_string(impl_->parser.get(), nullptr, content.c_str(),
                                            static_cast<uint32_t>(content.size())));
        if (!tree) {
            // Parser state is undefined after an aborted parse
            ts_parser_reset(impl_->parser.get());
            result.failure = ParseFailure{path, "parser returned no tree"};
            return result;
        }

        SyntaxNode root = convertTree(tree.get());

        const SyntaxNode* error = findFirstError(root);
        if (error || ts_node_has_error(ts_tree_root_node(tree.get()))) {
            result.errorLine = error ? error->startLine : 0;
            result.failure = ParseFailure{path, failureReason(error)};
            return result;
        }

        result.tree.emplace(path, content, std::move(root));
    } catch (const std::exception& e) {
        result.tree.reset();
        result.failure = ParseFailure{path, std::string("extraction failed: ") + e.what()};
    }

    return result;
}

bool isValidUtf8(const std::string& content) {
    size_t i = 0;
    const size_t size = content.size();

    while (i < size) {
        const auto lead = static_cast<unsigned char>(content[i]);
        size_t length;
        uint32_t codepoint;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codepoint = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }

        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(content[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        // Reject overlong forms, surrogates and out-of-range values
        if ((length == 2 && codepoint < 0x80) || (length == 3 && codepoint < 0x800) ||
            (length == 4 && (codepoint < 0x10000 || codepoint > 0x10FFFF)) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }

        i += length;
    }

    return true;
}
