#include "structural_indexer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string stripWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

// identifier(.identifier)*
bool isDottedName(const std::string& text) {
    if (text.empty() || text.front() == '.' || text.back() == '.') {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == '.') {
            if (text[i - 1] == '.') {
                return false;
            }
        } else if (!std::isalnum(c) && c != '_' && c < 0x80) {
            return false;
        }
    }
    return true;
}

const SyntaxNode* definitionOf(const SyntaxNode& decorated) {
    if (const SyntaxNode* definition = decorated.childByField("definition")) {
        return definition;
    }
    for (const auto& child : decorated.children) {
        if (child.isScope()) {
            return &child;
        }
    }
    return nullptr;
}

// Name bound by an import clause: the dotted name itself, or the original
// name of an `x as y` alias.
std::string importedName(const SyntaxTree& tree, const SyntaxNode& node) {
    if (node.type == "aliased_import") {
        if (const SyntaxNode* name = node.childByField("name")) {
            return tree.text(*name);
        }
    }
    return tree.text(node);
}

} // namespace

IndexedFile StructuralIndexer::index(const SyntaxTree& tree) const {
    IndexedFile out;
    const fs::path path(tree.path());

    out.module.id = 0;
    out.module.path = tree.path();
    out.module.name = path.stem().string();
    out.module.lineCount = countLines(tree.source());
    out.module.docstring = extractDocstring(tree, tree.root());

    const std::string filename = path.filename().string();
    out.module.isMain = filename == "main.py" || filename == "__main__.py";
    for (const auto& statement : tree.root().children) {
        if (isMainGuard(tree, statement)) {
            out.module.isMain = true;
            break;
        }
    }

    visit(tree, tree.root(), Scope{}, out);
    return out;
}

void StructuralIndexer::visit(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope,
                              IndexedFile& out) const {
    for (const auto& child : node.children) {
        switch (child.kind) {
            case NodeKind::FunctionDefinition:
                indexFunction(tree, child, scope, {}, out);
                break;
            case NodeKind::ClassDefinition:
                indexClass(tree, child, scope, {}, out);
                break;
            case NodeKind::DecoratedDefinition: {
                std::vector<std::string> decorators;
                for (const auto& part : child.children) {
                    if (part.kind == NodeKind::Decorator) {
                        decorators.push_back(decoratorName(tree, part));
                    }
                }
                const SyntaxNode* definition = definitionOf(child);
                if (!definition) {
                    break;
                }
                if (definition->kind == NodeKind::FunctionDefinition) {
                    indexFunction(tree, *definition, scope, decorators, out);
                } else {
                    indexClass(tree, *definition, scope, decorators, out);
                }
                break;
            }
            case NodeKind::ImportStatement:
            case NodeKind::ImportFromStatement:
                collectImport(tree, child, out);
                break;
            default:
                visit(tree, child, scope, out);
                break;
        }
    }
}

void StructuralIndexer::indexFunction(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope,
                                      const std::vector<std::string>& decorators, IndexedFile& out) const {
    const SyntaxNode* nameNode = node.childByField("name");
    const SyntaxNode* body = node.childByField("body");
    if (!nameNode || !body) {
        return;
    }

    FunctionInfo info;
    info.id = out.functions.size();
    info.name = tree.text(*nameNode);
    info.qualifiedName = scope.qualifiedPrefix + info.name;
    info.module = 0;
    info.file = tree.path();
    info.line = node.startLine;
    info.endLine = node.endLine;
    info.decorators = decorators;
    info.docstring = extractDocstring(tree, *body);
    info.ownerClass = scope.ownerClass;
    info.isMethod = scope.ownerClass.has_value();

    if (const SyntaxNode* parameters = node.childByField("parameters")) {
        info.parameters = collectParameters(tree, *parameters);
    }
    if (const SyntaxNode* returnType = node.childByField("return_type")) {
        info.returnType = tree.text(*returnType);
    }

    info.isAsync = std::any_of(node.children.begin(), node.children.end(),
                               [](const SyntaxNode& child) { return !child.named && child.type == "async"; });

    bool staticDecorated = false;
    for (const auto& decorator : decorators) {
        const std::string segment = lastDottedSegment(decorator);
        if (segment == "property" || segment == "cached_property" ||
            segment == "setter" || segment == "getter" || segment == "deleter") {
            info.isProperty = true;
        } else if (segment == "classmethod") {
            info.isClassMethod = true;
        } else if (segment == "staticmethod") {
            staticDecorated = true;
        }
    }
    info.isStaticLike = info.isMethod && (staticDecorated || info.parameters.empty());

    collectCallees(tree, *body, info.callees);

    const FunctionId id = info.id;
    const std::string nestedPrefix = info.qualifiedName + ".";
    if (info.ownerClass) {
        out.classes[*info.ownerClass].methods.push_back(info.name);
    }
    out.module.functions.push_back(id);
    out.functions.push_back(std::move(info));
    out.functionNodes.push_back(&node);

    visit(tree, *body, Scope{nestedPrefix, std::nullopt}, out);
}

void StructuralIndexer::indexClass(const SyntaxTree& tree, const SyntaxNode& node, const Scope& scope,
                                   const std::vector<std::string>& decorators, IndexedFile& out) const {
    const SyntaxNode* nameNode = node.childByField("name");
    const SyntaxNode* body = node.childByField("body");
    if (!nameNode || !body) {
        return;
    }

    ClassInfo info;
    info.id = out.classes.size();
    info.name = tree.text(*nameNode);
    info.qualifiedName = scope.qualifiedPrefix + info.name;
    info.module = 0;
    info.file = tree.path();
    info.line = node.startLine;
    info.endLine = node.endLine;
    info.decorators = decorators;
    info.docstring = extractDocstring(tree, *body);

    if (const SyntaxNode* superclasses = node.childByField("superclasses")) {
        for (const SyntaxNode* base : superclasses->namedChildren()) {
            // metaclass=... and other keywords are not bases
            if (base->type == "keyword_argument" || base->kind == NodeKind::Comment) {
                continue;
            }
            info.bases.push_back(stripWhitespace(tree.text(*base)));
        }
    }

    for (const auto& base : info.bases) {
        std::string lower = base;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.find("abc") != std::string::npos || lower.find("abstract") != std::string::npos) {
            info.isAbstract = true;
        }
        if (lower.find("exception") != std::string::npos || lower.find("error") != std::string::npos) {
            info.isException = true;
        }
    }

    const ClassId id = info.id;
    const std::string nestedPrefix = info.qualifiedName + ".";
    out.module.classes.push_back(id);
    out.classes.push_back(std::move(info));

    visit(tree, *body, Scope{nestedPrefix, id}, out);
}

void StructuralIndexer::collectImport(const SyntaxTree& tree, const SyntaxNode& node, IndexedFile& out) const {
    if (node.kind == NodeKind::ImportStatement) {
        // import a.b, c as d  ->  one record per imported module
        for (const SyntaxNode* name : node.childrenByField("name")) {
            ImportRecord record;
            record.module = importedName(tree, *name);
            record.line = node.startLine;
            out.module.imports.push_back(std::move(record));
        }
        return;
    }

    ImportRecord record;
    record.isFrom = true;
    record.line = node.startLine;

    if (const SyntaxNode* moduleName = node.childByField("module_name")) {
        if (moduleName->type == "relative_import") {
            for (const auto& part : moduleName->children) {
                if (part.type == "import_prefix") {
                    const std::string dots = tree.text(part);
                    record.level = static_cast<int>(std::count(dots.begin(), dots.end(), '.'));
                } else if (part.type == "dotted_name") {
                    record.module = tree.text(part);
                }
            }
        } else {
            record.module = tree.text(*moduleName);
        }
    }

    for (const auto& child : node.children) {
        if (child.field == "name") {
            record.names.push_back(importedName(tree, child));
        } else if (child.type == "wildcard_import") {
            record.names.push_back("*");
        }
    }

    out.module.imports.push_back(std::move(record));
}

std::vector<Parameter> StructuralIndexer::collectParameters(const SyntaxTree& tree,
                                                            const SyntaxNode& parameters) const {
    std::vector<Parameter> result;

    for (const SyntaxNode* param : parameters.namedChildren()) {
        Parameter parameter;

        if (param->kind == NodeKind::Identifier ||
            param->type == "list_splat_pattern" || param->type == "dictionary_splat_pattern") {
            parameter.name = tree.text(*param);
        } else if (param->type == "typed_parameter") {
            // The name is the unlabelled child: identifier or a splat pattern
            for (const SyntaxNode* part : param->namedChildren()) {
                if (part->field.empty()) {
                    parameter.name = tree.text(*part);
                    break;
                }
            }
            if (const SyntaxNode* type = param->childByField("type")) {
                parameter.type = tree.text(*type);
            }
        } else if (param->type == "default_parameter" || param->type == "typed_default_parameter") {
            if (const SyntaxNode* name = param->childByField("name")) {
                parameter.name = tree.text(*name);
            }
            if (const SyntaxNode* type = param->childByField("type")) {
                parameter.type = tree.text(*type);
            }
            if (const SyntaxNode* value = param->childByField("value")) {
                parameter.defaultValue = tree.text(*value);
            }
        } else {
            // keyword_separator, positional_separator and comments
            continue;
        }

        if (!parameter.name.empty()) {
            result.push_back(std::move(parameter));
        }
    }

    return result;
}

void StructuralIndexer::collectCallees(const SyntaxTree& tree, const SyntaxNode& node,
                                       std::set<std::string>& callees) const {
    for (const auto& child : node.children) {
        // Calls inside a nested definition belong to that definition
        if (child.isScope()) {
            continue;
        }

        if (child.kind == NodeKind::Call) {
            const SyntaxNode* function = child.childByField("function");
            if (function && (function->kind == NodeKind::Identifier || function->kind == NodeKind::Attribute)) {
                std::string name = stripWhitespace(tree.text(*function));
                if (isDottedName(name)) {
                    callees.insert(std::move(name));
                }
            }
        }

        collectCallees(tree, child, callees);
    }
}

std::string StructuralIndexer::decoratorName(const SyntaxTree& tree, const SyntaxNode& decorator) const {
    const SyntaxNode* expression = decorator.firstNamedChild();
    if (!expression) {
        return "";
    }
    // @app.route("/x") is recorded as app.route
    if (expression->kind == NodeKind::Call) {
        if (const SyntaxNode* function = expression->childByField("function")) {
            return stripWhitespace(tree.text(*function));
        }
    }
    return stripWhitespace(tree.text(*expression));
}

bool StructuralIndexer::isMainGuard(const SyntaxTree& tree, const SyntaxNode& node) const {
    if (node.kind != NodeKind::IfStatement) {
        return false;
    }
    const SyntaxNode* condition = node.childByField("condition");
    if (!condition) {
        return false;
    }

    std::string text = stripWhitespace(tree.text(*condition));
    std::replace(text.begin(), text.end(), '\'', '"');
    return text == "__name__==\"__main__\"" || text == "\"__main__\"==__name__";
}

std::optional<std::string> extractDocstring(const SyntaxTree& tree, const SyntaxNode& body) {
    const SyntaxNode* first = body.firstNamedChild();
    if (!first || first->kind != NodeKind::ExpressionStatement) {
        return std::nullopt;
    }
    const SyntaxNode* literal = first->firstNamedChild();
    if (!literal || literal->kind != NodeKind::String) {
        return std::nullopt;
    }
    return cleanDocstring(tree.text(*literal));
}

std::string cleanDocstring(const std::string& literal) {
    size_t begin = 0;
    while (begin < literal.size() && std::isalpha(static_cast<unsigned char>(literal[begin]))) {
        ++begin;
    }

    size_t quoteLength = 0;
    if (literal.compare(begin, 3, "\"\"\"") == 0 || literal.compare(begin, 3, "'''") == 0) {
        quoteLength = 3;
    } else if (begin < literal.size() && (literal[begin] == '"' || literal[begin] == '\'')) {
        quoteLength = 1;
    }

    std::string body;
    if (literal.size() >= begin + 2 * quoteLength) {
        body = literal.substr(begin + quoteLength, literal.size() - begin - 2 * quoteLength);
    }

    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const size_t end = body.find('\n', start);
        std::string line = body.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    size_t margin = SIZE_MAX;
    for (size_t i = 1; i < lines.size(); ++i) {
        const size_t content = lines[i].find_first_not_of(" \t");
        if (content != std::string::npos) {
            margin = std::min(margin, content);
        }
    }

    const size_t lead = lines[0].find_first_not_of(" \t");
    lines[0] = lead == std::string::npos ? "" : lines[0].substr(lead);
    if (margin != SIZE_MAX) {
        for (size_t i = 1; i < lines.size(); ++i) {
            lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : "";
        }
    }

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    size_t first = 0;
    while (first < lines.size() && lines[first].empty()) {
        ++first;
    }

    std::string result;
    for (size_t i = first; i < lines.size(); ++i) {
        if (i > first) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

size_t countLines(const std::string& content) {
    if (content.empty()) {
        return 0;
    }
    size_t lines = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') {
        ++lines;
    }
    return lines;
}

std::string lastDottedSegment(const std::string& dotted) {
    const size_t dot = dotted.rfind('.');
    return dot == std::string::npos ? dotted : dotted.substr(dot + 1);
}
