#include "flow_inferencer.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>
#include "structural_indexer.hpp"

std::set<std::string> LastSegmentCalleeNames::calleesOf(const FunctionInfo& function) const {
    std::set<std::string> names;
    for (const auto& callee : function.callees) {
        names.insert(lastDottedSegment(callee));
    }
    return names;
}

std::string LastSegmentCalleeNames::calledAs(const FunctionInfo& function) const {
    return function.name;
}

FlowLexicon defaultFlowLexicon() {
    FlowLexicon lexicon;
    lexicon.outputVerbs = {"save", "write", "log", "export", "render"};
    lexicon.persistenceVerbs = {"cache", "persist", "db", "store"};

    lexicon.validatorVerbs = {"validate", "verify", "check", "ensure"};
    lexicon.predicatePrefixes = {"is", "has"};

    lexicon.transformationKinds = {
        {{"parse", "decode", "deserialize"}, "parser"},
        {{"clean", "sanitize", "normalize"}, "cleaner"},
        {{"convert", "transform", "map"}, "converter"},
        {{"filter", "select", "extract"}, "filter"},
        {{"aggregate", "reduce", "summarize"}, "aggregator"},
        {{"validate", "verify", "check"}, "validator"},
    };
    lexicon.transformationDefault = "processor";

    lexicon.outputKinds = {
        {{"save", "write", "store"}, "storage"},
        {{"export", "dump", "serialize"}, "export"},
        {{"send", "transmit", "publish"}, "communication"},
        {{"render", "display", "show"}, "presentation"},
        {{"log", "print", "output"}, "logging"},
    };
    lexicon.outputDefault = "output";

    lexicon.dataStoreKinds = {
        {{"load", "read", "open"}, "file_reader"},
        {{"fetch", "get", "retrieve"}, "data_fetcher"},
        {{"query", "search", "find"}, "query_engine"},
        {{"connect", "init", "setup"}, "connector"},
    };
    lexicon.dataStoreDefault = "data_accessor";
    return lexicon;
}

std::vector<std::string> nameTokens(const std::string& name) {
    std::vector<std::string> tokens;
    std::string current;
    char previous = '\0';

    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '_') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            // saveResults splits before the capital
            if (std::isupper(uc) && std::islower(static_cast<unsigned char>(previous)) && !current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            current += static_cast<char>(std::tolower(uc));
        }
        previous = c;
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

bool tokenMatchesVerb(const std::string& token, const std::string& verb) {
    if (verb.empty()) {
        return false;
    }
    if (token == verb) {
        return true;
    }
    if (token.size() <= verb.size()) {
        return false;
    }

    static const char* const plainSuffixes[] = {"s", "es", "ed", "ing", "er", "ers"};
    static const char* const stemSuffixes[] = {"ed", "ing", "er", "ers"};

    for (const char* suffix : plainSuffixes) {
        if (token == verb + suffix) {
            return true;
        }
    }

    const char last = verb.back();
    if (last == 'e') {
        // save -> saved, saving
        const std::string stem = verb.substr(0, verb.size() - 1);
        for (const char* suffix : stemSuffixes) {
            if (token == stem + suffix) {
                return true;
            }
        }
    } else if (std::string("aeiouwxy").find(last) == std::string::npos) {
        // log -> logged, logging
        const std::string doubled = verb + last;
        for (const char* suffix : stemSuffixes) {
            if (token == doubled + suffix) {
                return true;
            }
        }
    }
    return false;
}

FlowChainInferencer::FlowChainInferencer(int maxDepth, size_t maxChains, FlowLexicon lexicon,
                                         std::shared_ptr<const CalleeNames> calleeNames)
    : maxDepth_(std::max(maxDepth, 1)),
      maxChains_(maxChains),
      lexicon_(std::move(lexicon)),
      calleeNames_(calleeNames ? std::move(calleeNames) : std::make_shared<LastSegmentCalleeNames>()) {}

FlowInference FlowChainInferencer::infer(const std::vector<FunctionInfo>& functions) const {
    FlowInference inference;

    const std::vector<size_t> callers = countCallers(functions);
    inference.roles.reserve(functions.size());
    for (const auto& function : functions) {
        auto role = roleOf(function, callers[function.id]);
        if (role) {
            inference.points.push_back({function.id, *role, kindOf(function, *role)});
        }
        if (auto validator = validatorOf(function)) {
            inference.validators.push_back(*validator);
        }
        inference.roles.push_back(role);
    }

    const auto successors = link(functions);

    for (const auto& function : functions) {
        if (inference.roles[function.id] != FlowRole::EntryPoint) {
            continue;
        }

        Traversal traversal{successors, inference.roles, {}, {}, false, false};
        traversal.path.push_back({function.id, FlowRole::EntryPoint});
        traversal.onPath.insert(function.id);
        extend(traversal, inference.chains);

        if (traversal.truncated) {
            inference.diagnostics.push_back({DiagnosticKind::DepthExceeded, function.file,
                                             "flow traversal from '" + function.qualifiedName +
                                                 "' truncated at depth " + std::to_string(maxDepth_),
                                             function.line});
        }

        if (traversal.limitReached) {
            inference.diagnostics.push_back({DiagnosticKind::ChainLimitReached, function.file,
                                             "flow chain limit of " + std::to_string(maxChains_) +
                                                 " reached while tracing '" + function.qualifiedName +
                                                 "'; further chains were dropped",
                                             function.line});
            break;
        }
    }

    return inference;
}

std::optional<FlowRole> FlowChainInferencer::roleOf(const FunctionInfo& function, size_t callerCount) const {
    if (function.category == FunctionCategory::EntryPoint || callerCount == 0) {
        return FlowRole::EntryPoint;
    }
    if (matchesLexicon(function.name, lexicon_.outputVerbs)) {
        return FlowRole::Output;
    }
    if (matchesLexicon(function.name, lexicon_.persistenceVerbs)) {
        return FlowRole::DataStore;
    }
    if (function.category == FunctionCategory::Processor) {
        return FlowRole::Transformation;
    }
    return std::nullopt;
}

std::optional<std::string> FlowChainInferencer::kindOf(const FunctionInfo& function, FlowRole role) const {
    switch (role) {
        case FlowRole::EntryPoint:
            return std::nullopt;
        case FlowRole::Transformation:
            return classify(function.name, lexicon_.transformationKinds, lexicon_.transformationDefault);
        case FlowRole::Output:
            return classify(function.name, lexicon_.outputKinds, lexicon_.outputDefault);
        case FlowRole::DataStore:
            return classify(function.name, lexicon_.dataStoreKinds, lexicon_.dataStoreDefault);
    }
    return std::nullopt;
}

std::optional<Validator> FlowChainInferencer::validatorOf(const FunctionInfo& function) const {
    const auto tokens = nameTokens(function.name);
    if (tokens.empty()) {
        return std::nullopt;
    }

    bool predicate = tokens.size() > 1 &&
                     std::find(lexicon_.predicatePrefixes.begin(), lexicon_.predicatePrefixes.end(),
                               tokens.front()) != lexicon_.predicatePrefixes.end();
    if (!predicate && !matchesLexicon(function.name, lexicon_.validatorVerbs)) {
        return std::nullopt;
    }

    Validator validator;
    validator.function = function.id;
    if (function.returnType) {
        std::string annotation = *function.returnType;
        std::transform(annotation.begin(), annotation.end(), annotation.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        validator.returnsBoolean = annotation.find("bool") != std::string::npos;
    }
    return validator;
}

std::vector<std::vector<FunctionId>> FlowChainInferencer::link(const std::vector<FunctionInfo>& functions) const {
    std::unordered_map<std::string, std::vector<FunctionId>> byName;
    std::unordered_map<ModuleId, std::vector<FunctionId>> byModule;
    for (const auto& function : functions) {
        byName[calleeNames_->calledAs(function)].push_back(function.id);
        byModule[function.module].push_back(function.id);
    }

    std::vector<std::vector<FunctionId>> successors(functions.size());
    for (const auto& caller : functions) {
        std::set<FunctionId> targets;

        for (const auto& name : calleeNames_->calleesOf(caller)) {
            auto it = byName.find(name);
            if (it != byName.end()) {
                targets.insert(it->second.begin(), it->second.end());
            }
        }

        for (FunctionId other : byModule[caller.module]) {
            if (functions[other].line > caller.line) {
                targets.insert(other);
            }
        }

        targets.erase(caller.id);
        successors[caller.id].assign(targets.begin(), targets.end());
    }

    return successors;
}

std::vector<size_t> FlowChainInferencer::countCallers(const std::vector<FunctionInfo>& functions) const {
    std::unordered_map<std::string, std::vector<FunctionId>> byName;
    for (const auto& function : functions) {
        byName[calleeNames_->calledAs(function)].push_back(function.id);
    }

    std::vector<std::set<FunctionId>> callers(functions.size());
    for (const auto& caller : functions) {
        for (const auto& name : calleeNames_->calleesOf(caller)) {
            auto it = byName.find(name);
            if (it == byName.end()) {
                continue;
            }
            for (FunctionId callee : it->second) {
                // Recursion does not make a function reachable
                if (callee != caller.id) {
                    callers[callee].insert(caller.id);
                }
            }
        }
    }

    std::vector<size_t> counts;
    counts.reserve(callers.size());
    for (const auto& set : callers) {
        counts.push_back(set.size());
    }
    return counts;
}

void FlowChainInferencer::extend(Traversal& traversal, std::vector<FlowChain>& chains) const {
    const size_t maxNodes = static_cast<size_t>(maxDepth_) + 1;

    for (FunctionId next : traversal.successors[traversal.path.back().function]) {
        if (traversal.limitReached) {
            return;
        }
        if (traversal.onPath.count(next) > 0) {
            continue;
        }

        const auto& role = traversal.roles[next];
        if (!role || *role == FlowRole::EntryPoint) {
            continue;
        }

        traversal.path.push_back({next, *role});
        traversal.onPath.insert(next);

        if (*role == FlowRole::Output || *role == FlowRole::DataStore) {
            record(traversal, chains);
        } else if (traversal.path.size() == maxNodes) {
            record(traversal, chains);
            // Anything still reachable from here is cut off
            for (FunctionId beyond : traversal.successors[next]) {
                const auto& beyondRole = traversal.roles[beyond];
                if (beyondRole && *beyondRole != FlowRole::EntryPoint && traversal.onPath.count(beyond) == 0) {
                    traversal.truncated = true;
                    break;
                }
            }
        } else {
            extend(traversal, chains);
        }

        traversal.onPath.erase(next);
        traversal.path.pop_back();
    }
}

void FlowChainInferencer::record(Traversal& traversal, std::vector<FlowChain>& chains) const {
    if (traversal.path.size() < 3) {
        return;
    }
    if (chains.size() >= maxChains_) {
        traversal.limitReached = true;
        return;
    }
    chains.push_back(FlowChain{traversal.path});
}

bool FlowChainInferencer::matchesLexicon(const std::string& name, const std::vector<std::string>& verbs) const {
    for (const auto& token : nameTokens(name)) {
        for (const auto& verb : verbs) {
            if (tokenMatchesVerb(token, verb)) {
                return true;
            }
        }
    }
    return false;
}

std::string FlowChainInferencer::classify(const std::string& name, const std::vector<FlowKindRule>& rules,
                                          const std::string& fallback) const {
    for (const auto& rule : rules) {
        if (matchesLexicon(name, rule.verbs)) {
            return rule.kind;
        }
    }
    return fallback;
}
