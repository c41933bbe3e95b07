#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "analysis_types.hpp"

// Flow chains are built from name matches, not from a resolved call graph.
// Implementations decide which names a function calls and under which name
// callers reach it.
class CalleeNames {
public:
    virtual ~CalleeNames() = default;

    // Names this function calls
    virtual std::set<std::string> calleesOf(const FunctionInfo& function) const = 0;

    // Name a caller uses to reach this function
    virtual std::string calledAs(const FunctionInfo& function) const = 0;
};

// Matches on the last dotted segment: `self.store.save_results()` reaches any
// function named save_results.
class LastSegmentCalleeNames : public CalleeNames {
public:
    std::set<std::string> calleesOf(const FunctionInfo& function) const override;
    std::string calledAs(const FunctionInfo& function) const override;
};

struct FlowKindRule {
    std::vector<std::string> verbs;
    std::string kind;
};

// Verbs match whole name tokens (split on '_' and camelCase) or their regular
// inflections: "saves", "saved", "saving", "logged", "writer". Kind rules are
// evaluated top to bottom and fall back to the table's default label.
struct FlowLexicon {
    std::vector<std::string> outputVerbs;
    std::vector<std::string> persistenceVerbs;

    std::vector<std::string> validatorVerbs;
    std::vector<std::string> predicatePrefixes;     // leading token, as in is_valid

    std::vector<FlowKindRule> transformationKinds;
    std::string transformationDefault;
    std::vector<FlowKindRule> outputKinds;
    std::string outputDefault;
    std::vector<FlowKindRule> dataStoreKinds;
    std::string dataStoreDefault;
};

FlowLexicon defaultFlowLexicon();

// Lowercased name tokens of an identifier
std::vector<std::string> nameTokens(const std::string& name);

// True when token is verb or one of its regular inflections
bool tokenMatchesVerb(const std::string& token, const std::string& verb);

struct FlowInference {
    std::vector<FlowChain> chains;
    std::vector<std::optional<FlowRole>> roles;     // per function id, empty if not a flow node
    std::vector<FlowPoint> points;                  // functions with a role, by id
    std::vector<Validator> validators;
    std::vector<Diagnostic> diagnostics;
};

// Links classified functions into candidate pipelines. Every chain starts at
// an entry point, runs through transformations and ends at an output or data
// store, or stops when it reaches maxDepth edges. At most maxChains chains are
// kept; a ChainLimitReached diagnostic marks the point where more were dropped.
class FlowChainInferencer {
public:
    FlowChainInferencer(int maxDepth, size_t maxChains,
                        FlowLexicon lexicon = defaultFlowLexicon(),
                        std::shared_ptr<const CalleeNames> calleeNames = nullptr);

    // Function ids must equal their index in the vector
    FlowInference infer(const std::vector<FunctionInfo>& functions) const;

    // Role of one function given how many other functions call it. Declared
    // entry points and uncalled functions are entry points before any verb
    // lexicon is consulted.
    std::optional<FlowRole> roleOf(const FunctionInfo& function, size_t callerCount) const;

    // Finer label for a role; empty for entry points
    std::optional<std::string> kindOf(const FunctionInfo& function, FlowRole role) const;

    std::optional<Validator> validatorOf(const FunctionInfo& function) const;

    // Successor lists: A -> B when A calls B's name, or both live in the same
    // module and A is declared first
    std::vector<std::vector<FunctionId>> link(const std::vector<FunctionInfo>& functions) const;

    // Number of distinct other functions calling each function
    std::vector<size_t> countCallers(const std::vector<FunctionInfo>& functions) const;

private:
    struct Traversal {
        const std::vector<std::vector<FunctionId>>& successors;
        const std::vector<std::optional<FlowRole>>& roles;
        std::vector<FlowNode> path;
        std::set<FunctionId> onPath;
        bool truncated = false;
        bool limitReached = false;
    };

    void extend(Traversal& traversal, std::vector<FlowChain>& chains) const;
    void record(Traversal& traversal, std::vector<FlowChain>& chains) const;
    bool matchesLexicon(const std::string& name, const std::vector<std::string>& verbs) const;
    std::string classify(const std::string& name, const std::vector<FlowKindRule>& rules,
                         const std::string& fallback) const;

    int maxDepth_;
    size_t maxChains_;
    FlowLexicon lexicon_;
    std::shared_ptr<const CalleeNames> calleeNames_;
};
