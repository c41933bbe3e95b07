#include "source_analyzer.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <iterator>
#include <numeric>
#include <sstream>
#include <system_error>
#include <thread>
#include "dependency_graph.hpp"
#include "flow_inferencer.hpp"
#include "pattern_matcher.hpp"
#include "project_profile.hpp"

namespace {

template <typename T>
void appendAll(std::vector<T>& target, std::vector<T>&& source) {
    target.insert(target.end(), std::make_move_iterator(source.begin()), std::make_move_iterator(source.end()));
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

SourceAnalyzer::SourceAnalyzer(const AnalyzerOptions& options)
    : options_(options) {}

SourceAnalyzer::SourceAnalyzer(const AnalyzerOptions& options, RoleClassifier classifier,
                               ArchitectureClassifier architecture)
    : options_(options), classifier_(std::move(classifier)), architecture_(std::move(architecture)) {}

std::optional<AnalysisResult> SourceAnalyzer::analyzeDirectory(const fs::path& root,
                                                               const CancellationToken* cancellation) {
    auto loadStart = std::chrono::steady_clock::now();

    if (options_.verbose) {
        std::cout << "Analyzing directory: " << root << std::endl;
    }

    PatternMatcher patternMatcher;
    patternMatcher.setIncludePatterns(options_.includePatterns);
    patternMatcher.setExcludePatterns(options_.excludePatterns);

    if (options_.respectGitignore) {
        const fs::path gitignorePath = root / ".gitignore";
        std::error_code ec;
        if (fs::is_regular_file(gitignorePath, ec)) {
            patternMatcher.loadGitignore(gitignorePath);
        }
    }

    SourceLoader loader(patternMatcher, options_);
    LoadResult loaded = loader.loadDirectory(root);
    loadDuration_ = elapsedSince(loadStart);

    if (cancellation && cancellation->isCancelled()) {
        return std::nullopt;
    }

    auto result = analyze(loaded.files, cancellation);
    if (!result) {
        return std::nullopt;
    }

    // Non-source files count towards languages and project type
    ProjectProfile profile = profileProject(loaded.projectPaths);
    result->overview.languagesDetected = std::move(profile.languages);
    result->overview.projectType = std::move(profile.projectType);

    // Loader diagnostics precede the per-file ones
    result->diagnostics.insert(result->diagnostics.begin(),
                               std::make_move_iterator(loaded.diagnostics.begin()),
                               std::make_move_iterator(loaded.diagnostics.end()));
    return result;
}

std::optional<AnalysisResult> SourceAnalyzer::analyze(const std::vector<SourceFile>& files,
                                                      const CancellationToken* cancellation) {
    auto extractionStart = std::chrono::steady_clock::now();

    // Work in path order regardless of how the caller ordered the files
    std::vector<size_t> order(files.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&files](size_t a, size_t b) { return files[a].path < files[b].path; });

    std::vector<FileOutcome> outcomes(files.size());
    WorkQueue queue{files, order, outcomes, cancellation};

    runWorkers(queue);
    extractionDuration_ = elapsedSince(extractionStart);

    if (cancellation && cancellation->isCancelled()) {
        if (options_.verbose) {
            std::cout << "Analysis cancelled, discarding partial results" << std::endl;
        }
        return std::nullopt;
    }

    auto aggregationStart = std::chrono::steady_clock::now();

    AnalysisResult result = merge(files, order, outcomes);
    aggregate(result);

    std::vector<std::string> paths;
    paths.reserve(order.size());
    for (size_t index : order) {
        paths.push_back(files[index].path);
    }
    ProjectProfile profile = profileProject(paths);
    result.overview.languagesDetected = std::move(profile.languages);
    result.overview.projectType = std::move(profile.projectType);

    aggregationDuration_ = elapsedSince(aggregationStart);

    if (options_.verbose) {
        std::cout << "Analyzed " << result.modules.size() << " modules, "
                  << result.functions.size() << " functions, "
                  << result.classes.size() << " classes ("
                  << result.parseFailures.size() << " files failed to parse)" << std::endl;
        std::cout << "Found " << result.dependencies.size() << " dependencies and "
                  << result.flowChains.size() << " flow chains" << std::endl;
    }

    return result;
}

void SourceAnalyzer::runWorkers(WorkQueue& queue) {
    const size_t fileCount = queue.order.size();
    if (fileCount == 0) {
        return;
    }

    const size_t threadCount = std::min<size_t>(std::max(options_.numThreads, 1u), fileCount);

    // One parser per worker, all created before any thread starts so that a
    // setup failure cannot leave threads running
    std::vector<std::unique_ptr<TreeExtractor>> extractors;
    extractors.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        extractors.push_back(std::make_unique<TreeExtractor>());
    }

    if (options_.verbose) {
        std::cout << "Analyzing " << fileCount << " files with " << threadCount << " threads" << std::endl;
    }

    std::vector<std::thread> workers;
    try {
        for (size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back(&SourceAnalyzer::workerThread, this, std::ref(queue), std::cref(*extractors[i]));
        }
    } catch (const std::system_error& e) {
        // Use whatever threads did start
        std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
    }

    if (workers.empty()) {
        std::cerr << "Falling back to single-threaded analysis" << std::endl;
        workerThread(queue, *extractors.front());
    }

    // Barrier: aggregation starts only after every worker is done
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void SourceAnalyzer::workerThread(WorkQueue& queue, const TreeExtractor& extractor) const {
    while (true) {
        size_t slot;
        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            if (queue.next >= queue.order.size()) {
                return;
            }
            slot = queue.next++;
        }

        const SourceFile& file = queue.files[queue.order[slot]];

        // Each slot is written by exactly one worker
        try {
            queue.outcomes[slot] = processFile(extractor, file);
        } catch (const std::exception& e) {
            std::cerr << "Error analyzing file " << file.path << ": " << e.what() << std::endl;

            FileOutcome errorOutcome;
            errorOutcome.failure = ParseFailure{file.path, std::string("analysis failed: ") + e.what()};
            queue.outcomes[slot] = std::move(errorOutcome);
        }

        if (queue.cancellation && queue.cancellation->isCancelled()) {
            return;
        }
    }
}

SourceAnalyzer::FileOutcome SourceAnalyzer::processFile(const TreeExtractor& extractor,
                                                        const SourceFile& file) const {
    FileOutcome outcome;

    ExtractResult extracted = extractor.extract(file.path, file.content);
    if (!extracted.ok()) {
        outcome.failure = extracted.failure.value_or(ParseFailure{file.path, "parse failed"});
        outcome.errorLine = extracted.errorLine;
        return outcome;
    }

    IndexedFile indexed = indexer_.index(*extracted.tree);

    for (size_t i = 0; i < indexed.functions.size(); ++i) {
        auto& function = indexed.functions[i];
        function.complexity = complexity_.complexity(*indexed.functionNodes[i]);
        function.category = classifier_.classifyFunction(function);
    }
    for (auto& cls : indexed.classes) {
        cls.category = classifier_.classifyClass(cls);
    }

    // The nodes belong to the tree, which is released when this returns
    indexed.functionNodes.clear();

    outcome.indexed = std::move(indexed);
    return outcome;
}

AnalysisResult SourceAnalyzer::merge(const std::vector<SourceFile>& files, const std::vector<size_t>& order,
                                     std::vector<FileOutcome>& outcomes) const {
    AnalysisResult result;

    for (size_t slot = 0; slot < order.size(); ++slot) {
        const SourceFile& file = files[order[slot]];
        FileOutcome& outcome = outcomes[slot];

        if (outcome.failure || !outcome.indexed) {
            ParseFailure failure = outcome.failure.value_or(ParseFailure{file.path, "file was not analyzed"});
            if (options_.verbose) {
                std::cerr << "Warning: Skipping " << failure.path << ": " << failure.reason << std::endl;
            }
            result.diagnostics.push_back({DiagnosticKind::ParseFailure, failure.path, failure.reason,
                                          outcome.errorLine});
            result.parseFailures.push_back(std::move(failure));
            continue;
        }

        IndexedFile& indexed = *outcome.indexed;
        const ModuleId moduleId = result.modules.size();
        const ClassId classOffset = result.classes.size();
        const FunctionId functionOffset = result.functions.size();

        // File-local ids become run-wide ids
        indexed.module.id = moduleId;
        for (auto& id : indexed.module.classes) {
            id += classOffset;
        }
        for (auto& id : indexed.module.functions) {
            id += functionOffset;
        }
        for (auto& cls : indexed.classes) {
            cls.id += classOffset;
            cls.module = moduleId;
        }
        for (auto& function : indexed.functions) {
            function.id += functionOffset;
            function.module = moduleId;
            if (function.ownerClass) {
                *function.ownerClass += classOffset;
            }
        }

        result.modules.push_back(std::move(indexed.module));
        appendAll(result.classes, std::move(indexed.classes));
        appendAll(result.functions, std::move(indexed.functions));
    }

    return result;
}

void SourceAnalyzer::aggregate(AnalysisResult& result) const {
    DependencyGraphBuilder dependencyBuilder(result.modules);
    DependencyGraph graph = dependencyBuilder.build();
    result.dependencies = std::move(graph.edges);
    appendAll(result.diagnostics, std::move(graph.diagnostics));

    FlowChainInferencer inferencer(options_.maxFlowDepth, options_.maxFlowChains);
    FlowInference flows = inferencer.infer(result.functions);
    result.flowChains = std::move(flows.chains);
    result.flowPoints = std::move(flows.points);
    result.validators = std::move(flows.validators);
    appendAll(result.diagnostics, std::move(flows.diagnostics));

    std::vector<std::string> paths;
    paths.reserve(result.modules.size());
    for (const auto& module : result.modules) {
        paths.push_back(module.path);
    }
    result.layers = architecture_.classifyLayers(paths);
    result.architecturePatterns = architecture_.detectPatterns(paths);

    result.overview.totalFiles = result.modules.size() + result.parseFailures.size();
    result.overview.failedFiles = result.parseFailures.size();
    result.overview.totalFunctions = result.functions.size();
    result.overview.totalClasses = result.classes.size();
    for (const auto& module : result.modules) {
        result.overview.totalLines += module.lineCount;
    }

    result.complexity = summarizeComplexity(result.functions, options_.highComplexityThreshold);

    result.reindex();
}

std::string SourceAnalyzer::getTimingInfo() const {
    const auto total = loadDuration_ + extractionDuration_ + aggregationDuration_;
    const auto percent = [&total](std::chrono::milliseconds part) {
        return part.count() * 100 / (total.count() ? total.count() : 1);
    };

    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << total.count() << "ms" << std::endl;
    ss << "- File loading time: " << loadDuration_.count() << "ms (" << percent(loadDuration_) << "%)" << std::endl;
    ss << "- Parsing and indexing time: " << extractionDuration_.count() << "ms ("
       << percent(extractionDuration_) << "%)" << std::endl;
    ss << "- Aggregation time: " << aggregationDuration_.count() << "ms ("
       << percent(aggregationDuration_) << "%)" << std::endl;
    return ss.str();
}
