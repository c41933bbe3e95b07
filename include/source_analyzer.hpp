#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "analysis_types.hpp"
#include "analyzer_options.hpp"
#include "architecture_classifier.hpp"
#include "complexity_calculator.hpp"
#include "role_classifier.hpp"
#include "source_loader.hpp"
#include "structural_indexer.hpp"
#include "tree_extractor.hpp"

namespace fs = std::filesystem;

// Cooperative cancellation flag shared between the caller and a running analysis
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Runs a full analysis over a set of source files
 *
 * Files are parsed, indexed, scored and classified by a pool of worker
 * threads. Once every worker has finished, the dependency graph, flow chains
 * and architecture layers are built from the merged tables.
 *
 * Each call produces a fresh AnalysisResult; nothing is kept between runs
 * except timing information.
 */
class SourceAnalyzer {
public:
    explicit SourceAnalyzer(const AnalyzerOptions& options);
    SourceAnalyzer(const AnalyzerOptions& options, RoleClassifier classifier, ArchitectureClassifier architecture);

    // Load and analyze every matching file under root.
    // Throws std::runtime_error if root is missing or not a directory.
    // Returns std::nullopt if the run was cancelled.
    std::optional<AnalysisResult> analyzeDirectory(const fs::path& root,
                                                   const CancellationToken* cancellation = nullptr);

    // Analyze files that were already loaded. Returns std::nullopt if the run
    // was cancelled. Throws std::runtime_error if no parser can be created.
    std::optional<AnalysisResult> analyze(const std::vector<SourceFile>& files,
                                          const CancellationToken* cancellation = nullptr);

    // Per-phase durations of the last run
    std::string getTimingInfo() const;

    const AnalyzerOptions& options() const { return options_; }

private:
    // Outcome of the per-file phase for one file
    struct FileOutcome {
        std::optional<IndexedFile> indexed;
        std::optional<ParseFailure> failure;
        int errorLine = 0;
    };

    struct WorkQueue {
        const std::vector<SourceFile>& files;
        const std::vector<size_t>& order;
        std::vector<FileOutcome>& outcomes;
        const CancellationToken* cancellation;
        size_t next = 0;
        std::mutex mutex;
    };

    void runWorkers(WorkQueue& queue);
    void workerThread(WorkQueue& queue, const TreeExtractor& extractor) const;
    FileOutcome processFile(const TreeExtractor& extractor, const SourceFile& file) const;

    AnalysisResult merge(const std::vector<SourceFile>& files, const std::vector<size_t>& order,
                         std::vector<FileOutcome>& outcomes) const;
    void aggregate(AnalysisResult& result) const;

    AnalyzerOptions options_;
    StructuralIndexer indexer_;
    ComplexityCalculator complexity_;
    RoleClassifier classifier_;
    ArchitectureClassifier architecture_;

    std::chrono::milliseconds loadDuration_{0};
    std::chrono::milliseconds extractionDuration_{0};
    std::chrono::milliseconds aggregationDuration_{0};
};
