#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "analysis_types.hpp"
#include "analyzer_options.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// One file handed to the analyzer: root-relative path plus raw bytes.
struct SourceFile {
    std::string path;       // '/'-separated, relative to the analysis root
    std::string content;
    size_t byteSize = 0;
};

struct LoadResult {
    std::vector<SourceFile> files;          // sorted by path
    std::vector<Diagnostic> diagnostics;    // unreadable files
    std::vector<std::string> projectPaths;  // every regular file not ignored, any extension, sorted
};

class SourceLoader {
public:
    SourceLoader(const PatternMatcher& patternMatcher, const AnalyzerOptions& options);

    // Collect and read every matching source file under root.
    // Throws std::runtime_error if root is missing or not a directory.
    LoadResult loadDirectory(const fs::path& root) const;

    // Read a single file; throws std::runtime_error when it cannot be read
    std::string readFile(const fs::path& filePath) const;

    bool hasSourceExtension(const fs::path& filePath) const;

private:
    const PatternMatcher& patternMatcher_;
    const AnalyzerOptions& options_;

    // Files above this size are memory mapped instead of streamed
    static constexpr size_t MMAP_THRESHOLD = 1 * 1024 * 1024;

    bool isBinaryFile(const fs::path& filePath) const;
    std::string readMappedFile(const fs::path& filePath, size_t fileSize) const;
};
