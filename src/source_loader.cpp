#include "source_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

// Bytes inspected when sniffing for binary content
constexpr size_t BINARY_SNIFF_SIZE = 8192;

SourceLoader::SourceLoader(const PatternMatcher& patternMatcher, const AnalyzerOptions& options)
    : patternMatcher_(patternMatcher), options_(options) {}

LoadResult SourceLoader::loadDirectory(const fs::path& root) const {
    if (!fs::exists(root) || !fs::is_directory(root)) {
        throw std::runtime_error("Invalid directory: " + root.string());
    }

    LoadResult result;
    std::vector<fs::path> candidates;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + root.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "Warning: Error while walking " << root << ": " << ec.message() << std::endl;
            ec.clear();
            continue;
        }

        const fs::path relative = fs::relative(it->path(), root, ec);
        if (ec) {
            ec.clear();
            continue;
        }

        // Prune ignored directories instead of walking into them
        if (it->is_directory(ec)) {
            if (patternMatcher_.isIgnored(relative.generic_string() + "/")) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (!patternMatcher_.isIgnored(relative)) {
            result.projectPaths.push_back(relative.generic_string());
        }
        if (!hasSourceExtension(it->path())) {
            continue;
        }
        if (!patternMatcher_.shouldProcess(relative)) {
            continue;
        }

        candidates.push_back(relative);
    }

    std::sort(candidates.begin(), candidates.end());
    std::sort(result.projectPaths.begin(), result.projectPaths.end());

    for (const auto& relative : candidates) {
        const fs::path fullPath = root / relative;
        const std::string relPath = relative.generic_string();

        auto fileSize = fs::file_size(fullPath, ec);
        if (ec) {
            result.diagnostics.push_back({DiagnosticKind::UnreadableFile, relPath,
                                          "Error getting file size: " + ec.message(), 0});
            ec.clear();
            continue;
        }

        if (fileSize > options_.maxFileSize) {
            if (options_.verbose) {
                std::cout << "Skipping large file: " << relPath << " (" << fileSize << " bytes)" << std::endl;
            }
            continue;
        }

        if (isBinaryFile(fullPath)) {
            continue;
        }

        try {
            SourceFile file;
            file.path = relPath;
            file.content = readFile(fullPath);
            file.byteSize = file.content.size();
            result.files.push_back(std::move(file));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to read file " << relPath << ": " << e.what() << std::endl;
            result.diagnostics.push_back({DiagnosticKind::UnreadableFile, relPath, e.what(), 0});
        }
    }

    if (options_.verbose) {
        std::cout << "Collected " << result.files.size() << " source files from " << root << std::endl;
    }

    return result;
}

bool SourceLoader::hasSourceExtension(const fs::path& filePath) const {
    std::string extension = filePath.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(options_.sourceExtensions.begin(), options_.sourceExtensions.end(), extension) !=
           options_.sourceExtensions.end();
}

bool SourceLoader::isBinaryFile(const fs::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        // Let readFile report the problem
        return false;
    }

    char buffer[BINARY_SNIFF_SIZE];
    const auto bytesRead = file.read(buffer, BINARY_SNIFF_SIZE).gcount();

    return std::find(buffer, buffer + bytesRead, '\0') != buffer + bytesRead;
}

std::string SourceLoader::readFile(const fs::path& filePath) const {
    std::error_code ec;
    const auto fileSize = fs::file_size(filePath, ec);
    if (ec) {
        throw std::runtime_error("Error getting file size: " + ec.message());
    }

    if (fileSize > MMAP_THRESHOLD) {
        return readMappedFile(filePath, static_cast<size_t>(fileSize));
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::string content;
    content.reserve(static_cast<size_t>(fileSize));
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    if (file.bad()) {
        throw std::runtime_error("I/O error while reading: " + filePath.string());
    }

    return content;
}

std::string SourceLoader::readMappedFile(const fs::path& filePath, size_t fileSize) const {
    int fd = open(filePath.c_str(), O_RDONLY);
    if (fd == -1) {
        throw std::runtime_error("Failed to open file for memory mapping: " + filePath.string());
    }

    void* mapped = mmap(nullptr, fileSize, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED) {
        close(fd);
        throw std::runtime_error("Failed to memory map file: " + filePath.string());
    }

    std::string content(static_cast<const char*>(mapped), fileSize);

    munmap(mapped, fileSize);
    close(fd);

    return content;
}
