#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Directory walking and file name helpers for the batch scanner
 */
class FileUtils
{
public:
    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Collects the supported image files of a directory in lexicographic order
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @param extensions Accepted extensions, lowercase without the dot
     * @throws std::runtime_error if the directory cannot be listed
     */
    static std::vector<std::string> listImageFiles(const std::string &dir_path, bool recursive,
                                                   const std::vector<std::string> &extensions);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Lowercase extension of a path without the leading dot ("" if none)
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Check whether the file extension is one of the accepted extensions
     */
    static bool hasExtension(const std::string &file_path, const std::vector<std::string> &extensions);

    /**
     * @brief Read a whole file, or at most max_bytes of it
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::vector<uint8_t> readFileBytes(const std::string &file_path, size_t max_bytes = SIZE_MAX);
};
