#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    // Log the error but continue scanning
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };

    scanDirectory(fs::path(dir_path));
}

std::vector<std::string> FileUtils::listImageFiles(const std::string &dir_path, bool recursive,
                                                   const std::vector<std::string> &extensions)
{
    std::vector<std::string> files;
    std::string error;

    listFilesAsObservable(dir_path, recursive)
        .subscribe(
            [&files, &extensions](const std::string &file_path)
            {
                if (hasExtension(file_path, extensions))
                {
                    files.push_back(file_path);
                }
            },
            [&error](const std::exception &e)
            {
                error = e.what();
            });

    if (!error.empty())
    {
        throw std::runtime_error(error);
    }

    std::sort(files.begin(), files.end());
    Logger::info("Found " + std::to_string(files.size()) + " image files in " + dir_path);
    return files;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string extension = fs::path(file_path).extension().string();
    if (!extension.empty() && extension[0] == '.')
    {
        extension.erase(0, 1);
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool FileUtils::hasExtension(const std::string &file_path, const std::vector<std::string> &extensions)
{
    const std::string extension = getFileExtension(file_path);
    if (extension.empty())
    {
        return false;
    }
    return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

std::vector<uint8_t> FileUtils::readFileBytes(const std::string &file_path, size_t max_bytes)
{
    std::ifstream file(file_path, std::ios::binary | std::ios::ate);
    if (!file)
    {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    const std::streamoff size = file.tellg();
    if (size < 0)
    {
        throw std::runtime_error("Cannot determine size of file: " + file_path);
    }

    const size_t to_read = std::min(static_cast<size_t>(size), max_bytes);
    std::vector<uint8_t> bytes(to_read);
    file.seekg(0, std::ios::beg);
    if (to_read > 0 && !file.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(to_read)))
    {
        throw std::runtime_error("Error reading file: " + file_path);
    }
    return bytes;
}
