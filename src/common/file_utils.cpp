#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>
#include <sstream>
#include <algorithm>
#include <iterator>

namespace deskpilot {
namespace utils {

namespace fs = std::filesystem;

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    std::string content;
    if (!readFileToString(filePath, content)) {
        return false;
    }

    try {
        jsonOutput = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    if (jsonOutput.is_null()) {
        SLOG_WARNING().message("Loaded empty JSON from file").context("path", filePath);
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    std::string serialized;
    try {
        serialized = jsonData.dump(2);
    } catch (const nlohmann::json::exception& e) {
        SLOG_ERROR().message("JSON serialization error").context("path", filePath).context("error", e.what());
        return false;
    }

    return writeStringToFile(filePath, serialized);
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (filePath.empty()) {
        return false;
    }

    std::error_code ec;
    return fs::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        SLOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (fs::exists(directoryPath, ec)) {
        if (fs::is_directory(directoryPath, ec)) {
            return true;
        }
        SLOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    if (fs::create_directories(directoryPath, ec) || fs::is_directory(directoryPath)) {
        SLOG_DEBUG().message("Created directory").context("path", directoryPath);
        return true;
    }

    SLOG_ERROR().message("Could not create directory").context("path", directoryPath).context("error", ec.message());
    return false;
}

bool FileUtils::readFileToString(const std::string& filePath, std::string& content) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_DEBUG().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        SLOG_ERROR().message("Error reading file content").context("path", filePath);
        return false;
    }

    content = buffer.str();
    return true;
}

bool FileUtils::writeStringToFile(const std::string& filePath, const std::string& content) {
    return atomicWrite(filePath, content.data(), content.size(), false);
}

bool FileUtils::readBinaryFile(const std::string& filePath, std::vector<std::uint8_t>& data) {
    if (!validateFilePath(filePath) || !fileExists(filePath)) {
        return false;
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        SLOG_ERROR().message("Error reading binary file").context("path", filePath);
        data.clear();
        return false;
    }
    return true;
}

bool FileUtils::writeBinaryFile(const std::string& filePath, const std::vector<std::uint8_t>& data) {
    return atomicWrite(filePath, reinterpret_cast<const char*>(data.data()), data.size(), true);
}

bool FileUtils::removeFile(const std::string& filePath) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    std::error_code ec;
    bool removed = fs::remove(filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to remove file").context("path", filePath).context("error", ec.message());
        return false;
    }
    return removed;
}

std::vector<std::string> FileUtils::listFiles(const std::string& directoryPath, const std::string& extension) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(directoryPath, ec)) {
        return files;
    }

    for (fs::directory_iterator it(directoryPath, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == extension) {
            files.push_back(it->path().string());
        }
    }

    if (ec) {
        SLOG_WARNING().message("Directory listing incomplete").context("path", directoryPath).context("error", ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtils::atomicWrite(const std::string& filePath, const char* data, size_t size, bool binary) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    {
        std::ofstream tempFile(tempFilePath, binary ? (std::ios::out | std::ios::binary | std::ios::trunc)
                                                    : (std::ios::out | std::ios::trunc));
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }

        tempFile.write(data, static_cast<std::streamsize>(size));
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            std::error_code ec;
            fs::remove(tempFilePath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file").context("path", filePath).context("error", ec.message());
        std::error_code cleanup;
        fs::remove(tempFilePath, cleanup);
        return false;
    }

    SLOG_DEBUG().message("Wrote file").context("path", filePath).context("bytes", size);
    return true;
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided");
        return false;
    }

    const std::string invalidChars = "<>\"|?*";
    if (filePath.find_first_of(invalidChars) != std::string::npos) {
        SLOG_ERROR().message("Invalid character in file path").context("path", filePath);
        return false;
    }

    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    fs::path parentPath = fs::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parentPath.string());
}

} // namespace utils
} // namespace deskpilot
