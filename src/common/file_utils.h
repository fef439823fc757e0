#ifndef DESKPILOT_FILE_UTILS_H
#define DESKPILOT_FILE_UTILS_H

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace deskpilot {
namespace utils {

/**
 * @brief File I/O helpers with validation and logging
 *
 * Functions report failure through their return value and log the cause;
 * they do not throw.
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON document
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Receives the parsed document
     * @return true if the file exists and parses
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Save JSON pretty printed, written to a temp file then renamed
     * @note Creates parent directories as needed
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

    /**
     * @brief Create directory and parents if they don't exist
     * @return true if the directory exists afterwards
     */
    static bool createDirectoryIfNotExists(const std::string& directoryPath);

    static bool readFileToString(const std::string& filePath, std::string& content);
    static bool writeStringToFile(const std::string& filePath, const std::string& content);

    static bool readBinaryFile(const std::string& filePath, std::vector<std::uint8_t>& data);
    static bool writeBinaryFile(const std::string& filePath, const std::vector<std::uint8_t>& data);

    /**
     * @brief Remove a regular file
     * @return true if the file was removed, false if it did not exist or removal failed
     */
    static bool removeFile(const std::string& filePath);

    /**
     * @brief List regular files in a directory with the given extension (".json")
     * @return Paths sorted by name; empty if the directory is missing
     */
    static std::vector<std::string> listFiles(const std::string& directoryPath, const std::string& extension);

private:
    static bool validateFilePath(const std::string& filePath);
    static bool ensureParentDirectoryExists(const std::string& filePath);
    static bool atomicWrite(const std::string& filePath, const char* data, size_t size, bool binary);
};

} // namespace utils
} // namespace deskpilot

#endif // DESKPILOT_FILE_UTILS_H
