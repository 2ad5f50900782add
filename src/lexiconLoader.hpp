#pragma once

#include <string>
#include <vector>
#include <optional>
#include "nlohmann/json.hpp"
#include "lexiconValidator.hpp"

struct LexiconFile {
    std::string path;
    std::optional<nlohmann::json> document;
    std::string error;          // set when document could not be read
};

class LexiconLoader {
public:
    // Load a JSON file, throws std::runtime_error if it cannot be opened or parsed
    static nlohmann::json loadJsonFile(const std::string& filePath);

    // A single file, or every *.json file under a directory (recursive, sorted by path)
    static std::vector<std::string> listLexiconFiles(const std::string& path);

    // Load every file listLexiconFiles() finds; unreadable files are reported, not thrown
    static std::vector<LexiconFile> loadLexicons(const std::string& path);

    static std::vector<nlohmann::json> documentsOf(const std::vector<LexiconFile>& files);

    // Validates the files together and returns each file's own errors, in file order.
    // Files sharing a lexicon id with a failing file fail too.
    static std::vector<std::vector<std::string>> checkFiles(
        const std::vector<LexiconFile>& files, const ValidationOptions& options = {});
};
