#include "lexiconLoader.hpp"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

nlohmann::json LexiconLoader::loadJsonFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open lexicon file: " + filePath);
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON in " + filePath + ": " + e.what());
    }
}

std::vector<std::string> LexiconLoader::listLexiconFiles(const std::string& path) {
    std::vector<std::string> files;

    if (!fs::exists(path)) {
        throw std::runtime_error("Path does not exist: " + path);
    }

    if (fs::is_regular_file(path)) {
        files.push_back(path);
        return files;
    }

    if (!fs::is_directory(path)) {
        throw std::runtime_error("Not a file or directory: " + path);
    }

    for (const auto& entry : fs::recursive_directory_iterator(path)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<LexiconFile> LexiconLoader::loadLexicons(const std::string& path) {
    std::vector<LexiconFile> loaded;

    for (const auto& filePath : listLexiconFiles(path)) {
        LexiconFile file{filePath, std::nullopt, ""};
        try {
            file.document = loadJsonFile(filePath);
        } catch (const std::runtime_error& e) {
            file.error = e.what();
        }
        loaded.push_back(std::move(file));
    }

    return loaded;
}

std::vector<nlohmann::json> LexiconLoader::documentsOf(const std::vector<LexiconFile>& files) {
    std::vector<nlohmann::json> documents;
    for (const auto& file : files) {
        if (file.document) documents.push_back(*file.document);
    }
    return documents;
}

std::vector<std::vector<std::string>> LexiconLoader::checkFiles(
    const std::vector<LexiconFile>& files, const ValidationOptions& options) {

    std::vector<std::vector<std::string>> fileErrors(files.size());

    std::vector<nlohmann::json> documents;
    std::vector<size_t> fileOf;
    for (size_t i = 0; i < files.size(); ++i) {
        if (!files[i].document) {
            fileErrors[i].push_back(files[i].error);
            continue;
        }
        documents.push_back(*files[i].document);
        fileOf.push_back(i);
    }

    DocumentErrors perDocument = LexiconValidator::validateDocuments(documents, options);
    for (size_t j = 0; j < documents.size(); ++j) {
        fileErrors[fileOf[j]] = std::move(perDocument[j]);
    }

    std::map<std::string, std::vector<size_t>> filesById;
    for (size_t j = 0; j < documents.size(); ++j) {
        const auto& doc = documents[j];
        if (doc.is_object() && doc.contains("id") && doc["id"].is_string()) {
            filesById[doc["id"].get<std::string>()].push_back(fileOf[j]);
        }
    }

    for (const auto& [id, sharing] : filesById) {
        if (sharing.size() < 2) continue;

        auto failing = std::find_if(sharing.begin(), sharing.end(),
                                    [&](size_t i) { return !fileErrors[i].empty(); });
        if (failing == sharing.end()) continue;

        for (size_t i : sharing) {
            if (fileErrors[i].empty()) {
                fileErrors[i].push_back("lexicon id '" + id + "' is also defined in " + files[*failing].path);
            }
        }
    }

    return fileErrors;
}
