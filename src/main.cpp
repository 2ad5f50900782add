#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "lexiconValidator.hpp"
#include "lexiconLoader.hpp"

using namespace std;

/* -------------------------- DECLARATIONS -------------------------- */
void addValidationOptions(CLI::App* cmd, ValidationOptions& options, bool& allowDuplicates, bool& verbose);
int runCheck(const string& path, const ValidationOptions& options, bool verbose);
int runValidateRecord(const string& lexiconPath, const string& nsid, const string& recordFile,
                      const ValidationOptions& options, bool verbose);
void displayLoadedLexicons(const vector<LexiconFile>& files);

/* -------------------------- MAIN FUNCTION -------------------------- */

int main(int argc, char** argv) {

    CLI::App app{"lexval - Lexicon schema validator\nChecks lexicon documents and validates records against them."};

    ValidationOptions options;
    bool allowDuplicates = false;
    bool verbose = false;

    string path;
    string nsid;
    string recordFile;

    // CHECK subcommand
    CLI::App* checkCmd = app.add_subcommand("check", "Validate a lexicon file, or every *.json file in a directory together");
    checkCmd->add_option("path", path, "Lexicon file or directory")->required();
    addValidationOptions(checkCmd, options, allowDuplicates, verbose);

    // VALIDATE-RECORD subcommand
    CLI::App* recordCmd = app.add_subcommand("validate-record", "Validate a record against a lexicon's main definition");
    recordCmd->add_option("lexicons", path, "Lexicon file or directory")->required();
    recordCmd->add_option("nsid", nsid, "Lexicon id of the record type")->required();
    recordCmd->add_option("record", recordFile, "JSON file holding the record")->required();
    addValidationOptions(recordCmd, options, allowDuplicates, verbose);

    // HELP subcommand
    CLI::App* helpCmd = app.add_subcommand("help", "Print usage information");

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    options.rejectDuplicateIds = !allowDuplicates;

    if (*checkCmd) {
        return runCheck(path, options, verbose);
    }
    else if (*recordCmd) {
        return runValidateRecord(path, nsid, recordFile, options, verbose);
    }
    else if (*helpCmd) {
        cout << app.help() << endl;
    }

    return 0;
}

/* -------------------------- HELPER FUNCTIONS -------------------------- */

void addValidationOptions(CLI::App* cmd, ValidationOptions& options, bool& allowDuplicates, bool& verbose) {

    cmd->add_option("--max-depth", options.maxDepth, "Maximum schema and data nesting depth")
        ->check(CLI::PositiveNumber);
    cmd->add_flag("--allow-duplicate-ids", allowDuplicates, "Let a later lexicon replace an earlier one with the same id");
    cmd->add_flag("-v,--verbose", verbose, "Print the loaded lexicons before validating");

}

void displayLoadedLexicons(const vector<LexiconFile>& files) {
    cout << "Loaded " << files.size() << " lexicon file(s)\n";
    for (const auto& file : files) {
        if (!file.document) continue;
        const auto& doc = *file.document;
        string id = doc.contains("id") && doc["id"].is_string() ? doc["id"].get<string>() : "<no id>";
        size_t defCount = doc.contains("defs") && doc["defs"].is_object() ? doc["defs"].size() : 0;
        cout << "  " << id << " (" << defCount << " definitions) from " << file.path << "\n";
    }
    cout << endl;
}

int runCheck(const string& path, const ValidationOptions& options, bool verbose) {

    vector<LexiconFile> files;
    try {
        files = LexiconLoader::loadLexicons(path);
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    if (files.empty()) {
        cerr << "No lexicon files found in " << path << endl;
        return 1;
    }

    if (verbose) displayLoadedLexicons(files);

    auto allErrors = LexiconLoader::checkFiles(files, options);

    size_t passed = 0;
    size_t failed = 0;

    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        const auto& fileErrors = allErrors[i];

        if (fileErrors.empty()) {
            cout << "✓ " << file.path << "\n";
            passed++;
        } else {
            cout << "✗ " << file.path << "\n";
            for (const auto& message : fileErrors) {
                cout << "    " << message << "\n";
            }
            failed++;
        }
    }

    cout << "\n" << passed << " passed, " << failed << " failed (" << files.size() << " files)" << endl;
    return failed == 0 ? 0 : 1;
}

int runValidateRecord(const string& lexiconPath, const string& nsid, const string& recordFile,
                      const ValidationOptions& options, bool verbose) {

    vector<LexiconFile> files;
    nlohmann::json record;
    try {
        files = LexiconLoader::loadLexicons(lexiconPath);
        record = LexiconLoader::loadJsonFile(recordFile);
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    for (const auto& file : files) {
        if (!file.document) {
            cerr << "Error: " << file.error << endl;
            return 1;
        }
    }

    if (verbose) displayLoadedLexicons(files);

    auto result = LexiconValidator::validateRecord(LexiconLoader::documentsOf(files), nsid, record, options);
    if (!result) {
        cout << "✗ " << recordFile << "\n";
        cout << "    " << result.error().toString() << endl;
        return 1;
    }

    cout << "✓ " << recordFile << " is a valid " << nsid << endl;
    return 0;
}
