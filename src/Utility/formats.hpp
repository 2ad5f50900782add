#ifndef FORMATS_HPP
#define FORMATS_HPP

#include <string>
#include <optional>
#include <expected>

enum class FormatTag {
    Datetime,
    Uri,
    AtUri,
    Did,
    Handle,
    AtIdentifier,
    Nsid,
    Cid,
    Language,
    Tid,
    RecordKey
};

// Converts FormatTag to its lexicon spelling ("at-uri", "record-key", ...)
std::string format_tag_to_string(FormatTag tag);

// std::nullopt for names that are not a known string format
std::optional<FormatTag> format_tag_from_string(const std::string& str);

bool isValidUri(const std::string& value);
bool isValidAtUri(const std::string& value);
bool isValidDid(const std::string& value);
bool isValidHandle(const std::string& value);
bool isValidAtIdentifier(const std::string& value);
bool isValidNsid(const std::string& value);
bool isValidLanguage(const std::string& value);
bool isValidTid(const std::string& value);
bool isValidRecordKey(const std::string& value);

std::expected<void, std::string> validateStringFormat(const std::string& value, FormatTag format);

#endif
