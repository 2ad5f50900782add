#include "formats.hpp"
#include "dateTime.hpp"
#include "cid.hpp"

#include <cctype>
#include <regex>
#include <vector>

using namespace std;

constexpr size_t MAX_URI_LENGTH = 8192;
constexpr size_t MAX_DID_LENGTH = 2048;
constexpr size_t MAX_HANDLE_LENGTH = 253;
constexpr size_t MAX_NSID_LENGTH = 317;
constexpr size_t MAX_RECORD_KEY_LENGTH = 512;

static vector<string> splitString(const string& value, char delimiter) {
    vector<string> parts;
    size_t start = 0;
    while (true) {
        size_t end = value.find(delimiter, start);
        if (end == string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

static bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool isAsciiAlnum(char c) {
    return isAsciiAlpha(c) || (c >= '0' && c <= '9');
}

// Hostname label: 1-63 alphanumerics or hyphens, no leading or trailing hyphen
static bool isValidDomainLabel(const string& label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    for (char c : label) {
        if (!isAsciiAlnum(c) && c != '-') return false;
    }
    return true;
}

string format_tag_to_string(FormatTag tag) {
    switch (tag) {
        case FormatTag::Datetime:     return "datetime";
        case FormatTag::Uri:          return "uri";
        case FormatTag::AtUri:        return "at-uri";
        case FormatTag::Did:          return "did";
        case FormatTag::Handle:       return "handle";
        case FormatTag::AtIdentifier: return "at-identifier";
        case FormatTag::Nsid:         return "nsid";
        case FormatTag::Cid:          return "cid";
        case FormatTag::Language:     return "language";
        case FormatTag::Tid:          return "tid";
        case FormatTag::RecordKey:    return "record-key";
    }
    return "unknown";
}

optional<FormatTag> format_tag_from_string(const string& str) {
    if (str == "datetime")      return FormatTag::Datetime;
    if (str == "uri")           return FormatTag::Uri;
    if (str == "at-uri")        return FormatTag::AtUri;
    if (str == "did")           return FormatTag::Did;
    if (str == "handle")        return FormatTag::Handle;
    if (str == "at-identifier") return FormatTag::AtIdentifier;
    if (str == "nsid")          return FormatTag::Nsid;
    if (str == "cid")           return FormatTag::Cid;
    if (str == "language")      return FormatTag::Language;
    if (str == "tid")           return FormatTag::Tid;
    if (str == "record-key")    return FormatTag::RecordKey;
    return nullopt;
}

bool isValidUri(const string& value) {
    if (value.empty() || value.size() > MAX_URI_LENGTH) return false;

    size_t colon = value.find(':');
    if (colon == string::npos || colon == 0) return false;

    if (!isAsciiAlpha(value[0])) return false;
    for (size_t i = 1; i < colon; ++i) {
        char c = value[i];
        if (!isAsciiAlnum(c) && c != '+' && c != '.' && c != '-') return false;
    }

    if (colon + 1 >= value.size()) return false;
    for (size_t i = colon + 1; i < value.size(); ++i) {
        if (isspace(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

bool isValidAtUri(const string& value) {
    if (value.size() > MAX_URI_LENGTH) return false;
    if (!value.starts_with("at://")) return false;

    vector<string> parts = splitString(value.substr(5), '/');
    if (parts.size() > 3) return false;

    if (!isValidAtIdentifier(parts[0])) return false;
    if (parts.size() >= 2 && !isValidNsid(parts[1])) return false;
    if (parts.size() == 3 && !isValidRecordKey(parts[2])) return false;

    return true;
}

bool isValidDid(const string& value) {
    if (value.size() > MAX_DID_LENGTH) return false;
    if (!value.starts_with("did:")) return false;

    size_t methodEnd = value.find(':', 4);
    if (methodEnd == string::npos || methodEnd == 4) return false;

    for (size_t i = 4; i < methodEnd; ++i) {
        if (value[i] < 'a' || value[i] > 'z') return false;
    }

    string identifier = value.substr(methodEnd + 1);
    if (identifier.empty()) return false;

    for (char c : identifier) {
        if (!isAsciiAlnum(c) && c != '.' && c != '_' && c != ':' && c != '%' && c != '-') return false;
    }

    char last = identifier.back();
    return last != ':' && last != '%';
}

bool isValidHandle(const string& value) {
    if (value.empty() || value.size() > MAX_HANDLE_LENGTH) return false;

    vector<string> labels = splitString(value, '.');
    if (labels.size() < 2) return false;

    for (const auto& label : labels) {
        if (!isValidDomainLabel(label)) return false;
    }

    // TLD cannot start with a digit
    return isAsciiAlpha(labels.back().front());
}

bool isValidAtIdentifier(const string& value) {
    if (value.starts_with("did:")) return isValidDid(value);
    return isValidHandle(value);
}

bool isValidNsid(const string& value) {
    if (value.empty() || value.size() > MAX_NSID_LENGTH) return false;

    vector<string> segments = splitString(value, '.');
    if (segments.size() < 3) return false;

    size_t authorityLength = value.size() - segments.back().size() - 1;
    if (authorityLength > MAX_HANDLE_LENGTH) return false;

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!isValidDomainLabel(segments[i])) return false;
    }
    if (!isAsciiAlpha(segments.front().front())) return false;

    // Name segment: letter followed by alphanumerics, no hyphens
    const string& name = segments.back();
    if (name.empty() || name.size() > 63 || !isAsciiAlpha(name.front())) return false;
    for (char c : name) {
        if (!isAsciiAlnum(c)) return false;
    }
    return true;
}

bool isValidLanguage(const string& value) {
    // BCP 47 language tag: langtag | privateuse | grandfathered
    static const regex languageTag(
        "^(("
        "(en-GB-oed|i-ami|i-bnn|i-default|i-enochian|i-hak|i-klingon|i-lux|i-mingo|i-navajo|i-pwn|i-tao|i-tay|i-tsu|"
        "sgn-BE-FR|sgn-BE-NL|sgn-CH-DE)|"
        "(art-lojban|cel-gaulish|no-bok|no-nyn|zh-guoyu|zh-hakka|zh-min|zh-min-nan|zh-xiang))|"
        "((([A-Za-z]{2,3}(-([A-Za-z]{3}(-[A-Za-z]{3}){0,2}))?)|[A-Za-z]{4}|[A-Za-z]{5,8})"
        "(-([A-Za-z]{4}))?"
        "(-([A-Za-z]{2}|[0-9]{3}))?"
        "(-([A-Za-z0-9]{5,8}|[0-9][A-Za-z0-9]{3}))*"
        "(-([0-9A-WY-Za-wy-z](-[A-Za-z0-9]{2,8})+))*"
        "(-(x(-[A-Za-z0-9]{1,8})+))?)|"
        "(x(-[A-Za-z0-9]{1,8})+))$");

    if (value.empty() || value.size() > 128) return false;
    return regex_match(value, languageTag);
}

bool isValidTid(const string& value) {
    static const string firstChars = "234567abcdefghij";
    static const string restChars = "234567abcdefghijklmnopqrstuvwxyz";

    if (value.size() != 13) return false;
    if (firstChars.find(value[0]) == string::npos) return false;
    for (size_t i = 1; i < value.size(); ++i) {
        if (restChars.find(value[i]) == string::npos) return false;
    }
    return true;
}

bool isValidRecordKey(const string& value) {
    if (value.empty() || value.size() > MAX_RECORD_KEY_LENGTH) return false;
    if (value == "." || value == "..") return false;

    for (char c : value) {
        if (!isAsciiAlnum(c) && c != '_' && c != '~' && c != '.' && c != ':' && c != '-') return false;
    }
    return true;
}

expected<void, string> validateStringFormat(const string& value, FormatTag format) {
    bool valid = false;

    switch (format) {
        case FormatTag::Datetime: {
            auto parsed = DateTime::parse(value);
            if (!parsed) {
                return unexpected("Invalid datetime format: " + value + " (" + parsed.error() + ")");
            }
            return {};
        }
        case FormatTag::Uri:          valid = isValidUri(value); break;
        case FormatTag::AtUri:        valid = isValidAtUri(value); break;
        case FormatTag::Did:          valid = isValidDid(value); break;
        case FormatTag::Handle:       valid = isValidHandle(value); break;
        case FormatTag::AtIdentifier: valid = isValidAtIdentifier(value); break;
        case FormatTag::Nsid:         valid = isValidNsid(value); break;
        case FormatTag::Cid:          valid = isValidCid(value); break;
        case FormatTag::Language:     valid = isValidLanguage(value); break;
        case FormatTag::Tid:          valid = isValidTid(value); break;
        case FormatTag::RecordKey:    valid = isValidRecordKey(value); break;
    }

    if (!valid) {
        return unexpected("Invalid " + format_tag_to_string(format) + " format: " + value);
    }
    return {};
}
