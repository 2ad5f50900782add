#include "cid.hpp"
#include "utils.hpp"

#include <cctype>

using namespace std;

static optional<uint64_t> readVarint(const vector<uint8_t>& bytes, size_t& offset) {
    uint64_t value = 0;
    int shift = 0;
    while (offset < bytes.size()) {
        uint8_t byte = bytes[offset++];
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) return value;
        shift += 7;
        if (shift >= 63) return nullopt;
    }
    return nullopt;
}

bool isValidCid(const string& cid) {
    if (cid.size() < 8 || cid.size() > 256) return false;

    for (char c : cid) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '=') return false;
    }

    // CIDv0 is not accepted
    if (cid.starts_with("Qmb")) return false;

    return true;
}

optional<CidInfo> parseCidV1(const string& cid) {
    if (cid.size() < 2 || cid[0] != 'b') return nullopt;

    auto bytes = decodeBase32Lower(cid.substr(1));
    if (!bytes) return nullopt;

    size_t offset = 0;
    auto version = readVarint(*bytes, offset);
    auto codec = readVarint(*bytes, offset);
    auto hashCode = readVarint(*bytes, offset);
    auto digestLength = readVarint(*bytes, offset);

    if (!version || !codec || !hashCode || !digestLength) return nullopt;
    if (*version != 1) return nullopt;
    if (bytes->size() - offset != *digestLength) return nullopt;

    CidInfo info;
    info.version = *version;
    info.codec = *codec;
    info.hashCode = *hashCode;
    info.digest.assign(bytes->begin() + static_cast<long>(offset), bytes->end());
    return info;
}

bool isValidRawCid(const string& cid) {
    if (!isValidCid(cid)) return false;

    auto info = parseCidV1(cid);
    if (!info) return false;

    return info->codec == MULTICODEC_RAW
        && info->hashCode == MULTIHASH_SHA2_256
        && info->digest.size() == 32;
}
