#ifndef CID_HPP
#define CID_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Multicodec codes the validator cares about
constexpr uint64_t MULTICODEC_RAW = 0x55;
constexpr uint64_t MULTICODEC_DAG_CBOR = 0x71;
constexpr uint64_t MULTIHASH_SHA2_256 = 0x12;

struct CidInfo {
    uint64_t version;
    uint64_t codec;
    uint64_t hashCode;
    std::vector<uint8_t> digest;
};

// Syntax-level check used for the "cid" string format and cid-link values
bool isValidCid(const std::string& cid);

// Decodes a base32 ('b' multibase) CIDv1. CIDv0 and other bases are not decoded.
std::optional<CidInfo> parseCidV1(const std::string& cid);

// CIDv1 with the raw codec and a sha2-256 digest, as required for blob references
bool isValidRawCid(const std::string& cid);

#endif
