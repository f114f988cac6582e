#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace signer {

// Bech32 (BIP173) and Bech32m (BIP350) checksummed base32 codec
class Bech32 {
public:
    enum class Encoding {
        Invalid,
        Bech32,  // Witness version 0
        Bech32m  // Witness versions 1 through 16
    };

    struct DecodeResult {
        Encoding encoding = Encoding::Invalid;
        std::string hrp;
        std::vector<uint8_t> data; // 5-bit values, checksum removed
    };

    // Encodes 5-bit values under a lowercase human-readable part
    static std::string encode(const std::string& hrp, std::span<const uint8_t> values, Encoding encoding);

    // Decodes a bech32/bech32m string; encoding is Invalid on any failure
    static DecodeResult decode(const std::string& str);

    // Regroups bits, e.g. 8-bit bytes to 5-bit values and back
    static bool convert_bits(std::vector<uint8_t>& out, std::span<const uint8_t> in,
                             int from_bits, int to_bits, bool pad);

private:
    Bech32() = delete;
};

struct WitnessProgram {
    uint8_t version;
    std::vector<uint8_t> program;
};

// Segwit address encoding on top of Bech32
class SegwitAddress {
public:
    // Throws SignerError(EncodingFailure) if the version/program pair is not encodable
    static std::string encode(const std::string& hrp, uint8_t witness_version, std::span<const uint8_t> program);

    // Returns nullopt if addr is not a valid segwit address for hrp
    static std::optional<WitnessProgram> decode(const std::string& hrp, const std::string& addr);

private:
    SegwitAddress() = delete;
};

} // namespace signer
