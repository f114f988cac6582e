#include "bech32.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace signer {

namespace {

// Bech32 character set (BIP-173)
const char* BECH32_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

// Checksum constants XORed into the polymod result
constexpr uint32_t BECH32_CONST = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

constexpr size_t CHECKSUM_LENGTH = 6;
constexpr size_t MAX_LENGTH = 90;

int8_t charset_rev(char c) {
    const char* pos = std::strchr(BECH32_CHARSET, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int8_t>(pos - BECH32_CHARSET);
}

uint32_t encoding_constant(Bech32::Encoding encoding) {
    return encoding == Bech32::Encoding::Bech32m ? BECH32M_CONST : BECH32_CONST;
}

// Bech32 polymod -- GF(2^5) polynomial checksum
uint32_t bech32_polymod(const std::vector<uint8_t>& values) {
    const uint32_t GEN[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t chk = 1;
    for (auto v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= GEN[i];
            }
        }
    }
    return chk;
}

// Expand human-readable part for checksum computation
std::vector<uint8_t> bech32_hrp_expand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
    }
    return ret;
}

std::vector<uint8_t> bech32_create_checksum(const std::string& hrp,
                                            std::span<const uint8_t> values,
                                            Bech32::Encoding encoding) {
    auto enc = bech32_hrp_expand(hrp);
    enc.insert(enc.end(), values.begin(), values.end());
    enc.resize(enc.size() + CHECKSUM_LENGTH, 0);

    uint32_t polymod = bech32_polymod(enc) ^ encoding_constant(encoding);

    std::vector<uint8_t> chk(CHECKSUM_LENGTH);
    for (size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        chk[i] = (polymod >> (5 * (5 - i))) & 31;
    }
    return chk;
}

Bech32::Encoding bech32_verify_checksum(const std::string& hrp, const std::vector<uint8_t>& values) {
    auto enc = bech32_hrp_expand(hrp);
    enc.insert(enc.end(), values.begin(), values.end());
    uint32_t check = bech32_polymod(enc);
    if (check == BECH32_CONST) {
        return Bech32::Encoding::Bech32;
    }
    if (check == BECH32M_CONST) {
        return Bech32::Encoding::Bech32m;
    }
    return Bech32::Encoding::Invalid;
}

} // anonymous namespace

std::string Bech32::encode(const std::string& hrp, std::span<const uint8_t> values, Encoding encoding) {
    if (encoding == Encoding::Invalid) {
        throw SignerError(SignerError::ErrorType::EncodingFailure, "No bech32 variant selected");
    }

    auto checksum = bech32_create_checksum(hrp, values, encoding);

    // Format: hrp + "1" + data_chars + checksum_chars
    std::string result = hrp + "1";
    result.reserve(result.size() + values.size() + checksum.size());
    for (auto v : values) {
        result += BECH32_CHARSET[v & 31];
    }
    for (auto v : checksum) {
        result += BECH32_CHARSET[v];
    }
    return result;
}

// Decodes a bech32 or bech32m string per BIP173/BIP350.
//
// Rejected inputs:
// - longer than 90 characters, or characters outside US-ASCII 33..126
// - mixed upper and lower case
// - no '1' separator, an empty human-readable part, or fewer than 6 data characters
// - a data character outside the charset, or a checksum matching neither constant
Bech32::DecodeResult Bech32::decode(const std::string& str) {
    DecodeResult result;
    if (str.size() > MAX_LENGTH) {
        return result;
    }

    bool has_lower = false;
    bool has_upper = false;
    for (char c : str) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            return result;
        }
        if (c >= 'a' && c <= 'z') has_lower = true;
        if (c >= 'A' && c <= 'Z') has_upper = true;
    }
    if (has_lower && has_upper) {
        return result;
    }

    std::string lowered = str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t pos = lowered.rfind('1');
    if (pos == std::string::npos || pos == 0 || pos + CHECKSUM_LENGTH + 1 > lowered.size()) {
        return result;
    }

    std::vector<uint8_t> values;
    values.reserve(lowered.size() - pos - 1);
    for (size_t i = pos + 1; i < lowered.size(); ++i) {
        int8_t rev = charset_rev(lowered[i]);
        if (rev < 0) {
            return result;
        }
        values.push_back(static_cast<uint8_t>(rev));
    }

    std::string hrp = lowered.substr(0, pos);
    Encoding encoding = bech32_verify_checksum(hrp, values);
    if (encoding == Encoding::Invalid) {
        return result;
    }

    result.encoding = encoding;
    result.hrp = std::move(hrp);
    result.data.assign(values.begin(), values.end() - CHECKSUM_LENGTH);
    return result;
}

// General power-of-2 base conversion.
// With pad=false, leftover bits must be fewer than from_bits and all zero.
bool Bech32::convert_bits(std::vector<uint8_t>& out, std::span<const uint8_t> in,
                          int from_bits, int to_bits, bool pad) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    const uint32_t max_acc = (1u << (from_bits + to_bits - 1)) - 1;

    for (uint8_t value : in) {
        if ((value >> from_bits) != 0) {
            return false;
        }
        acc = ((acc << from_bits) | value) & max_acc;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv) != 0) {
        return false;
    }
    return true;
}

// Encodes a witness program as a segwit address.
//
// Version 0 programs must be 20 (P2WPKH) or 32 (P2WSH) bytes and use bech32;
// versions 1 to 16 take 2 to 40 bytes and use bech32m. The result is lowercase.
std::string SegwitAddress::encode(const std::string& hrp, uint8_t witness_version,
                                  std::span<const uint8_t> program) {
    if (witness_version > 16 || program.size() < 2 || program.size() > 40 ||
        (witness_version == 0 && program.size() != 20 && program.size() != 32)) {
        throw SignerError(SignerError::ErrorType::EncodingFailure,
            "Witness program cannot be encoded as a segwit address");
    }

    std::vector<uint8_t> values;
    values.reserve(1 + (program.size() * 8 + 4) / 5);
    values.push_back(witness_version);
    if (!Bech32::convert_bits(values, program, 8, 5, true)) {
        throw SignerError(SignerError::ErrorType::EncodingFailure, "Bit conversion failed");
    }

    auto encoding = witness_version == 0 ? Bech32::Encoding::Bech32 : Bech32::Encoding::Bech32m;
    auto address = Bech32::encode(hrp, values, encoding);

    // The address must decode back to the same version and program
    if (!decode(hrp, address)) {
        throw SignerError(SignerError::ErrorType::EncodingFailure, "Encoded address failed validation");
    }
    return address;
}

std::optional<WitnessProgram> SegwitAddress::decode(const std::string& hrp, const std::string& addr) {
    auto decoded = Bech32::decode(addr);
    if (decoded.encoding == Bech32::Encoding::Invalid || decoded.hrp != hrp || decoded.data.empty()) {
        return std::nullopt;
    }

    uint8_t version = decoded.data[0];
    if (version > 16) {
        return std::nullopt;
    }
    if ((version == 0 && decoded.encoding != Bech32::Encoding::Bech32) ||
        (version != 0 && decoded.encoding != Bech32::Encoding::Bech32m)) {
        return std::nullopt;
    }

    WitnessProgram result{version, {}};
    std::span<const uint8_t> values(decoded.data.data() + 1, decoded.data.size() - 1);
    if (!Bech32::convert_bits(result.program, values, 5, 8, false)) {
        return std::nullopt;
    }
    if (result.program.size() < 2 || result.program.size() > 40) {
        return std::nullopt;
    }
    if (version == 0 && result.program.size() != 20 && result.program.size() != 32) {
        return std::nullopt;
    }
    return result;
}

} // namespace signer
