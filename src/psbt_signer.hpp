#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "private_key.hpp"
#include "psbt.hpp"

namespace signer {

struct SigningSummary {
    size_t inputs_matched;   // Inputs spending this key's P2WPKH output, signed now or before
    size_t signatures_added;
};

// Adds P2WPKH partial signatures for one private key to a parsed PSBT
class PsbtSigner {
public:
    explicit PsbtSigner(const PrivateKey& key);
    // The signer keeps a reference to the key, which must outlive it
    PsbtSigner(PrivateKey&&) = delete;

    // Signs every input whose spent output is P2WPKH(hash160(pubkey)) and which is
    // neither finalized nor already signed by this key, then moves the container
    // to the Signed state.
    //
    // Signatures are computed for all matching inputs before any is inserted, so
    // on failure the container is unchanged and stays Parsed.
    // Throws SignerError(NoMatchingInput) if no input spends this key's output.
    SigningSummary sign(Psbt& psbt) const;

    const std::vector<uint8_t>& public_key() const { return pubkey_; }

private:
    const PrivateKey& key_;
    std::vector<uint8_t> pubkey_;
    std::vector<uint8_t> script_pubkey_;
    std::vector<uint8_t> script_code_;
};

} // namespace signer
