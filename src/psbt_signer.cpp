#include "psbt_signer.hpp"
#include "ecdsa_signer.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "segwit.hpp"
#include "sighash.hpp"
#include <stdexcept>
#include <string>

namespace signer {

namespace {

struct PendingSignature {
    size_t input_index;
    std::vector<uint8_t> signature; // DER || sighash byte
};

} // namespace

PsbtSigner::PsbtSigner(const PrivateKey& key)
    : key_(key)
    , pubkey_(key.public_key())
{
    script_pubkey_ = Segwit::get_p2wpkh_program(pubkey_);
    script_code_ = Segwit::get_p2wpkh_scriptcode(HashUtils::hash160(pubkey_));
}

SigningSummary PsbtSigner::sign(Psbt& psbt) const {
    if (psbt.state() != Psbt::State::Parsed) {
        throw std::logic_error("PsbtSigner::sign requires a freshly parsed container");
    }

    SigningSummary summary{.inputs_matched = 0, .signatures_added = 0};
    std::vector<PendingSignature> pending;

    for (size_t i = 0; i < psbt.input_count(); ++i) {
        if (psbt.is_finalized(i)) {
            continue;
        }
        auto spent = psbt.spent_output(i);
        if (!spent || !Segwit::is_p2wpkh_program(spent->script_pubkey) ||
            spent->script_pubkey != script_pubkey_) {
            continue;
        }
        ++summary.inputs_matched;

        if (psbt.has_partial_signature(i, pubkey_)) {
            continue;
        }

        uint32_t sighash_type = psbt.sighash_type(i);
        auto digest = SignatureHash::bip143(psbt.unsigned_tx(), i, script_code_,
                                            spent->amount, sighash_type);
        auto signature = EcdsaSigner::sign(key_.bytes(), digest);
        if (!EcdsaSigner::verify(pubkey_, digest, signature)) {
            throw SignerError(SignerError::ErrorType::CryptoFailure,
                "Signature for input " + std::to_string(i) + " failed verification");
        }
        signature.push_back(static_cast<uint8_t>(sighash_type & 0xff));
        pending.push_back({i, std::move(signature)});
    }

    if (summary.inputs_matched == 0) {
        throw SignerError(SignerError::ErrorType::NoMatchingInput,
            "No input spends a P2WPKH output of the supplied key");
    }

    for (const auto& entry : pending) {
        psbt.add_partial_signature(entry.input_index, pubkey_, entry.signature);
    }
    psbt.mark_signed();

    summary.signatures_added = pending.size();
    return summary;
}

} // namespace signer
