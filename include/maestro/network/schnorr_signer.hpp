#pragma once

#include "event_network.hpp"

#include <memory>
#include <string>
#include <vector>

namespace maestro {
namespace network {

/**
 * @brief BIP-340 Schnorr signer over secp256k1.
 *
 * Holds a 32-byte secret key; the public key is the x-only coordinate of
 * the corresponding curve point. Arithmetic is done with OpenSSL's EC and
 * BIGNUM primitives.
 */
class SchnorrSigner : public ISigner {
public:
    ~SchnorrSigner() override;

    SchnorrSigner(const SchnorrSigner&) = delete;
    SchnorrSigner& operator=(const SchnorrSigner&) = delete;

    /// Generate a fresh random identity.
    static Expected<std::shared_ptr<SchnorrSigner>> generate();

    /// Load an identity from its 64-character hex secret key.
    static Expected<std::shared_ptr<SchnorrSigner>> from_secret_hex(const std::string& secret_hex);

    std::string pubkey() const override { return pubkey_hex_; }

    /// Signs the 32-byte id with fresh auxiliary randomness.
    Expected<std::string> sign(const std::string& event_id) override;

    /// Deterministic signing with caller-supplied auxiliary data (32 bytes).
    Expected<std::string> sign_with_aux(const std::vector<unsigned char>& message,
                                        const std::vector<unsigned char>& aux) const;

private:
    explicit SchnorrSigner(std::vector<unsigned char> secret, std::string pubkey_hex)
        : secret_(std::move(secret))
        , pubkey_hex_(std::move(pubkey_hex))
    {}

    std::vector<unsigned char> secret_;
    std::string pubkey_hex_;
};

/**
 * @brief Verify a BIP-340 signature.
 *
 * @param pubkey_hex 32-byte x-only public key, hex
 * @param message_hex 32-byte message, hex
 * @param signature_hex 64-byte signature, hex
 */
bool verify_schnorr(const std::string& pubkey_hex,
                    const std::string& message_hex,
                    const std::string& signature_hex);

/**
 * @brief Check that an event's id matches its content and its signature is valid.
 */
Expected<void> verify_event(const Event& event);

} // namespace network
} // namespace maestro
