#include "maestro/network/schnorr_signer.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>

namespace maestro {
namespace network {

namespace {

using Bytes32 = std::array<unsigned char, 32>;
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using CtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

BnPtr make_bn() {
    return BnPtr(BN_new(), &BN_clear_free);
}

BnPtr bn_from_bytes(const unsigned char* data, size_t size) {
    return BnPtr(BN_bin2bn(data, static_cast<int>(size), nullptr), &BN_clear_free);
}

Bytes32 bn_to_bytes(const BIGNUM* bn) {
    Bytes32 out{};
    BN_bn2binpad(bn, out.data(), static_cast<int>(out.size()));
    return out;
}

struct Curve {
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free};
    CtxPtr ctx{BN_CTX_new(), &BN_CTX_free};
    BnPtr order = make_bn();
    BnPtr field = make_bn();
    bool ok = false;

    Curve() {
        if (group && ctx && order && field) {
            ok = EC_GROUP_get_order(group.get(), order.get(), ctx.get()) == 1 &&
                 EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr, ctx.get()) == 1;
        }
    }

    PointPtr new_point() const {
        return PointPtr(EC_POINT_new(group.get()), &EC_POINT_free);
    }

    /// Affine coordinates of a point; false when the point is at infinity.
    bool coordinates(const EC_POINT* point, BIGNUM* x, BIGNUM* y) const {
        if (EC_POINT_is_at_infinity(group.get(), point) == 1) {
            return false;
        }
        return EC_POINT_get_affine_coordinates(group.get(), point, x, y, ctx.get()) == 1;
    }
};

bool tagged_hash(const char* tag, const std::vector<const std::vector<unsigned char>*>& parts, Bytes32& out) {
    unsigned char tag_digest[EVP_MAX_MD_SIZE];
    unsigned int tag_len = 0;
    if (EVP_Digest(tag, std::strlen(tag), tag_digest, &tag_len, EVP_sha256(), nullptr) != 1) {
        return false;
    }

    MdCtxPtr md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!md || EVP_DigestInit_ex(md.get(), EVP_sha256(), nullptr) != 1) {
        return false;
    }
    if (EVP_DigestUpdate(md.get(), tag_digest, tag_len) != 1 ||
        EVP_DigestUpdate(md.get(), tag_digest, tag_len) != 1) {
        return false;
    }
    for (const auto* part : parts) {
        if (EVP_DigestUpdate(md.get(), part->data(), part->size()) != 1) {
            return false;
        }
    }
    unsigned int out_len = 0;
    return EVP_DigestFinal_ex(md.get(), out.data(), &out_len) == 1 && out_len == out.size();
}

std::vector<unsigned char> as_vector(const Bytes32& bytes) {
    return std::vector<unsigned char>(bytes.begin(), bytes.end());
}

Error crypto_error(const std::string& message) {
    return Error{ErrorCode::SigningFailed, message};
}

/// x-only public key of a secret scalar; empty when the scalar is out of range.
std::vector<unsigned char> derive_pubkey(const Curve& curve, const std::vector<unsigned char>& secret) {
    auto d = bn_from_bytes(secret.data(), secret.size());
    if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), curve.order.get()) >= 0) {
        return {};
    }
    auto point = curve.new_point();
    auto x = make_bn();
    auto y = make_bn();
    if (!point || EC_POINT_mul(curve.group.get(), point.get(), d.get(), nullptr, nullptr, curve.ctx.get()) != 1 ||
        !curve.coordinates(point.get(), x.get(), y.get())) {
        return {};
    }
    return as_vector(bn_to_bytes(x.get()));
}

} // namespace

SchnorrSigner::~SchnorrSigner() {
    if (!secret_.empty()) {
        OPENSSL_cleanse(secret_.data(), secret_.size());
    }
}

Expected<std::shared_ptr<SchnorrSigner>> SchnorrSigner::generate() {
    Curve curve;
    if (!curve.ok) {
        return tl::unexpected(crypto_error("secp256k1 is not available"));
    }

    std::vector<unsigned char> secret(32);
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
            return tl::unexpected(crypto_error("Random number generation failed"));
        }
        auto pubkey = derive_pubkey(curve, secret);
        if (!pubkey.empty()) {
            return std::shared_ptr<SchnorrSigner>(
                new SchnorrSigner(std::move(secret), to_hex(pubkey.data(), pubkey.size())));
        }
    }
    return tl::unexpected(crypto_error("Failed to generate a valid secret key"));
}

Expected<std::shared_ptr<SchnorrSigner>> SchnorrSigner::from_secret_hex(const std::string& secret_hex) {
    auto secret = from_hex(secret_hex);
    if (!secret || secret->size() != 32) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Secret key must be 32 bytes of hex"});
    }

    Curve curve;
    if (!curve.ok) {
        return tl::unexpected(crypto_error("secp256k1 is not available"));
    }
    auto pubkey = derive_pubkey(curve, *secret);
    if (pubkey.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Secret key is out of range"});
    }
    return std::shared_ptr<SchnorrSigner>(
        new SchnorrSigner(std::move(*secret), to_hex(pubkey.data(), pubkey.size())));
}

Expected<std::string> SchnorrSigner::sign(const std::string& event_id) {
    auto message = from_hex(event_id);
    if (!message || message->size() != 32) {
        return tl::unexpected(Error{ErrorCode::InvalidEvent, "Event id must be 32 bytes of hex", event_id});
    }

    std::vector<unsigned char> aux(32);
    if (RAND_bytes(aux.data(), static_cast<int>(aux.size())) != 1) {
        return tl::unexpected(crypto_error("Random number generation failed"));
    }
    return sign_with_aux(*message, aux);
}

Expected<std::string> SchnorrSigner::sign_with_aux(const std::vector<unsigned char>& message,
                                                   const std::vector<unsigned char>& aux) const {
    if (aux.size() != 32) {
        return tl::unexpected(crypto_error("Auxiliary data must be 32 bytes"));
    }

    Curve curve;
    if (!curve.ok) {
        return tl::unexpected(crypto_error("secp256k1 is not available"));
    }
    BIGNUM* n = curve.order.get();
    BN_CTX* ctx = curve.ctx.get();

    auto d0 = bn_from_bytes(secret_.data(), secret_.size());
    auto public_point = curve.new_point();
    auto px = make_bn();
    auto py = make_bn();
    if (!d0 || !public_point ||
        EC_POINT_mul(curve.group.get(), public_point.get(), d0.get(), nullptr, nullptr, ctx) != 1 ||
        !curve.coordinates(public_point.get(), px.get(), py.get())) {
        return tl::unexpected(crypto_error("Failed to derive public point"));
    }

    // Negate the secret when the public point has odd y.
    auto d = make_bn();
    if (BN_is_odd(py.get())) {
        BN_sub(d.get(), n, d0.get());
    } else {
        BN_copy(d.get(), d0.get());
    }

    const auto d_bytes = bn_to_bytes(d.get());
    const auto px_bytes = as_vector(bn_to_bytes(px.get()));

    Bytes32 aux_hash{};
    if (!tagged_hash("BIP0340/aux", {&aux}, aux_hash)) {
        return tl::unexpected(crypto_error("Tagged hash failed"));
    }
    std::vector<unsigned char> t(32);
    for (size_t i = 0; i < t.size(); ++i) {
        t[i] = static_cast<unsigned char>(d_bytes[i] ^ aux_hash[i]);
    }

    Bytes32 nonce_hash{};
    if (!tagged_hash("BIP0340/nonce", {&t, &px_bytes, &message}, nonce_hash)) {
        return tl::unexpected(crypto_error("Tagged hash failed"));
    }
    OPENSSL_cleanse(t.data(), t.size());

    auto k0_raw = bn_from_bytes(nonce_hash.data(), nonce_hash.size());
    auto k0 = make_bn();
    if (!k0_raw || BN_nnmod(k0.get(), k0_raw.get(), n, ctx) != 1 || BN_is_zero(k0.get())) {
        return tl::unexpected(crypto_error("Derived nonce is invalid"));
    }

    auto nonce_point = curve.new_point();
    auto rx = make_bn();
    auto ry = make_bn();
    if (!nonce_point ||
        EC_POINT_mul(curve.group.get(), nonce_point.get(), k0.get(), nullptr, nullptr, ctx) != 1 ||
        !curve.coordinates(nonce_point.get(), rx.get(), ry.get())) {
        return tl::unexpected(crypto_error("Failed to derive nonce point"));
    }

    auto k = make_bn();
    if (BN_is_odd(ry.get())) {
        BN_sub(k.get(), n, k0.get());
    } else {
        BN_copy(k.get(), k0.get());
    }

    const auto rx_bytes = as_vector(bn_to_bytes(rx.get()));
    Bytes32 challenge{};
    if (!tagged_hash("BIP0340/challenge", {&rx_bytes, &px_bytes, &message}, challenge)) {
        return tl::unexpected(crypto_error("Tagged hash failed"));
    }
    auto e_raw = bn_from_bytes(challenge.data(), challenge.size());
    auto e = make_bn();
    auto ed = make_bn();
    auto s = make_bn();
    if (BN_nnmod(e.get(), e_raw.get(), n, ctx) != 1 ||
        BN_mod_mul(ed.get(), e.get(), d.get(), n, ctx) != 1 ||
        BN_mod_add(s.get(), k.get(), ed.get(), n, ctx) != 1) {
        return tl::unexpected(crypto_error("Scalar arithmetic failed"));
    }

    std::vector<unsigned char> signature(rx_bytes);
    const auto s_bytes = bn_to_bytes(s.get());
    signature.insert(signature.end(), s_bytes.begin(), s_bytes.end());
    return to_hex(signature.data(), signature.size());
}

bool verify_schnorr(const std::string& pubkey_hex,
                    const std::string& message_hex,
                    const std::string& signature_hex) {
    auto pubkey = from_hex(pubkey_hex);
    auto message = from_hex(message_hex);
    auto signature = from_hex(signature_hex);
    if (!pubkey || !message || !signature ||
        pubkey->size() != 32 || message->size() != 32 || signature->size() != 64) {
        return false;
    }

    Curve curve;
    if (!curve.ok) {
        return false;
    }
    BIGNUM* n = curve.order.get();
    BN_CTX* ctx = curve.ctx.get();

    // lift_x: the point with this x and even y.
    auto x = bn_from_bytes(pubkey->data(), pubkey->size());
    auto public_point = curve.new_point();
    if (!x || !public_point || BN_cmp(x.get(), curve.field.get()) >= 0 ||
        EC_POINT_set_compressed_coordinates(curve.group.get(), public_point.get(), x.get(), 0, ctx) != 1) {
        return false;
    }

    const std::vector<unsigned char> r_bytes(signature->begin(), signature->begin() + 32);
    auto r = bn_from_bytes(r_bytes.data(), r_bytes.size());
    auto s = bn_from_bytes(signature->data() + 32, 32);
    if (!r || !s || BN_cmp(r.get(), curve.field.get()) >= 0 || BN_cmp(s.get(), n) >= 0) {
        return false;
    }

    Bytes32 challenge{};
    if (!tagged_hash("BIP0340/challenge", {&r_bytes, &*pubkey, &*message}, challenge)) {
        return false;
    }
    auto e_raw = bn_from_bytes(challenge.data(), challenge.size());
    auto e = make_bn();
    auto neg_e = make_bn();
    if (BN_nnmod(e.get(), e_raw.get(), n, ctx) != 1 ||
        BN_mod_sub(neg_e.get(), n, e.get(), n, ctx) != 1) {
        return false;
    }

    // R = s*G - e*P
    auto result = curve.new_point();
    auto rx = make_bn();
    auto ry = make_bn();
    if (!result ||
        EC_POINT_mul(curve.group.get(), result.get(), s.get(), public_point.get(), neg_e.get(), ctx) != 1 ||
        !curve.coordinates(result.get(), rx.get(), ry.get())) {
        return false;
    }
    return !BN_is_odd(ry.get()) && BN_cmp(rx.get(), r.get()) == 0;
}

Expected<void> verify_event(const Event& event) {
    auto id = compute_event_id(event);
    if (!id) {
        return tl::unexpected(id.error());
    }
    if (*id != event.id) {
        return tl::unexpected(Error{ErrorCode::InvalidEvent, "Event id does not match content", event.id});
    }
    if (!verify_schnorr(event.pubkey, event.id, event.sig)) {
        return tl::unexpected(Error{ErrorCode::InvalidSignature, "Invalid event signature", event.id});
    }
    return {};
}

} // namespace network
} // namespace maestro
