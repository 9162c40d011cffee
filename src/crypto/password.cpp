#include "twinkit/crypto/password.hpp"
#include "twinkit/config/crypto.hpp"
#include "twinkit/codec.hpp"
#include "twinkit/types.hpp"

#include <array>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "lcr/log/logger.hpp"

namespace twinkit::crypto {

using namespace config::crypto;

Error encrypt_password(std::string_view password, std::string_view salt, std::string& out) {
    std::array<std::uint8_t, SCRYPT_DKLEN> key{};
    const int rc = EVP_PBE_scrypt(password.data(), password.size(),
                                  reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                                  SCRYPT_N, SCRYPT_R, SCRYPT_P, SCRYPT_MAXMEM,
                                  key.data(), key.size());
    if (rc != 1) {
        TK_ERROR("[CRYPTO] scrypt derivation failed");
        return Error::ResourceError;
    }
    out = codec::hex_encode(BytesView(key));
    return Error::None;
}

Error hash_password(std::string_view password, std::string& out) {
    std::array<std::uint8_t, SALT_BYTES> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        TK_ERROR("[CRYPTO] Unable to draw " << raw.size() << " salt bytes");
        return Error::ResourceError;
    }
    const std::string salt = codec::hex_encode(BytesView(raw));

    std::string derived;
    const Error err = encrypt_password(password, salt, derived);
    if (err != Error::None) {
        return err;
    }
    out = derived + salt;
    return Error::None;
}

bool match_password(std::string_view password, std::string_view stored) {
    if (stored.size() < DERIVED_HEX_LENGTH) {
        return false;
    }
    const std::string_view expected = stored.substr(0, DERIVED_HEX_LENGTH);
    const std::string_view salt = stored.substr(DERIVED_HEX_LENGTH);

    std::string derived;
    if (encrypt_password(password, salt, derived) != Error::None) {
        TK_WARN("[CRYPTO] Password check could not derive a key; treating as mismatch");
        return false;
    }
    return CRYPTO_memcmp(derived.data(), expected.data(), DERIVED_HEX_LENGTH) == 0;
}

} // namespace twinkit::crypto
