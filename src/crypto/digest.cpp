#include "twinkit/crypto/digest.hpp"
#include "twinkit/codec.hpp"

#include <memory>

#include <openssl/evp.h>

#include "lcr/log/logger.hpp"

namespace twinkit::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

Error md5(BytesView data, Md5Digest& out) {
    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        TK_ERROR("[CRYPTO] Digest context allocation failed");
        return Error::ResourceError;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        TK_ERROR("[CRYPTO] MD5 digest unavailable");
        return Error::ResourceError;
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        TK_ERROR("[CRYPTO] MD5 update failed");
        return Error::ResourceError;
    }
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        TK_ERROR("[CRYPTO] MD5 final failed");
        return Error::ResourceError;
    }
    return Error::None;
}

Error md5_hex(std::string_view text, std::string& out) {
    Md5Digest digest{};
    const Error err = md5(as_bytes(text), digest);
    if (err != Error::None) {
        return err;
    }
    out = codec::hex_encode(BytesView(digest));
    return Error::None;
}

} // namespace twinkit::crypto
