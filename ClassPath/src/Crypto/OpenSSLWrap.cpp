// We need our declaration
#include "../../include/Crypto/OpenSSLWrap.hpp"

#if (WantSSLCode == 1)
#include <openssl/evp.h>

namespace Crypto
{
    OSSL_SHA256::OSSL_SHA256() : c(::EVP_MD_CTX_new()) { Start(); }
    OSSL_SHA256::~OSSL_SHA256() { ::EVP_MD_CTX_free(c); }

    void OSSL_SHA256::Start() { if (c) ::EVP_DigestInit_ex(c, ::EVP_sha256(), NULL); }
    void OSSL_SHA256::Hash(const uint8 * buffer, uint32 size) { if (c && size) ::EVP_DigestUpdate(c, buffer, size); }
    void OSSL_SHA256::Finalize(uint8 * outBuffer)
    {
        unsigned int len = DigestSize;
        if (!c || ::EVP_DigestFinal_ex(c, (unsigned char*)outBuffer, &len) != 1) memset(outBuffer, 0, DigestSize);
    }
}

#endif
