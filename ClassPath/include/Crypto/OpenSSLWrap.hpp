#ifndef hpp_OpenSSLWrap_hpp
#define hpp_OpenSSLWrap_hpp

// We need types
#include "../Types.hpp"

#if (WantSSLCode == 1)
// We need the hasher interface
#include "../Hashing/BaseHash.hpp"

// Forward declare the OpenSSL digest context, so we don't leak OpenSSL headers everywhere
extern "C" { struct evp_md_ctx_st; }

/** The cryptographic primitives wrappers around OpenSSL's libcrypto */
namespace Crypto
{
    /** SHA256 algorithm using OpenSSL.
        It's using the EVP digest interface, so it's not deprecated with OpenSSL 3 */
    struct OSSL_SHA256 : public Hashing::Hasher
    {
    private:
        ::evp_md_ctx_st * c;

    public:
        /** The public size */
        enum { BlockSize = 64, DigestSize = 32 };

    public:
        /** Start the hashing */
        virtual void    Start();
        /** Hash the given buffer */
        virtual void    Hash(const uint8 * buffer, uint32 size);
        /** Finalize the hashing  and store the result */
        virtual void    Finalize(uint8 * outBuffer);
        /** Get the default hash size in byte */
        virtual uint32  hashSize() const throw() { return DigestSize; }

        OSSL_SHA256();
        ~OSSL_SHA256();

    private:
        OSSL_SHA256(const OSSL_SHA256 &);
        OSSL_SHA256 & operator = (const OSSL_SHA256 &);
    };
}

#endif

#endif
