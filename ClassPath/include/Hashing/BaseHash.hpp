#ifndef hpp_CPP_BaseHash_CPP_hpp
#define hpp_CPP_BaseHash_CPP_hpp

// We need type declaration
#include "../Types.hpp"

/** All cryptographic hash functions interfaces are defined here.
    The implementations come from a cryptographic library (see Crypto::OSSL_SHA256) */
namespace Hashing
{
    /** This structure define the interface each hashing algorithm must respect

        Using this any hasher is the same :
        @code
            Crypto::OSSL_SHA256 hasher;
            // Prepare the context
            hasher.Start();
            // Hash the given buffer (as many times as required)
            hasher.Hash(myBuffer, myBufferSize);
            // Finally get the result
            hasher.Finalize((uint8*)result);
        @endcode
    */
    struct Hasher
    {
    public:
        /** Start the hashing */
        virtual void    Start() = 0;
        /** Hash the given buffer */
        virtual void    Hash(const uint8 * buffer, uint32 size) = 0;
        /** Finalize the hashing and store the result (hashSize() bytes) */
        virtual void    Finalize(uint8 * outBuffer) = 0;
        /** Get the default hash size in byte */
        virtual uint32  hashSize() const throw() = 0;
        /** Constructor */
        Hasher(){}
        /** Destructor */
        virtual ~Hasher(){}
    };
}

#endif
