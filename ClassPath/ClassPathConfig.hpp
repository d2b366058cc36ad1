/** This file sets up the features to enable in this class path.
    Only the features the parcel tool needs are kept here, read the instructions for each features below */
#ifndef HasClassPathConfig
/** The configuration can be done either by modifying this file, or by building with
    -DHasClassPathConfig=1 -DWantXXX=1 (the CMake build does not, so this file is the reference) */
#define HasClassPathConfig 1

/** If you want the OpenSSL based hashing code (SHA-256 used for chunk checksums), enable this.
    This adds the dependency on OpenSSL's libcrypto library to your application.
    Default: enabled */
#define WantSSLCode 1

/** If you want buffer and stream compression code, enable this.
    This is required for the gzip compressed chunk streams, and adds a dependency on zlib.
    Default: enabled */
#define WantCompression 1

/** By default ClassPath declares its own plain old data types (like uint32, int16 etc...).
    If you're using a project declaring its own types, and you do provide them before including the ClassPath,
    then you'll likely prevent redefinition by defining this option
    Default: disabled */
// #define DontWantTypes 1

/** The size of the in-memory buffer joining the imaging engine and the chunk files, in bytes.
    The producer blocks when it is full, the consumer when it is empty.
    Default: 4MB */
#define BridgeBufferSize (4 * 1024 * 1024)

#endif
