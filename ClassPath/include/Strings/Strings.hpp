#ifndef hpp_Strings_hpp
#define hpp_Strings_hpp

// We need types
#include "../Types.hpp"
// We need std::string for the storage
#include <string>
// We need map for the string map
#include <map>


/** UTF-8 strings helpers.
    FastString is a std::string, and the usual string manipulation (search from first or last needle,
    trimming, printf like formatting) is provided by free functions in this namespace. */
namespace Strings
{
    /** Define the FastString type */
    typedef std::string FastString;

    typedef char const * const tCharPtr;

    /** Find the length of the given C string, limited to the given size if non zero */
    unsigned int findLength(tCharPtr, const size_t limit = 0);

    /** Printf-like formatting into a FastString */
    FastString Print(const char * format, ...)
#if defined(__GNUC__)
        __attribute__ ((format (printf, 1, 2)))
#endif
        ;
    /** Same as Print, with a va_list */
    FastString vPrint(const char * format, va_list argp);

    /** Trim the string from any char in the given array (both direction) */
    FastString Trimmed(const FastString & text, const char * chars = " \t\r\n");
    /** Get the string from the first occurrence of the given string.
        If not found, it returns an empty string if includeFind is false, or the whole string if true
        @code
            fromFirst("abcdefdef", "d") == "efdef"
            fromFirst("abcdefdef", "d", true) == "defdef"
        @endcode */
    FastString fromFirst(const FastString & text, const FastString & find, const bool includeFind = false);
    /** Get the string from the last occurrence of the given string.
        If not found, it returns an empty string if includeFind is false, or the whole string if true */
    FastString fromLast(const FastString & text, const FastString & find, const bool includeFind = false);
    /** Get the string up to the first occurrence of the given string.
        If not found, it returns the whole string unless includeFind is true (empty string in that case) */
    FastString upToFirst(const FastString & text, const FastString & find, const bool includeFind = false);
    /** Get the string up to the last occurrence of the given string.
        If not found, it returns the whole string unless includeFind is true (empty string in that case) */
    FastString upToLast(const FastString & text, const FastString & find, const bool includeFind = false);
    /** Split a string at the first occurrence of the needle.
        @return the part before the needle (or the whole text if not found), and the text is updated to start after the needle */
    FastString splitUpTo(FastString & text, const FastString & find);
    /** Replace all occurrence of the given needle with the replacement */
    FastString replaceAll(const FastString & text, const FastString & find, const FastString & replacement);
    /** Check if the text starts with the given prefix */
    inline bool startsWith(const FastString & text, const FastString & prefix) { return text.compare(0, prefix.size(), prefix) == 0; }
    /** Check if the text ends with the given suffix */
    inline bool endsWith(const FastString & text, const FastString & suffix) { return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0; }
    /** Find first char that's not in the given set of chars
        @return the position of the char, or -1 if all chars are in the set */
    int invFindAnyChar(const FastString & text, const char * chars, unsigned int pos = 0);

    /** Parse an unsigned decimal integer.
        @param text    The text to parse, must only contain digits
        @param value   On output, the parsed value
        @return false if the text is empty, contains any other char, or overflow */
    bool parseUnsigned(const FastString & text, uint64 & value);

    /** Convert a binary buffer to a lowercase hexadecimal string */
    FastString toHex(const uint8 * data, const size_t size);

    /** A class containing an array of strings, and allowing some juicy features
        like joining the array into a single string or splitting a string in an array. */
    template <class T>
    class StringArrayT
    {
        // Type definition and enumeration
    public:
        /** The pointer to the string array */
        typedef T *     TPtr;
        // Members
    private:
        /** The array */
        TPtr *      array;
        /** The actual usage */
        size_t      currentSize;
        /** The array allocation size */
        size_t      allocatedSize;
        // Helpers
    private:
        /** Reset the vector to its initial state (doesn't perform destruction of data) */
        inline void Reset() { currentSize = 0; allocatedSize = 0; array = 0; }
        /** Enlarge the array */
        inline void Enlarge(size_t amount = 0)
        {
            if (!amount) amount = allocatedSize ? allocatedSize + (allocatedSize >> 1) : 2;
            size_t newAllocatedSize = allocatedSize + amount;
            TPtr * newArray = (TPtr*)realloc(array, newAllocatedSize * sizeof(array[0]));
            if (!newArray) { Clear(); return; }
            memset(&newArray[currentSize], 0, (newAllocatedSize - currentSize) * sizeof(newArray[0]));
            array = newArray;
            allocatedSize = newAllocatedSize;
        }
        /** Default element */
        static T & getDefaultElement() { static T elem; elem = T(); return elem; }
        // Array interface
    public:
        /** Clear the array, and destruct any remaining objects */
        inline void Clear() { for(size_t i = 0; i < currentSize; i++) delete array[i]; free(array); Reset(); }
        /** Append an element to the end of the array */
        inline void Append(const T & ref) { if (currentSize+1 >= allocatedSize) Enlarge(); if (array) array[currentSize++] = new T(ref); }
        /** Remove an object from the array
            @param index Zero based index of the object to remove */
        inline void Remove(size_t index)
        {
            if (index >= currentSize) return;
            delete array[index];
            memmove(&array[index], &array[index+1], (currentSize - index - 1) * sizeof(array[0]));
            array[--currentSize] = 0;
        }
        /** Classic copy operator */
        inline const StringArrayT& operator = (const StringArrayT & other)
        {
            if (&other == this) return *this;
            Clear();
            for(size_t i = 0; i < other.currentSize; i++) Append(*other.array[i]);
            return *this;
        }
        /** Access size member */
        inline size_t getSize() const { return currentSize; }
        /** Access operator
            @param index The position in the array
            @return the index-th element if index is in bound, or an empty string in the other case */
        inline const T & operator [] (size_t index) const { return index < currentSize ? *array[index] : getDefaultElement(); }
        /** Search operator
            @param objectToSearch   The object to look for in the array
            @param fromPos          The position to start from
            @return the element index of the given element or getSize() if not found. */
        inline size_t indexOf(const T & objectToSearch, const size_t fromPos = 0) const { for (size_t i = fromPos; i < currentSize; i++) if (*array[i] == objectToSearch) return i; return currentSize; }
        /** Search operator, tells if it contains the given content or not */
        inline bool Contains(const T & objectToSearch, const size_t fromPos = 0) const { return indexOf(objectToSearch, fromPos) != currentSize; }
        /** Look up the first element starting with the given prefix
            @return the element index or getSize() if not found */
        inline size_t lookUp(const T & prefix, const size_t fromPos = 0) const { for (size_t i = fromPos; i < currentSize; i++) if (startsWith(*array[i], prefix)) return i; return currentSize; }
        /** Extract the given range [from, to) in a new array */
        inline StringArrayT Extract(const size_t from, const size_t to) const { StringArrayT ret; for (size_t i = from; i < min(to, currentSize); i++) ret.Append(*array[i]); return ret; }
        // Our specific interface
    public:
        /** Join the array in a big string, using the given separator */
        inline T Join(const T & separator = "\n") const { T ret; for (size_t i = 0; i < currentSize; i++) { if (i) ret += separator; ret += *array[i]; } return ret; }
        /** Split the given text on any char in the given set, dropping empty parts */
        inline void appendSplit(const T & text, const char * separators = " \t")
        {
            size_t pos = 0;
            while (pos < text.size())
            {
                size_t start = text.find_first_not_of(separators, pos);
                if (start == T::npos) break;
                size_t end = text.find_first_of(separators, start);
                if (end == T::npos) end = text.size();
                Append(text.substr(start, end - start));
                pos = end;
            }
        }

        // Construction and destruction
    public:
        /** Default constructor */
        StringArrayT() : array(0), currentSize(0), allocatedSize(0) {}
        /** Construct from a single element */
        StringArrayT(const T & element) : array(0), currentSize(0), allocatedSize(0) { Append(element); }
        /** Construct from a C array (like the main's argument) */
        StringArrayT(char ** argv, const size_t argc) : array(0), currentSize(0), allocatedSize(0) { for (size_t i = 0; i < argc; i++) Append(T(argv[i])); }
        /** Copy constructor */
        StringArrayT(const StringArrayT & other) : array(0), currentSize(0), allocatedSize(0) { *this = other; }
        /** Destructor */
        ~StringArrayT() { Clear(); }
    };

    /** The usual string array */
    typedef StringArrayT<FastString> StringArray;

    /** A simple key/value string map, used for storing the parsed options */
    class StringMap
    {
        // Members
    private:
        /** The storage */
        std::map<FastString, FastString> map;

        // Interface
    public:
        /** Store a value for the given key
            @param key       The key to store
            @param value     The value to store
            @param replace   If false, an existing key is not replaced
            @return false if the key exists and replace is false */
        bool storeValue(const FastString & key, const FastString & value, const bool replace = true)
        {
            if (!replace && map.find(key) != map.end()) return false;
            map[key] = value;
            return true;
        }
        /** Get the value for the given key
            @return A pointer on the value, or 0 if not found */
        const FastString * operator[] (const FastString & key) const
        {
            std::map<FastString, FastString>::const_iterator it = map.find(key);
            return it == map.end() ? 0 : &it->second;
        }
        /** Get the value for the given key, or the given default value */
        FastString getValue(const FastString & key, const FastString & defaultValue = "") const
        {
            const FastString * value = (*this)[key];
            return value ? *value : defaultValue;
        }
        /** Clear the map */
        void Clear() { map.clear(); }
    };
}

#endif
