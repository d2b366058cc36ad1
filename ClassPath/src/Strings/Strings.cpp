// We need our declaration
#include "../../include/Strings/Strings.hpp"

namespace Strings
{
    unsigned int findLength(tCharPtr text, const size_t limit)
    {
        if (!text) return 0;
        if (limit) { const char * end = (const char*)memchr(text, 0, limit); return end ? (unsigned int)(end - text) : (unsigned int)limit; }
        return (unsigned int)strlen(text);
    }

    FastString vPrint(const char * format, va_list argp)
    {
        // Start with a reasonable size, and double it until it fits
        int size = 256;
        while (size > 0)
        {
            char * buffer = (char*)malloc(size);
            if (!buffer) return FastString();
            va_list copy;
            va_copy(copy, argp);
            int ret = vsnprintf(buffer, size, format, copy);
            va_end(copy);
            if (ret < 0) { free(buffer); return FastString(); }
            if (ret < size)
            {
                FastString result(buffer, ret);
                free(buffer);
                return result;
            }
            free(buffer);
            size = ret + 1;
        }
        return FastString();
    }

    FastString Print(const char * format, ...)
    {
        va_list argp;
        va_start(argp, format);
        FastString ret = vPrint(format, argp);
        va_end(argp);
        return ret;
    }

    FastString Trimmed(const FastString & text, const char * chars)
    {
        size_t start = text.find_first_not_of(chars);
        if (start == FastString::npos) return FastString();
        size_t end = text.find_last_not_of(chars);
        return text.substr(start, end - start + 1);
    }

    FastString fromFirst(const FastString & text, const FastString & find, const bool includeFind)
    {
        size_t pos = text.find(find);
        if (pos == FastString::npos) return includeFind ? text : FastString();
        return text.substr(includeFind ? pos : pos + find.size());
    }

    FastString fromLast(const FastString & text, const FastString & find, const bool includeFind)
    {
        size_t pos = text.rfind(find);
        if (pos == FastString::npos) return includeFind ? text : FastString();
        return text.substr(includeFind ? pos : pos + find.size());
    }

    FastString upToFirst(const FastString & text, const FastString & find, const bool includeFind)
    {
        size_t pos = text.find(find);
        if (pos == FastString::npos) return includeFind ? FastString() : text;
        return text.substr(0, includeFind ? pos + find.size() : pos);
    }

    FastString upToLast(const FastString & text, const FastString & find, const bool includeFind)
    {
        size_t pos = text.rfind(find);
        if (pos == FastString::npos) return includeFind ? FastString() : text;
        return text.substr(0, includeFind ? pos + find.size() : pos);
    }

    FastString splitUpTo(FastString & text, const FastString & find)
    {
        size_t pos = text.find(find);
        if (pos == FastString::npos) { FastString ret; ret.swap(text); return ret; }
        FastString ret = text.substr(0, pos);
        text.erase(0, pos + find.size());
        return ret;
    }

    FastString replaceAll(const FastString & text, const FastString & find, const FastString & replacement)
    {
        if (find.empty()) return text;
        FastString ret;
        size_t last = 0, pos = 0;
        while ((pos = text.find(find, last)) != FastString::npos)
        {
            ret.append(text, last, pos - last);
            ret += replacement;
            last = pos + find.size();
        }
        ret.append(text, last, FastString::npos);
        return ret;
    }

    int invFindAnyChar(const FastString & text, const char * chars, unsigned int pos)
    {
        size_t found = text.find_first_not_of(chars, pos);
        return found == FastString::npos ? -1 : (int)found;
    }

    bool parseUnsigned(const FastString & text, uint64 & value)
    {
        if (text.empty() || invFindAnyChar(text, "0123456789") != -1) return false;
        uint64 ret = 0;
        for (size_t i = 0; i < text.size(); i++)
        {
            uint64 digit = (uint64)(text[i] - '0');
            if (ret > (UINT64_MAX - digit) / 10) return false;
            ret = ret * 10 + digit;
        }
        value = ret;
        return true;
    }

    FastString toHex(const uint8 * data, const size_t size)
    {
        static const char hexChars[] = "0123456789abcdef";
        FastString ret(size * 2, '0');
        for (size_t i = 0; i < size; i++)
        {
            ret[i * 2]     = hexChars[data[i] >> 4];
            ret[i * 2 + 1] = hexChars[data[i] & 0xF];
        }
        return ret;
    }
}
