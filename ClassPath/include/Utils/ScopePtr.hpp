#ifndef hpp_ScopedPointer_hpp
#define hpp_ScopedPointer_hpp

// We need ForcedInline declaration
#include "../Types.hpp"

namespace Utils
{
    /** Usual scope pointer class with operator overloading.
        A ScopePtr stores a pointer and deletes it when it's deleted (usually when it goes out of scope).
        Use it like a pointer, thanks to operator overloading.
        It can't be copied, call Forget() to take the object out of it. */
    template <class T>
    class ScopePtr
    {
        // Members
    private:
        /** The pointer object*/
        T *         pointer;

        // Operators
    public:
        /** Assignment operator
            @warning This own the object passed in, and delete the previous one */
        ForcedInline(ScopePtr& operator = (T* const ownPtr))
        {
            if (pointer != ownPtr) { T * prev = pointer; pointer = ownPtr; delete prev; }
            return *this;
        }
        /** All classical pointer overload */
        ForcedInline(operator T*() const throw())                              { return pointer; }
        ForcedInline(T& operator*() const throw())                             { return *pointer; }
        ForcedInline(T* operator->() const throw())                            { return pointer; }

        // Interface
    public:
        /** Forget the object owned (don't delete it)
            The internal pointer is reset to 0.
            @return The pointer to the object */
        ForcedInline(T * Forget()) { T * p = pointer; pointer = 0; return p; }

        // Construction
    public:
        /** Own the given object */
        ForcedInline(ScopePtr(T* const ownPtr = 0)) : pointer (ownPtr)    { }
        /** Destructor */
        ForcedInline(~ScopePtr())                                         { delete pointer; }

    private:
        ScopePtr(const ScopePtr &);
        ScopePtr & operator = (const ScopePtr &);
    };
}


#endif
