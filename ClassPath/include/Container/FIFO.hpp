#ifndef hpp_CPP_FIFO_CPP_hpp
#define hpp_CPP_FIFO_CPP_hpp

// Need global definitions
#include "../Types.hpp"
// Need locks and events
#include "../Threading/Lock.hpp"

/** Stack implementations */
namespace Stack
{
    /** A bounded, thread safe, FIFO of bytes.
        This is used to join a producer thread and a consumer thread.
        The producer blocks in Push when the FIFO is full, the consumer blocks in Pop when it's empty.

        The producer signals the end of the stream with Close, and the consumer gets the remaining bytes
        then a zero sized Pop.
        Either side can Cancel the FIFO, and any waiting side is woken up and fails.

        @code
            Stack::BoundedFIFO fifo(4096);
            // Producer thread
            while (read something) if (!fifo.Push(buffer, size)) break; // Cancelled
            fifo.Close();
            // Consumer thread
            uint32 size = 0;
            while ((size = fifo.Pop(buffer, sizeof(buffer))) > 0) consume(buffer, size);
            if (fifo.isCancelled()) ...
        @endcode */
    class BoundedFIFO
    {
        // Members
    private:
        /** The ring buffer */
        uint8 *                     array;
        /** The ring buffer capacity */
        const uint32                capacity;
        /** The read position */
        uint32                      readPos;
        /** The number of bytes in the ring */
        uint32                      used;
        /** Set when the producer has finished */
        bool                        closed;
        /** Set when the transfer was cancelled */
        bool                        cancelled;
        /** The lock protecting the members above */
        Threading::Lock             lock;
        /** Signaled when some data was pushed */
        Threading::Event            dataAvailable;
        /** Signaled when some space was freed */
        Threading::Event            spaceAvailable;

        // Interface
    public:
        /** Push the given buffer in the FIFO, waiting for space if required.
            @return false if the FIFO was cancelled or closed (not all bytes might have been pushed) */
        bool Push(const uint8 * buffer, uint32 size)
        {
            while (size)
            {
                {
                    Threading::ScopedLock scope(lock);
                    if (cancelled || closed || !array) return false;
                    if (used < capacity)
                    {
                        uint32 writePos = (readPos + used) % capacity;
                        uint32 chunk = min(size, min(capacity - used, capacity - writePos));
                        memcpy(&array[writePos], buffer, chunk);
                        used += chunk; buffer += chunk; size -= chunk;
                        dataAvailable.Set();
                        continue;
                    }
                }
                spaceAvailable.Wait();
            }
            return true;
        }
        /** Pop at most the given size from the FIFO, waiting for data if required.
            @return the number of bytes popped, 0 on end of stream or on cancellation (check isCancelled) */
        uint32 Pop(uint8 * buffer, const uint32 size)
        {
            while (size)
            {
                {
                    Threading::ScopedLock scope(lock);
                    if (cancelled || !array) return 0;
                    if (used)
                    {
                        uint32 ret = 0;
                        while (used && ret < size)
                        {
                            uint32 chunk = min(size - ret, min(used, capacity - readPos));
                            memcpy(&buffer[ret], &array[readPos], chunk);
                            readPos = (readPos + chunk) % capacity; used -= chunk; ret += chunk;
                        }
                        spaceAvailable.Set();
                        return ret;
                    }
                    if (closed) return 0;
                }
                dataAvailable.Wait();
            }
            return 0;
        }
        /** Close the FIFO, the consumer will get the remaining data and then an end of stream */
        void Close()
        {
            Threading::ScopedLock scope(lock);
            closed = true;
            dataAvailable.Set();
        }
        /** Cancel the FIFO, both side are woken up and fail */
        void Cancel()
        {
            Threading::ScopedLock scope(lock);
            cancelled = true;
            dataAvailable.Set();
            spaceAvailable.Set();
        }
        /** Check if the FIFO was cancelled */
        bool isCancelled() const { Threading::ScopedLock scope(const_cast<Threading::Lock&>(lock)); return cancelled; }
        /** Check if the ring buffer could be allocated */
        bool isValid() const { return array != 0; }

        // Construction and destruction
    public:
        /** Build a FIFO with the given capacity in bytes */
        BoundedFIFO(const uint32 capacity)
            : array(new (std::nothrow) uint8[capacity ? capacity : 1]), capacity(capacity ? capacity : 1), readPos(0), used(0), closed(false), cancelled(false),
              lock("fifo"), dataAvailable("fifo data", Threading::Event::AutoReset), spaceAvailable("fifo space", Threading::Event::AutoReset) {}
        ~BoundedFIFO() { deleteA0(array); }

    private:
        BoundedFIFO(const BoundedFIFO &);
        BoundedFIFO & operator = (const BoundedFIFO &);
    };
}

#endif
