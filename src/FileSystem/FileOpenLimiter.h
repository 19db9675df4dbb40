/**
 * @file FileOpenLimiter.h
 * @brief Back-pressure hook invoked around every underlying open or stat
 *
 * The file system calls acquire() immediately before it opens a file, opens a
 * directory or probes metadata, and release() exactly once afterwards on every
 * exit path. Implementations decide the policy: the stock BoundedFileOpenLimiter
 * caps the number of concurrently open descriptors so parallel consumers do not
 * run into the process' descriptor ulimit.
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace Strata::Core::IO {

class IFileOpenLimiter {
public:
    virtual ~IFileOpenLimiter() = default;

    // Blocks until the caller may open one more file
    virtual void acquire() = 0;
    // Returns a slot obtained by acquire()
    virtual void release() = 0;
};

/**
 * @brief Limiter that never blocks
 */
class NullFileOpenLimiter : public IFileOpenLimiter {
public:
    void acquire() override {}
    void release() override {}
};

/**
 * @brief Counting limiter allowing at most capacity() outstanding acquires
 *
 * acquire() blocks while capacity() slots are held. A capacity of zero is
 * treated as one.
 */
class BoundedFileOpenLimiter : public IFileOpenLimiter {
public:
    static constexpr size_t DefaultCapacity = 32;

    explicit BoundedFileOpenLimiter(size_t capacity = DefaultCapacity);

    void acquire() override;
    void release() override;

    size_t capacity() const noexcept { return _capacity; }
    size_t inFlight() const;

private:
    const size_t _capacity;
    size_t _inFlight = 0;
    mutable std::mutex _mutex;
    std::condition_variable _available;
};

/**
 * @brief RAII acquire/release pair around a single open or stat
 *
 * @code
 * ScopedFileOpen guard(*limiter);
 * int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
 * @endcode
 */
class ScopedFileOpen {
public:
    explicit ScopedFileOpen(IFileOpenLimiter& limiter) : _limiter(limiter) {
        _limiter.acquire();
    }
    ~ScopedFileOpen() { _limiter.release(); }

    ScopedFileOpen(const ScopedFileOpen&) = delete;
    ScopedFileOpen& operator=(const ScopedFileOpen&) = delete;

private:
    IFileOpenLimiter& _limiter;
};

// Returns a limiter for the given capacity: Bounded for capacity > 0, Null otherwise
std::shared_ptr<IFileOpenLimiter> makeFileOpenLimiter(size_t capacity);

} // namespace Strata::Core::IO
