#include "FileOpenLimiter.h"
#include <algorithm>

namespace Strata::Core::IO {

BoundedFileOpenLimiter::BoundedFileOpenLimiter(size_t capacity)
    : _capacity(std::max<size_t>(capacity, 1)) {
}

void BoundedFileOpenLimiter::acquire() {
    std::unique_lock<std::mutex> lock(_mutex);
    _available.wait(lock, [this] { return _inFlight < _capacity; });
    ++_inFlight;
}

void BoundedFileOpenLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_inFlight > 0) {
            --_inFlight;
        }
    }
    _available.notify_one();
}

size_t BoundedFileOpenLimiter::inFlight() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _inFlight;
}

std::shared_ptr<IFileOpenLimiter> makeFileOpenLimiter(size_t capacity) {
    if (capacity == 0) {
        return std::make_shared<NullFileOpenLimiter>();
    }
    return std::make_shared<BoundedFileOpenLimiter>(capacity);
}

} // namespace Strata::Core::IO
