#include "worker/slot_pool.hpp"
#include <stdexcept>

namespace dcx::worker {
using namespace std;

slot_pool::slot_pool(int capacity) : total(capacity), free(capacity) {
    if (capacity <= 0) throw invalid_argument("capacity should be positive");
}

void slot_pool::acquire() {
    unique_lock<mutex> lock(mut);
    cv.wait(lock, [this] { return free > 0; });
    --free;
}

bool slot_pool::try_acquire() {
    scoped_lock guard(mut);
    if (free == 0) return false;
    --free;
    return true;
}

void slot_pool::release() {
    {
        scoped_lock guard(mut);
        if (free < total) ++free;
    }
    cv.notify_one();
}

int slot_pool::capacity() const {
    return total;
}

int slot_pool::available() const {
    scoped_lock guard(mut);
    return free;
}

slot_guard::slot_guard(slot_pool &pool) : pool(pool) {}

slot_guard::~slot_guard() {
    pool.release();
}

}  // namespace dcx::worker
