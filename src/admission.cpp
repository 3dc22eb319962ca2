#include "admission.hpp"
#include <stdexcept>

namespace codebox {
using namespace std;

admission_permit::admission_permit(admission_gate *gate) : gate(gate) {}

admission_permit::admission_permit(admission_permit &&other) noexcept : gate(other.gate) {
    other.gate = nullptr;
}

admission_permit::~admission_permit() {
    if (gate) gate->release();
}

admission_gate::admission_gate(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) throw invalid_argument("admission gate capacity must be positive");
}

admission_permit admission_gate::acquire() {
    unique_lock<mutex> lock(mut);
    cv.wait(lock, [this] { return used < capacity_; });
    ++used;
    return admission_permit(this);
}

optional<admission_permit> admission_gate::try_acquire() {
    lock_guard<mutex> lock(mut);
    if (used >= capacity_) return nullopt;
    ++used;
    return admission_permit(this);
}

size_t admission_gate::in_use() const {
    lock_guard<mutex> lock(mut);
    return used;
}

size_t admission_gate::capacity() const {
    return capacity_;
}

bool admission_gate::saturated() const {
    lock_guard<mutex> lock(mut);
    return used >= capacity_;
}

void admission_gate::release() {
    {
        lock_guard<mutex> lock(mut);
        --used;
    }
    cv.notify_one();
}

}  // namespace codebox
