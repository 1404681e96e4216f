#include "mediagate/admission_gate.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <stdexcept>
#include <utility>

namespace mediagate {

Permit::~Permit() { release(); }

Permit::Permit(Permit&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
    }
    return *this;
}

void Permit::release() noexcept {
    std::shared_ptr<AdmissionGate> gate = std::exchange(gate_, nullptr);
    if (!gate) {
        return;
    }
    try {
        gate->release();
    } catch (const std::exception& ex) {
        logger()->error("permit release failed: {}", ex.what());
    }
}

AdmissionGate::AdmissionGate(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("admission capacity must be at least 1");
    }
}

bool AdmissionGate::tryAcquire(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool granted = slot_freed_.wait_for(lock, wait, [this] { return outstanding_ < capacity_; });
    if (!granted) {
        ++denied_;
        return false;
    }
    ++outstanding_;
    return true;
}

Permit AdmissionGate::acquire(std::chrono::milliseconds wait) {
    if (!tryAcquire(wait)) {
        logger()->warn("admission denied: {} of {} slots in use", outstanding(), capacity_);
        throw CapacityExceeded(capacity_);
    }
    return Permit{shared_from_this()};
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ == 0) {
            throw std::logic_error("admission release without a matching acquire");
        }
        --outstanding_;
    }
    slot_freed_.notify_one();
}

std::size_t AdmissionGate::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

std::uint64_t AdmissionGate::denied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return denied_;
}

} // namespace mediagate
