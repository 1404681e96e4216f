#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace mediagate {

class AdmissionGate;

// One unit of admission quota. Move-only; gives the slot back exactly once,
// either through release() or on destruction. Co-owns its gate, so a permit
// may outlive whoever created the gate.
class Permit {
public:
    Permit() = default;
    ~Permit();

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;

    // No-op when the permit was already released or moved from.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

private:
    friend class AdmissionGate;
    explicit Permit(std::shared_ptr<AdmissionGate> gate) noexcept : gate_(std::move(gate)) {}

    std::shared_ptr<AdmissionGate> gate_;
};

// Caps the number of heavy operations in flight. Callers that find the gate
// full wait only briefly and are then turned away; nobody queues.
// Must be owned by a shared_ptr before acquire() is called.
class AdmissionGate : public std::enable_shared_from_this<AdmissionGate> {
public:
    explicit AdmissionGate(std::size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    [[nodiscard]] bool tryAcquire(std::chrono::milliseconds wait);

    // Throws CapacityExceeded on denial.
    [[nodiscard]] Permit acquire(std::chrono::milliseconds wait);

    // Throws std::logic_error if nothing is outstanding.
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t outstanding() const;
    [[nodiscard]] std::uint64_t denied() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::size_t outstanding_{0};
    std::uint64_t denied_{0};
};

} // namespace mediagate
