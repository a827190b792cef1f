#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <type_traits>

namespace interleaf
{
// Wait-free single-producer/single-consumer triple buffer.
// The writer fills its back slot and publishes it; the reader swaps the freshest
// published slot into its front slot. Neither side ever sees a slot the other is
// writing, so a snapshot is always read whole.
template <typename T>
class SnapshotExchange
{
public:
    static_assert(std::is_trivially_copyable<T>::value, "Snapshots must be trivially copyable");

    explicit SnapshotExchange(const T& initial = T {})
    {
        slots.fill(initial);
    }

    // Writer side.
    T& getWriteSlot() { return slots[static_cast<size_t>(backIndex)]; }

    void publish()
    {
        const int previous = middle.exchange(backIndex | kFreshBit, std::memory_order_acq_rel);
        backIndex = previous & kIndexMask;
    }

    void publish(const T& value)
    {
        getWriteSlot() = value;
        publish();
    }

    // Reader side. Returns true when a newer snapshot became current.
    bool acquire()
    {
        if ((middle.load(std::memory_order_relaxed) & kFreshBit) == 0)
            return false;

        const int previous = middle.exchange(frontIndex, std::memory_order_acq_rel);
        frontIndex = previous & kIndexMask;
        return true;
    }

    const T& current() const { return slots[static_cast<size_t>(frontIndex)]; }

private:
    static constexpr int kIndexMask = 0x3;
    static constexpr int kFreshBit = 0x4;

    std::array<T, 3> slots {};
    int frontIndex = 0;
    std::atomic<int> middle { 1 };
    int backIndex = 2;
};
} // namespace interleaf
