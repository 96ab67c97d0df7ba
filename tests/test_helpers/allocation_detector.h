#pragma once
// ==============================================================================
// Allocation Detector
// ==============================================================================
// Counts heap allocations while a scope is being tracked. Used to verify that
// the audio path stays allocation-free.
//
// The detector only counts. A test executable that wants counting links one
// translation unit that replaces the global operator new and calls
// AllocationDetector::instance().recordAllocation() from it.
// ==============================================================================

#include <atomic>
#include <cstddef>

namespace TestHelpers {

// ==============================================================================
// Allocation Tracking
// ==============================================================================

class AllocationDetector {
public:
    AllocationDetector() = default;

    void startTracking() {
        allocationCount_.store(0, std::memory_order_relaxed);
        tracking_.store(true, std::memory_order_release);
    }

    size_t stopTracking() {
        tracking_.store(false, std::memory_order_release);
        return allocationCount_.load(std::memory_order_acquire);
    }

    bool isTracking() const {
        return tracking_.load(std::memory_order_acquire);
    }

    size_t getAllocationCount() const {
        return allocationCount_.load(std::memory_order_acquire);
    }

    // Called by the replaced operator new
    void recordAllocation() {
        if (tracking_.load(std::memory_order_acquire)) {
            allocationCount_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static AllocationDetector& instance() {
        static AllocationDetector detector;
        return detector;
    }

private:
    std::atomic<bool> tracking_{false};
    std::atomic<size_t> allocationCount_{0};
};

// ==============================================================================
// RAII Tracking Scope
// ==============================================================================

class AllocationScope {
public:
    AllocationScope() {
        AllocationDetector::instance().startTracking();
    }

    ~AllocationScope() {
        stop();
    }

    /// Ends tracking early; the destructor then does nothing.
    size_t stop() {
        if (!stopped_) {
            count_ = AllocationDetector::instance().stopTracking();
            stopped_ = true;
        }
        return count_;
    }

    size_t getAllocationCount() const {
        return count_;
    }

    bool hadAllocations() const {
        return count_ > 0;
    }

private:
    size_t count_ = 0;
    bool stopped_ = false;
};

} // namespace TestHelpers
