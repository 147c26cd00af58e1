#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <dlinkwm/core/types.h>

namespace dlinkwm::runtime {

inline constexpr uint64_t kWasmPageSize = 64 * 1024;

// First-fit free-list allocator over a reserved region of guest linear memory. Backs the
// host_malloc/host_free imports; offsets are guest addresses, never host pointers.
class GuestHeap {
public:
    struct Options {
        // Explicit start of the region. Unset means the region is appended to the guest's
        // memory at instantiation, after its stack and static data.
        std::optional<uint32_t> base;
        uint32_t size = 1024 * 1024; // bytes reserved for host allocations
        uint32_t alignment = 8;
    };

    // Where the region lands in a memory that is currently `memoryBytes` long, and how many
    // pages the memory has to grow by so the whole region is addressable.
    struct Placement {
        uint32_t base = 0;
        uint64_t growPages = 0;
    };

    struct Stats {
        uint64_t allocations = 0;
        uint64_t frees = 0;
        uint64_t failedAllocations = 0;
        uint32_t bytesInUse = 0;
        uint32_t largestFreeBlock = 0;
    };

    // Places the region immediately when options.base is set; otherwise the heap hands out
    // nothing until assign() is called.
    explicit GuestHeap(Options options);
    explicit GuestHeap() : GuestHeap(Options{}) {}

    GuestHeap(const GuestHeap&) = delete;
    GuestHeap& operator=(const GuestHeap&) = delete;

    // ResourceExhausted when the region does not fit in a 32-bit address space.
    static Result<Placement> plan(const Options& options, uint64_t memoryBytes);

    // Places (or moves) the region at `base`, dropping all live allocations.
    void assign(uint32_t base);

    bool placed() const;

    // Returns the guest offset of a block of at least `size` bytes, or nullopt when the
    // region cannot satisfy the request.
    std::optional<uint32_t> allocate(uint32_t size);

    // Returns false when `offset` was not handed out by allocate (double free, foreign pointer).
    bool release(uint32_t offset);

    // Start of the placed region, nullopt before placement.
    std::optional<uint32_t> base() const;
    // Exclusive end of the placed region, 0 before placement.
    uint64_t regionEnd() const;

    const Options& options() const { return options_; }
    Stats stats() const;

private:
    uint32_t alignUp(uint32_t value) const;

    Options options_;
    mutable std::mutex mutex_;
    std::optional<uint32_t> base_;
    std::map<uint32_t, uint32_t> free_; // offset -> size, coalesced
    std::map<uint32_t, uint32_t> used_; // offset -> size
    Stats stats_;
};

} // namespace dlinkwm::runtime
