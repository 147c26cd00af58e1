#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <dlinkwm/runtime/guest_heap.h>

namespace dlinkwm::runtime {

namespace {
constexpr uint64_t kAddressSpace = 0x100000000ull;
}

GuestHeap::GuestHeap(Options options) : options_(options) {
    if (options_.alignment == 0 || (options_.alignment & (options_.alignment - 1)) != 0) {
        options_.alignment = 8;
    }
    if (options_.base) {
        assign(*options_.base);
    }
}

Result<GuestHeap::Placement> GuestHeap::plan(const Options& options, uint64_t memoryBytes) {
    Placement out;
    uint64_t end = 0;
    if (options.base) {
        out.base = *options.base;
        end = static_cast<uint64_t>(out.base) + options.size;
        if (end > kAddressSpace) {
            return Error{ErrorCode::ResourceExhausted,
                         "Heap region [" + std::to_string(out.base) + ", " +
                             std::to_string(end) + ") exceeds the 32-bit address space"};
        }
        if (end > memoryBytes) {
            out.growPages = (end - memoryBytes + kWasmPageSize - 1) / kWasmPageSize;
        }
        return out;
    }

    // Append after the current end; the guest's own memory.grow calls land after the region
    const uint64_t start = (memoryBytes + kWasmPageSize - 1) / kWasmPageSize * kWasmPageSize;
    out.growPages = (static_cast<uint64_t>(options.size) + kWasmPageSize - 1) / kWasmPageSize;
    end = start + out.growPages * kWasmPageSize;
    if (end > kAddressSpace) {
        return Error{ErrorCode::ResourceExhausted,
                     "No room for a " + std::to_string(options.size) +
                         " byte heap after " + std::to_string(memoryBytes) +
                         " bytes of guest memory"};
    }
    out.growPages += (start - memoryBytes + kWasmPageSize - 1) / kWasmPageSize;
    out.base = static_cast<uint32_t>(start);
    return out;
}

void GuestHeap::assign(uint32_t base) {
    std::lock_guard<std::mutex> lk(mutex_);
    free_.clear();
    used_.clear();
    stats_.bytesInUse = 0;
    base_ = base;

    // Offset 0 is the allocation-failure sentinel seen by guests
    uint32_t start = alignUp(std::max(base, options_.alignment));
    uint64_t end = std::min<uint64_t>(static_cast<uint64_t>(base) + options_.size,
                                      kAddressSpace - 1);
    if (end > start) {
        free_.emplace(start, static_cast<uint32_t>(end - start));
    }
}

bool GuestHeap::placed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return base_.has_value();
}

std::optional<uint32_t> GuestHeap::base() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return base_;
}

uint64_t GuestHeap::regionEnd() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return base_ ? static_cast<uint64_t>(*base_) + options_.size : 0;
}

uint32_t GuestHeap::alignUp(uint32_t value) const {
    const uint64_t a = options_.alignment;
    uint64_t v = (static_cast<uint64_t>(value) + a - 1) & ~(a - 1);
    return v > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<uint32_t>(v);
}

std::optional<uint32_t> GuestHeap::allocate(uint32_t size) {
    std::lock_guard<std::mutex> lk(mutex_);
    const uint32_t need = alignUp(std::max<uint32_t>(size, 1));
    for (auto it = free_.begin(); it != free_.end(); ++it) {
        if (it->second < need) {
            continue;
        }
        const uint32_t offset = it->first;
        const uint32_t remaining = it->second - need;
        free_.erase(it);
        if (remaining > 0) {
            free_.emplace(offset + need, remaining);
        }
        used_.emplace(offset, need);
        stats_.allocations++;
        stats_.bytesInUse += need;
        return offset;
    }
    stats_.failedAllocations++;
    if (!base_) {
        spdlog::debug("[GuestHeap] allocation of {} bytes before the region was placed", size);
    } else {
        spdlog::debug("[GuestHeap] allocation of {} bytes failed ({} bytes in use)", size,
                      stats_.bytesInUse);
    }
    return std::nullopt;
}

bool GuestHeap::release(uint32_t offset) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = used_.find(offset);
    if (it == used_.end()) {
        return false;
    }
    uint32_t start = it->first;
    uint32_t len = it->second;
    used_.erase(it);
    stats_.frees++;
    stats_.bytesInUse -= len;

    // Coalesce with the following block
    auto next = free_.lower_bound(start);
    if (next != free_.end() && start + len == next->first) {
        len += next->second;
        next = free_.erase(next);
    }
    // Coalesce with the preceding block
    if (next != free_.begin()) {
        auto prev = std::prev(next);
        if (prev->first + prev->second == start) {
            start = prev->first;
            len += prev->second;
            free_.erase(prev);
        }
    }
    free_.emplace(start, len);
    return true;
}

GuestHeap::Stats GuestHeap::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    Stats s = stats_;
    s.largestFreeBlock = 0;
    for (const auto& [off, len] : free_) {
        s.largestFreeBlock = std::max(s.largestFreeBlock, len);
    }
    return s;
}

} // namespace dlinkwm::runtime
