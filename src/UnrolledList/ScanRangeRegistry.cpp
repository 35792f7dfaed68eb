#include "UnrolledList/ScanRangeRegistry.hpp"

#include <cstdint>
#include <cstdio>

ScanRangeRegistry& ScanRangeRegistry::instance() noexcept {
    static ScanRangeRegistry registry;
    return registry;
}

void ScanRangeRegistry::addRange(const void* base, std::size_t nbytes) {
    if (base == nullptr || nbytes == 0) {
        return;
    }

    std::lock_guard<std::mutex> guard(lock_);

    auto result = ranges_.emplace(base, nbytes);
    if (!result.second) {
        // 同一基址重复登记：以最新长度为准
        registered_bytes_ -= result.first->second;
        result.first->second = nbytes;
    }
    registered_bytes_ += nbytes;
}

void ScanRangeRegistry::removeRange(const void* base) noexcept {
    if (base == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> guard(lock_);

    auto it = ranges_.find(base);
    if (it == ranges_.end()) {
        fprintf(stderr, "Error: Attempted to remove a scan range that was never registered (%p).\n", base);
        return;
    }

    registered_bytes_ -= it->second;
    ranges_.erase(it);
}

bool ScanRangeRegistry::contains(const void* ptr) const noexcept {
    std::lock_guard<std::mutex> guard(lock_);

    const auto p = reinterpret_cast<std::uintptr_t>(ptr);
    for (const auto& entry : ranges_) {
        const auto begin = reinterpret_cast<std::uintptr_t>(entry.first);
        if (p >= begin && p - begin < entry.second) {
            return true;
        }
    }
    return false;
}

std::size_t ScanRangeRegistry::rangeCount() const noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    return ranges_.size();
}

std::size_t ScanRangeRegistry::registeredBytes() const noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    return registered_bytes_;
}
