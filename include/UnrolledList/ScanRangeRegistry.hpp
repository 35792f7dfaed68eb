#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_map>

/**
 * ScanRangeRegistry
 * ------------------------------------------------------------------
 * 进程级的“需要被扫描的内存区间”登记表。
 * 追踪式回收器在标记阶段遍历这里登记的每个区间，把其中的字当作潜在引用。
 * 容器在节点分配后登记、释放前注销，二者严格成对。
 */
class ScanRangeRegistry {
public:
    static ScanRangeRegistry& instance() noexcept;

    void        addRange(const void* base, std::size_t nbytes);
    void        removeRange(const void* base) noexcept;

    // 状态查询
    bool        contains(const void* ptr) const noexcept;     // ptr 是否落在某个已登记区间内
    std::size_t rangeCount() const noexcept;
    std::size_t registeredBytes() const noexcept;

    ScanRangeRegistry(const ScanRangeRegistry&)            = delete;
    ScanRangeRegistry& operator=(const ScanRangeRegistry&) = delete;
    ScanRangeRegistry(ScanRangeRegistry&&)                 = delete;
    ScanRangeRegistry& operator=(ScanRangeRegistry&&)      = delete;

private:
    ScanRangeRegistry() = default;
    ~ScanRangeRegistry() = default;

    mutable std::mutex lock_;
    std::unordered_map<const void*, std::size_t> ranges_;   // base -> 字节数
    std::size_t registered_bytes_ = 0;
};
