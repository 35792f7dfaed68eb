#pragma once

#include <climits>
#include <cstddef>

#include "UnrolledList/UnrolledListConfig.hpp"

/**
 * @brief 计算一个“胖节点”在给定缓存行预算内最多能容纳多少个元素
 *
 * 节点布局为：占用位图 + capacity 个元素槽 + pointer_count 个链接指针，
 * 返回满足
 *     registry_bytes + capacity * element_size + pointer_count * pointer_size <= cache_line_size
 * 的最大 capacity，且至少为 1（元素本身比缓存行还大时节点只放一个元素）。
 *
 * 公式不计对齐填充，前提是 alignof(T) <= alignof(void*) 且缓存行预算是指针大小的倍数：
 * 此时位图后、槽位后的填充都落在公式留出的余量里，节点实际大小不超过预算
 * （capacity 被抬到 1 的情况除外）。
 * 超对齐的 T（例如 alignas(32)）不满足前提，节点会超出预算。
 */
constexpr std::size_t fatNodeCapacity(std::size_t element_size,
                                      std::size_t pointer_size,
                                      std::size_t pointer_count,
                                      std::size_t registry_bytes,
                                      std::size_t cache_line_size) noexcept {
    const std::size_t overhead = registry_bytes + pointer_size * pointer_count;
    if (element_size == 0 || cache_line_size <= overhead) {
        return 1;
    }
    const std::size_t optimistic = (cache_line_size - overhead) / element_size;
    return optimistic > 0 ? optimistic : 1;
}

// 针对具体元素类型的容量；再按位图宽度截断（每个槽位必须有一位）
template <class T,
          class Registry = UnrolledListConfig::registry_type,
          std::size_t CacheLineSize = UnrolledListConfig::kDefaultCacheLineSize>
struct NodeCapacity {
    static constexpr std::size_t kRegistryBits = sizeof(Registry) * CHAR_BIT;

    static constexpr std::size_t kUnclamped =
        fatNodeCapacity(sizeof(T), sizeof(void*), UnrolledListConfig::kPointerCount,
                        sizeof(Registry), CacheLineSize);

    static constexpr std::size_t value =
        kUnclamped > kRegistryBits ? kRegistryBits : kUnclamped;
};
