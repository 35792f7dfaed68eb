#pragma once

#include <cstddef>
#include <cstdint>


class UnrolledListConfig {
public:
    // ---- 编译期常量（节点布局相关）----
    static constexpr std::size_t kDefaultCacheLineSize = 64;  // 节点默认装入一条 64B 缓存行
    static constexpr std::size_t kPointerCount         = 2;   // prev + next

    // 占用位图所用的整数类型：每个槽位一位，因此也限制了单节点容量上限
    using registry_type = std::uint16_t;

    UnrolledListConfig() = delete;
};
