#pragma once

#include <cstddef>
#include <type_traits>

#include "UnrolledList/ScanRangeRegistry.hpp"

// 扫描钩子策略：在每个节点生命周期的两端各调用一次
//   addRange(node, sizeof(node))  : 节点分配之后
//   removeRange(node)             : 节点释放之前
//   touch()                       : 容器构造时，确保钩子背后的全局对象先于容器构造、晚于容器析构

// 默认：不登记任何区间（元素里不会有需要被回收器看到的引用）
struct NoScanHook {
    static constexpr bool kEnabled = false;

    static void touch() noexcept {}
    static void addRange(const void*, std::size_t) noexcept {}
    static void removeRange(const void*) noexcept {}
};

// 把节点区间登记到进程级 ScanRangeRegistry
struct RegistryScanHook {
    static constexpr bool kEnabled = true;

    static void touch() noexcept { ScanRangeRegistry::instance(); }

    static void addRange(const void* base, std::size_t nbytes) {
        ScanRangeRegistry::instance().addRange(base, nbytes);
    }

    static void removeRange(const void* base) noexcept {
        ScanRangeRegistry::instance().removeRange(base);
    }
};

// 只有可能持有引用的元素类型才需要登记；算术类型和枚举里不可能有指针
template <class T>
struct MayHoldReferences
    : std::integral_constant<bool, !(std::is_arithmetic<std::remove_cv_t<T>>::value ||
                                     std::is_enum<std::remove_cv_t<T>>::value)> {};

template <class ScanHook, class T>
struct ShouldAddScanRange
    : std::integral_constant<bool, ScanHook::kEnabled && MayHoldReferences<T>::value> {};
