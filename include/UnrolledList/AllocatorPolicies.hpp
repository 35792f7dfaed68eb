#pragma once

#include <new>
#include <utility>

// 节点分配策略：容器只通过 allocate<T>/deallocate<T> 这两个静态入口申请和归还节点。
// 分配失败直接以异常形式向上传播，容器本身不做重试。

// 默认策略：标准的 new/delete
struct StandardAllocPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        return new T(std::forward<Args>(args)...);
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        delete p;
    }
};

// 与对象构造分离的版本：先拿原始内存，再 placement new；对齐按 T 的要求
struct AlignedAllocPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        void* mem = ::operator new(sizeof(T), std::align_val_t(alignof(T)));
        try {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...) {
            ::operator delete(mem, std::align_val_t(alignof(T)));
            throw;
        }
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        if (p) {
            p->~T();
            ::operator delete(static_cast<void*>(p), std::align_val_t(alignof(T)));
        }
    }
};
