#pragma once

#include <cassert>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include "UnrolledList/OccupancyMask.hpp"

/**
 * @brief 展开链表的节点 (Node for an Unrolled Linked List)
 *
 * @tparam T        元素类型（可以是 const 限定的类型）
 * @tparam Capacity 每个节点的槽位数
 * @tparam Registry 占用位图所用的无符号整数类型
 *
 * 节点只管理自己的槽位和位图，对链表本身一无所知：
 * 1.  槽位是未初始化的对齐存储，元素按需 placement-new 构造。
 * 2.  位图中第 i 位为 1 ⇔ 第 i 个槽位有存活元素。
 * 3.  同一节点内，槽位下标顺序就是元素的逻辑顺序。
 * 4.  prev / next 由链表维护；next 是拥有方向，prev 只用于拼接。
 */
template <class T, std::size_t Capacity, class Registry>
class UnrolledListNode {
public:
    using element_type = T;
    using mask_type    = OccupancyMask<Registry, Capacity>;

    static constexpr std::size_t kCapacity = Capacity;
    static constexpr std::size_t k_not_found = mask_type::k_not_found;

public:
    UnrolledListNode() noexcept = default;

    // 析构时销毁所有存活元素
    ~UnrolledListNode() {
        if (!std::is_trivially_destructible<T>::value) {
            for (std::size_t i = 0; i < Capacity; ++i) {
                if (registry_.isUsed(i)) {
                    destroySlot(i);
                }
            }
        }
    }

    UnrolledListNode(const UnrolledListNode&) = delete;
    UnrolledListNode& operator=(const UnrolledListNode&) = delete;
    UnrolledListNode(UnrolledListNode&&) = delete;
    UnrolledListNode& operator=(UnrolledListNode&&) = delete;

    // 最低位空闲槽；满时返回 >= Capacity 的哨兵值
    std::size_t nextAvailableIndex() const noexcept { return registry_.findFirstFree(); }

    // 最低位占用槽；空时返回 k_not_found
    std::size_t firstUsedIndex() const noexcept { return registry_.findFirstUsed(); }

    void markUsed(std::size_t index) noexcept { registry_.markAsUsed(index); }

    // 清位的同时销毁槽中的元素，逻辑删除后不再持有任何资源
    void markUnused(std::size_t index) noexcept {
        assert(registry_.isUsed(index));
        destroySlot(index);
        registry_.markAsFree(index);
    }

    bool isFree(std::size_t index) const noexcept { return !registry_.isUsed(index); }
    std::size_t population() const noexcept { return registry_.count(); }
    bool isEmpty() const noexcept { return registry_.none(); }
    bool isFull() const noexcept { return registry_.full(); }

    // 在空闲槽 index 上构造元素并置位
    template <class... Args>
    T& emplaceAt(std::size_t index, Args&&... args) {
        assert(index < Capacity);
        assert(isFree(index));
        T* p = ::new (static_cast<void*>(&slots_[index])) T(std::forward<Args>(args)...);
        markUsed(index);
        return *p;
    }

    T& item(std::size_t index) noexcept {
        assert(index < Capacity && !isFree(index));
        return *std::launder(reinterpret_cast<T*>(&slots_[index]));
    }

    const T& item(std::size_t index) const noexcept {
        assert(index < Capacity && !isFree(index));
        return *std::launder(reinterpret_cast<const T*>(&slots_[index]));
    }

    /**
     * @brief 把存活元素依次挪到槽位 [0, population) 中，保持相对顺序
     *
     * 目标下标总是不大于源下标，因此可以原地从前往后搬。
     * 返回压缩后的元素个数。
     */
    std::size_t compact() {
        std::size_t dst = 0;
        for (std::size_t src = 0; src < Capacity; ++src) {
            if (isFree(src)) {
                continue;
            }
            if (src != dst) {
                relocateTo(*this, src, dst);
            }
            ++dst;
        }
        return dst;
    }

    /**
     * @brief 把 other 的存活元素按槽位顺序追加到本节点 [start, ...) 处
     *
     * 调用方保证本节点从 start 起有足够空闲槽位。other 搬完后为空。
     */
    std::size_t absorb(UnrolledListNode& other, std::size_t start) {
        std::size_t dst = start;
        for (std::size_t src = 0; src < Capacity; ++src) {
            if (other.isFree(src)) {
                continue;
            }
            assert(dst < Capacity);
            other.relocateTo(*this, src, dst);
            ++dst;
        }
        return dst;
    }

    Registry registryBits() const noexcept { return registry_.raw(); }

private:
    using storage_type = std::aligned_storage_t<sizeof(T), alignof(T)>;

    void destroySlot(std::size_t index) noexcept {
        T* p = std::launder(reinterpret_cast<T*>(&slots_[index]));
        p->~T();
    }

    // 把本节点 src 槽的元素移动构造到 target 的 dst 槽，并销毁源元素
    void relocateTo(UnrolledListNode& target, std::size_t src, std::size_t dst) {
        target.emplaceAt(dst, std::move(item(src)));
        markUnused(src);
    }

private:
    mask_type registry_;
    storage_type slots_[Capacity];

public:
    UnrolledListNode* prev = nullptr;
    UnrolledListNode* next = nullptr;
};
