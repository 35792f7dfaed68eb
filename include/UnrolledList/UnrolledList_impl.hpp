#pragma once

#include <cassert>
#include <cstdio>

#include "UnrolledList.hpp"

// ============================================================================
// --- 生命周期 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::~UnrolledList() {
    clear();
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::UnrolledList(UnrolledList&& other) noexcept
    : front_(other.front_),
      back_(other.back_),
      length_(other.length_)
#ifdef UNROLLED_LIST_DEBUG
      , alloc_count_(other.alloc_count_),
      dealloc_count_(other.dealloc_count_)
#endif
{
    other.front_ = nullptr;
    other.back_ = nullptr;
    other.length_ = 0;
#ifdef UNROLLED_LIST_DEBUG
    other.alloc_count_ = 0;
    other.dealloc_count_ = 0;
#endif
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>&
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::operator=(UnrolledList&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    clear();

    front_ = other.front_;
    back_ = other.back_;
    length_ = other.length_;
    other.front_ = nullptr;
    other.back_ = nullptr;
    other.length_ = 0;
#ifdef UNROLLED_LIST_DEBUG
    alloc_count_ = other.alloc_count_;
    dealloc_count_ = other.dealloc_count_;
    other.alloc_count_ = 0;
    other.dealloc_count_ = 0;
#endif
    return *this;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>
UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::clone() const {
    UnrolledList copy;
    for (const T& item : *this) {
        copy.insertBack(item);
    }
    return copy;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::clear() noexcept {
#ifdef UNROLLED_LIST_DEBUG
    const size_type node_count = nodeCount();
#endif
    node_ptr cur = front_;
    while (cur != nullptr) {
        node_ptr next = cur->next;
        // 节点析构会销毁其中所有存活元素
        releaseNode(cur);
        cur = next;
    }
    front_ = nullptr;
    back_ = nullptr;
#ifdef UNROLLED_LIST_DEBUG
    if (alloc_count_ != dealloc_count_) {
        fprintf(stderr,
                "UnrolledList::clear: node leak\n"
                "\tNodes: %zu\n\tallocations: %llu\n\tdeallocations: %llu\n"
                "\tnodeCapacity: %zu\n\tlength: %zu\n",
                node_count, alloc_count_, dealloc_count_, nodeCapacity, length_);
    }
    assert(alloc_count_ == dealloc_count_);
#endif
    length_ = 0;
}

// ============================================================================
// --- 插入 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBack(const value_type& item) {
    insertBackImpl(item);
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBack(value_type&& item) {
    insertBackImpl(std::move(item));
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
template <class InputIt>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBack(InputIt first, InputIt last) {
    for (; first != last; ++first) {
        insertBackImpl(*first);
    }
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
template <class InputRange, class>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBack(const InputRange& range) {
    using std::begin;
    using std::end;
    insertBack(begin(range), end(range));
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBack(std::initializer_list<value_type> items) {
    insertBack(items.begin(), items.end());
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
template <class U>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertBackImpl(U&& item) {
    if (back_ == nullptr) {
        assert(front_ == nullptr);
        back_ = allocateNode(std::forward<U>(item));
        front_ = back_;
    } else {
        // 接在尾节点最后一个存活元素之后，插入顺序才能保持
        const std::size_t index = lastUsedIndex(back_) + 1;
        if (index < nodeCapacity) {
            back_->emplaceAt(index, std::forward<U>(item));
        } else if (!back_->isFull()) {
            // 只剩中间空洞：先压实尾节点。item 可能引用尾节点里的元素，
            // 压实会把它搬走，所以先构造本地副本
            value_type local(std::forward<U>(item));
            back_->emplaceAt(back_->compact(), std::move(local));
        } else {
            node_ptr n = allocateNode(std::forward<U>(item));
            n->prev = back_;
            back_->next = n;
            back_ = n;
        }
    }
    ++length_;
    debugCheck();
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertAnywhere(const value_type& item) {
    insertAnywhereImpl(item);
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertAnywhere(value_type&& item) {
    insertAnywhereImpl(std::move(item));
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
template <class U>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::insertAnywhereImpl(U&& item) {
    for (node_ptr n = front_; n != nullptr; n = n->next) {
        const std::size_t index = n->nextAvailableIndex();
        if (index < nodeCapacity) {
            n->emplaceAt(index, std::forward<U>(item));
            ++length_;
            debugCheck();
            return;
        }
    }

    // 所有节点都满了：在尾部新建
    node_ptr n = allocateNode(std::forward<U>(item));
    if (back_ == nullptr) {
        front_ = n;
    } else {
        n->prev = back_;
        back_->next = n;
    }
    back_ = n;
    ++length_;
    debugCheck();
}

// ============================================================================
// --- 删除 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
bool UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::remove(const value_type& item) {
    for (node_ptr n = front_; n != nullptr; n = n->next) {
        for (std::size_t i = 0; i < nodeCapacity; ++i) {
            if (n->isFree(i) || !(n->item(i) == item)) {
                continue;
            }

            n->markUnused(i);
            --length_;
            if (n->isEmpty()) {
                deallocateNode(n);
            } else if (shouldMerge(n, n->next)) {
                mergeNodes(n, n->next);
            } else if (shouldMerge(n->prev, n)) {
                mergeNodes(n->prev, n);
            }
            debugCheck();
            return true;
        }
    }
    return false;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::popFront() {
    assert(!empty());
    assert(front_ != nullptr && !front_->isEmpty());

    front_->markUnused(front_->firstUsedIndex());
    --length_;
    settleFront();
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
auto UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::moveFront() -> value_type {
    assert(!empty());
    assert(front_ != nullptr && !front_->isEmpty());

    const std::size_t index = front_->firstUsedIndex();
    value_type result = std::move(front_->item(index));
    front_->markUnused(index);
    --length_;
    settleFront();
    return result;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::popBack() {
    assert(!empty());
    assert(back_ != nullptr && !back_->isEmpty());

    back_->markUnused(lastUsedIndex(back_));
    --length_;
    settleBack();
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
auto UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::moveBack() -> value_type {
    assert(!empty());
    assert(back_ != nullptr && !back_->isEmpty());

    const std::size_t index = lastUsedIndex(back_);
    value_type result = std::move(back_->item(index));
    back_->markUnused(index);
    --length_;
    settleBack();
    return result;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::settleFront() {
    if (front_->isEmpty()) {
        // front_ 前移；链表变空时 back_ 一并清空
        deallocateNode(front_);
    } else if (shouldMerge(front_, front_->next)) {
        mergeNodes(front_, front_->next);
    }
    debugCheck();
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::settleBack() {
    if (back_->isEmpty()) {
        deallocateNode(back_);
    } else if (shouldMerge(back_->prev, back_)) {
        mergeNodes(back_->prev, back_);
    }
    debugCheck();
}

// ============================================================================
// --- 访问 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
T& UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::front() noexcept {
    assert(!empty());
    assert(front_ != nullptr && !front_->isEmpty());
    return front_->item(front_->firstUsedIndex());
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
const T& UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::front() const noexcept {
    assert(!empty());
    assert(front_ != nullptr && !front_->isEmpty());
    return front_->item(front_->firstUsedIndex());
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
T& UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::back() noexcept {
    assert(!empty());
    assert(back_ != nullptr && !back_->isEmpty());
    return back_->item(lastUsedIndex(back_));
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
const T& UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::back() const noexcept {
    assert(!empty());
    assert(back_ != nullptr && !back_->isEmpty());
    return back_->item(lastUsedIndex(back_));
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
auto UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::nodeCount() const noexcept -> size_type {
    size_type count = 0;
    for (const node_type* n = front_; n != nullptr; n = n->next) {
        ++count;
    }
    return count;
}

// 从最后一个槽位往回线性查找；调用方保证节点非空
template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
std::size_t UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::lastUsedIndex(const node_type* n) noexcept {
    assert(n != nullptr && !n->isEmpty());
    std::size_t i = nodeCapacity - 1;
    while (n->isFree(i)) {
        assert(i > 0);
        --i;
    }
    return i;
}

// ============================================================================
// --- 节点管理 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
template <class U>
auto UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::allocateNode(U&& item) -> node_ptr {
    node_ptr n = AllocPolicy::template allocate<node_type>();
#ifdef UNROLLED_LIST_DEBUG
    ++alloc_count_;
#endif

    if (ShouldAddScanRange<ScanHook, T>::value) {
        try {
            ScanHook::addRange(n, sizeof(node_type));
        } catch (...) {
#ifdef UNROLLED_LIST_DEBUG
            ++dealloc_count_;
#endif
            AllocPolicy::template deallocate<node_type>(n);
            throw;
        }
    }

    try {
        n->emplaceAt(0, std::forward<U>(item));
    } catch (...) {
        releaseNode(n);
        throw;
    }
    return n;
}

// 把节点从链中摘下并释放；维护 front_ / back_
template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::deallocateNode(node_ptr n) noexcept {
    assert(n != nullptr);
    assert(n->next != n && n->prev != n);

    if (n->prev != nullptr) {
        n->prev->next = n->next;
    }
    if (n->next != nullptr) {
        n->next->prev = n->prev;
    }
    if (front_ == n) {
        front_ = n->next;
    }
    if (back_ == n) {
        back_ = n->prev;
    }
    releaseNode(n);
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::releaseNode(node_ptr n) noexcept {
#ifdef UNROLLED_LIST_DEBUG
    ++dealloc_count_;
#endif
    if (ShouldAddScanRange<ScanHook, T>::value) {
        ScanHook::removeRange(n);
    }
    AllocPolicy::template deallocate<node_type>(n);
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
bool UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::shouldMerge(const node_type* first,
                                                                        const node_type* second) noexcept {
    if (first == nullptr || second == nullptr) {
        return false;
    }
    return first->population() + second->population() <= nodeCapacity;
}

/**
 * 把 first 的存活元素、再把 second 的存活元素，按槽位顺序压实到 first 的
 * [0, pop(first) + pop(second)) 槽位中，然后释放 second。
 * 元素的槽位会变，但链顺序 + 槽位顺序定义的逻辑顺序不变。
 */
template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::mergeNodes(node_ptr first, node_ptr second) {
    assert(first != nullptr);
    assert(second != nullptr);
    assert(second == first->next);

    const std::size_t expected = first->population() + second->population();
    assert(expected <= nodeCapacity);

    const std::size_t compacted = first->compact();
    const std::size_t total = first->absorb(*second, compacted);
    assert(total == expected);
    assert(first->population() == total && second->isEmpty());
    (void)expected;
    (void)total;

    deallocateNode(second);
}

// ============================================================================
// --- 自检 ---
// ============================================================================

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
bool UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::checkInvariants() const noexcept {
    if ((front_ == nullptr) != (back_ == nullptr)) {
        fprintf(stderr, "UnrolledList invariant: front=%p back=%p (only one is null)\n",
                static_cast<const void*>(front_), static_cast<const void*>(back_));
        return false;
    }
    if (front_ == nullptr) {
        if (length_ != 0) {
            fprintf(stderr, "UnrolledList invariant: empty chain but length=%zu\n", length_);
            return false;
        }
        return true;
    }
    if (front_->prev != nullptr) {
        fprintf(stderr, "UnrolledList invariant: front node has a predecessor\n");
        return false;
    }

    size_type total = 0;
    size_type nodes = 0;
    const node_type* prev = nullptr;
    for (const node_type* n = front_; n != nullptr; n = n->next) {
        // 每个节点至少一个元素，节点数超过 length_ 说明链上有环或计数错了
        if (++nodes > length_) {
            fprintf(stderr, "UnrolledList invariant: more nodes than elements (length=%zu)\n", length_);
            return false;
        }
        if (n->prev != prev) {
            fprintf(stderr, "UnrolledList invariant: node %zu has a wrong prev link\n", nodes - 1);
            return false;
        }
        if (n->isEmpty()) {
            fprintf(stderr, "UnrolledList invariant: node %zu is empty\n", nodes - 1);
            return false;
        }
        if (prev != nullptr && prev->population() + n->population() <= nodeCapacity) {
            fprintf(stderr,
                    "UnrolledList invariant: nodes %zu and %zu should have been merged (%zu + %zu <= %zu)\n",
                    nodes - 2, nodes - 1, prev->population(), n->population(), nodeCapacity);
            return false;
        }
        total += n->population();
        prev = n;
    }

    if (prev != back_) {
        fprintf(stderr, "UnrolledList invariant: back pointer is wrong\n");
        return false;
    }
    if (total != length_) {
        fprintf(stderr, "UnrolledList invariant: length=%zu but nodes hold %zu elements\n", length_, total);
        return false;
    }
    return true;
}

template <class T, class ScanHook, std::size_t CacheLineSize, class AllocPolicy>
void UnrolledList<T, ScanHook, CacheLineSize, AllocPolicy>::debugCheck() const noexcept {
#ifdef UNROLLED_LIST_DEBUG
    assert(checkInvariants());
#endif
}
