#pragma once

#include <cassert>
#include <cstddef>
#include <iterator>
#include <type_traits>

/**
 * @brief 展开链表的前向迭代器
 *
 * 游标 = (当前节点, 槽位下标)。前进时跳过空闲槽位，越过最后一个槽位就
 * 转到 next 节点；当前节点为空指针即表示遍历结束（等于默认构造的 end）。
 *
 * 迭代器只读取节点状态，从不修改链结构。链表在迭代器存活期间发生任何
 * 插入 / 删除 / 合并，迭代器都可能指向已释放的节点，行为未定义。
 */
template <class Node, bool IsConst>
class UnrolledListIterator {
public:
    using element_type      = typename Node::element_type;
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::remove_cv_t<element_type>;
    using difference_type   = std::ptrdiff_t;
    using reference         = std::conditional_t<IsConst, const element_type&, element_type&>;
    using pointer           = std::conditional_t<IsConst, const element_type*, element_type*>;
    using node_pointer      = std::conditional_t<IsConst, const Node*, Node*>;

    UnrolledListIterator() noexcept = default;

    // 定位到 node 中的第一个存活元素；node 为空指针时得到 end
    explicit UnrolledListIterator(node_pointer node) noexcept : current_(node), index_(0) {
        if (current_ != nullptr) {
            index_ = current_->firstUsedIndex();
            assert(index_ < Node::kCapacity);
        }
    }

    // 非 const 迭代器可隐式转换为 const 迭代器
    template <bool WasConst, class = std::enable_if_t<IsConst && !WasConst>>
    UnrolledListIterator(const UnrolledListIterator<Node, WasConst>& other) noexcept
        : current_(other.node()), index_(other.index()) {}

    reference operator*() const noexcept {
        assert(current_ != nullptr);
        return current_->item(index_);
    }

    pointer operator->() const noexcept { return &**this; }

    UnrolledListIterator& operator++() noexcept {
        advance();
        return *this;
    }

    UnrolledListIterator operator++(int) noexcept {
        UnrolledListIterator tmp = *this;
        advance();
        return tmp;
    }

    friend bool operator==(const UnrolledListIterator& a, const UnrolledListIterator& b) noexcept {
        return a.current_ == b.current_ && (a.current_ == nullptr || a.index_ == b.index_);
    }

    friend bool operator!=(const UnrolledListIterator& a, const UnrolledListIterator& b) noexcept {
        return !(a == b);
    }

    bool exhausted() const noexcept { return current_ == nullptr; }

    node_pointer node() const noexcept { return current_; }
    std::size_t index() const noexcept { return index_; }

private:
    void advance() noexcept {
        assert(current_ != nullptr);
        ++index_;
        while (current_ != nullptr) {
            if (index_ >= Node::kCapacity) {
                current_ = current_->next;
                index_ = 0;
            } else if (current_->isFree(index_)) {
                ++index_;
            } else {
                return;
            }
        }
    }

    node_pointer current_ = nullptr;
    std::size_t index_ = 0;
};


/**
 * @brief 游标式的惰性序列视图：empty / front / popFront / save
 *
 * save() 返回当前位置的独立副本，多个游标可以同时遍历同一个链表。
 * 同时提供 begin()/end()，可直接用于范围 for。
 */
template <class Iterator>
class UnrolledListRange {
public:
    using iterator  = Iterator;
    using reference = typename Iterator::reference;

    explicit UnrolledListRange(Iterator first) noexcept : current_(first) {}

    bool empty() const noexcept { return current_.exhausted(); }

    reference front() const noexcept {
        assert(!empty());
        return *current_;
    }

    void popFront() noexcept {
        assert(!empty());
        ++current_;
    }

    UnrolledListRange save() const noexcept { return *this; }

    Iterator begin() const noexcept { return current_; }
    Iterator end() const noexcept { return Iterator(); }

private:
    Iterator current_;
};
