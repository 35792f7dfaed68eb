// UnrolledList/UnrolledList.hpp
#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>

#include "UnrolledList/AllocatorPolicies.hpp"
#include "UnrolledList/NodeCapacity.hpp"
#include "UnrolledList/ScanHook.hpp"
#include "UnrolledList/UnrolledListConfig.hpp"
#include "UnrolledList/UnrolledListIterator.hpp"
#include "UnrolledList/UnrolledListNode.hpp"

namespace UnrolledListDetail {

// 判断类型是否可用 begin()/end() 遍历
template <class R, class = void>
struct IsIterable : std::false_type {};

template <class R>
struct IsIterable<R, std::void_t<decltype(std::begin(std::declval<R&>())),
                                 decltype(std::end(std::declval<R&>()))>> : std::true_type {};

} // namespace UnrolledListDetail

/**
 * UnrolledList
 * ------------------------------------------------------------------
 * 展开链表：每个节点是一块定长数组 + 占用位图 + prev/next，节点大小按缓存行裁剪，
 * 遍历时触碰的缓存行远少于普通链表。
 *
 * @tparam T             元素类型；声明为 const 时所有访问路径都是只读的
 * @tparam ScanHook      扫描钩子策略（NoScanHook / RegistryScanHook）
 * @tparam CacheLineSize 节点尺寸预算（字节）
 * @tparam AllocPolicy   节点分配策略
 *
 * 单线程容器：没有任何内部同步；并发访问需要外部互斥。
 */
template <class T,
          class ScanHook = NoScanHook,
          std::size_t CacheLineSize = UnrolledListConfig::kDefaultCacheLineSize,
          class AllocPolicy = StandardAllocPolicy>
class UnrolledList {
public:
    using element_type  = T;
    using value_type    = std::remove_cv_t<T>;
    using size_type     = std::size_t;
    using registry_type = UnrolledListConfig::registry_type;

    // 每个节点可容纳的元素个数
    static constexpr std::size_t nodeCapacity = NodeCapacity<T, registry_type, CacheLineSize>::value;

    using node_type  = UnrolledListNode<T, nodeCapacity, registry_type>;
    using node_ptr   = node_type*;

    using iterator       = UnrolledListIterator<node_type, false>;
    using const_iterator = UnrolledListIterator<node_type, true>;
    using range_type       = UnrolledListRange<iterator>;
    using const_range_type = UnrolledListRange<const_iterator>;

public:
    UnrolledList() noexcept {
        if (ShouldAddScanRange<ScanHook, T>::value) {
            ScanHook::touch();
        }
    }
    ~UnrolledList();

    UnrolledList(const UnrolledList&) = delete;
    UnrolledList& operator=(const UnrolledList&) = delete;

    UnrolledList(UnrolledList&& other) noexcept;
    UnrolledList& operator=(UnrolledList&& other) noexcept;

    // 显式深拷贝（结果是紧凑排列的，元素顺序不变）
    UnrolledList clone() const;

    // 销毁所有元素并释放所有节点
    void clear() noexcept;

    // ---- 插入 ----

    // 追加到末尾，保持插入顺序；不会回头扫描前面的节点
    void insertBack(const value_type& item);
    void insertBack(value_type&& item);

    // 按源顺序逐个追加
    template <class InputIt>
    void insertBack(InputIt first, InputIt last);

    template <class InputRange,
              class = std::enable_if_t<UnrolledListDetail::IsIterable<const InputRange>::value &&
                                       !std::is_convertible<const InputRange&, value_type>::value>>
    void insertBack(const InputRange& range);

    void insertBack(std::initializer_list<value_type> items);

    /**
     * 放进从前往后第一个有空闲槽位的节点，只有所有节点都满时才在尾部新建节点。
     * 删除留下的空洞会被优先填补，因此元素可能出现在链表的任意位置：
     * 只在不关心元素顺序时使用。
     */
    void insertAnywhere(const value_type& item);
    void insertAnywhere(value_type&& item);

    // ---- 删除 ----
    //
    // 删除后可能与相邻节点合并，合并要搬移元素。搬移抛异常时只提供基本保证：
    // 目标元素已被删除，其余元素完整且顺序不变，但这两个节点保持未合并状态
    // （checkInvariants() 会报告，插桩构建中下一次修改会触发断言）。
    // 元素的移动构造（const T 则为拷贝构造）不抛异常时不会出现这种情况。

    // 删除第一个与 item 相等的元素；没找到返回 false
    bool remove(const value_type& item);

    void popFront();
    value_type moveFront();

    void popBack();
    value_type moveBack();

    // ---- 访问 ----

    // O(1)：头节点中最低位的占用槽
    T& front() noexcept;
    const T& front() const noexcept;

    // O(capacity)：尾节点可能因中间删除留下尾部空洞，需要从最后一个槽位往回找
    T& back() noexcept;
    const T& back() const noexcept;

    size_type length() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

    // O(节点数)
    size_type nodeCount() const noexcept;

    // ---- 遍历 ----
    range_type range() noexcept { return range_type(iterator(front_)); }
    const_range_type range() const noexcept { return const_range_type(const_iterator(front_)); }

    iterator begin() noexcept { return iterator(front_); }
    iterator end() noexcept { return iterator(); }
    const_iterator begin() const noexcept { return const_iterator(front_); }
    const_iterator end() const noexcept { return const_iterator(); }
    const_iterator cbegin() const noexcept { return const_iterator(front_); }
    const_iterator cend() const noexcept { return const_iterator(); }

    // 结构自检：任何一条不成立都会打印到 stderr 并返回 false
    bool checkInvariants() const noexcept;

#ifdef UNROLLED_LIST_DEBUG
    unsigned long long allocCount() const noexcept { return alloc_count_; }
    unsigned long long deallocCount() const noexcept { return dealloc_count_; }
#endif

private:
    template <class U>
    void insertBackImpl(U&& item);

    template <class U>
    void insertAnywhereImpl(U&& item);

    template <class U>
    node_ptr allocateNode(U&& item);
    void deallocateNode(node_ptr n) noexcept;
    void releaseNode(node_ptr n) noexcept;

    // 删除头 / 尾元素后的收尾：空节点释放，否则尝试与相邻节点合并
    void settleFront();
    void settleBack();

    static std::size_t lastUsedIndex(const node_type* n) noexcept;

    static bool shouldMerge(const node_type* first, const node_type* second) noexcept;
    void mergeNodes(node_ptr first, node_ptr second);

    void debugCheck() const noexcept;

    node_ptr  front_  = nullptr;
    node_ptr  back_   = nullptr;
    size_type length_ = 0;

#ifdef UNROLLED_LIST_DEBUG
    unsigned long long alloc_count_   = 0;
    unsigned long long dealloc_count_ = 0;
#endif
};

#include "UnrolledList_impl.hpp"
