#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>
#include <list>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "fixtures/UnrolledListTestFixture.hpp"
#include "UnrolledList/UnrolledList.hpp"

// ============================================================================
// --- 类型别名 ---
// ============================================================================
using IntList     = UnrolledList<int>;
using SpyList     = UnrolledList<int, NoScanHook, UnrolledListConfig::kDefaultCacheLineSize, SpyAllocPolicy>;
using TrackedList = UnrolledList<Tracked, NoScanHook, UnrolledListConfig::kDefaultCacheLineSize, SpyAllocPolicy>;

constexpr int kCap = static_cast<int>(IntList::nodeCapacity);


// ============================================================================
// --- 测试夹具 (Fixture) ---
// ============================================================================
class UnrolledListFixture : public UnrolledListTestFixture {};


// ============================================================================
// --- 基础场景 ---
// ============================================================================

// 1) 空链表
TEST_F(UnrolledListFixture, EmptyList_StateCorrect) {
    IntList l;
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.length(), 0u);
    EXPECT_EQ(l.nodeCount(), 0u);
    EXPECT_FALSE(l.remove(42));
    EXPECT_TRUE(l.range().empty());
    EXPECT_EQ(l.begin(), l.end());
    EXPECT_TRUE(l.checkInvariants());
}

// 2) 插入 0..99，按插入顺序遍历，再逐个删除
TEST_F(UnrolledListFixture, InsertHundred_IterateThenRemoveAll) {
    IntList l;
    l.insertBack(0);
    EXPECT_EQ(l.length(), 1u);
    EXPECT_FALSE(l.empty());

    for (int i = 1; i < 100; ++i) {
        l.insertBack(i);
    }
    EXPECT_EQ(l.length(), 100u);
    EXPECT_EQ(to_vector(l), iota_vector(0, 100));
    EXPECT_TRUE(l.checkInvariants());

    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(l.remove(i)) << i;
        EXPECT_TRUE(l.checkInvariants()) << i;
    }
    EXPECT_EQ(l.length(), 0u);
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.nodeCount(), 0u);
}

// 3) front / popFront 序列
TEST_F(UnrolledListFixture, PopFront_AdvancesFront) {
    IntList l;
    l.insertBack(1);
    l.insertBack(2);
    l.insertBack(3);

    EXPECT_EQ(l.front(), 1);
    l.popFront();
    EXPECT_EQ(l.front(), 2);
    EXPECT_EQ(to_vector(l), (std::vector<int>{2, 3}));

    l.popFront();
    EXPECT_EQ(to_vector(l), (std::vector<int>{3}));

    l.popFront();
    EXPECT_TRUE(l.empty());
    EXPECT_TRUE(to_vector(l).empty());
    EXPECT_TRUE(l.checkInvariants());
}

// 4) moveFront 200 次得到 0..199；重新填充后 moveBack 得到 199..0
TEST_F(UnrolledListFixture, MoveFrontAndMoveBack_TwoHundred) {
    IntList l;
    for (int i = 0; i < 200; ++i) {
        l.insertBack(i);
    }
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(l.moveFront(), i);
    }
    EXPECT_TRUE(l.empty());

    for (int i = 0; i < 200; ++i) {
        l.insertBack(i);
    }
    EXPECT_EQ(l.length(), 200u);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(l.length(), static_cast<std::size_t>(200 - i));
        EXPECT_EQ(l.moveBack(), 200 - i - 1);
    }
    EXPECT_TRUE(l.empty());
    EXPECT_TRUE(l.checkInvariants());
}

// 5) popBack 与 back
TEST_F(UnrolledListFixture, PopBack_RetreatsBack) {
    IntList l;
    l.insertBack({1, 2, 3});
    EXPECT_EQ(l.back(), 3);
    l.popBack();
    EXPECT_EQ(l.back(), 2);
    l.popBack();
    EXPECT_EQ(l.back(), 1);
    EXPECT_EQ(l.front(), 1);
    l.popBack();
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.nodeCount(), 0u);
}

// 6) 删除不存在的值：返回 false，长度不变
TEST_F(UnrolledListFixture, RemoveAbsent_ReturnsFalse) {
    IntList l;
    l.insertBack({5, 6, 7});
    EXPECT_FALSE(l.remove(8));
    EXPECT_EQ(l.length(), 3u);
    EXPECT_EQ(to_vector(l), (std::vector<int>{5, 6, 7}));
}

// 7) 重复值：每次 remove 只删一个
TEST_F(UnrolledListFixture, RemoveDuplicates_OnePerCall) {
    IntList l;
    l.insertBack({4, 1, 4, 2, 4});
    EXPECT_TRUE(l.remove(4));
    EXPECT_EQ(to_vector(l), (std::vector<int>{1, 4, 2, 4}));
    EXPECT_TRUE(l.remove(4));
    EXPECT_TRUE(l.remove(4));
    EXPECT_FALSE(l.remove(4));
    EXPECT_EQ(to_vector(l), (std::vector<int>{1, 2}));
}

// ============================================================================
// --- 插入变体 ---
// ============================================================================

// 8) 序列插入：vector、迭代器区间、初始化列表、std::list
TEST_F(UnrolledListFixture, InsertBackSequence_SourceOrder) {
    IntList l;
    const std::vector<int> a = iota_vector(0, 10);
    const std::list<int> b = {10, 11, 12};

    l.insertBack(a);
    l.insertBack(b.begin(), b.end());
    l.insertBack({13, 14});

    EXPECT_EQ(l.length(), 15u);
    EXPECT_EQ(to_vector(l), iota_vector(0, 15));
}

// 9) 中间删除后 insertBack 仍保持插入顺序
TEST_F(UnrolledListFixture, InsertBack_AfterInteriorRemoval_KeepsOrder) {
    IntList l;
    for (int i = 0; i < kCap; ++i) {
        l.insertBack(i);
    }
    ASSERT_EQ(l.nodeCount(), 1u);

    ASSERT_TRUE(l.remove(1));
    l.insertBack(100);

    std::vector<int> expected = iota_vector(0, kCap);
    expected.erase(expected.begin() + 1);
    expected.push_back(100);
    EXPECT_EQ(to_vector(l), expected);
    EXPECT_EQ(l.nodeCount(), 1u);   // 填进了尾节点，没有新建节点
    EXPECT_EQ(l.back(), 100);
    EXPECT_TRUE(l.checkInvariants());
}

// 10) insertAnywhere 优先填补空洞（只断言多重集合）
TEST_F(UnrolledListFixture, InsertAnywhere_FillsGaps) {
    IntList l;
    for (int i = 0; i < 3 * kCap; ++i) {
        l.insertBack(i);
    }
    const std::size_t nodes = l.nodeCount();
    ASSERT_TRUE(l.remove(1));
    ASSERT_TRUE(l.remove(kCap + 1));

    l.insertAnywhere(-1);
    l.insertAnywhere(-2);
    EXPECT_EQ(l.length(), static_cast<std::size_t>(3 * kCap));
    EXPECT_EQ(l.nodeCount(), nodes);

    std::vector<int> got = to_vector(l);
    std::vector<int> expected = iota_vector(0, 3 * kCap);
    expected.erase(std::find(expected.begin(), expected.end(), kCap + 1));
    expected.erase(std::find(expected.begin(), expected.end(), 1));
    expected.push_back(-1);
    expected.push_back(-2);
    std::sort(got.begin(), got.end());
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(got, expected);
    EXPECT_TRUE(l.checkInvariants());
}

// 11) insertAnywhere 在空链表 / 全满时新建尾节点
TEST_F(UnrolledListFixture, InsertAnywhere_AllocatesWhenFull) {
    SpyList l;
    l.insertAnywhere(7);
    EXPECT_EQ(l.length(), 1u);
    EXPECT_EQ(l.front(), 7);
    EXPECT_EQ(SpyAllocPolicy::allocation_count, 1u);

    for (int i = 1; i < kCap; ++i) {
        l.insertAnywhere(i);
    }
    EXPECT_EQ(SpyAllocPolicy::allocation_count, 1u);

    l.insertAnywhere(99);
    EXPECT_EQ(SpyAllocPolicy::allocation_count, 2u);
    EXPECT_EQ(l.back(), 99);
    EXPECT_EQ(l.nodeCount(), 2u);
    EXPECT_TRUE(l.checkInvariants());
}

// ============================================================================
// --- 访问 ---
// ============================================================================

// 12) 尾节点有尾部空洞时 back() 向前查找
TEST_F(UnrolledListFixture, Back_SkipsTrailingGaps) {
    IntList l;
    for (int i = 0; i < kCap; ++i) {
        l.insertBack(i);
    }
    ASSERT_TRUE(l.remove(kCap - 1));
    EXPECT_EQ(l.back(), kCap - 2);
    ASSERT_TRUE(l.remove(kCap - 2));
    EXPECT_EQ(l.back(), kCap - 3);
    EXPECT_EQ(l.moveBack(), kCap - 3);
}

// 13) front() / back() 返回可写引用（非 const 元素）
TEST_F(UnrolledListFixture, FrontBack_MutableReferences) {
    IntList l;
    l.insertBack({1, 2, 3});
    l.front() = 10;
    l.back() = 30;
    EXPECT_EQ(to_vector(l), (std::vector<int>{10, 2, 30}));

    const IntList& cl = l;
    static_assert(std::is_same<decltype(cl.front()), const int&>::value, "const list gives const access");
    EXPECT_EQ(cl.front(), 10);
    EXPECT_EQ(cl.back(), 30);
}

// 14) const 元素类型：所有访问路径只读
TEST_F(UnrolledListFixture, ConstElement_ReadOnlyEverywhere) {
    struct A {
        int a;
        int b;
        bool operator==(const A& o) const { return a == o.a && b == o.b; }
    };

    UnrolledList<const A> objs;
    objs.insertBack(A{10, 11});
    objs.insertBack(A{20, 21});

    static_assert(std::is_const<std::remove_reference_t<decltype(objs.front())>>::value, "front");
    static_assert(std::is_const<std::remove_reference_t<decltype(objs.back())>>::value, "back");
    static_assert(std::is_const<std::remove_reference_t<decltype(objs.range().front())>>::value, "range");
    static_assert(std::is_const<std::remove_reference_t<decltype(*objs.begin())>>::value, "iterator");

    EXPECT_EQ(objs.front().a, 10);
    EXPECT_TRUE(objs.remove(A{10, 11}));

    A moved = objs.moveFront();
    EXPECT_EQ(moved.b, 21);
    EXPECT_TRUE(objs.empty());
}

// ============================================================================
// --- 生命周期与资源 ---
// ============================================================================

// 15) 每个元素恰好析构一次（remove / pop / merge / clear / 析构）
TEST_F(UnrolledListFixture, ElementDestructors_RunExactlyOnce) {
    {
        TrackedList l;
        for (int i = 0; i < 5 * kCap; ++i) {
            l.insertBack(Tracked(i));
        }
        EXPECT_EQ(Tracked::live, 5 * kCap);

        for (int i = 0; i < 5 * kCap; i += 2) {
            ASSERT_TRUE(l.remove(Tracked(i)));
        }
        EXPECT_EQ(Tracked::live, static_cast<int>(l.length()));

        l.popFront();
        l.popBack();
        EXPECT_EQ(Tracked::live, static_cast<int>(l.length()));

        l.clear();
        EXPECT_EQ(Tracked::live, 0);
        EXPECT_EQ(SpyAllocPolicy::live(), 0u);

        for (int i = 0; i < 3 * kCap; ++i) {
            l.insertBack(Tracked(i));
        }
    }
    EXPECT_EQ(Tracked::live, 0);
    EXPECT_EQ(SpyAllocPolicy::live(), 0u);
}

// 16) 每个节点一次分配；全部释放后分配 == 释放
TEST_F(UnrolledListFixture, NodeAllocations_Balanced) {
    {
        SpyList l;
        for (int i = 0; i < 4 * kCap; ++i) {
            l.insertBack(i);
        }
        EXPECT_EQ(SpyAllocPolicy::allocation_count, 4u);
        EXPECT_EQ(l.nodeCount(), 4u);

        while (!l.empty()) {
            l.popFront();
        }
        EXPECT_EQ(SpyAllocPolicy::deallocation_count, 4u);
    }
    EXPECT_EQ(SpyAllocPolicy::allocation_count, SpyAllocPolicy::deallocation_count);
}

// 17) 移动构造 / 移动赋值转移整条链
TEST_F(UnrolledListFixture, Move_TransfersChain) {
    SpyList a;
    a.insertBack(iota_vector(0, 30));

    SpyList b(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a.nodeCount(), 0u);
    EXPECT_EQ(b.length(), 30u);
    EXPECT_EQ(to_vector(b), iota_vector(0, 30));

    SpyList c;
    c.insertBack({1, 2});
    c = std::move(b);
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(to_vector(c), iota_vector(0, 30));
    EXPECT_TRUE(c.checkInvariants());

    // 移走后的源对象仍可继续使用
    a.insertBack(5);
    EXPECT_EQ(a.front(), 5);

    static_assert(!std::is_copy_constructible<SpyList>::value, "container is move-only");
    static_assert(!std::is_copy_assignable<SpyList>::value, "container is move-only");
}

// 18) clone 是独立的深拷贝且排列紧凑
TEST_F(UnrolledListFixture, Clone_IsIndependentAndCompact) {
    SpyList a;
    for (int i = 0; i < 4 * kCap; ++i) {
        a.insertBack(i);
    }
    for (int i = 0; i < 4 * kCap; i += 3) {
        ASSERT_TRUE(a.remove(i));
    }

    SpyList b = a.clone();
    EXPECT_EQ(to_vector(b), to_vector(a));
    EXPECT_LE(b.nodeCount(), a.nodeCount());
    EXPECT_TRUE(b.checkInvariants());

    b.popFront();
    EXPECT_NE(b.length(), a.length());
}

// 19) 元素拷贝抛异常：链表状态与分配计数不受影响
TEST_F(UnrolledListFixture, InsertBack_ThrowingCopy_LeavesListIntact) {
    TrackedList l;
    for (int i = 0; i < kCap; ++i) {
        l.insertBack(Tracked(i));
    }
    const std::size_t allocs = SpyAllocPolicy::allocation_count;

    const Tracked extra(1000);
    Tracked::copies_before_throw = 0;
    EXPECT_THROW(l.insertBack(extra), std::runtime_error);   // 需要新节点
    Tracked::copies_before_throw = -1;

    EXPECT_EQ(l.length(), static_cast<std::size_t>(kCap));
    EXPECT_EQ(l.nodeCount(), 1u);
    EXPECT_EQ(SpyAllocPolicy::allocation_count, allocs + 1);
    EXPECT_EQ(SpyAllocPolicy::live(), 1u);
    EXPECT_TRUE(l.checkInvariants());
}

// 20) 只可移动的元素类型
TEST_F(UnrolledListFixture, MoveOnlyElements) {
    UnrolledList<std::unique_ptr<int>> l;
    for (int i = 0; i < 20; ++i) {
        l.insertBack(std::make_unique<int>(i));
    }
    EXPECT_EQ(*l.front(), 0);
    EXPECT_EQ(*l.back(), 19);

    std::unique_ptr<int> first = l.moveFront();
    std::unique_ptr<int> last = l.moveBack();
    EXPECT_EQ(*first, 0);
    EXPECT_EQ(*last, 19);
    EXPECT_EQ(l.length(), 18u);
}

// 21) 对齐分配策略同样可用
TEST_F(UnrolledListFixture, AlignedAllocPolicy_Works) {
    UnrolledList<std::string, NoScanHook, UnrolledListConfig::kDefaultCacheLineSize, AlignedAllocPolicy> l;
    for (int i = 0; i < 50; ++i) {
        l.insertBack(std::to_string(i));
    }
    EXPECT_TRUE(l.remove("25"));
    EXPECT_EQ(l.length(), 49u);
    EXPECT_EQ(l.front(), "0");
    EXPECT_EQ(l.back(), "49");
    EXPECT_TRUE(l.checkInvariants());
}

// 22) 缓存行预算改变节点容量
TEST_F(UnrolledListFixture, CacheLineSize_ChangesNodeCount) {
    UnrolledList<int, NoScanHook, 32> small;
    for (int i = 0; i < 30; ++i) {
        small.insertBack(i);
    }
    const std::size_t cap = UnrolledList<int, NoScanHook, 32>::nodeCapacity;
    EXPECT_EQ(small.nodeCount(), (30 + cap - 1) / cap);
    EXPECT_EQ(to_vector(small), iota_vector(0, 30));
}

// 23) 参数引用的是本链表尾节点里的元素：压实尾节点不能破坏它
TEST_F(UnrolledListFixture, InsertBack_ElementOfSameList_SurvivesCompaction) {
    using StringList = UnrolledList<std::string, NoScanHook, 256>;
    static_assert(StringList::nodeCapacity > 3, "needs room for interior gaps");
    const int cap = static_cast<int>(StringList::nodeCapacity);

    StringList l;
    std::vector<std::string> expected;
    for (int i = 0; i < cap; ++i) {
        expected.push_back(std::string(40, static_cast<char>('a' + i)));   // 超出 SSO，析构后内容必然失效
        l.insertBack(expected.back());
    }
    ASSERT_EQ(l.nodeCount(), 1u);

    // 槽位 0 空出，最后一个槽位仍被占用：下一次 insertBack 先压实
    ASSERT_TRUE(l.remove(expected.front()));
    expected.erase(expected.begin());

    l.insertBack(l.back());
    expected.push_back(expected.back());
    EXPECT_EQ(l.nodeCount(), 1u);
    EXPECT_EQ(l.back(), expected.back());
    EXPECT_EQ(to_vector(l), expected);

    // 再挖一个中间空洞，引用空洞之后会被搬到低位的元素
    ASSERT_TRUE(l.remove(expected[2]));
    expected.erase(expected.begin() + 2);

    const std::string& moved = *std::next(l.begin(), 2);
    ASSERT_EQ(moved, expected[2]);
    l.insertBack(moved);
    expected.push_back(expected[2]);
    EXPECT_EQ(l.back(), expected[2]);
    EXPECT_EQ(to_vector(l), expected);
    EXPECT_TRUE(l.checkInvariants());
}
