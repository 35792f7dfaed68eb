#pragma once

#include <cassert>
#include <climits>
#include <cstddef>
#include <type_traits>

// 定宽位图：直接放在节点里的一个无符号整数，一位对应一个槽位
// 位为 1 表示槽位里有存活元素
template <class Registry, std::size_t Capacity>
class OccupancyMask {
    static_assert(std::is_unsigned<Registry>::value, "Registry must be an unsigned integer type");
    static_assert(Capacity > 0, "Capacity must be positive");
    static_assert(Capacity <= sizeof(Registry) * CHAR_BIT, "Capacity exceeds the registry width");

public:
    static constexpr std::size_t k_not_found = static_cast<std::size_t>(-1);

    static constexpr std::size_t kBits = sizeof(Registry) * CHAR_BIT;
    static constexpr Registry kFullBits =
        Capacity == kBits ? static_cast<Registry>(~Registry(0))
                          : static_cast<Registry>((Registry(1) << Capacity) - 1);

    OccupancyMask() noexcept = default;

    void markAsUsed(std::size_t bit_index) noexcept {
        assert(bit_index < Capacity);
        bits_ = static_cast<Registry>(bits_ | bitFor(bit_index));
    }

    void markAsFree(std::size_t bit_index) noexcept {
        assert(bit_index < Capacity);
        bits_ = static_cast<Registry>(bits_ & static_cast<Registry>(~bitFor(bit_index)));
    }

    bool isUsed(std::size_t bit_index) const noexcept {
        assert(bit_index < Capacity);
        return (bits_ & bitFor(bit_index)) != 0;
    }

    // 最低位的空闲槽；已满时返回 k_not_found（总是 >= Capacity）
    std::size_t findFirstFree() const noexcept {
        const Registry free_bits = static_cast<Registry>(~bits_ & kFullBits);
        if (free_bits == 0) {
            return k_not_found;
        }
        return lowestSetBit(free_bits);
    }

    // 最低位的占用槽；为空时返回 k_not_found
    std::size_t findFirstUsed() const noexcept {
        if (bits_ == 0) {
            return k_not_found;
        }
        return lowestSetBit(bits_);
    }

    std::size_t count() const noexcept {
        return static_cast<std::size_t>(
            __builtin_popcountll(static_cast<unsigned long long>(bits_)));
    }

    bool none() const noexcept { return bits_ == 0; }
    bool full() const noexcept { return bits_ == kFullBits; }

    void reset() noexcept { bits_ = 0; }

    Registry raw() const noexcept { return bits_; }

private:
    static Registry bitFor(std::size_t bit_index) noexcept {
        return static_cast<Registry>(Registry(1) << bit_index);
    }

    static std::size_t lowestSetBit(Registry v) noexcept {
        return static_cast<std::size_t>(
            __builtin_ctzll(static_cast<unsigned long long>(v)));
    }

    Registry bits_ = 0;
};
