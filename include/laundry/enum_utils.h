#pragma once
/*
===============================================================================
ENUM UTILS — Enum-keyed registries for the laundry optimizer
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel and a
fixed-size map keyed by those enumerations. Item types, variable tables and
constraint tables are all sized by COUNT, so adding an enumerator is the only
change needed to grow a registry.

KEY COMPONENTS
--------------
• LAUNDRY_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• enum_size<E>: uniform size trait
• toIndex(): checked enum -> array index conversion
• EnumMap<E, T>: std::array wrapper indexed by enum values

USAGE EXAMPLES
--------------
    LAUNDRY_ENUM_WITH_COUNT(Family, Garment, Shirt, Sheet);

    EnumMap<Family, int> demand{};
    demand[Family::Shirt] = 12;

    for (std::size_t i = 0; i < Family_COUNT; ++i) {
        auto f = static_cast<Family>(i);
        ...
    }

THREAD SAFETY
-------------
• Macros and traits are compile-time only
• EnumMap has value semantics; concurrent const access is safe

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <type_traits>

/**
 * @macro LAUNDRY_ENUM_WITH_COUNT
 * @brief Declares an enum class with an appended COUNT sentinel
 *
 * Expands to:
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not list COUNT yourself; values are sequential from 0.
 */
#define LAUNDRY_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace laundry {

    /// @brief Number of enumerators (COUNT excluded)
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /**
     * @brief Convert an enumerator to an array index
     * @throws std::out_of_range for COUNT or any value past it
     */
    template<typename Enum>
    constexpr std::size_t toIndex(Enum e)
    {
        static_assert(std::is_enum_v<Enum>, "toIndex: Enum must be an enumeration");
        auto idx = static_cast<std::size_t>(e);
        if (idx >= enum_size_v<Enum>) {
            throw std::out_of_range(
                std::format("toIndex: enumerator {} >= {}", idx, enum_size_v<Enum>));
        }
        return idx;
    }

    /**
     * @class EnumMap
     * @brief Fixed-size map with one slot per enumerator
     *
     * @tparam Enum Enumeration declared with LAUNDRY_ENUM_WITH_COUNT
     * @tparam T    Stored value type
     *
     * @example
     *     EnumMap<ItemType, double> prices{};
     *     prices[ItemType::Shirt] = 0.75;
     */
    template<typename Enum, typename T>
    class EnumMap {
    public:
        using storage_type = std::array<T, enum_size_v<Enum>>;

        EnumMap() = default;

        T& operator[](Enum e) { return data_[toIndex(e)]; }
        const T& operator[](Enum e) const { return data_[toIndex(e)]; }

        /// @brief Assign the same value to every slot
        void fill(const T& v) { data_.fill(v); }

        /**
         * @brief Visit every (enumerator, value) pair in declaration order
         * @tparam Fn Callable with signature void(Enum, const T&)
         */
        template<typename Fn>
        void forEach(Fn&& fn) const
        {
            for (std::size_t i = 0; i < data_.size(); ++i)
                fn(static_cast<Enum>(i), data_[i]);
        }

        static constexpr std::size_t size() noexcept { return enum_size_v<Enum>; }

        auto begin() noexcept { return data_.begin(); }
        auto end() noexcept { return data_.end(); }
        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        friend bool operator==(const EnumMap&, const EnumMap&) = default;

    private:
        storage_type data_{};
    };

} // namespace laundry
