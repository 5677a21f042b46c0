#pragma once
/*
===============================================================================
ORDER — Validated item counts for one quote
===============================================================================

An Order holds one non-negative quantity per recognized item type. It is
built either directly (set()) or from a raw name -> count mapping with
Order::fromCounts(), which is where request validation happens:

    * every key must be a recognized item name, otherwise a ValidationError
      listing all offending keys is thrown;
    * every count must be >= 0 and at most kMaxQuantity;
    * names that are absent default to zero.

The upper bound keeps every demand exact as a double and every pack-capacity
sum well inside int64.

===============================================================================
*/

#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <vector>

#include "catalog.h"
#include "enum_utils.h"
#include "errors.h"

namespace laundry {

    /// @brief Largest accepted count for a single item type
    inline constexpr std::int64_t kMaxQuantity = 1'000'000'000;

    /// @brief Quantities of the three pack-eligible families
    struct FamilyDemand {
        std::int64_t garments = 0;
        std::int64_t shirts = 0;
        std::int64_t sheets = 0;
    };

    class Order {
    public:
        Order() = default;

        /**
         * @brief Build an order from raw item counts
         * @throws ValidationError naming every unrecognized key, or naming the
         *         keys whose count is negative or above kMaxQuantity
         */
        static Order fromCounts(const std::map<std::string, std::int64_t>& counts)
        {
            std::vector<std::string> unknown;
            for (const auto& [name, qty] : counts) {
                if (!parseItemType(name))
                    unknown.push_back(name);
            }
            if (!unknown.empty()) {
                throw ValidationError(
                    std::format("Unknown item types: {}", joinKeys(unknown)), unknown);
            }

            std::vector<std::string> negative;
            std::vector<std::string> tooLarge;
            Order order;
            for (const auto& [name, qty] : counts) {
                if (qty < 0) {
                    negative.push_back(name);
                    continue;
                }
                if (qty > kMaxQuantity) {
                    tooLarge.push_back(name);
                    continue;
                }
                order.quantities_[*parseItemType(name)] = qty;
            }
            if (!negative.empty()) {
                throw ValidationError(
                    std::format("Negative quantities for: {}", joinKeys(negative)), negative);
            }
            if (!tooLarge.empty())
                throw tooLargeError(tooLarge);
            return order;
        }

        /// @throws ValidationError if qty < 0 or qty > kMaxQuantity
        Order& set(ItemType t, std::int64_t qty)
        {
            if (qty < 0) {
                std::string name(itemName(t));
                throw ValidationError(
                    std::format("Negative quantities for: [{}]", name), { name });
            }
            if (qty > kMaxQuantity)
                throw tooLargeError({ std::string(itemName(t)) });
            quantities_[t] = qty;
            return *this;
        }

        std::int64_t quantity(ItemType t) const { return quantities_[t]; }

        FamilyDemand familyDemand() const
        {
            return { quantities_[ItemType::GenericGarment],
                     quantities_[ItemType::Shirt],
                     quantities_[ItemType::Sheet] };
        }

        /// @brief Per-unit cost of the items that are never pack-eligible
        double specialsCost(const Catalog& catalog) const
        {
            double total = 0.0;
            for (ItemType t : specialItems())
                total += static_cast<double>(quantities_[t]) * catalog.unitPrice(t);
            return total;
        }

        bool empty() const
        {
            for (auto q : quantities_) {
                if (q != 0)
                    return false;
            }
            return true;
        }

        /// @brief "{peca_variada: 3, camisa: 12, ...}" with every item type listed
        std::string toString() const
        {
            std::string out = "{";
            quantities_.forEach([&](ItemType t, std::int64_t q) {
                if (out.size() > 1)
                    out += ", ";
                out += std::format("{}: {}", itemName(t), q);
            });
            out += "}";
            return out;
        }

        friend bool operator==(const Order&, const Order&) = default;

        /// @brief Error for counts above kMaxQuantity, naming the keys
        static ValidationError tooLargeError(const std::vector<std::string>& keys)
        {
            return ValidationError(
                std::format("Quantities above {} for: {}", kMaxQuantity, joinKeys(keys)), keys);
        }

    private:
        static std::string joinKeys(const std::vector<std::string>& keys)
        {
            std::string out = "[";
            for (std::size_t i = 0; i < keys.size(); ++i) {
                if (i > 0)
                    out += ", ";
                out += "'" + keys[i] + "'";
            }
            out += "]";
            return out;
        }

        EnumMap<ItemType, std::int64_t> quantities_{};
    };

} // namespace laundry
