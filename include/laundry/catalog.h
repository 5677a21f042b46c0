#pragma once
/*
===============================================================================
CATALOG — Item types, pack catalog, unit prices and delivery fees
===============================================================================

OVERVIEW
--------
Everything the optimizer needs to price an order, gathered in one immutable
value (PricingConfig). It is built once, validated, and handed to the
optimizer by const reference; no part of the library keeps pricing data in
mutable globals.

KEY COMPONENTS
--------------
• ItemType — fixed set of recognized item types and their wire names
• MixedPack / SinglePack — purchasable bundles
• Catalog — pack lists plus à-la-carte prices
• DeliveryFees — case-insensitive location lookup with a default fee
• PricingConfig, defaultPricing(), validate()

ITEM FAMILIES
-------------
    mixed-eligible   peca_variada, camisa, lencol  (covered by packs)
    specials         vestido_simples, vestido_frisado, fato, casaco, toalha
                     (always priced per unit)

A mixed pack takes up to `capacity` pieces, at most `shirtLimit` of which may
be shirts. Shirt packs take only shirts, sheet packs only sheets.

===============================================================================
*/

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "enum_utils.h"
#include "errors.h"

namespace laundry {

    // ========================================================================
    // ITEM TYPES
    // ========================================================================
    LAUNDRY_ENUM_WITH_COUNT(ItemType,
        GenericGarment,
        Shirt,
        SimpleDress,
        OrnamentedDress,
        FormalSuit,
        Coat,
        Towel,
        Sheet);

    /// @brief Wire name of an item type ("peca_variada", "camisa", ...)
    inline std::string_view itemName(ItemType t)
    {
        switch (t) {
            case ItemType::GenericGarment:  return "peca_variada";
            case ItemType::Shirt:           return "camisa";
            case ItemType::SimpleDress:     return "vestido_simples";
            case ItemType::OrnamentedDress: return "vestido_frisado";
            case ItemType::FormalSuit:      return "fato";
            case ItemType::Coat:            return "casaco";
            case ItemType::Towel:           return "toalha";
            case ItemType::Sheet:           return "lencol";
            case ItemType::COUNT:           break;
        }
        throw std::out_of_range("itemName: invalid item type");
    }

    /// @brief Reverse of itemName(); exact, case-sensitive match
    inline std::optional<ItemType> parseItemType(std::string_view name)
    {
        for (std::size_t i = 0; i < ItemType_COUNT; ++i) {
            auto t = static_cast<ItemType>(i);
            if (itemName(t) == name)
                return t;
        }
        return std::nullopt;
    }

    /// @brief Specials are never covered by packs
    constexpr bool isSpecial(ItemType t) noexcept
    {
        return t != ItemType::GenericGarment
            && t != ItemType::Shirt
            && t != ItemType::Sheet;
    }

    inline std::vector<ItemType> specialItems()
    {
        std::vector<ItemType> out;
        for (std::size_t i = 0; i < ItemType_COUNT; ++i) {
            auto t = static_cast<ItemType>(i);
            if (isSpecial(t))
                out.push_back(t);
        }
        return out;
    }

    // ========================================================================
    // PACKS
    // ========================================================================
    struct MixedPack {
        std::string label;
        int capacity = 0;
        int shirtLimit = 0;
        double price = 0.0;
    };

    /// @brief Shirt-only or sheet-only pack
    struct SinglePack {
        std::string label;
        int capacity = 0;
        double price = 0.0;
    };

    /**
     * @brief Numeric value of a pack label ("150" -> 150)
     * @return std::nullopt when the label is empty or not a plain integer
     */
    inline std::optional<long> labelValue(std::string_view label)
    {
        if (label.empty())
            return std::nullopt;

        long v = 0;
        auto [ptr, ec] = std::from_chars(label.data(), label.data() + label.size(), v);
        if (ec != std::errc{} || ptr != label.data() + label.size())
            return std::nullopt;
        return v;
    }

    /// @brief Labels of a pack list, in catalog order
    template<typename Pack>
    std::vector<std::string> labelsOf(const std::vector<Pack>& packs)
    {
        std::vector<std::string> out;
        out.reserve(packs.size());
        for (const auto& p : packs)
            out.push_back(p.label);
        return out;
    }

    struct Catalog {
        std::vector<MixedPack>  mixedPacks;
        std::vector<SinglePack> shirtPacks;
        std::vector<SinglePack> sheetPacks;
        EnumMap<ItemType, double> unitPrices{};

        double unitPrice(ItemType t) const { return unitPrices[t]; }
    };

    // ========================================================================
    // DELIVERY FEES
    // ========================================================================
    /**
     * @class DeliveryFees
     * @brief Location -> flat delivery fee, falling back to a default entry
     *
     * @details Locations are stored lower-cased. feeFor() lower-cases the
     *          requested location before the lookup, so "Montijo", "MONTIJO"
     *          and "montijo" all resolve to the same entry. An unknown location
     *          is not an error: it silently gets the default fee.
     */
    class DeliveryFees {
    public:
        static constexpr std::string_view kDefaultKey = "default";

        DeliveryFees() = default;

        explicit DeliveryFees(const std::map<std::string, double>& fees)
        {
            for (const auto& [loc, fee] : fees)
                set(loc, fee);
        }

        static std::string normalize(std::string_view location)
        {
            std::string out(location);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        void set(std::string_view location, double fee)
        {
            fees_[normalize(location)] = fee;
        }

        bool hasDefault() const { return fees_.count(std::string(kDefaultKey)) > 0; }

        /// @throws ConfigError if the table has no default entry
        double defaultFee() const
        {
            auto it = fees_.find(std::string(kDefaultKey));
            if (it == fees_.end())
                throw ConfigError("delivery fee table has no 'default' entry");
            return it->second;
        }

        double feeFor(std::string_view location) const
        {
            auto it = fees_.find(normalize(location));
            return it != fees_.end() ? it->second : defaultFee();
        }

        const std::map<std::string, double>& entries() const noexcept { return fees_; }

    private:
        std::map<std::string, double> fees_;
    };

    // ========================================================================
    // PRICING CONFIGURATION
    // ========================================================================
    struct PricingConfig {
        Catalog catalog;
        DeliveryFees fees;
    };

    namespace catalog_detail {

        template<typename Pack>
        void checkLabels(const std::vector<Pack>& packs, std::string_view family)
        {
            std::set<long> seen;
            for (const auto& p : packs) {
                auto v = labelValue(p.label);
                if (!v) {
                    throw ConfigError(std::format(
                        "{}: pack label '{}' is not numeric", family, p.label));
                }
                if (!seen.insert(*v).second) {
                    throw ConfigError(std::format(
                        "{}: duplicate pack label '{}'", family, p.label));
                }
                if (p.capacity <= 0) {
                    throw ConfigError(std::format(
                        "{}: pack '{}' has non-positive capacity {}", family, p.label, p.capacity));
                }
                if (p.price < 0.0) {
                    throw ConfigError(std::format(
                        "{}: pack '{}' has negative price {}", family, p.label, p.price));
                }
            }
        }

    } // namespace catalog_detail

    /**
     * @brief Check a pricing configuration for internal consistency
     *
     * @throws ConfigError on non-numeric or duplicate labels, non-positive
     *         capacities, negative prices, shirt limits outside
     *         [0, capacity], negative unit prices or delivery fees, or a
     *         missing default delivery fee
     */
    inline void validate(const PricingConfig& cfg)
    {
        const auto& c = cfg.catalog;

        catalog_detail::checkLabels(c.mixedPacks, "packs_mistos");
        catalog_detail::checkLabels(c.shirtPacks, "packs_camisas");
        catalog_detail::checkLabels(c.sheetPacks, "packs_lencois");

        for (const auto& p : c.mixedPacks) {
            if (p.shirtLimit < 0 || p.shirtLimit > p.capacity) {
                throw ConfigError(std::format(
                    "packs_mistos: pack '{}' shirt limit {} outside [0, {}]",
                    p.label, p.shirtLimit, p.capacity));
            }
        }

        c.unitPrices.forEach([](ItemType t, double price) {
            if (price < 0.0) {
                throw ConfigError(std::format(
                    "avulso: negative unit price {} for '{}'", price, itemName(t)));
            }
        });

        if (!cfg.fees.hasDefault())
            throw ConfigError("entrega: missing 'default' delivery fee");

        for (const auto& [loc, fee] : cfg.fees.entries()) {
            if (fee < 0.0) {
                throw ConfigError(std::format(
                    "entrega: negative fee {} for '{}'", fee, loc));
            }
        }
    }

    /// @brief Built-in price list and delivery table
    inline PricingConfig defaultPricing()
    {
        PricingConfig cfg;
        auto& c = cfg.catalog;

        c.mixedPacks = {
            { "20",  20,  2, 10.0 },
            { "40",  40,  4, 20.0 },
            { "60",  60,  5, 30.0 },
            { "80",  80,  5, 37.5 },
            { "100", 100, 6, 45.0 },
            { "150", 150, 6, 65.0 },
            { "200", 200, 7, 85.0 },
        };
        c.shirtPacks = {
            { "10", 10, 7.5 },
            { "20", 20, 14.0 },
            { "50", 50, 37.5 },
        };
        c.sheetPacks = {
            { "10", 10, 9.5 },
            { "20", 20, 18.0 },
        };

        c.unitPrices[ItemType::GenericGarment]  = 0.80;
        c.unitPrices[ItemType::Shirt]           = 0.75;
        c.unitPrices[ItemType::SimpleDress]     = 7.0;
        c.unitPrices[ItemType::OrnamentedDress] = 12.5;
        c.unitPrices[ItemType::FormalSuit]      = 5.5;
        c.unitPrices[ItemType::Coat]            = 3.5;
        c.unitPrices[ItemType::Towel]           = 3.5;
        c.unitPrices[ItemType::Sheet]           = 1.0;

        cfg.fees.set("montijo", 5.0);
        cfg.fees.set("lisboa", 0.0);
        cfg.fees.set("porto", 0.0);
        cfg.fees.set(DeliveryFees::kDefaultKey, 5.0);

        return cfg;
    }

} // namespace laundry
