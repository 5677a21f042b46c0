#pragma once
/*
===============================================================================
QUOTE JSON — Request, response and pricing-file codecs (nlohmann::json)
===============================================================================

REQUEST
-------
    { "items": { "camisa": 12, "lencol": 3 }, "delivery_location": "Lisboa" }

    delivery_location is optional ("default" when absent or null).

RESPONSE (keys in this order)
-----------------------------
    {
      "total_cost": 12.0,
      "packs_mistos":   { "20": 1 },
      "packs_camisas":  { "10": 1 },
      "packs_lencois":  {},
      "avulso":         { "peca_variada": 0, "camisa": 2, "lencol": 3 },
      "camisas_nos_mistos": { "20": 2 },
      "custos": { "pecas_especiais": 0.0, "packs_mistos": 10.0,
                  "packs_camisas": 7.5, "packs_lencois": 0.0,
                  "avulso": 4.5, "entrega": 0.0 }
    }

PRICING FILE
------------
    {
      "packs_mistos":  [ { "tipo": "20", "capacidade": 20, "limite_camisas": 2, "preco": 10.0 } ],
      "packs_camisas": [ { "tipo": "10", "capacidade": 10, "preco": 7.5 } ],
      "packs_lencois": [ { "tipo": "10", "capacidade": 10, "preco": 9.5 } ],
      "avulso":  { "peca_variada": 0.8, ... every item type ... },
      "entrega": { "lisboa": 0.0, "default": 5.0 }
    }

Malformed requests raise ValidationError; malformed pricing files raise
ConfigError. Responses use ordered_json so pack labels keep their numeric
order ("20" before "100").

===============================================================================
*/

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog.h"
#include "errors.h"
#include "optimizer.h"
#include "order.h"

namespace laundry {

    struct QuoteRequest {
        std::map<std::string, std::int64_t> items;
        std::string deliveryLocation{ DeliveryFees::kDefaultKey };
    };

    // ========================================================================
    // REQUEST
    // ========================================================================

    /// @throws ValidationError on a missing or malformed field, or a count above kMaxQuantity
    inline QuoteRequest parseRequest(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw ValidationError("request must be a JSON object");

        auto items = j.find("items");
        if (items == j.end())
            throw ValidationError("request is missing 'items'", { "items" });
        if (!items->is_object())
            throw ValidationError("'items' must be an object", { "items" });

        QuoteRequest req;
        std::vector<std::string> bad;
        std::vector<std::string> tooLarge;
        for (const auto& [name, qty] : items->items()) {
            if (qty.is_number_unsigned()) {
                auto value = qty.get<std::uint64_t>();
                if (value > static_cast<std::uint64_t>(kMaxQuantity))
                    tooLarge.push_back(name);
                else
                    req.items[name] = static_cast<std::int64_t>(value);
            }
            else if (qty.is_number_integer()) {
                req.items[name] = qty.get<std::int64_t>();
            }
            else {
                bad.push_back(name);
            }
        }
        if (!bad.empty()) {
            std::string list;
            for (const auto& k : bad)
                list += (list.empty() ? "'" : ", '") + k + "'";
            throw ValidationError(std::format("item counts must be integers: [{}]", list), bad);
        }
        if (!tooLarge.empty())
            throw Order::tooLargeError(tooLarge);

        auto loc = j.find("delivery_location");
        if (loc != j.end() && !loc->is_null()) {
            if (!loc->is_string()) {
                throw ValidationError("'delivery_location' must be a string",
                    { "delivery_location" });
            }
            req.deliveryLocation = loc->get<std::string>();
        }
        return req;
    }

    /// @throws ValidationError if the text is not valid JSON or not a valid request
    inline QuoteRequest parseRequestText(std::string_view text)
    {
        auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded())
            throw ValidationError("request body is not valid JSON");
        return parseRequest(j);
    }

    // ========================================================================
    // RESPONSE
    // ========================================================================
    namespace json_detail {

        inline nlohmann::ordered_json packObject(const std::vector<PackCount>& packs)
        {
            auto obj = nlohmann::ordered_json::object();
            for (const auto& p : packs)
                obj[p.label] = p.count;
            return obj;
        }

    } // namespace json_detail

    inline nlohmann::ordered_json toJson(const Quote& q)
    {
        const auto& b = q.breakdown;
        nlohmann::ordered_json j;
        j["total_cost"] = q.totalCost;
        j["packs_mistos"] = json_detail::packObject(b.mixedPacks);
        j["packs_camisas"] = json_detail::packObject(b.shirtPacks);
        j["packs_lencois"] = json_detail::packObject(b.sheetPacks);
        j["avulso"] = {
            { "peca_variada", b.loose.garments },
            { "camisa",       b.loose.shirts },
            { "lencol",       b.loose.sheets },
        };
        j["camisas_nos_mistos"] = json_detail::packObject(b.shirtsInMixed);
        j["custos"] = {
            { "pecas_especiais", b.costs.specials },
            { "packs_mistos",    b.costs.mixedPacks },
            { "packs_camisas",   b.costs.shirtPacks },
            { "packs_lencois",   b.costs.sheetPacks },
            { "avulso",          b.costs.loose },
            { "entrega",         b.costs.delivery },
        };
        return j;
    }

    inline nlohmann::ordered_json errorJson(std::string_view message)
    {
        nlohmann::ordered_json j;
        j["error"] = std::string(message);
        return j;
    }

    // ========================================================================
    // PRICING FILE
    // ========================================================================
    namespace json_detail {

        inline const nlohmann::json& member(const nlohmann::json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end())
                throw ConfigError(std::format("pricing: missing '{}'", key));
            return *it;
        }

        inline std::string labelOf(const nlohmann::json& entry)
        {
            const auto& t = member(entry, "tipo");
            if (t.is_number_integer())
                return std::to_string(t.get<long long>());
            return t.get<std::string>();
        }

        inline std::vector<SinglePack> singlePacks(const nlohmann::json& arr, const char* family)
        {
            if (!arr.is_array())
                throw ConfigError(std::format("pricing: '{}' must be an array", family));
            std::vector<SinglePack> out;
            for (const auto& e : arr) {
                out.push_back({ labelOf(e),
                                member(e, "capacidade").get<int>(),
                                member(e, "preco").get<double>() });
            }
            return out;
        }

    } // namespace json_detail

    /**
     * @brief Build and validate a PricingConfig from its JSON form
     * @throws ConfigError on missing keys, wrong types, unknown item names or
     *         anything validate() rejects
     */
    inline PricingConfig loadPricing(const nlohmann::json& j)
    {
        using json_detail::member;

        PricingConfig cfg;
        try {
            if (!j.is_object())
                throw ConfigError("pricing: document must be an object");

            const auto& mixed = member(j, "packs_mistos");
            if (!mixed.is_array())
                throw ConfigError("pricing: 'packs_mistos' must be an array");
            for (const auto& e : mixed) {
                cfg.catalog.mixedPacks.push_back({ json_detail::labelOf(e),
                                                   member(e, "capacidade").get<int>(),
                                                   member(e, "limite_camisas").get<int>(),
                                                   member(e, "preco").get<double>() });
            }
            cfg.catalog.shirtPacks = json_detail::singlePacks(member(j, "packs_camisas"), "packs_camisas");
            cfg.catalog.sheetPacks = json_detail::singlePacks(member(j, "packs_lencois"), "packs_lencois");

            const auto& prices = member(j, "avulso");
            if (!prices.is_object())
                throw ConfigError("pricing: 'avulso' must be an object");
            EnumMap<ItemType, bool> seen{};
            for (const auto& [name, price] : prices.items()) {
                auto t = parseItemType(name);
                if (!t)
                    throw ConfigError(std::format("pricing: unknown item type '{}'", name));
                cfg.catalog.unitPrices[*t] = price.get<double>();
                seen[*t] = true;
            }
            seen.forEach([](ItemType t, bool present) {
                if (!present) {
                    throw ConfigError(std::format(
                        "pricing: missing unit price for '{}'", itemName(t)));
                }
            });

            const auto& fees = member(j, "entrega");
            if (!fees.is_object())
                throw ConfigError("pricing: 'entrega' must be an object");
            for (const auto& [loc, fee] : fees.items())
                cfg.fees.set(loc, fee.get<double>());
        }
        catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::format("pricing: {}", e.what()));
        }

        validate(cfg);
        return cfg;
    }

    /// @throws ConfigError if the file cannot be read or parsed
    inline PricingConfig loadPricingFile(const std::filesystem::path& path)
    {
        std::ifstream in(path);
        if (!in)
            throw ConfigError(std::format("pricing: cannot open '{}'", path.string()));

        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded())
            throw ConfigError(std::format("pricing: '{}' is not valid JSON", path.string()));
        return loadPricing(j);
    }

    inline nlohmann::ordered_json toJson(const PricingConfig& cfg)
    {
        nlohmann::ordered_json j;

        auto mixed = nlohmann::ordered_json::array();
        for (const auto& p : cfg.catalog.mixedPacks) {
            mixed.push_back({ { "tipo", p.label }, { "capacidade", p.capacity },
                              { "limite_camisas", p.shirtLimit }, { "preco", p.price } });
        }
        j["packs_mistos"] = mixed;

        auto singles = [](const std::vector<SinglePack>& packs) {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& p : packs) {
                arr.push_back({ { "tipo", p.label }, { "capacidade", p.capacity },
                                { "preco", p.price } });
            }
            return arr;
        };
        j["packs_camisas"] = singles(cfg.catalog.shirtPacks);
        j["packs_lencois"] = singles(cfg.catalog.sheetPacks);

        auto prices = nlohmann::ordered_json::object();
        cfg.catalog.unitPrices.forEach([&](ItemType t, double price) {
            prices[std::string(itemName(t))] = price;
        });
        j["avulso"] = prices;

        auto fees = nlohmann::ordered_json::object();
        for (const auto& [loc, fee] : cfg.fees.entries())
            fees[loc] = fee;
        j["entrega"] = fees;

        return j;
    }

} // namespace laundry
