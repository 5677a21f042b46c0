#pragma once
/*
===============================================================================
OPTIMIZER — Cheapest way to launder an order
===============================================================================

Overview
--------
LaundryOptimizer turns an order and a delivery location into a Quote:

    order ──► specials (per unit)                     ─┐
          └─► garments / shirts / sheets ──► CostModel ─┼─► Quote
    location ──► delivery fee                         ─┘

    total = specials + optimal pack/loose spend + delivery fee

Every currency figure in the Quote is rounded to cents. Pack counts and the
shirts-in-mixed-pack allocation list only non-zero entries, in ascending
numeric label order. rawVariables reports every decision variable.

Typical Usage
-------------
    laundry::LaundryOptimizer opt;                       // built-in prices
    auto quote = opt.optimize({ { "camisa", 12 } }, "lisboa");
    std::cout << quote.totalCost << "\n";                // 9

Failure
-------
    ValidationError  unknown item names / negative counts (via Order)
    SolverError      no proven optimum, solver exception, or an allocation
                     that fails the coverage re-check
    ConfigError      constructor, when the pricing configuration is invalid

Concurrency
-----------
optimize() is const and builds a private CostModel (own Gurobi environment)
per call; one optimizer may serve concurrent callers.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "catalog.h"
#include "cost_model.h"
#include "diagnostics.h"
#include "errors.h"
#include "logging.h"
#include "order.h"

namespace laundry {

    /// @brief Purchase count of one pack type, keyed by its catalog label
    struct PackCount {
        std::string label;
        long long count = 0;

        friend bool operator==(const PackCount&, const PackCount&) = default;
    };

    /// @brief Items bought individually in each pack-eligible family
    struct LooseCounts {
        long long garments = 0;
        long long shirts = 0;
        long long sheets = 0;

        friend bool operator==(const LooseCounts&, const LooseCounts&) = default;
    };

    /// @brief Spend attributed to each part of the order, rounded to cents
    struct CostSummary {
        double specials = 0.0;
        double mixedPacks = 0.0;
        double shirtPacks = 0.0;
        double sheetPacks = 0.0;
        double loose = 0.0;
        double delivery = 0.0;

        friend bool operator==(const CostSummary&, const CostSummary&) = default;
    };

    /**
     * @struct Breakdown
     * @brief What to buy and what each part costs
     *
     * @details Pack lists hold non-zero counts only, sorted by numeric label.
     *          shirtsInMixed gives, per mixed pack type, the shirts placed in
     *          those packs.
     */
    struct Breakdown {
        std::vector<PackCount> mixedPacks;
        std::vector<PackCount> shirtPacks;
        std::vector<PackCount> sheetPacks;
        LooseCounts loose;
        std::vector<PackCount> shirtsInMixed;
        CostSummary costs;
    };

    /// @brief Result of LaundryOptimizer::optimize()
    struct Quote {
        double totalCost = 0.0;
        Breakdown breakdown;
        std::map<std::string, long long> rawVariables;
    };

    /// @brief Round to cents; never returns negative zero
    inline double roundCurrency(double v)
    {
        double r = std::round(v * 100.0) / 100.0;
        return r == 0.0 ? 0.0 : r;
    }

    namespace optimizer_detail {

        /// @brief Non-zero counts with their labels, sorted by numeric label
        inline std::vector<PackCount> nonZero(const std::vector<std::string>& labels,
            const std::vector<long long>& counts)
        {
            std::vector<PackCount> out;
            for (std::size_t i = 0; i < labels.size() && i < counts.size(); ++i) {
                if (counts[i] != 0)
                    out.push_back({ labels[i], counts[i] });
            }
            std::stable_sort(out.begin(), out.end(),
                [](const PackCount& a, const PackCount& b) {
                    return labelValue(a.label).value_or(0) < labelValue(b.label).value_or(0);
                });
            return out;
        }

    } // namespace optimizer_detail

    /**
     * @brief Solve a cost model and require a proven optimum
     *
     * @param context Order description used in the error log line
     * @throws SolverError with the Gurobi status when the solve ends in any
     *         state other than GRB_OPTIMAL, or with the GRBException error
     *         code when the engine itself fails
     */
    inline void solveToOptimality(CostModel& model, Logger& log, const std::string& context)
    {
        try {
            model.optimize();

            if (!model.solved()) {
                int status = model.status();
                log.error("Solver failed: status={} for order {}", statusString(status), context);
                throw SolverError(
                    std::format("Solver failed: {}", statusString(status)), status);
            }

            if (log.enabled(LogLevel::Debug)) {
                log.debug("{} | runtime={:.3f}s nodes={}",
                    modelSummary(model.model()), model.runtime(), model.nodeCount());
            }
        }
        catch (const GRBException& e) {
            log.error("Gurobi error {}: {}", e.getErrorCode(), e.getMessage());
            throw SolverError(
                std::format("Solver engine error {}: {}", e.getErrorCode(), e.getMessage()),
                e.getErrorCode());
        }
    }

    /**
     * @class LaundryOptimizer
     * @brief Prices orders at minimum cost under one pricing configuration
     *
     * @details Immutable after construction. Every optimize() call builds its
     *          own CostModel (and Gurobi environment), so one optimizer may be
     *          shared by concurrent callers as long as the logger is.
     *
     * @example
     *     LaundryOptimizer opt;
     *     Quote q = opt.optimize({ { "camisa", 12 } }, "Lisboa");  // 9.00
     */
    class LaundryOptimizer {
    public:
        /// @throws ConfigError if the pricing configuration is invalid
        explicit LaundryOptimizer(PricingConfig pricing = defaultPricing(),
            SolveSettings settings = {},
            Logger& log = Logger::defaultLogger())
            : pricing_(std::move(pricing)), settings_(settings), log_(log)
        {
            validate(pricing_);
        }

        const PricingConfig& pricing() const noexcept { return pricing_; }
        const SolveSettings& settings() const noexcept { return settings_; }

        /// @brief Fee for a location, case-insensitive, default fee if unknown
        double deliveryFee(std::string_view location) const
        {
            return pricing_.fees.feeFor(location);
        }

        /**
         * @brief Validate raw item counts and quote them
         * @throws ValidationError for unknown item names, negative counts or
         *         counts above kMaxQuantity
         * @throws SolverError if no proven optimum is obtained
         */
        Quote optimize(const std::map<std::string, std::int64_t>& items,
            std::string_view deliveryLocation = DeliveryFees::kDefaultKey) const
        {
            return optimize(Order::fromCounts(items), deliveryLocation);
        }

        /**
         * @brief Quote a validated order
         *
         * @details Total = specials + optimal pack and loose spend + delivery
         *          fee. The allocation is re-checked against every row before
         *          it is reported; no partial quote is ever returned.
         *
         * @throws SolverError if the solve is not certified optimal, the
         *         engine fails, or the returned allocation violates a row
         */
        Quote optimize(const Order& order,
            std::string_view deliveryLocation = DeliveryFees::kDefaultKey) const
        {
            const Catalog& catalog = pricing_.catalog;

            double fee = deliveryFee(deliveryLocation);
            log_.info("Order {} | delivery={} ({:.2f} EUR)",
                order.toString(), deliveryLocation, fee);

            double specials = order.specialsCost(catalog);
            FamilyDemand demand = order.familyDemand();

            CostModel model(catalog, demand, settings_);
            solveToOptimality(model, log_, order.toString());

            const Allocation& a = model.allocation();
            std::string violation = findViolation(catalog, a, demand);
            if (!violation.empty()) {
                log_.error("Solver allocation rejected: {}", violation);
                throw SolverError(
                    std::format("Solver returned an infeasible allocation: {}", violation),
                    GRB_NUMERIC);
            }

            Spend spend = spendOf(catalog, a);

            Quote q;
            auto& b = q.breakdown;
            b.mixedPacks = optimizer_detail::nonZero(labelsOf(catalog.mixedPacks), a.mixedPacks);
            b.shirtPacks = optimizer_detail::nonZero(labelsOf(catalog.shirtPacks), a.shirtPacks);
            b.sheetPacks = optimizer_detail::nonZero(labelsOf(catalog.sheetPacks), a.sheetPacks);
            b.loose = { a.looseGarments, a.looseShirts, a.looseSheets };
            b.shirtsInMixed = optimizer_detail::nonZero(labelsOf(catalog.mixedPacks), a.shirtsInMixed);

            b.costs.specials = roundCurrency(specials);
            b.costs.mixedPacks = roundCurrency(spend.mixedPacks);
            b.costs.shirtPacks = roundCurrency(spend.shirtPacks);
            b.costs.sheetPacks = roundCurrency(spend.sheetPacks);
            b.costs.loose = roundCurrency(spend.loose);
            b.costs.delivery = roundCurrency(fee);

            q.totalCost = roundCurrency(specials + spend.total() + fee);
            q.rawVariables = model.rawValues();

            log_.info("Quote total={:.2f} EUR (packs={}, loose={})",
                q.totalCost, a.totalPacks(), a.looseGarments + a.looseShirts + a.looseSheets);
            return q;
        }

    private:
        PricingConfig pricing_;
        SolveSettings settings_;
        Logger& log_;
    };

} // namespace laundry
