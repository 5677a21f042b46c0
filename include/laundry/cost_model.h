#pragma once
/*
===============================================================================
COST MODEL — Integer program choosing packs and loose items for one order
===============================================================================

MATHEMATICAL MODEL
------------------
Sets:
    M   mixed packs       (capacity c_m, shirt limit l_m, price p_m)
    C   shirt packs       (capacity c_c, price p_c)
    L   sheet packs       (capacity c_l, price p_l)

Demand:
    G garments, S shirts, H sheets

Variables (integer, >= 0):
    x_m   mixed packs bought            x_misto_<label>
    y_c   shirt packs bought            y_cam_<label>
    z_l   sheet packs bought            z_len_<label>
    s_m   shirts placed in mixed packs  s_cam_<label>
    a_g, a_s, a_h  loose garments / shirts / sheets

Objective:
    min  sum p_m x_m + sum p_c y_c + sum p_l z_l
         + u_g a_g + u_s a_s + u_h a_h

Constraints:
    limite_camisas[m]:   s_m <= l_m x_m
    cobertura_camisas:   sum s_m + sum c_c y_c + a_s >= S
    cobertura_pecas:     sum (c_m x_m - s_m) + a_g >= G
    cobertura_lencois:   sum c_l z_l + a_h >= H

The loose-item variables are unbounded, so the program is always feasible;
a non-optimal status means a solver problem, not a bad order.

TIE-BREAK
---------
With TieBreak::FewestPacks a second, lower-priority objective minimizes the
total number of packs bought. It never changes the optimal spend, only which
of several equally cheap allocations is returned.

===============================================================================
*/

#include <cstdint>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "gurobi_c++.h"

#include "catalog.h"
#include "constraints.h"
#include "diagnostics.h"
#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"
#include "model_builder.h"
#include "order.h"
#include "variables.h"

namespace laundry {

    /// @brief Variable families of the cost model, one table slot each
    LAUNDRY_ENUM_WITH_COUNT(CostVar,
        MixedPacks,
        ShirtPacks,
        SheetPacks,
        LooseGarments,
        LooseShirts,
        LooseSheets,
        ShirtsInMixed);

    /// @brief Row families: per-pack shirt limits and the three coverage rows
    LAUNDRY_ENUM_WITH_COUNT(CostCon,
        ShirtLimit,
        ShirtCover,
        GarmentCover,
        SheetCover);

    /// @brief Choice among allocations of equal spend
    enum class TieBreak {
        None,         ///< whatever optimum Gurobi returns first
        FewestPacks   ///< secondary objective: minimize the number of packs
    };

    /**
     * @struct SolveSettings
     * @brief Solver parameters applied by CostModel::addParameters()
     *
     * @note MIPGap is always 0; only a proven optimum is accepted.
     */
    struct SolveSettings {
        double timeLimitSeconds = 10.0;   ///< <= 0 disables the limit
        int threads = 1;
        TieBreak tieBreak = TieBreak::FewestPacks;
        bool solverOutput = false;
    };

    /// @brief Integer decision values; pack vectors follow catalog order
    struct Allocation {
        std::vector<long long> mixedPacks;
        std::vector<long long> shirtPacks;
        std::vector<long long> sheetPacks;
        std::vector<long long> shirtsInMixed;
        long long looseGarments = 0;
        long long looseShirts = 0;
        long long looseSheets = 0;

        long long totalPacks() const
        {
            long long n = 0;
            for (auto v : mixedPacks) n += v;
            for (auto v : shirtPacks) n += v;
            for (auto v : sheetPacks) n += v;
            return n;
        }
    };

    /// @brief Unrounded spend per family of an allocation
    struct Spend {
        double mixedPacks = 0.0;
        double shirtPacks = 0.0;
        double sheetPacks = 0.0;
        double loose = 0.0;

        double total() const { return mixedPacks + shirtPacks + sheetPacks + loose; }
    };

    namespace cost_detail {

        template<typename Pack>
        double packSpend(const std::vector<Pack>& packs, const std::vector<long long>& n)
        {
            double total = 0.0;
            for (std::size_t i = 0; i < packs.size() && i < n.size(); ++i)
                total += packs[i].price * static_cast<double>(n[i]);
            return total;
        }

        template<typename Pack>
        long long packCapacity(const std::vector<Pack>& packs, const std::vector<long long>& n)
        {
            long long total = 0;
            for (std::size_t i = 0; i < packs.size() && i < n.size(); ++i)
                total += static_cast<long long>(packs[i].capacity) * n[i];
            return total;
        }

        template<typename Pack>
        std::vector<double> prices(const std::vector<Pack>& packs)
        {
            std::vector<double> out;
            for (const auto& p : packs)
                out.push_back(p.price);
            return out;
        }

        template<typename Pack>
        std::vector<double> capacities(const std::vector<Pack>& packs)
        {
            std::vector<double> out;
            for (const auto& p : packs)
                out.push_back(static_cast<double>(p.capacity));
            return out;
        }

    } // namespace cost_detail

    /// @brief Price an allocation at catalog prices, per family
    inline Spend spendOf(const Catalog& catalog, const Allocation& a)
    {
        Spend s;
        s.mixedPacks = cost_detail::packSpend(catalog.mixedPacks, a.mixedPacks);
        s.shirtPacks = cost_detail::packSpend(catalog.shirtPacks, a.shirtPacks);
        s.sheetPacks = cost_detail::packSpend(catalog.sheetPacks, a.sheetPacks);
        s.loose =
            catalog.unitPrice(ItemType::GenericGarment) * static_cast<double>(a.looseGarments) +
            catalog.unitPrice(ItemType::Shirt) * static_cast<double>(a.looseShirts) +
            catalog.unitPrice(ItemType::Sheet) * static_cast<double>(a.looseSheets);
        return s;
    }

    /**
     * @brief Describe the first violated model constraint, if any
     * @return Empty string when the allocation is non-negative, respects every
     *         shirt limit and covers all three families
     */
    inline std::string findViolation(const Catalog& catalog, const Allocation& a,
        const FamilyDemand& demand)
    {
        const auto& mixed = catalog.mixedPacks;
        if (a.mixedPacks.size() != mixed.size() || a.shirtsInMixed.size() != mixed.size()
            || a.shirtPacks.size() != catalog.shirtPacks.size()
            || a.sheetPacks.size() != catalog.sheetPacks.size()) {
            return "allocation does not match catalog size";
        }

        auto negative = [](const std::vector<long long>& v) {
            for (auto n : v) {
                if (n < 0)
                    return true;
            }
            return false;
        };
        if (negative(a.mixedPacks) || negative(a.shirtPacks) || negative(a.sheetPacks)
            || negative(a.shirtsInMixed)
            || a.looseGarments < 0 || a.looseShirts < 0 || a.looseSheets < 0) {
            return "negative decision value";
        }

        long long shirtsInMixed = 0;
        long long garmentRoom = 0;
        for (std::size_t i = 0; i < mixed.size(); ++i) {
            long long limit = static_cast<long long>(mixed[i].shirtLimit) * a.mixedPacks[i];
            if (a.shirtsInMixed[i] > limit) {
                return std::format("limite_camisas[{}]: {} shirts > {}",
                    mixed[i].label, a.shirtsInMixed[i], limit);
            }
            shirtsInMixed += a.shirtsInMixed[i];
            garmentRoom += static_cast<long long>(mixed[i].capacity) * a.mixedPacks[i]
                - a.shirtsInMixed[i];
        }

        long long shirtCover = shirtsInMixed
            + cost_detail::packCapacity(catalog.shirtPacks, a.shirtPacks) + a.looseShirts;
        if (shirtCover < demand.shirts)
            return std::format("cobertura_camisas: {} < {}", shirtCover, demand.shirts);

        long long garmentCover = garmentRoom + a.looseGarments;
        if (garmentCover < demand.garments)
            return std::format("cobertura_pecas: {} < {}", garmentCover, demand.garments);

        long long sheetCover = cost_detail::packCapacity(catalog.sheetPacks, a.sheetPacks)
            + a.looseSheets;
        if (sheetCover < demand.sheets)
            return std::format("cobertura_lencois: {} < {}", sheetCover, demand.sheets);

        return {};
    }

    // ============================================================================
    // COST MODEL BUILDER
    // ============================================================================
    /**
     * @class CostModel
     * @brief Integer program choosing packs and loose items for one order
     *
     * @details Variables: x_misto_<p>, y_cam_<p>, z_len_<p> pack counts,
     *          s_cam_<p> shirts placed in mixed pack type p, and the loose
     *          counts a_variada, a_camisa, a_lencol. Rows: limite_camisas[<p>]
     *          caps s_cam_<p> at the pack's shirt limit times x_misto_<p>;
     *          cobertura_* cover each family's demand.
     *
     * @example
     *     CostModel m(catalog, order.familyDemand());
     *     m.optimize();
     *     if (m.solved())
     *         auto spend = spendOf(catalog, m.allocation());
     */
    class CostModel : public ModelBuilder<CostVar, CostCon> {
    public:
        using Base = ModelBuilder<CostVar, CostCon>;

        /// @note The catalog must outlive the model
        CostModel(const Catalog& catalog, FamilyDemand demand, SolveSettings settings = {})
            : catalog_(catalog), demand_(demand), settings_(settings)
        {
        }

        CostModel(GRBModel& external, const Catalog& catalog, FamilyDemand demand,
            SolveSettings settings = {})
            : Base(external), catalog_(catalog), demand_(demand), settings_(settings)
        {
        }

        const FamilyDemand& demand() const noexcept { return demand_; }
        const SolveSettings& settings() const noexcept { return settings_; }

        /// @brief True once afterOptimize() extracted an optimal allocation
        bool solved() const noexcept { return solved_; }

        /// @throws std::logic_error before a successful solve
        const Allocation& allocation() const
        {
            requireSolved("allocation");
            return allocation_;
        }

        /**
         * @brief Every decision variable name -> integer value
         * @throws std::logic_error before a successful solve
         */
        std::map<std::string, long long> rawValues() const
        {
            requireSolved("rawValues");
            std::map<std::string, long long> out;
            for (auto key : { CostVar::MixedPacks, CostVar::ShirtPacks, CostVar::SheetPacks,
                              CostVar::ShirtsInMixed }) {
                const auto& g = variables().get(key).group();
                for (std::size_t i = 0; i < g.size(); ++i)
                    out[g.name(i)] = count(g.at(i));
            }
            for (auto key : { CostVar::LooseGarments, CostVar::LooseShirts, CostVar::LooseSheets }) {
                const auto& c = variables().get(key);
                out[c.scalarName()] = count(c.scalar());
            }
            return out;
        }

        // ---------------------------------------------------------------------
        // Spend expressions (usable once variables exist)
        // ---------------------------------------------------------------------
        /// @brief Sum of mixed-pack prices times x_misto_<p>
        GRBLinExpr mixedPackSpend() const
        {
            return dot(cost_detail::prices(catalog_.mixedPacks), group(CostVar::MixedPacks));
        }

        GRBLinExpr shirtPackSpend() const
        {
            return dot(cost_detail::prices(catalog_.shirtPacks), group(CostVar::ShirtPacks));
        }

        GRBLinExpr sheetPackSpend() const
        {
            return dot(cost_detail::prices(catalog_.sheetPacks), group(CostVar::SheetPacks));
        }

        /// @brief Unit prices times the three loose counts
        GRBLinExpr looseSpend() const
        {
            const auto& v = variables();
            return catalog_.unitPrice(ItemType::GenericGarment) * v.var(CostVar::LooseGarments)
                + catalog_.unitPrice(ItemType::Shirt) * v.var(CostVar::LooseShirts)
                + catalog_.unitPrice(ItemType::Sheet) * v.var(CostVar::LooseSheets);
        }

        /// @brief Primary objective
        GRBLinExpr totalSpend() const
        {
            return mixedPackSpend() + shirtPackSpend() + sheetPackSpend() + looseSpend();
        }

        /// @brief Secondary objective under TieBreak::FewestPacks
        GRBLinExpr packCount() const
        {
            return sum(group(CostVar::MixedPacks)) + sum(group(CostVar::ShirtPacks))
                + sum(group(CostVar::SheetPacks));
        }

    protected:
        void configureEnvironment(GRBEnv& env) override
        {
            env.set(GRB_IntParam_OutputFlag, settings_.solverOutput ? 1 : 0);
        }

        void addVariables() override
        {
            auto& m = model();
            auto& v = variables();

            v.set(CostVar::MixedPacks, VariableFactory::addPerPack(
                m, GRB_INTEGER, 0.0, GRB_INFINITY, "x_misto", labelsOf(catalog_.mixedPacks)));
            v.set(CostVar::ShirtPacks, VariableFactory::addPerPack(
                m, GRB_INTEGER, 0.0, GRB_INFINITY, "y_cam", labelsOf(catalog_.shirtPacks)));
            v.set(CostVar::SheetPacks, VariableFactory::addPerPack(
                m, GRB_INTEGER, 0.0, GRB_INFINITY, "z_len", labelsOf(catalog_.sheetPacks)));

            v.set(CostVar::LooseGarments,
                VariableFactory::add(m, GRB_INTEGER, 0.0, GRB_INFINITY, "a_variada"));
            v.set(CostVar::LooseShirts,
                VariableFactory::add(m, GRB_INTEGER, 0.0, GRB_INFINITY, "a_camisa"));
            v.set(CostVar::LooseSheets,
                VariableFactory::add(m, GRB_INTEGER, 0.0, GRB_INFINITY, "a_lencol"));

            v.set(CostVar::ShirtsInMixed, VariableFactory::addPerPack(
                m, GRB_INTEGER, 0.0, GRB_INFINITY, "s_cam", labelsOf(catalog_.mixedPacks)));
        }

        void addConstraints() override
        {
            auto& m = model();
            const auto& mixed = catalog_.mixedPacks;
            const auto& X = group(CostVar::MixedPacks);
            const auto& S = group(CostVar::ShirtsInMixed);
            const auto& v = variables();

            constraints().set(CostCon::ShirtLimit, ConstraintFactory::addPerPack(
                m, "limite_camisas", labelsOf(mixed),
                [&](std::size_t p) {
                    return S(p) <= static_cast<double>(mixed[p].shirtLimit) * X(p);
                }));

            constraints().set(CostCon::ShirtCover, ConstraintFactory::add(
                m, "cobertura_camisas",
                [&] {
                    return sum(S)
                        + dot(cost_detail::capacities(catalog_.shirtPacks), group(CostVar::ShirtPacks))
                        + v.var(CostVar::LooseShirts)
                        >= static_cast<double>(demand_.shirts);
                }));

            constraints().set(CostCon::GarmentCover, ConstraintFactory::add(
                m, "cobertura_pecas",
                [&] {
                    return dot(cost_detail::capacities(mixed), X) - sum(S)
                        + v.var(CostVar::LooseGarments)
                        >= static_cast<double>(demand_.garments);
                }));

            constraints().set(CostCon::SheetCover, ConstraintFactory::add(
                m, "cobertura_lencois",
                [&] {
                    return dot(cost_detail::capacities(catalog_.sheetPacks), group(CostVar::SheetPacks))
                        + v.var(CostVar::LooseSheets)
                        >= static_cast<double>(demand_.sheets);
                }));
        }

        /// @brief Output, threads and time limit from settings; MIPGap 0
        void addParameters() override
        {
            if (settings_.solverOutput)
                verbose();
            else
                quiet();
            threads(settings_.threads);
            timeLimit(settings_.timeLimitSeconds);
            mipGapLimit(0.0);
        }

        void addObjective() override
        {
            if (settings_.tieBreak == TieBreak::FewestPacks) {
                minimizeHierarchical({
                    { totalSpend(), "custo" },
                    { packCount(), "packs" },
                });
            }
            else {
                minimize(totalSpend());
            }
        }

        void beforeOptimize() override
        {
            solved_ = false;
            allocation_ = {};
        }

        /// @brief Read the rounded allocation, only for GRB_OPTIMAL
        void afterOptimize() override
        {
            if (!isOptimal())
                return;

            allocation_.mixedPacks = counts(group(CostVar::MixedPacks));
            allocation_.shirtPacks = counts(group(CostVar::ShirtPacks));
            allocation_.sheetPacks = counts(group(CostVar::SheetPacks));
            allocation_.shirtsInMixed = counts(group(CostVar::ShirtsInMixed));
            allocation_.looseGarments = count(variables().var(CostVar::LooseGarments));
            allocation_.looseShirts = count(variables().var(CostVar::LooseShirts));
            allocation_.looseSheets = count(variables().var(CostVar::LooseSheets));
            solved_ = true;
        }

    private:
        const PackVariableGroup& group(CostVar key) const
        {
            return variables().get(key).group();
        }

        void requireSolved(const char* what) const
        {
            if (!solved_) {
                throw std::logic_error(
                    std::format("CostModel::{}: no optimal solution loaded", what));
            }
        }

        const Catalog& catalog_;
        FamilyDemand demand_;
        SolveSettings settings_;

        bool solved_ = false;
        Allocation allocation_;
    };

} // namespace laundry
