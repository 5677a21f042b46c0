#pragma once
/*
===============================================================================
EXPRESSIONS — GRBLinExpr builders over catalog positions
===============================================================================

The cost model writes its objective and coverage rows as sums over catalog
entries:

    sum_p price_p * x_p          -> sum(packs.size(), [&](std::size_t p) { ... })
    sum_p s_p                    -> sum(S)
    sum_p w_p * v_p              -> dot(weights, V)

Every call builds a fresh GRBLinExpr; nothing is cached.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <stdexcept>
#include <vector>

#include "gurobi_c++.h"
#include "variables.h"

namespace laundry {

    /**
     * @brief sum_{i in [0, n)} f(i)
     * @tparam Func Callable taking std::size_t and returning anything that can
     *         be added to a GRBLinExpr (GRBVar, GRBLinExpr, double)
     */
    template<typename Func>
    GRBLinExpr sum(std::size_t n, Func&& f)
    {
        GRBLinExpr expr = 0.0;
        for (std::size_t i = 0; i < n; ++i)
            expr += f(i);
        return expr;
    }

    /// @brief Plain sum of every variable in a per-pack group
    inline GRBLinExpr sum(const PackVariableGroup& g)
    {
        GRBLinExpr expr = 0.0;
        for (const auto& v : g.all())
            expr += v;
        return expr;
    }

    /**
     * @brief sum_i weights[i] * g(i)
     * @throws std::invalid_argument when the sizes differ
     */
    inline GRBLinExpr dot(const std::vector<double>& weights, const PackVariableGroup& g)
    {
        if (weights.size() != g.size()) {
            throw std::invalid_argument(std::format(
                "dot: {} weights for {} variables", weights.size(), g.size()));
        }
        GRBLinExpr expr = 0.0;
        for (std::size_t i = 0; i < weights.size(); ++i)
            expr += weights[i] * g.at(i);
        return expr;
    }

} // namespace laundry
