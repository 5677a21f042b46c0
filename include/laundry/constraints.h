#pragma once
/*
===============================================================================
CONSTRAINTS — Constraint containers for the cost model
===============================================================================

OVERVIEW
--------
Mirror of variables.h for constraints. The cost model adds

    * one coverage row per family   cobertura_camisas, cobertura_pecas,
                                    cobertura_lencois
    * one row per mixed pack        limite_camisas[<label>]

ConstraintFactory builds them from generator callables returning
GRBTempConstr; ConstraintTable keeps them under enum keys so they can be
inspected after the solve (RHS, sense).

USAGE EXAMPLES
--------------
    auto limit = ConstraintFactory::addPerPack(model, "limite_camisas", labels,
        [&](std::size_t p) { return S(p) <= packs[p].shirtLimit * X(p); });

    auto cover = ConstraintFactory::add(model, "cobertura_lencois",
        [&] { return sheetCapacity + aSheets >= demand.sheets; });

    cons.set(Cons::ShirtLimit, std::move(limit));
    cons.set(Cons::SheetCover, std::move(cover));

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "enum_utils.h"
#include "naming.h"

namespace laundry {

    // ============================================================================
    // CONSTRAINT GROUP
    // ============================================================================
    /**
     * @class ConstraintGroup
     * @brief A single constraint or one constraint per catalog pack
     */
    class ConstraintGroup {
    public:
        ConstraintGroup() = default;

        std::size_t size() const noexcept { return constrs_.size(); }
        bool empty() const noexcept { return constrs_.empty(); }

        GRBConstr& at(std::size_t i)
        {
            checkIndex(i);
            return constrs_[i];
        }

        const GRBConstr& at(std::size_t i) const
        {
            checkIndex(i);
            return constrs_[i];
        }

        GRBConstr& operator()(std::size_t i) { return at(i); }
        const GRBConstr& operator()(std::size_t i) const { return at(i); }

        /// @brief The only constraint of a scalar group
        /// @throws std::logic_error if the group does not hold exactly one row
        GRBConstr& scalar()
        {
            requireScalar();
            return constrs_.front();
        }

        const GRBConstr& scalar() const
        {
            requireScalar();
            return constrs_.front();
        }

        const std::string& name(std::size_t i) const
        {
            checkIndex(i);
            return names_[i];
        }

        const std::vector<GRBConstr>& all() const noexcept { return constrs_; }

    private:
        void checkIndex(std::size_t i) const
        {
            if (i >= constrs_.size()) {
                throw std::out_of_range(
                    std::format("ConstraintGroup: index {} >= size {}", i, constrs_.size()));
            }
        }

        void requireScalar() const
        {
            if (constrs_.size() != 1) {
                throw std::logic_error(
                    std::format("ConstraintGroup::scalar: group holds {} constraints", constrs_.size()));
            }
        }

        void add(GRBConstr c, std::string name)
        {
            constrs_.push_back(std::move(c));
            names_.push_back(std::move(name));
        }

        std::vector<GRBConstr>   constrs_;
        std::vector<std::string> names_;

        friend class ConstraintFactory;
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
    public:
        /**
         * @brief Add one constraint
         * @tparam Generator Callable with signature GRBTempConstr()
         */
        template<typename Generator>
        static ConstraintGroup add(GRBModel& model,
            const std::string& baseName,
            Generator&& gen)
        {
            ConstraintGroup g;
            g.add(model.addConstr(gen(), make_name::math(baseName)),
                force_name::math(baseName));
            return g;
        }

        /**
         * @brief Add one constraint per label, named <baseName>[<label>]
         * @tparam Generator Callable with signature GRBTempConstr(std::size_t)
         *         receiving the catalog position
         */
        template<typename Generator>
        static ConstraintGroup addPerPack(GRBModel& model,
            const std::string& baseName,
            const std::vector<std::string>& labels,
            Generator&& gen)
        {
            ConstraintGroup g;
            for (std::size_t i = 0; i < labels.size(); ++i) {
                g.add(model.addConstr(gen(i), make_name::math(baseName, labels[i])),
                    force_name::math(baseName, labels[i]));
            }
            return g;
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    /**
     * @class ConstraintTable
     * @brief Enum-keyed registry of ConstraintGroup
     */
    template<typename EnumT>
    class ConstraintTable {
    public:
        void set(EnumT key, ConstraintGroup&& g) { table_[toIndex(key)] = std::move(g); }

        ConstraintGroup& get(EnumT key) { return table_[toIndex(key)]; }
        const ConstraintGroup& get(EnumT key) const { return table_[toIndex(key)]; }

        ConstraintGroup& operator()(EnumT key) { return get(key); }
        const ConstraintGroup& operator()(EnumT key) const { return get(key); }

        bool isEmpty(EnumT key) const { return get(key).empty(); }

        std::size_t totalSize() const
        {
            std::size_t n = 0;
            for (const auto& g : table_)
                n += g.size();
            return n;
        }

    private:
        std::array<ConstraintGroup, enum_size_v<EnumT>> table_;
    };

    // ============================================================================
    // CONSTRAINT QUERIES
    // ============================================================================

    inline double rhs(const GRBConstr& c) { return c.get(GRB_DoubleAttr_RHS); }

    inline char sense(const GRBConstr& c) { return c.get(GRB_CharAttr_Sense); }

} // namespace laundry
