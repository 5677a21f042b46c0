#pragma once
/*
===============================================================================
VARIABLES — Decision-variable containers for the cost model
===============================================================================

OVERVIEW
--------
The cost model has two shapes of decision variable:

    * scalars        a_variada, a_camisa, a_lencol   (loose items)
    * per-pack sets  x_misto_<label>, y_cam_<label>, z_len_<label>,
                     s_cam_<label>                    (one per catalog pack)

PackVariableGroup stores a per-pack set together with the pack labels.
VariableContainer holds either shape so both fit in one enum-keyed
VariableTable. VariableFactory creates the GRBVar objects and attaches names
(see naming.h).

KEY COMPONENTS
--------------
• PackVariableGroup — GRBVar per catalog pack, addressable by position
• VariableContainer — empty / scalar / per-pack holder
• VariableFactory — creation of scalars and per-pack groups
• VariableTable — enum-keyed registry used by ModelBuilder
• value(), count(), counts() — solution extraction

USAGE EXAMPLES
--------------
    auto X = VariableFactory::addPerPack(model, GRB_INTEGER, 0, GRB_INFINITY,
        "x_misto", labelsOf(catalog.mixedPacks));
    auto a = VariableFactory::add(model, GRB_INTEGER, 0, GRB_INFINITY, "a_camisa");

    vars.set(Vars::MixedPacks, std::move(X));
    vars.set(Vars::LooseShirts, std::move(a));

    model.optimize();
    long long n = laundry::count(vars.var(Vars::MixedPacks, 2));

EXCEPTION SAFETY
----------------
• at() / scalar() / group(): std::out_of_range or std::logic_error on misuse
• value() / count(): propagate GRBException if no solution is loaded

===============================================================================
*/

#include <array>
#include <cmath>
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
    // PER-PACK VARIABLE GROUP
    // ============================================================================
    /**
     * @class PackVariableGroup
     * @brief One GRBVar per catalog pack, in catalog order
     *
     * @details Position i always corresponds to catalog entry i of the family
     *          the group was created for; label(i) keeps the pack label so
     *          solution reports can be produced without the catalog.
     */
    class PackVariableGroup {
    public:
        PackVariableGroup() = default;

        std::size_t size() const noexcept { return vars_.size(); }
        bool empty() const noexcept { return vars_.empty(); }

        GRBVar& at(std::size_t i)
        {
            checkIndex(i);
            return vars_[i];
        }

        const GRBVar& at(std::size_t i) const
        {
            checkIndex(i);
            return vars_[i];
        }

        GRBVar& operator()(std::size_t i) { return at(i); }
        const GRBVar& operator()(std::size_t i) const { return at(i); }

        const std::string& label(std::size_t i) const
        {
            checkIndex(i);
            return labels_[i];
        }

        const std::vector<GRBVar>& all() const noexcept { return vars_; }

        /// @brief Raw-report name of entry i ("x_misto_20")
        const std::string& name(std::size_t i) const
        {
            checkIndex(i);
            return names_[i];
        }

    private:
        void checkIndex(std::size_t i) const
        {
            if (i >= vars_.size()) {
                throw std::out_of_range(
                    std::format("PackVariableGroup: index {} >= size {}", i, vars_.size()));
            }
        }

        void add(GRBVar v, std::string label, std::string name)
        {
            vars_.push_back(std::move(v));
            labels_.push_back(std::move(label));
            names_.push_back(std::move(name));
        }

        std::vector<GRBVar>      vars_;
        std::vector<std::string> labels_;
        std::vector<std::string> names_;

        friend class VariableFactory;
    };

    // ============================================================================
    // VARIABLE CONTAINER
    // ============================================================================
    /**
     * @class VariableContainer
     * @brief Holds either a single GRBVar or a PackVariableGroup
     */
    class VariableContainer {
    public:
        enum class Mode { Empty, Scalar, PerPack };

        VariableContainer() = default;

        VariableContainer(GRBVar v, std::string name)
            : mode_(Mode::Scalar), scalar_(std::move(v)), name_(std::move(name))
        {
        }

        explicit VariableContainer(PackVariableGroup g)
            : mode_(Mode::PerPack), group_(std::move(g))
        {
        }

        Mode mode() const noexcept { return mode_; }
        bool isEmpty() const noexcept { return mode_ == Mode::Empty; }
        bool isScalar() const noexcept { return mode_ == Mode::Scalar; }
        bool isPerPack() const noexcept { return mode_ == Mode::PerPack; }

        /// @throws std::logic_error unless the container holds a scalar
        GRBVar& scalar()
        {
            requireMode(Mode::Scalar, "scalar");
            return scalar_;
        }

        const GRBVar& scalar() const
        {
            requireMode(Mode::Scalar, "scalar");
            return scalar_;
        }

        /// @brief Raw-report name of a scalar ("a_camisa")
        const std::string& scalarName() const
        {
            requireMode(Mode::Scalar, "scalarName");
            return name_;
        }

        /// @throws std::logic_error unless the container holds a per-pack group
        PackVariableGroup& group()
        {
            requireMode(Mode::PerPack, "group");
            return group_;
        }

        const PackVariableGroup& group() const
        {
            requireMode(Mode::PerPack, "group");
            return group_;
        }

        GRBVar& at(std::size_t i) { return group().at(i); }
        const GRBVar& at(std::size_t i) const { return group().at(i); }

        /// @brief Number of GRBVar held (0, 1 or the pack count)
        std::size_t size() const noexcept
        {
            switch (mode_) {
                case Mode::Scalar:  return 1;
                case Mode::PerPack: return group_.size();
                default:            return 0;
            }
        }

    private:
        void requireMode(Mode m, const char* what) const
        {
            if (mode_ != m) {
                throw std::logic_error(
                    std::format("VariableContainer::{}: wrong container mode", what));
            }
        }

        Mode mode_ = Mode::Empty;
        GRBVar scalar_;
        std::string name_;
        PackVariableGroup group_;
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    /**
     * @class VariableFactory
     * @brief Creates GRBVar objects with names taken from naming.h
     *
     * @details Gurobi only receives a name in debug builds (make_name); the
     *          raw-report name stored next to the variable is always built
     *          (force_name).
     */
    class VariableFactory {
    public:
        /**
         * @brief Create one scalar variable
         * @return Container already holding the variable and its report name
         */
        static VariableContainer add(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName)
        {
            GRBVar v = model.addVar(lb, ub, 0.0, vtype, make_name::index(baseName));
            return VariableContainer(v, force_name::index(baseName));
        }

        /**
         * @brief Create one variable per label, named <baseName>_<label>
         *
         * @example
         *     auto Y = VariableFactory::addPerPack(model, GRB_INTEGER, 0.0,
         *         GRB_INFINITY, "y_cam", { "10", "20", "50" });
         *     // y_cam_10, y_cam_20, y_cam_50
         */
        static PackVariableGroup addPerPack(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            const std::vector<std::string>& labels)
        {
            PackVariableGroup g;
            for (const auto& label : labels) {
                GRBVar v = model.addVar(lb, ub, 0.0, vtype, make_name::index(baseName, label));
                g.add(v, label, force_name::index(baseName, label));
            }
            return g;
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of VariableContainer
     *
     * @tparam EnumT Enum declared with LAUNDRY_ENUM_WITH_COUNT
     */
    template<typename EnumT>
    class VariableTable {
    public:
        void set(EnumT key, VariableContainer&& c) { table_[toIndex(key)] = std::move(c); }
        void set(EnumT key, PackVariableGroup&& g) { set(key, VariableContainer(std::move(g))); }

        VariableContainer& get(EnumT key) { return table_[toIndex(key)]; }
        const VariableContainer& get(EnumT key) const { return table_[toIndex(key)]; }

        VariableContainer& operator()(EnumT key) { return get(key); }
        const VariableContainer& operator()(EnumT key) const { return get(key); }

        /// @brief Scalar variable at key
        GRBVar& var(EnumT key) { return get(key).scalar(); }
        const GRBVar& var(EnumT key) const { return get(key).scalar(); }

        /// @brief Entry i of the per-pack group at key
        GRBVar& var(EnumT key, std::size_t i) { return get(key).at(i); }
        const GRBVar& var(EnumT key, std::size_t i) const { return get(key).at(i); }

        bool isEmpty(EnumT key) const { return get(key).isEmpty(); }

        /// @brief Total GRBVar count across all entries
        std::size_t totalSize() const
        {
            std::size_t n = 0;
            for (const auto& c : table_)
                n += c.size();
            return n;
        }

    private:
        std::array<VariableContainer, enum_size_v<EnumT>> table_;
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /// @brief Solution value (GRB_DoubleAttr_X); needs a loaded solution
    inline double value(const GRBVar& v)
    {
        return v.get(GRB_DoubleAttr_X);
    }

    /**
     * @brief Solution value of an integer variable, rounded to the nearest
     *        integer to strip the solver's integrality tolerance
     */
    inline long long count(const GRBVar& v)
    {
        return std::llround(value(v));
    }

    /// @brief count() of every member of a per-pack group, in catalog order
    inline std::vector<long long> counts(const PackVariableGroup& g)
    {
        std::vector<long long> out;
        out.reserve(g.size());
        for (const auto& v : g.all())
            out.push_back(count(v));
        return out;
    }

} // namespace laundry
