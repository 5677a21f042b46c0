#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method base for Gurobi models
===============================================================================

Overview
--------
ModelBuilder owns (or borrows) a Gurobi environment and model and runs the
build/solve workflow through virtual hooks:

    optimize() {
        initialize();        // env + model, once
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

The cost model (cost_model.h) derives from it; tests derive small builders
from it to exercise the workflow in isolation.

Key Features
------------
1. Lazy initialization: the constructor never touches Gurobi. The
   environment is created with deferred start so configureEnvironment() can
   silence the license banner before env.start().
2. External model support: a builder constructed from a GRBModel& never
   creates an environment and never owns the model.
3. Typed registries: VariableTable<VarEnum> and ConstraintTable<ConEnum>.
4. Parameter setters (timeLimit(), threads(), mipGapLimit(), quiet()) so
   derived builders never spell Gurobi parameter macros.
5. Objective helpers: minimize() for one objective, minimizeHierarchical()
   for a priority-ordered list solved lexicographically.
6. Status accessors: status(), isOptimal(), hasSolution(), runtime(), ...

Ownership
---------
Each builder has its own environment. Gurobi environments must not be
shared across threads, so one builder per optimize() call keeps concurrent
quotes independent.

===============================================================================
*/

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "constraints.h"
#include "variables.h"

namespace laundry {

    /// @brief One entry of a hierarchical objective; earlier entries win
    struct ObjectiveTerm {
        GRBLinExpr expr;
        std::string name;
    };

    /**
     * @class ModelBuilder
     * @brief Template-method base for one Gurobi model
     *
     * @tparam VarEnum Enum keying the variable table (LAUNDRY_ENUM_WITH_COUNT)
     * @tparam ConEnum Enum keying the constraint table (LAUNDRY_ENUM_WITH_COUNT)
     *
     * @details Derived classes override the hooks; optimize() drives them in
     *          a fixed order. The model is created lazily on first access.
     */
    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> owned_model_;

        GRBModel* external_model_ = nullptr;

        bool initialized_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;

    public:
        ModelBuilder() = default;

        /// @brief Build into a caller-owned model; no environment is created
        explicit ModelBuilder(GRBModel& externalModel)
            : external_model_(&externalModel),
            initialized_(true)
        {
        }

        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /**
         * @brief Create the environment and model if not done yet
         *
         * @details Idempotent. The environment is created with deferred start
         *          so configureEnvironment() can set parameters before
         *          env.start(). External-model builders skip this entirely.
         *
         * @throws GRBException if the environment cannot be started (license,
         *         invalid parameter)
         */
        void initialize()
        {
            if (initialized_)
                return;

            if (!external_model_) {
                env_ = std::make_unique<GRBEnv>(true);
                configureEnvironment(*env_);
                env_->start();
                owned_model_ = std::make_unique<GRBModel>(*env_);
            }

            initialized_ = true;
        }

        /// @brief True once initialize() ran or an external model was given
        bool isInitialized() const noexcept { return initialized_; }

        /// @brief False for builders constructed from an external model
        bool ownsModel() const noexcept { return owned_model_ != nullptr; }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------
        /**
         * @brief The model being built, initializing on first call
         * @throws GRBException if lazy initialization fails
         */
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return external_model_ ? *external_model_ : *owned_model_;
        }

        /// @pre isInitialized()
        const GRBModel& model() const
        {
            return external_model_ ? *external_model_ : *owned_model_;
        }

        /// @brief Registry of the variables created in addVariables()
        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        /// @brief Registry of the rows created in addConstraints()
        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        // -------------------------------------------------------------------------
        // Parameters
        // -------------------------------------------------------------------------
        /**
         * @brief Set any Gurobi parameter on the model
         *
         * @example
         *     setParam(GRB_IntParam_Presolve, 2);
         *
         * @throws GRBException for an out-of-range value
         */
        template <typename Param, typename Val>
        void setParam(Param p, Val&& value)
        {
            model().set(p, std::forward<Val>(value));
        }

        /// @param seconds Maximum solve time; 0 or less leaves Gurobi's default
        void timeLimit(double seconds)
        {
            if (seconds > 0.0)
                setParam(GRB_DoubleParam_TimeLimit, seconds);
        }

        /// @param gap Relative MIP gap; 0 demands a proven optimum
        void mipGapLimit(double gap) { setParam(GRB_DoubleParam_MIPGap, gap); }

        /**
         * @brief Set the solver thread count
         * @param n Thread count (0 = automatic)
         * @throws GRBException for a negative count
         */
        void threads(int n) { setParam(GRB_IntParam_Threads, n); }

        /// @brief Suppress Gurobi's console log
        void quiet() { setParam(GRB_IntParam_OutputFlag, 0); }

        /// @brief Enable Gurobi's console log
        void verbose() { setParam(GRB_IntParam_OutputFlag, 1); }

        // -------------------------------------------------------------------------
        // Objective helpers
        // -------------------------------------------------------------------------
        /**
         * @brief Set a single objective to minimize
         *
         * @example
         *     minimize(dot(prices, X) + looseRate * A);
         */
        void minimize(const GRBLinExpr& expr)
        {
            model().setObjective(expr, GRB_MINIMIZE);
        }

        /**
         * @brief Lexicographic minimization of several objectives
         *
         * @details terms[0] gets the highest priority. Every objective is
         *          solved with zero allowed degradation, so a lower-priority
         *          term only breaks ties among optima of the ones before it.
         *
         * @example
         *     minimizeHierarchical({ { spend, "custo" }, { sum(X), "packs" } });
         */
        void minimizeHierarchical(const std::vector<ObjectiveTerm>& terms)
        {
            auto& m = model();
            m.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
            m.set(GRB_IntAttr_NumObj, static_cast<int>(terms.size()));

            int priority = static_cast<int>(terms.size());
            for (std::size_t i = 0; i < terms.size(); ++i) {
                m.setObjectiveN(terms[i].expr, static_cast<int>(i), priority--,
                    1.0, 0.0, 0.0, terms[i].name);
            }
        }

        // -------------------------------------------------------------------------
        // Solution diagnostics (valid after optimize())
        // -------------------------------------------------------------------------
        /// @brief Gurobi optimization status (GRB_OPTIMAL, GRB_TIME_LIMIT, ...)
        int status() const { return model().get(GRB_IntAttr_Status); }

        /// @brief True only for a proven optimum
        bool isOptimal() const { return status() == GRB_OPTIMAL; }

        /// @brief True if at least one feasible solution is available
        bool hasSolution() const { return solutionCount() > 0; }

        bool isInfeasible() const { return status() == GRB_INFEASIBLE; }

        /// @note For hierarchical objectives this is the highest-priority one
        double objVal() const { return model().get(GRB_DoubleAttr_ObjVal); }

        /// @brief Wall-clock seconds of the last optimize()
        double runtime() const { return model().get(GRB_DoubleAttr_Runtime); }

        int solutionCount() const { return model().get(GRB_IntAttr_SolCount); }

        double nodeCount() const { return model().get(GRB_DoubleAttr_NodeCount); }

        // -------------------------------------------------------------------------
        // Hooks
        // -------------------------------------------------------------------------

        /// @brief Runs before env.start() on owned environments only
        virtual void configureEnvironment(GRBEnv& env) {}

        /// @brief Set solver parameters (runs after the rows are added)
        virtual void addParameters() {}

        /// @brief Create variables and register them in variables()
        virtual void addVariables() {}

        /// @brief Create rows and register them in constraints()
        virtual void addConstraints() {}

        /// @brief Set the objective, usually through minimize() or minimizeHierarchical()
        virtual void addObjective() {}

        virtual void beforeOptimize() {}

        /// @brief Runs after model.optimize() whatever the resulting status
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Orchestration
        // -------------------------------------------------------------------------
        /**
         * @brief Build the model through the hooks and solve it
         *
         * @details Hook order: addVariables, addConstraints, addParameters,
         *          addObjective, beforeOptimize, model.optimize(),
         *          afterOptimize. A non-optimal status is not an error here;
         *          callers inspect status().
         *
         * @return The solved model
         * @throws GRBException on solver engine errors
         */
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace laundry
