#pragma once
/*
===============================================================================
DIAGNOSTICS — Solver status names and model statistics
===============================================================================

Free functions over GRBModel used for log lines and error messages:

    statusString(GRB_TIME_LIMIT)     -> "TIME_LIMIT"
    computeStatistics(model)         -> variable / constraint counts
    modelSummary(model)              -> "vars=22 (int=22) constrs=10 nz=..."

===============================================================================
*/

#include <format>
#include <string>

#include "gurobi_c++.h"

namespace laundry {

    /**
     * @brief Convert a Gurobi optimization status code to its name
     * @param status Value of GRB_IntAttr_Status
     * @return Name without the GRB_ prefix, or "UNKNOWN(<code>)"
     *
     * @example
     *     statusString(model.get(GRB_IntAttr_Status));  // "OPTIMAL"
     */
    inline std::string statusString(int status)
    {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    /**
     * @struct ModelStatistics
     * @brief Size of a model as Gurobi reports it
     */
    struct ModelStatistics {
        int numVars = 0;
        int numIntVars = 0;     ///< integer and binary
        int numConstrs = 0;
        int numNonZeros = 0;
        int numObjectives = 0;
    };

    /**
     * @brief Read model size attributes
     * @note Call after the model has been updated or optimized; pending
     *       additions are not counted before GRBModel::update()
     * @throws GRBException if an attribute cannot be queried
     */
    inline ModelStatistics computeStatistics(const GRBModel& model)
    {
        ModelStatistics stats;
        stats.numVars = model.get(GRB_IntAttr_NumVars);
        stats.numIntVars = model.get(GRB_IntAttr_NumIntVars);
        stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
        stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
        stats.numObjectives = model.get(GRB_IntAttr_NumObj);
        return stats;
    }

    /// @brief One-line summary of computeStatistics() for log records
    inline std::string modelSummary(const GRBModel& model)
    {
        auto s = computeStatistics(model);
        return std::format("vars={} (int={}) constrs={} nz={} objectives={}",
            s.numVars, s.numIntVars, s.numConstrs, s.numNonZeros, s.numObjectives);
    }

} // namespace laundry
