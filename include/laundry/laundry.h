#pragma once
/*
===============================================================================
LAUNDRY OPTIMIZER — Unified include header
===============================================================================

WHAT'S INCLUDED
---------------
• enum_utils.h    — LAUNDRY_ENUM_WITH_COUNT, EnumMap
• naming.h        — variable / constraint names
• errors.h        — ValidationError, SolverError, ConfigError
• logging.h       — Logger
• catalog.h       — item types, packs, delivery fees, PricingConfig
• order.h         — validated item counts
• variables.h     — decision-variable containers over Gurobi
• constraints.h   — constraint containers over Gurobi
• expressions.h   — sum() / dot() helpers
• model_builder.h — template-method model workflow
• diagnostics.h   — status names, model statistics
• cost_model.h    — the laundry integer program
• optimizer.h     — LaundryOptimizer, Quote
• quote_json.h    — JSON request / response / pricing codecs

QUICK START
-----------
    #include <laundry/laundry.h>

    int main() {
        laundry::LaundryOptimizer opt;
        auto q = opt.optimize({ { "camisa", 12 }, { "lencol", 4 } }, "Montijo");
        std::cout << laundry::toJson(q).dump(2) << "\n";
    }

REQUIREMENTS
------------
• C++20 compiler (<format>)
• Gurobi Optimizer 10.0+ with the C++ API
• nlohmann::json 3.x (quote_json.h only)

CONFIGURATION
-------------
Define LAUNDRY_DEBUG to pass variable and constraint names to Gurobi (useful
with model.write("model.lp")). The raw-variable report is named regardless.

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "errors.h"
#include "logging.h"

#include "catalog.h"
#include "order.h"

#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "model_builder.h"
#include "diagnostics.h"

#include "cost_model.h"
#include "optimizer.h"
#include "quote_json.h"
