#pragma once
/*
===============================================================================
NAMING — Symbolic names for decision variables and constraints
===============================================================================

OVERVIEW
--------
Builds the names attached to Gurobi variables and constraints. Two styles are
used throughout the cost model:

    index style   x_misto_20        (variables, raw solution dump)
    math style    limite_camisas[20] (constraints)

make_name:: only produces names when LAUNDRY_DEBUG (or _DEBUG) is defined, so
release builds hand empty names to Gurobi. force_name:: always produces a
name; the optimizer uses it for the raw-variable report, which is part of the
public result and must not depend on the build type.

USAGE EXAMPLES
--------------
    force_name::index("x_misto", "20");      // "x_misto_20"
    force_name::math("limite_camisas", "40"); // "limite_camisas[40]"
    make_name::index("a_camisa");             // "a_camisa" or "" in release

===============================================================================
*/

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#if defined(LAUNDRY_DEBUG) || defined(_DEBUG)
inline constexpr bool LAUNDRY_DEBUG_NAMES = true;
#else
inline constexpr bool LAUNDRY_DEBUG_NAMES = false;
#endif

namespace laundry {

    /// @brief True when solver-side names are attached (debug builds)
    [[nodiscard]] constexpr bool naming_enabled() noexcept { return LAUNDRY_DEBUG_NAMES; }

    namespace naming_detail {

        inline void requireBase(std::string_view base, bool hasParts)
        {
            if (base.empty() && hasParts) {
                throw std::invalid_argument("naming: empty base name with index parts");
            }
        }

        inline std::string joinIndex(std::string_view base,
            std::initializer_list<std::string_view> parts)
        {
            requireBase(base, parts.size() > 0);
            std::string out(base);
            for (auto p : parts) {
                out += '_';
                out += p;
            }
            return out;
        }

        inline std::string joinMath(std::string_view base,
            std::initializer_list<std::string_view> parts)
        {
            requireBase(base, parts.size() > 0);
            std::string out(base);
            if (parts.size() == 0)
                return out;

            out += '[';
            bool first = true;
            for (auto p : parts) {
                if (!first)
                    out += ',';
                out += p;
                first = false;
            }
            out += ']';
            return out;
        }

    } // namespace naming_detail

    // ------------------------------------------------------------------------
    // Always-on naming
    // ------------------------------------------------------------------------
    namespace force_name {

        /// @brief "base_p1_p2..." (just "base" without parts)
        inline std::string index(std::string_view base,
            std::initializer_list<std::string_view> parts = {})
        {
            return naming_detail::joinIndex(base, parts);
        }

        inline std::string index(std::string_view base, std::string_view part)
        {
            return naming_detail::joinIndex(base, { part });
        }

        /// @brief "base[p1,p2...]" (just "base" without parts)
        inline std::string math(std::string_view base,
            std::initializer_list<std::string_view> parts = {})
        {
            return naming_detail::joinMath(base, parts);
        }

        inline std::string math(std::string_view base, std::string_view part)
        {
            return naming_detail::joinMath(base, { part });
        }

    } // namespace force_name

    // ------------------------------------------------------------------------
    // Debug-only naming
    // ------------------------------------------------------------------------
    namespace make_name {

        inline std::string index(std::string_view base,
            std::initializer_list<std::string_view> parts = {})
        {
            if constexpr (!naming_enabled())
                return {};
            return force_name::index(base, parts);
        }

        inline std::string index(std::string_view base, std::string_view part)
        {
            if constexpr (!naming_enabled())
                return {};
            return force_name::index(base, part);
        }

        inline std::string math(std::string_view base,
            std::initializer_list<std::string_view> parts = {})
        {
            if constexpr (!naming_enabled())
                return {};
            return force_name::math(base, parts);
        }

        inline std::string math(std::string_view base, std::string_view part)
        {
            if constexpr (!naming_enabled())
                return {};
            return force_name::math(base, part);
        }

    } // namespace make_name

} // namespace laundry
