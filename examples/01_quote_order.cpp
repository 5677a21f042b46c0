/*
================================================================================
EXAMPLE 01: QUOTE A MIXED ORDER
================================================================================

PROBLEM DESCRIPTION
-------------------
A customer drops off shirts, assorted garments, bed sheets and a couple of
special items, to be delivered to Montijo. The laundry sells mixed packs
(with a per-pack shirt limit), shirt packs and sheet packs, and charges
per item for anything not covered by a pack. Find the cheapest combination.

WHAT THIS SHOWS
---------------
- Building an Order with typed item setters
- Quoting with the built-in price list
- Reading the breakdown (packs, loose items, shirts placed in mixed packs)
- Comparing the optimum with "everything loose"
- Inspecting the raw decision variables

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <laundry/laundry.h>

static void printPacks(const std::string& title, const std::vector<laundry::PackCount>& packs)
{
    std::cout << "  " << std::setw(22) << std::left << title << std::right;
    if (packs.empty()) {
        std::cout << "-\n";
        return;
    }
    for (const auto& p : packs)
        std::cout << p.count << " x " << p.label << "  ";
    std::cout << "\n";
}

int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Quote a mixed laundry order\n";
    std::cout << "================================================================\n\n";

    try {
        laundry::Logger log(std::cerr, laundry::LogLevel::Warn);
        laundry::LaundryOptimizer optimizer(laundry::defaultPricing(), {}, log);

        laundry::Order order;
        order.set(laundry::ItemType::GenericGarment, 37)
             .set(laundry::ItemType::Shirt, 9)
             .set(laundry::ItemType::Sheet, 14)
             .set(laundry::ItemType::Coat, 1)
             .set(laundry::ItemType::FormalSuit, 2);

        const std::string location = "Montijo";

        // ====================================================================
        // ORDER
        // ====================================================================
        std::cout << "ORDER\n";
        std::cout << "-----\n";
        for (std::size_t i = 0; i < laundry::ItemType_COUNT; ++i) {
            auto t = static_cast<laundry::ItemType>(i);
            if (order.quantity(t) == 0)
                continue;
            std::cout << "  " << std::setw(18) << std::left << laundry::itemName(t)
                      << std::right << std::setw(4) << order.quantity(t)
                      << (laundry::isSpecial(t) ? "   (per unit)" : "") << "\n";
        }
        std::cout << "  Delivery: " << location << "\n\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        laundry::Quote quote = optimizer.optimize(order, location);
        const auto& b = quote.breakdown;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "OPTIMAL PLAN\n";
        std::cout << "------------\n";
        printPacks("Mixed packs:", b.mixedPacks);
        printPacks("Shirt packs:", b.shirtPacks);
        printPacks("Sheet packs:", b.sheetPacks);
        printPacks("Shirts in mixed packs:", b.shirtsInMixed);
        std::cout << "  Loose: " << b.loose.garments << " garments, "
                  << b.loose.shirts << " shirts, " << b.loose.sheets << " sheets\n\n";

        std::cout << "COSTS (EUR)\n";
        std::cout << "-----------\n";
        std::cout << "  Special items  " << std::setw(8) << b.costs.specials << "\n";
        std::cout << "  Mixed packs    " << std::setw(8) << b.costs.mixedPacks << "\n";
        std::cout << "  Shirt packs    " << std::setw(8) << b.costs.shirtPacks << "\n";
        std::cout << "  Sheet packs    " << std::setw(8) << b.costs.sheetPacks << "\n";
        std::cout << "  Loose items    " << std::setw(8) << b.costs.loose << "\n";
        std::cout << "  Delivery       " << std::setw(8) << b.costs.delivery << "\n";
        std::cout << "  TOTAL          " << std::setw(8) << quote.totalCost << "\n\n";

        // ====================================================================
        // BASELINE: EVERYTHING LOOSE
        // ====================================================================
        const auto& catalog = optimizer.pricing().catalog;
        double loose = optimizer.deliveryFee(location);
        for (std::size_t i = 0; i < laundry::ItemType_COUNT; ++i) {
            auto t = static_cast<laundry::ItemType>(i);
            loose += static_cast<double>(order.quantity(t)) * catalog.unitPrice(t);
        }
        std::cout << "Everything loose would cost " << loose
                  << " EUR (saving " << loose - quote.totalCost << ")\n\n";

        // ====================================================================
        // RAW DECISION VARIABLES
        // ====================================================================
        std::cout << "RAW VARIABLES (non-zero)\n";
        std::cout << "------------------------\n";
        for (const auto& [name, value] : quote.rawVariables) {
            if (value != 0)
                std::cout << "  " << std::setw(14) << std::left << name << std::right << value << "\n";
        }

    } catch (const laundry::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
