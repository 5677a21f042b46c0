/*
===============================================================================
TEST OPTIMIZER — Tests for optimizer.h
===============================================================================

OVERVIEW
--------
End-to-end quotes through LaundryOptimizer. Besides worked examples, the
optimum for every small order is compared against an independent dynamic
program over (garments, shirts) and sheets, so the integer program is checked
without trusting the solver.

TEST ORGANIZATION
-----------------
• Section A: Worked examples
• Section B: Input validation and delivery fees
• Section C: Breakdown invariants
• Section D: Optimality against a reference dynamic program
• Section E: Determinism, logging and failure reporting
• Section F: Logger

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• optimizer.h - System under test
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <laundry/optimizer.h>

using namespace laundry;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// TEST UTILITIES
// ============================================================================

static Logger& silentLog()
{
    static std::ostringstream sink;
    static Logger log(sink, LogLevel::Off);
    return log;
}

static const LaundryOptimizer& optimizer()
{
    static const LaundryOptimizer opt(defaultPricing(), {}, silentLog());
    return opt;
}

template<typename Pack>
static const Pack& packByLabel(const std::vector<Pack>& packs, const std::string& label)
{
    auto it = std::find_if(packs.begin(), packs.end(),
        [&](const Pack& p) { return p.label == label; });
    REQUIRE(it != packs.end());
    return *it;
}

/// @brief Units of each family covered by a quote's breakdown
static FamilyDemand coveredBy(const Catalog& c, const Breakdown& b)
{
    FamilyDemand covered{ b.loose.garments, b.loose.shirts, b.loose.sheets };
    for (const auto& p : b.mixedPacks)
        covered.garments += packByLabel(c.mixedPacks, p.label).capacity * p.count;
    for (const auto& p : b.shirtsInMixed) {
        covered.garments -= p.count;
        covered.shirts += p.count;
    }
    for (const auto& p : b.shirtPacks)
        covered.shirts += packByLabel(c.shirtPacks, p.label).capacity * p.count;
    for (const auto& p : b.sheetPacks)
        covered.sheets += packByLabel(c.sheetPacks, p.label).capacity * p.count;
    return covered;
}

/**
 * @brief Cheapest cover of (garments, shirts) and of sheets by dynamic program
 *
 * @details A mixed pack holding k shirts (k up to its limit) covers
 *          (capacity - k) garments and k shirts; a shirt pack covers
 *          capacity shirts; loose items cover one unit each. Surplus is
 *          allowed, so each option is applied with clipping at zero.
 */
static double referenceSpend(const Catalog& c, int garments, int shirts, int sheets)
{
    const double inf = std::numeric_limits<double>::infinity();

    struct Option { int g; int s; double price; };
    std::vector<Option> opts;
    opts.push_back({ 1, 0, c.unitPrice(ItemType::GenericGarment) });
    opts.push_back({ 0, 1, c.unitPrice(ItemType::Shirt) });
    for (const auto& p : c.shirtPacks)
        opts.push_back({ 0, p.capacity, p.price });
    for (const auto& p : c.mixedPacks) {
        for (int k = 0; k <= p.shirtLimit; ++k)
            opts.push_back({ p.capacity - k, k, p.price });
    }

    std::vector<std::vector<double>> dp(garments + 1, std::vector<double>(shirts + 1, inf));
    dp[0][0] = 0.0;
    for (int g = 0; g <= garments; ++g) {
        for (int s = 0; s <= shirts; ++s) {
            if (g == 0 && s == 0)
                continue;
            for (const auto& o : opts) {
                int pg = std::max(0, g - o.g);
                int ps = std::max(0, s - o.s);
                if (pg == g && ps == s)
                    continue;
                dp[g][s] = std::min(dp[g][s], o.price + dp[pg][ps]);
            }
        }
    }

    std::vector<double> sheetDp(sheets + 1, inf);
    sheetDp[0] = 0.0;
    for (int h = 1; h <= sheets; ++h) {
        sheetDp[h] = c.unitPrice(ItemType::Sheet) + sheetDp[h - 1];
        for (const auto& p : c.sheetPacks)
            sheetDp[h] = std::min(sheetDp[h], p.price + sheetDp[std::max(0, h - p.capacity)]);
    }

    return dp[garments][shirts] + sheetDp[sheets];
}

// ============================================================================
// SECTION A: WORKED EXAMPLES
// ============================================================================

/**
 * @test Quote::TwelveShirtsToLisboa
 * @brief 12 shirts cost 9.00 either loose or as a 10-pack plus 2 loose;
 *        Lisboa delivery is free, and the fewest-packs rule keeps them loose
 */
TEST_CASE("A1: Quote::TwelveShirtsToLisboa", "[optimizer][examples]")
{
    auto q = optimizer().optimize({ { "camisa", 12 } }, "lisboa");

    REQUIRE(q.totalCost == Catch::Approx(9.0));
    REQUIRE(q.breakdown.costs.delivery == Catch::Approx(0.0));
    REQUIRE(q.breakdown.shirtPacks.empty());
    REQUIRE(q.breakdown.loose.shirts == 12);
}

TEST_CASE("A2: Quote::EmptyOrderPaysOnlyDelivery", "[optimizer][examples]")
{
    SECTION("default location") {
        auto q = optimizer().optimize(std::map<std::string, std::int64_t>{});
        REQUIRE(q.totalCost == Catch::Approx(5.0));
        REQUIRE(q.breakdown.mixedPacks.empty());
        REQUIRE(q.breakdown.loose == LooseCounts{});
    }
    SECTION("free location") {
        auto q = optimizer().optimize({ { "camisa", 0 } }, "Porto");
        REQUIRE(q.totalCost == Catch::Approx(0.0));
        REQUIRE_FALSE(std::signbit(q.totalCost));
    }
}

TEST_CASE("A3: Quote::SpecialsAlwaysPerUnit", "[optimizer][examples]")
{
    auto q = optimizer().optimize({ { "fato", 2 }, { "casaco", 1 } }, "Montijo");

    REQUIRE(q.breakdown.costs.specials == Catch::Approx(14.5));
    REQUIRE(q.breakdown.costs.mixedPacks == Catch::Approx(0.0));
    REQUIRE(q.breakdown.costs.delivery == Catch::Approx(5.0));
    REQUIRE(q.totalCost == Catch::Approx(19.5));
}

TEST_CASE("A4: Quote::MixedPackCarriesShirts", "[optimizer][examples]")
{
    auto q = optimizer().optimize({ { "peca_variada", 18 }, { "camisa", 2 } }, "lisboa");

    REQUIRE(q.totalCost == Catch::Approx(10.0));
    REQUIRE(q.breakdown.mixedPacks == std::vector<PackCount>{ { "20", 1 } });
    REQUIRE(q.breakdown.shirtsInMixed == std::vector<PackCount>{ { "20", 2 } });
    REQUIRE(q.rawVariables.at("x_misto_20") == 1);
    REQUIRE(q.rawVariables.at("s_cam_20") == 2);
}

TEST_CASE("A5: Quote::TotalIsSumOfParts", "[optimizer][examples]")
{
    auto q = optimizer().optimize({ { "peca_variada", 137 }, { "camisa", 31 }, { "lencol", 26 },
                                    { "vestido_frisado", 1 }, { "toalha", 4 } }, "montijo");
    const auto& c = q.breakdown.costs;
    double parts = c.specials + c.mixedPacks + c.shirtPacks + c.sheetPacks + c.loose + c.delivery;
    REQUIRE(q.totalCost == Catch::Approx(parts).margin(0.011));
    REQUIRE(c.specials == Catch::Approx(12.5 + 14.0));
}

// ============================================================================
// SECTION B: VALIDATION AND DELIVERY
// ============================================================================

TEST_CASE("B1: Validation::UnknownItemNamed", "[optimizer][validation]")
{
    try {
        (void)optimizer().optimize({ { "toalhas", 1 } });
        FAIL("expected ValidationError");
    }
    catch (const ValidationError& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("toalhas"));
        REQUIRE(e.keys() == std::vector<std::string>{ "toalhas" });
    }
}

TEST_CASE("B2: Validation::NegativeCountRejected", "[optimizer][validation]")
{
    REQUIRE_THROWS_AS(optimizer().optimize({ { "lencol", -3 } }), ValidationError);
}

TEST_CASE("B3: Delivery::LocationLookup", "[optimizer][delivery]")
{
    PricingConfig cfg = defaultPricing();
    cfg.fees = DeliveryFees({ { "montijo", 5.0 }, { "lisboa", 0.0 }, { "default", 7.5 } });
    LaundryOptimizer opt(cfg, {}, silentLog());

    REQUIRE(opt.optimize({ { "camisa", 0 } }, "Montijo").totalCost == Catch::Approx(5.0));
    REQUIRE(opt.optimize({ { "camisa", 0 } }, "MONTIJO").totalCost == Catch::Approx(5.0));
    REQUIRE(opt.optimize({ { "camisa", 0 } }, "mars").totalCost == Catch::Approx(7.5));
    REQUIRE(opt.deliveryFee("Lisboa") == Catch::Approx(0.0));
}

TEST_CASE("B4: Config::InvalidPricingRejectedUpFront", "[optimizer][config]")
{
    PricingConfig cfg = defaultPricing();
    cfg.catalog.mixedPacks[0].shirtLimit = 50;
    REQUIRE_THROWS_AS(LaundryOptimizer(cfg, {}, silentLog()), ConfigError);
}

// ============================================================================
// SECTION C: BREAKDOWN INVARIANTS
// ============================================================================

TEST_CASE("C1: Breakdown::CoversEveryFamily", "[optimizer][invariants]")
{
    const auto& c = optimizer().pricing().catalog;
    for (auto [g, s, h] : { std::tuple{ 37, 9, 14 }, std::tuple{ 0, 75, 0 },
                            std::tuple{ 260, 3, 55 }, std::tuple{ 1, 1, 1 } }) {
        auto q = optimizer().optimize({ { "peca_variada", g }, { "camisa", s }, { "lencol", h } });
        auto covered = coveredBy(c, q.breakdown);
        INFO("order " << g << "/" << s << "/" << h);
        REQUIRE(covered.garments >= g);
        REQUIRE(covered.shirts >= s);
        REQUIRE(covered.sheets >= h);
    }
}

TEST_CASE("C2: Breakdown::ShirtsWithinPackLimits", "[optimizer][invariants]")
{
    const auto& c = optimizer().pricing().catalog;
    auto q = optimizer().optimize({ { "peca_variada", 395 }, { "camisa", 40 } });

    for (const auto& p : q.breakdown.shirtsInMixed) {
        const auto& pack = packByLabel(c.mixedPacks, p.label);
        auto bought = std::find_if(q.breakdown.mixedPacks.begin(), q.breakdown.mixedPacks.end(),
            [&](const PackCount& m) { return m.label == p.label; });
        REQUIRE(bought != q.breakdown.mixedPacks.end());
        REQUIRE(p.count <= pack.shirtLimit * bought->count);
    }
}

TEST_CASE("C3: Breakdown::LabelsSortedNumerically", "[optimizer][invariants]")
{
    auto q = optimizer().optimize({ { "peca_variada", 1000 }, { "camisa", 400 }, { "lencol", 95 } });

    auto sorted = [](const std::vector<PackCount>& packs) {
        for (std::size_t i = 1; i < packs.size(); ++i) {
            if (*labelValue(packs[i - 1].label) >= *labelValue(packs[i].label))
                return false;
        }
        return true;
    };
    REQUIRE(sorted(q.breakdown.mixedPacks));
    REQUIRE(sorted(q.breakdown.shirtPacks));
    REQUIRE(sorted(q.breakdown.sheetPacks));
    REQUIRE(sorted(q.breakdown.shirtsInMixed));
    for (const auto& p : q.breakdown.mixedPacks)
        REQUIRE(p.count > 0);
}

TEST_CASE("C4: Breakdown::RawVariablesComplete", "[optimizer][invariants]")
{
    auto q = optimizer().optimize({ { "camisa", 3 } });
    REQUIRE(q.rawVariables.size() == 22);
    REQUIRE(q.rawVariables.at("a_camisa") == 3);
}

/**
 * @test Breakdown::LargestAcceptedOrder
 * @brief An order at the quantity bound is priced exactly: 10^9 garments fill
 *        5,000,000 packs of 200, the cheapest rate per garment
 */
TEST_CASE("C5: Breakdown::LargestAcceptedOrder", "[optimizer][invariants]")
{
    auto q = optimizer().optimize({ { "peca_variada", kMaxQuantity } }, "lisboa");

    REQUIRE(q.breakdown.mixedPacks.size() == 1);
    REQUIRE(q.breakdown.mixedPacks[0].label == "200");
    REQUIRE(q.breakdown.mixedPacks[0].count == 5'000'000);
    REQUIRE(q.breakdown.loose.garments == 0);
    REQUIRE(q.totalCost == Catch::Approx(425'000'000.0));
    REQUIRE(q.rawVariables.at("x_misto_200") == 5'000'000);
}

// ============================================================================
// SECTION D: OPTIMALITY
// ============================================================================

/**
 * @test Optimality::MatchesReferenceOnSmallOrders
 * @brief Every (garments, shirts) pair up to 10 and every sheet count up to
 *        10 is priced exactly as the reference dynamic program prices it
 *
 * @details Also checks that adding one item of a family never lowers the
 *          quote.
 */
TEST_CASE("D1: Optimality::MatchesReferenceOnSmallOrders", "[optimizer][optimality]")
{
    const auto& c = optimizer().pricing().catalog;
    constexpr int N = 10;

    std::vector<std::vector<double>> spend(N + 1, std::vector<double>(N + 1, 0.0));
    for (int g = 0; g <= N; ++g) {
        for (int s = 0; s <= N; ++s) {
            auto q = optimizer().optimize({ { "peca_variada", g }, { "camisa", s } }, "lisboa");
            INFO("garments=" << g << " shirts=" << s);
            REQUIRE(q.totalCost == Catch::Approx(roundCurrency(referenceSpend(c, g, s, 0))));
            spend[g][s] = q.totalCost;
        }
    }

    for (int g = 0; g <= N; ++g) {
        for (int s = 0; s <= N; ++s) {
            if (g < N)
                REQUIRE(spend[g + 1][s] >= spend[g][s] - 1e-9);
            if (s < N)
                REQUIRE(spend[g][s + 1] >= spend[g][s] - 1e-9);
        }
    }

    double previous = 0.0;
    for (int h = 0; h <= N; ++h) {
        auto q = optimizer().optimize({ { "lencol", h } }, "lisboa");
        INFO("sheets=" << h);
        REQUIRE(q.totalCost == Catch::Approx(roundCurrency(referenceSpend(c, 0, 0, h))));
        REQUIRE(q.totalCost >= previous - 1e-9);
        previous = q.totalCost;
    }
}

TEST_CASE("D2: Optimality::MatchesReferenceOnMixedOrders", "[optimizer][optimality]")
{
    const auto& c = optimizer().pricing().catalog;
    for (auto [g, s, h] : { std::tuple{ 45, 7, 0 }, std::tuple{ 78, 12, 19 },
                            std::tuple{ 155, 6, 21 }, std::tuple{ 21, 55, 30 } }) {
        auto q = optimizer().optimize({ { "peca_variada", g }, { "camisa", s }, { "lencol", h } },
            "lisboa");
        INFO("order " << g << "/" << s << "/" << h);
        REQUIRE(q.totalCost == Catch::Approx(roundCurrency(referenceSpend(c, g, s, h))));
    }
}

TEST_CASE("D3: Optimality::NeverAboveAllLoose", "[optimizer][optimality]")
{
    auto q = optimizer().optimize({ { "peca_variada", 63 }, { "camisa", 17 }, { "lencol", 11 } },
        "lisboa");
    REQUIRE(q.totalCost <= 63 * 0.8 + 17 * 0.75 + 11 * 1.0 + 1e-9);
}

// ============================================================================
// SECTION E: DETERMINISM, LOGGING AND FAILURES
// ============================================================================

TEST_CASE("E1: Determinism::RepeatedQuotesIdentical", "[optimizer][determinism]")
{
    std::map<std::string, std::int64_t> items{ { "peca_variada", 37 }, { "camisa", 9 },
                                               { "lencol", 14 }, { "casaco", 1 } };
    auto a = optimizer().optimize(items, "Montijo");
    auto b = optimizer().optimize(items, "Montijo");

    REQUIRE(a.totalCost == b.totalCost);
    REQUIRE(a.breakdown.costs == b.breakdown.costs);
    REQUIRE(a.breakdown.mixedPacks == b.breakdown.mixedPacks);
    REQUIRE(a.rawVariables == b.rawVariables);
}

TEST_CASE("E2: Logging::RequestAndResultLogged", "[optimizer][logging]")
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Info, "quotes");
    LaundryOptimizer opt(defaultPricing(), {}, log);

    (void)opt.optimize({ { "camisa", 12 } }, "Lisboa");

    auto text = sink.str();
    REQUIRE_THAT(text, ContainsSubstring("[quotes] INFO"));
    REQUIRE_THAT(text, ContainsSubstring("camisa: 12"));
    REQUIRE_THAT(text, ContainsSubstring("delivery=Lisboa"));
    REQUIRE_THAT(text, ContainsSubstring("Quote total=9.00"));
}

TEST_CASE("E3: Logging::LevelFilters", "[optimizer][logging]")
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Warn);
    LaundryOptimizer opt(defaultPricing(), {}, log);

    (void)opt.optimize({ { "camisa", 1 } });
    REQUIRE(sink.str().empty());
}

TEST_CASE("E4: Failure::SolverErrorsWrapped", "[optimizer][error]")
{
    SolveSettings bad;
    bad.threads = -5;
    std::ostringstream sink;
    Logger log(sink, LogLevel::Error);
    LaundryOptimizer opt(defaultPricing(), bad, log);

    REQUIRE_THROWS_AS(opt.optimize({ { "camisa", 1 } }), SolverError);
    REQUIRE_THAT(sink.str(), ContainsSubstring("ERROR"));
}

/**
 * @class InfeasibleCostModel
 * @brief Cost model with one extra row that no allocation can satisfy
 */
class InfeasibleCostModel : public CostModel {
public:
    using CostModel::CostModel;

protected:
    void addConstraints() override
    {
        CostModel::addConstraints();
        model().addConstr(variables().var(CostVar::LooseShirts) <= -1.0);
    }
};

/**
 * @test Failure::NonOptimalStatusReported
 * @brief A solve that ends without a proven optimum raises SolverError with
 *        the Gurobi status, logs it, and leaves no allocation behind
 */
TEST_CASE("E5: Failure::NonOptimalStatusReported", "[optimizer][error]")
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Error);
    auto pricing = defaultPricing();
    InfeasibleCostModel model(pricing.catalog, FamilyDemand{ 3, 2, 1 });

    try {
        solveToOptimality(model, log, "{camisa: 2}");
        FAIL("expected SolverError");
    }
    catch (const SolverError& e) {
        REQUIRE(e.status() != GRB_OPTIMAL);
        REQUIRE((e.status() == GRB_INFEASIBLE || e.status() == GRB_INF_OR_UNBD));
        REQUIRE_THAT(e.what(), ContainsSubstring("Solver failed"));
    }

    REQUIRE_FALSE(model.solved());
    REQUIRE_THROWS_AS(model.allocation(), std::logic_error);
    REQUIRE_THAT(sink.str(), ContainsSubstring("ERROR") && ContainsSubstring("{camisa: 2}"));
}

TEST_CASE("E6: Logging::ModelSummaryOnlyAtDebug", "[optimizer][logging]")
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Info);
    LaundryOptimizer opt(defaultPricing(), {}, log);

    (void)opt.optimize({ { "camisa", 4 } });
    REQUIRE_THAT(sink.str(), !ContainsSubstring("DEBUG"));

    log.setLevel(LogLevel::Debug);
    (void)opt.optimize({ { "camisa", 4 } });
    REQUIRE_THAT(sink.str(), ContainsSubstring("DEBUG") && ContainsSubstring("vars=22"));
}

// ============================================================================
// SECTION F: LOGGER
// ============================================================================

/**
 * @test Logger::LevelChangesDuringConcurrentWrites
 * @brief Writers sharing a logger keep whole lines while another thread
 *        changes the level
 */
TEST_CASE("F1: Logger::LevelChangesDuringConcurrentWrites", "[logger][concurrency]")
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Info, "mt");

    std::thread toggler([&] {
        for (int i = 0; i < 1000; ++i)
            log.setLevel(i % 2 == 0 ? LogLevel::Warn : LogLevel::Info);
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&log, w] {
            for (int i = 0; i < 200; ++i)
                log.warn("writer {} line {}", w, i);
        });
    }

    toggler.join();
    for (auto& t : writers)
        t.join();

    std::istringstream lines(sink.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        REQUIRE(line.rfind("[mt] WARN  writer ", 0) == 0);
        ++count;
    }
    REQUIRE(count == 800);
}
