#include <catch2/catch.hpp>
#include "multicrypto/combinatorics.hpp"
#include "multicrypto/error.hpp"
#include "multicrypto/expression.hpp"

using namespace multicrypto;

// ============================================================================
// Expression tests
// ============================================================================

TEST_CASE("Expression math", "[expression]") {
    auto e = Expression::math(3, 5, 2, 3);

    REQUIRE(e.is_math_problem());
    REQUIRE(e.value() == 9);
    REQUIRE(e.to_string() == "(3 x 5) - (2 x 3)");
    REQUIRE(e.literal_text().empty());
    const Expression::Operands expected{3, 5, 2, 3};
    REQUIRE(e.operands() == expected);

    SECTION("from multiplications") {
        auto m = Expression::math(Multiplication{3, 5}, Multiplication{2, 3});
        REQUIRE(m == e);
    }
}

TEST_CASE("Expression literal", "[expression]") {
    auto e = Expression::literal("!");

    REQUIRE(!e.is_math_problem());
    REQUIRE(!e.value().has_value());
    REQUIRE(e.to_string() == "!");
    REQUIRE(e.literal_text() == "!");
    REQUIRE(e != Expression::literal(" "));
}

TEST_CASE("DecoderClue to_string", "[expression]") {
    DecoderClue clue{'P', Expression::math(3, 5, 2, 3)};
    REQUIRE(clue.to_string() == "P: (3 x 5) - (2 x 3)");
}

// ============================================================================
// Product table tests
// ============================================================================

TEST_CASE("build_product_table small range", "[combinatorics]") {
    auto products = build_product_table(2, 3);

    REQUIRE(products.size() == 3);
    const std::vector<Multiplication> four{{2, 2}};
    const std::vector<Multiplication> six{{2, 3}, {3, 2}};
    const std::vector<Multiplication> nine{{3, 3}};
    REQUIRE(products.at(4) == four);
    REQUIRE(products.at(6) == six);
    REQUIRE(products.at(9) == nine);
}

TEST_CASE("build_product_table factors stay in range", "[combinatorics]") {
    auto products = build_product_table(DigitRange{2, 12});

    size_t total = 0;
    for (const auto& [value, factors] : products) {
        REQUIRE(!factors.empty());
        for (const auto& m : factors) {
            REQUIRE(m.a >= 2);
            REQUIRE(m.a <= 12);
            REQUIRE(m.b >= 2);
            REQUIRE(m.b <= 12);
            REQUIRE(m.value() == value);
        }
        total += factors.size();
    }
    // 11 x 11 の全ての組
    REQUIRE(total == 121);
}

TEST_CASE("build_product_table single digit", "[combinatorics]") {
    auto products = build_product_table(7, 7);
    REQUIRE(products.size() == 1);
    REQUIRE(products.at(49).size() == 1);
}

TEST_CASE("build_product_table rejects min > max", "[combinatorics][error]") {
    REQUIRE_THROWS_AS(build_product_table(5, 3), InvalidDigitRangeError);

    try {
        build_product_table(12, 2);
        FAIL("expected InvalidDigitRangeError");
    } catch (const GeneratorError& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidDigitRange);
    }
}

TEST_CASE("build_product_table rejects factors too large for int products", "[combinatorics][error]") {
    REQUIRE_THROWS_AS(build_product_table(2, MAX_DIGIT_MAGNITUDE + 1), InvalidDigitRangeError);
    REQUIRE_THROWS_AS(build_product_table(-MAX_DIGIT_MAGNITUDE - 1, 2), InvalidDigitRangeError);
    REQUIRE_THROWS_AS(build_product_table(46341, 46341), InvalidDigitRangeError);
    REQUIRE_NOTHROW(build_product_table(MAX_DIGIT_MAGNITUDE, MAX_DIGIT_MAGNITUDE));
    REQUIRE_NOTHROW(build_product_table(-MAX_DIGIT_MAGNITUDE, -MAX_DIGIT_MAGNITUDE));
}

// ============================================================================
// Subtraction table tests
// ============================================================================

TEST_CASE("build_subtraction_table small range", "[combinatorics]") {
    auto subtractions = build_subtraction_table(build_product_table(2, 3));

    const std::vector<Subtraction> two{{6, 4}};
    const std::vector<Subtraction> three{{9, 6}};
    const std::vector<Subtraction> five{{9, 4}};
    REQUIRE(subtractions[1] == two);
    REQUIRE(subtractions[2] == three);
    REQUIRE(subtractions[4] == five);
    REQUIRE(subtractions[0].empty());
    REQUIRE(subtractions[25].empty());

    auto missing = missing_differences(subtractions);
    REQUIRE(missing.size() == 23);
    REQUIRE(missing.front() == 1);
    REQUIRE(missing.back() == 26);
}

TEST_CASE("build_subtraction_table covers 1..26 for wide ranges", "[combinatorics]") {
    for (auto range : {DigitRange{2, 12}, DigitRange{1, 12}, DigitRange{2, 15}}) {
        auto products = build_product_table(range);
        auto subtractions = build_subtraction_table(products);

        REQUIRE(missing_differences(subtractions).empty());
        REQUIRE_NOTHROW(check_coverage(subtractions));

        for (int v = 1; v <= MAX_DIFFERENCE; ++v) {
            for (const auto& s : subtractions[static_cast<size_t>(v - 1)]) {
                REQUIRE(s.value() == v);
                REQUIRE(products.count(s.left) == 1);
                REQUIRE(products.count(s.right) == 1);
            }
        }
    }
}

TEST_CASE("check_coverage reports missing differences", "[combinatorics][error]") {
    SECTION("narrow range") {
        auto subtractions = build_subtraction_table(build_product_table(3, 5));
        REQUIRE_THROWS_AS(check_coverage(subtractions), IncompleteDifferenceCoverageError);
    }

    SECTION("single digit range misses everything") {
        auto subtractions = build_subtraction_table(build_product_table(2, 2));
        try {
            check_coverage(subtractions);
            FAIL("expected IncompleteDifferenceCoverageError");
        } catch (const IncompleteDifferenceCoverageError& e) {
            REQUIRE(e.kind() == ErrorKind::IncompleteDifferenceCoverage);
            REQUIRE(e.missing_values().size() == 26);
        }
    }
}

TEST_CASE("compute_table_stats", "[combinatorics]") {
    auto products = build_product_table(2, 3);
    auto stats = compute_table_stats(products, build_subtraction_table(products));

    REQUIRE(stats.product_count == 3);
    REQUIRE(stats.factorization_count == 4);
    REQUIRE(stats.subtraction_count == 3);
    REQUIRE(stats.min_solutions == 0);
    REQUIRE(stats.max_solutions == 1);
}
