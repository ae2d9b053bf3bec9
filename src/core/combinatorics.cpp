#include "multicrypto/combinatorics.hpp"
#include "multicrypto/error.hpp"
#include <algorithm>
#include <limits>

namespace multicrypto {

ProductTable build_product_table(int min, int max) {
    if (min > max ||
        min < -MAX_DIGIT_MAGNITUDE || max > MAX_DIGIT_MAGNITUDE) {
        throw InvalidDigitRangeError(min, max);
    }

    ProductTable products;
    for (int i = min; i <= max; ++i) {
        for (int j = min; j <= max; ++j) {
            products[i * j].push_back(Multiplication{i, j});
        }
    }
    return products;
}

SubtractionTable build_subtraction_table(const ProductTable& products) {
    SubtractionTable result;

    // left を固定して right = left - v を引く（キーは昇順）
    for (int v = 1; v <= MAX_DIFFERENCE; ++v) {
        auto& entry = result[static_cast<size_t>(v - 1)];
        for (const auto& [left, factors] : products) {
            (void)factors;
            if (products.count(left - v) > 0) {
                entry.push_back(Subtraction{left, left - v});
            }
        }
    }
    return result;
}

std::vector<int> missing_differences(const SubtractionTable& subtractions) {
    std::vector<int> missing;
    for (size_t i = 0; i < subtractions.size(); ++i) {
        if (subtractions[i].empty()) {
            missing.push_back(static_cast<int>(i) + 1);
        }
    }
    return missing;
}

void check_coverage(const SubtractionTable& subtractions) {
    auto missing = missing_differences(subtractions);
    if (!missing.empty()) {
        throw IncompleteDifferenceCoverageError(std::move(missing));
    }
}

TableStats compute_table_stats(const ProductTable& products,
                               const SubtractionTable& subtractions) {
    TableStats stats;
    stats.product_count = products.size();
    for (const auto& [value, factors] : products) {
        (void)value;
        stats.factorization_count += factors.size();
    }

    stats.min_solutions = std::numeric_limits<size_t>::max();
    for (const auto& entry : subtractions) {
        stats.subtraction_count += entry.size();
        stats.min_solutions = std::min(stats.min_solutions, entry.size());
        stats.max_solutions = std::max(stats.max_solutions, entry.size());
    }
    return stats;
}

} // namespace multicrypto
