/**
 * @file combinatorics.hpp
 * @brief 積テーブルと差テーブルの構築
 */
#ifndef MULTICRYPTO_COMBINATORICS_HPP
#define MULTICRYPTO_COMBINATORICS_HPP

#include "multicrypto/expression.hpp"
#include <array>
#include <map>
#include <vector>

namespace multicrypto {

/// 差の最大値（= アルファベットの文字数）
constexpr int MAX_DIFFERENCE = 26;

/**
 * @brief 掛け算の因数の範囲 [min, max]
 */
struct DigitRange {
    int min = 2;
    int max = 12;
};

/**
 * @brief 積の値 -> その積を作る (a, b) の一覧
 *
 * (i, j) と (j, i) は別エントリとして保持する。
 */
using ProductTable = std::map<int, std::vector<Multiplication>>;

/**
 * @brief 差 v (1..26) -> left - right = v となる積キーの組
 *
 * インデックスは v - 1。
 */
using SubtractionTable = std::array<std::vector<Subtraction>, MAX_DIFFERENCE>;

/**
 * @brief テーブルの統計情報
 */
struct TableStats {
    size_t product_count = 0;        // 異なる積の数
    size_t factorization_count = 0;  // (a, b) の総数
    size_t subtraction_count = 0;    // 全 v の引き算の総数
    size_t min_solutions = 0;        // v あたりの引き算の最小数
    size_t max_solutions = 0;        // v あたりの引き算の最大数
};

/**
 * @brief [min, max] の全ての (i, j) について積テーブルを構築
 * @throws InvalidDigitRangeError min > max、または因数の絶対値が
 *         MAX_DIGIT_MAGNITUDE を超える場合
 */
ProductTable build_product_table(int min, int max);

inline ProductTable build_product_table(const DigitRange& range) {
    return build_product_table(range.min, range.max);
}

/**
 * @brief 積テーブルのキーどうしで差 1..26 を作る組を列挙
 *
 * 作れない差のエントリは空のまま返す。検査は check_coverage() で行う。
 */
SubtractionTable build_subtraction_table(const ProductTable& products);

/**
 * @brief エントリが空の差（1..26）を昇順で返す
 */
std::vector<int> missing_differences(const SubtractionTable& subtractions);

/**
 * @brief 全ての差 1..26 が作れることを確認
 * @throws IncompleteDifferenceCoverageError 作れない差がある場合
 */
void check_coverage(const SubtractionTable& subtractions);

TableStats compute_table_stats(const ProductTable& products,
                               const SubtractionTable& subtractions);

} // namespace multicrypto

#endif // MULTICRYPTO_COMBINATORICS_HPP
