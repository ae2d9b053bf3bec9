/**
 * @file expression.hpp
 * @brief パズルの式（(a x b) - (c x d)）とデコーダキーの手がかり
 */
#ifndef MULTICRYPTO_EXPRESSION_HPP
#define MULTICRYPTO_EXPRESSION_HPP

#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace multicrypto {

/**
 * @brief 掛け算 (a x b)
 */
struct Multiplication {
    int a;
    int b;

    int value() const { return a * b; }

    bool operator==(const Multiplication& other) const {
        return a == other.a && b == other.b;
    }
};

/**
 * @brief 積どうしの引き算 (left - right)
 *
 * left, right は ProductTable のキー（積の値）。
 */
struct Subtraction {
    int left;
    int right;

    int value() const { return left - right; }

    bool operator==(const Subtraction& other) const {
        return left == other.left && right == other.right;
    }
};

/**
 * @brief パズルの1文字分
 *
 * 数式 (a x b) - (c x d) か、そのまま表示するリテラルのどちらか一方。
 */
class Expression {
public:
    using Operands = std::array<int, 4>;

    /**
     * @brief (0 x 0) - (0 x 0) で初期化
     */
    Expression() = default;

    /**
     * @brief 数式 (a x b) - (c x d) を作成
     */
    static Expression math(int a, int b, int c, int d);

    /**
     * @brief 数式を掛け算2つから作成
     */
    static Expression math(const Multiplication& left, const Multiplication& right);

    /**
     * @brief リテラル（英字以外の入力文字）を作成
     * @param text 入力文字（UTF-8 の場合は1文字分のバイト列）
     */
    static Expression literal(std::string text);

    /**
     * @brief 数式かどうか（解答欄を付けるかの判定に使う）
     */
    bool is_math_problem() const { return !literal_.has_value(); }

    /**
     * @brief 数式の値 (a*b) - (c*d)
     * @return リテラルなら std::nullopt
     */
    std::optional<int> value() const;

    /**
     * @brief オペランド {a, b, c, d}（リテラルでは全て0）
     */
    const Operands& operands() const { return operands_; }

    /**
     * @brief リテラルの文字列（数式なら空）
     */
    const std::string& literal_text() const;

    /**
     * @brief 表示用文字列
     *
     * 数式は "(a x b) - (c x d)"、リテラルはその文字自身。
     */
    std::string to_string() const;

    bool operator==(const Expression& other) const {
        return operands_ == other.operands_ && literal_ == other.literal_;
    }
    bool operator!=(const Expression& other) const { return !(*this == other); }

private:
    Operands operands_{};
    std::optional<std::string> literal_;
};

std::ostream& operator<<(std::ostream& os, const Expression& expr);

/**
 * @brief デコーダキーの1文字分の手がかり
 */
struct DecoderClue {
    char letter = 0;  // 大文字 'A'..'Z'
    Expression clue;

    /// "A: (a x b) - (c x d)"
    std::string to_string() const;
};

} // namespace multicrypto

#endif // MULTICRYPTO_EXPRESSION_HPP
