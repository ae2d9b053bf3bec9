#include "multicrypto/expression.hpp"
#include <sstream>

namespace multicrypto {

Expression Expression::math(int a, int b, int c, int d) {
    Expression expr;
    expr.operands_ = {a, b, c, d};
    return expr;
}

Expression Expression::math(const Multiplication& left, const Multiplication& right) {
    return math(left.a, left.b, right.a, right.b);
}

Expression Expression::literal(std::string text) {
    Expression expr;
    expr.literal_ = std::move(text);
    return expr;
}

std::optional<int> Expression::value() const {
    if (literal_) return std::nullopt;
    return operands_[0] * operands_[1] - operands_[2] * operands_[3];
}

const std::string& Expression::literal_text() const {
    static const std::string empty;
    return literal_ ? *literal_ : empty;
}

std::string Expression::to_string() const {
    if (literal_) {
        return *literal_;
    }
    std::ostringstream oss;
    oss << "(" << operands_[0] << " x " << operands_[1] << ") - ("
        << operands_[2] << " x " << operands_[3] << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Expression& expr) {
    return os << expr.to_string();
}

std::string DecoderClue::to_string() const {
    return std::string(1, letter) + ": " + clue.to_string();
}

} // namespace multicrypto
