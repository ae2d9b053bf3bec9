/**
 * @file error.hpp
 * @brief パズル生成器のエラー型
 */
#ifndef MULTICRYPTO_ERROR_HPP
#define MULTICRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace multicrypto {

/// 掛け算の因数の絶対値の上限（積と差が int に収まる範囲）
constexpr int MAX_DIGIT_MAGNITUDE = 10000;

/**
 * @brief エラー種別
 */
enum class ErrorKind {
    InvalidDigitRange,             // min > max、または因数が大きすぎる
    InvalidDecoderKeyLength,       // デコーダキーが26文字でない
    IncompleteDifferenceCoverage,  // 1..26 のいずれかの差が作れない
    MissingDecoderLetter           // デコーダキーに含まれない文字がある
};

/**
 * @brief パズル生成器のエラー基底クラス
 */
class GeneratorError : public std::runtime_error {
public:
    GeneratorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidDigitRangeError : public GeneratorError {
public:
    InvalidDigitRangeError(int min, int max)
        : GeneratorError(ErrorKind::InvalidDigitRange, make_message(min, max))
        , min_(min), max_(max) {}

    int min() const { return min_; }
    int max() const { return max_; }

private:
    static std::string make_message(int min, int max) {
        std::string range = "[" + std::to_string(min) + ", " + std::to_string(max) + "]";
        if (min > max) {
            return "Invalid digit range " + range + ": min is greater than max";
        }
        return "Invalid digit range " + range + ": factors must be within +/-" +
               std::to_string(MAX_DIGIT_MAGNITUDE);
    }

    int min_;
    int max_;
};

class InvalidDecoderKeyLengthError : public GeneratorError {
public:
    explicit InvalidDecoderKeyLengthError(size_t length)
        : GeneratorError(ErrorKind::InvalidDecoderKeyLength,
                         "The decoder must be 26 characters (got " +
                         std::to_string(length) + ")")
        , length_(length) {}

    size_t length() const { return length_; }

private:
    size_t length_;
};

/**
 * @brief 指定の数字範囲では 1..26 の一部の差が作れない
 */
class IncompleteDifferenceCoverageError : public GeneratorError {
public:
    explicit IncompleteDifferenceCoverageError(std::vector<int> missing)
        : GeneratorError(ErrorKind::IncompleteDifferenceCoverage,
                         make_message(missing))
        , missing_(std::move(missing)) {}

    /// 作れなかった差（1..26）
    const std::vector<int>& missing_values() const { return missing_; }

private:
    static std::string make_message(const std::vector<int>& missing) {
        std::string msg = "Digit range cannot produce differences:";
        for (auto v : missing) {
            msg += " " + std::to_string(v);
        }
        return msg;
    }

    std::vector<int> missing_;
};

class MissingDecoderLetterError : public GeneratorError {
public:
    explicit MissingDecoderLetterError(char letter)
        : GeneratorError(ErrorKind::MissingDecoderLetter,
                         std::string("Letter '") + letter + "' is not in the decoder key")
        , letter_(letter) {}

    char letter() const { return letter_; }

private:
    char letter_;
};

} // namespace multicrypto

#endif // MULTICRYPTO_ERROR_HPP
