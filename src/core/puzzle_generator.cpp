#include "multicrypto/puzzle_generator.hpp"
#include "multicrypto/error.hpp"
#include <iostream>
#include <stdexcept>

namespace multicrypto {

namespace {

// UTF-8 の先頭バイトからシーケンス長を求める（不正なバイトは1）
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// pos から始まる UTF-8 の1文字分のバイト数
// 継続バイトが足りない・不正な場合は先頭バイトだけを1文字とみなす
size_t utf8_char_length(const std::string& text, size_t pos) {
    size_t len = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
    if (pos + len > text.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(text[pos + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

char ascii_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

template <typename T>
const T& pick(const std::vector<T>& items, Rng& rng) {
    std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

}  // namespace

PuzzleGenerator::PuzzleGenerator(int min_digit, int max_digit, std::string decoder_key)
    : range_{min_digit, max_digit}
    , decoder_key_(std::move(decoder_key)) {
    if (decoder_key_.size() != DECODER_KEY_LENGTH) {
        throw InvalidDecoderKeyLengthError(decoder_key_.size());
    }

    products_ = build_product_table(range_);
    subtractions_ = build_subtraction_table(products_);
    check_coverage(subtractions_);
}

PuzzleGenerator::PuzzleGenerator(const PuzzleConfig& config)
    : PuzzleGenerator(config.range.min, config.range.max, config.decoder_key) {}

Expression PuzzleGenerator::expression_for_index(size_t index, Rng& rng) const {
    if (index >= subtractions_.size()) {
        throw std::out_of_range("Decoder index out of range: " + std::to_string(index));
    }

    // 構築時に check_coverage() 済みなので空ではない
    const auto& subtraction = pick(subtractions_[index], rng);
    const auto& left = pick(products_.at(subtraction.left), rng);
    const auto& right = pick(products_.at(subtraction.right), rng);

    return Expression::math(left, right);
}

DecoderKeyClues PuzzleGenerator::generate_decoder_key_clues(Rng& rng) const {
    DecoderKeyClues result;
    const std::string alpha = identity_decoder_key();  // 出力順

    for (size_t pos = 0; pos < alpha.size(); ++pos) {
        char c = alpha[pos];
        auto index = decoder_key_.find(c);
        if (index == std::string::npos) {
            throw MissingDecoderLetterError(c);
        }
        result[pos] = DecoderClue{ascii_upper(c), expression_for_index(index, rng)};
    }

    if (verbose_) {
        std::cerr << "% [verbose] decoder key clues generated for key " << decoder_key_ << "\n";
    }
    return result;
}

Puzzle PuzzleGenerator::generate_puzzle(const std::string& phrase, Rng& rng) const {
    Puzzle result;
    result.reserve(phrase.size());
    size_t math_count = 0;

    size_t i = 0;
    while (i < phrase.size()) {
        size_t len = utf8_char_length(phrase, i);

        if (len == 1) {
            char c = ascii_lower(phrase[i]);
            auto index = decoder_key_.find(c);
            if (index != std::string::npos) {
                result.push_back(expression_for_index(index, rng));
                ++math_count;
            } else {
                // 英字以外はそのまま出力
                result.push_back(Expression::literal(std::string(1, c)));
            }
        } else {
            result.push_back(Expression::literal(phrase.substr(i, len)));
        }
        i += len;
    }

    if (verbose_) {
        std::cerr << "% [verbose] puzzle: " << result.size() << " characters, "
                  << math_count << " math problems\n";
    }
    return result;
}

} // namespace multicrypto
