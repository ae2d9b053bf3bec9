/**
 * @file puzzle_generator.hpp
 * @brief 掛け算・引き算による暗号パズル生成器
 */
#ifndef MULTICRYPTO_PUZZLE_GENERATOR_HPP
#define MULTICRYPTO_PUZZLE_GENERATOR_HPP

#include "multicrypto/combinatorics.hpp"
#include "multicrypto/decoder_key.hpp"
#include "multicrypto/expression.hpp"
#include <array>
#include <string>
#include <vector>

namespace multicrypto {

/**
 * @brief 生成器の設定
 */
struct PuzzleConfig {
    DigitRange range;                               // 因数の範囲（既定は 2..12、x1 は簡単すぎる）
    std::string decoder_key = identity_decoder_key();
};

using DecoderKeyClues = std::array<DecoderClue, DECODER_KEY_LENGTH>;
using Puzzle = std::vector<Expression>;

/**
 * @brief フレーズの各文字を (a x b) - (c x d) の式に変換するパズル生成器
 *
 * 式の値 1..26 はデコーダキーの位置（0始まりで値-1）の文字を表す。
 * 例えばデコーダキーが "klcnogdwprftyxqismjvehabzu" のとき
 * (3 x 5) - (2 x 3) = 9 は "p" を表す。
 *
 * 積テーブルと差テーブルは構築時に一度だけ計算し、以後は読み取り専用。
 * 乱数状態は持たないため、Rng をスレッドごとに分ければ
 * 1つのインスタンスを複数スレッドから共有できる。
 */
class PuzzleGenerator {
public:
    /**
     * @brief 生成器を作成
     * @param min_digit 掛け算の因数の最小値
     * @param max_digit 掛け算の因数の最大値
     * @param decoder_key 26文字のデコーダキー。"abc..." なら A=1, B=2。
     *        identity_decoder_key() や random_decoder_key() を使うとよい。
     * @throws InvalidDecoderKeyLengthError キーが26文字でない場合
     * @throws InvalidDigitRangeError min_digit > max_digit、または因数が
     *         ±MAX_DIGIT_MAGNITUDE を超える場合
     * @throws IncompleteDifferenceCoverageError 1..26 の一部の差が作れない場合
     * @note キーが a..z の置換であることは検査しない（is_permutation_key() を参照）
     */
    PuzzleGenerator(int min_digit, int max_digit, std::string decoder_key);

    explicit PuzzleGenerator(const PuzzleConfig& config);

    /**
     * @brief デコーダキーの手がかりを生成
     *
     * 呼び出しごとに式はランダムに選び直す。
     * 結果はアルファベット順（先頭が A の式）。
     *
     * @throws MissingDecoderLetterError デコーダキーに含まれない英字がある場合
     */
    DecoderKeyClues generate_decoder_key_clues(Rng& rng) const;

    /**
     * @brief フレーズからパズルを生成
     *
     * フレーズは小文字化し、デコーダキーに含まれる文字は式に、
     * それ以外（空白・記号・数字など）はリテラルとしてそのまま出力する。
     */
    Puzzle generate_puzzle(const std::string& phrase, Rng& rng) const;

    /**
     * @brief デコーダキー位置 index (0..25) の値 index+1 を表す式をランダムに選ぶ
     * @throws std::out_of_range index が範囲外の場合
     */
    Expression expression_for_index(size_t index, Rng& rng) const;

    const DigitRange& digit_range() const { return range_; }
    const std::string& decoder_key() const { return decoder_key_; }
    const ProductTable& products() const { return products_; }
    const SubtractionTable& subtractions() const { return subtractions_; }

    /**
     * @brief テーブルの統計情報を取得
     */
    TableStats stats() const { return compute_table_stats(products_, subtractions_); }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    DigitRange range_;
    std::string decoder_key_;
    ProductTable products_;
    SubtractionTable subtractions_;
    bool verbose_ = false;
};

} // namespace multicrypto

#endif // MULTICRYPTO_PUZZLE_GENERATOR_HPP
