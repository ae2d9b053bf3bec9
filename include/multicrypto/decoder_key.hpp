/**
 * @file decoder_key.hpp
 * @brief デコーダキー（アルファベットの置換）と乱数生成器
 */
#ifndef MULTICRYPTO_DECODER_KEY_HPP
#define MULTICRYPTO_DECODER_KEY_HPP

#include <cstdint>
#include <random>
#include <string>

namespace multicrypto {

/**
 * @brief 乱数生成器の型
 *
 * 生成処理はすべて呼び出し側の Rng を受け取る。
 * スレッドごとに別インスタンスを使うこと。
 */
using Rng = std::mt19937;

/// デコーダキーの長さ
constexpr size_t DECODER_KEY_LENGTH = 26;

/// ランダムキー生成時のスワップ回数
constexpr int DECODER_SHUFFLE_SWAPS = 100;

/**
 * @brief 実行ごとに異なるシードで初期化した Rng を作成
 */
Rng make_rng();

/**
 * @brief 固定シードで初期化した Rng を作成
 */
Rng make_rng(uint32_t seed);

/**
 * @brief 標準の A=1, B=2, ... のデコーダキー
 */
std::string identity_decoder_key();

/**
 * @brief ランダムなデコーダキー
 *
 * 恒等置換から開始し、[0,26) の2位置を DECODER_SHUFFLE_SWAPS 回入れ替える。
 * 一様な置換の近似であり、暗号用途ではない。
 */
std::string random_decoder_key(Rng& rng);

/**
 * @brief a..z をちょうど1回ずつ含む26文字か
 */
bool is_permutation_key(const std::string& key);

} // namespace multicrypto

#endif // MULTICRYPTO_DECODER_KEY_HPP
