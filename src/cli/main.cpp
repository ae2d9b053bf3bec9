#include "multicrypto/puzzle_generator.hpp"
#include "multicrypto/decoder_key.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <optional>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-m MIN] [-M MAX] [-k KEY | -i] [-r SEED] [-s] [-v] <phrase>\n";
    std::cerr << "  -m MIN   Minimum multiplication factor (default 2)\n";
    std::cerr << "  -M MAX   Maximum multiplication factor (default 12)\n";
    std::cerr << "  -k KEY   Decoder key (a permutation of a-z)\n";
    std::cerr << "  -i       Use the standard A=1, B=2, ... decoder key\n";
    std::cerr << "  -r SEED  Random seed\n";
    std::cerr << "  -s       Print table statistics to stderr\n";
    std::cerr << "  -v       Verbose mode\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const multicrypto::PuzzleGenerator& generator) {
    if (!g_print_stats) return;
    const auto s = generator.stats();
    std::cerr << "% Stats: products=" << s.product_count
              << " factorizations=" << s.factorization_count
              << " subtractions=" << s.subtraction_count
              << " min_solutions=" << s.min_solutions
              << " max_solutions=" << s.max_solutions
              << "\n";
}

void print_decoder_key(const multicrypto::DecoderKeyClues& clues) {
    std::cout << "Decoder Key\n-----------\n\n";
    for (const auto& c : clues) {
        std::cout << c.to_string() << " = ______\n";
    }
}

void print_puzzle(const multicrypto::Puzzle& puzzle) {
    std::cout << "Secret Message\n--------------\n\n";
    for (const auto& c : puzzle) {
        if (c.is_math_problem()) {
            std::cout << c << " = ______\n";
        } else {
            std::cout << c << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    multicrypto::PuzzleConfig config;
    std::optional<std::string> key;
    bool identity_key = false;
    std::optional<uint32_t> seed;
    std::string phrase;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            config.range.min = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-M") == 0 && i + 1 < argc) {
            config.range.max = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            key = argv[++i];
        } else if (std::strcmp(argv[i], "-i") == 0) {
            identity_key = true;
        } else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' || argv[i][1] == '\0') {
            if (!phrase.empty()) phrase += ' ';
            phrase += argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (phrase.empty()) {
        std::cerr << "Need a word or phrase!\n";
        print_usage(argv[0]);
        return 1;
    }

    if (key && identity_key) {
        std::cerr << "Options -k and -i cannot be combined\n";
        return 1;
    }

    try {
        auto rng = seed ? multicrypto::make_rng(*seed) : multicrypto::make_rng();

        if (key) {
            if (!multicrypto::is_permutation_key(*key)) {
                std::cerr << "Error: decoder key must contain each letter a-z exactly once\n";
                return 1;
            }
            config.decoder_key = *key;
        } else if (identity_key) {
            config.decoder_key = multicrypto::identity_decoder_key();
        } else {
            config.decoder_key = multicrypto::random_decoder_key(rng);
        }

        if (g_verbose) {
            std::cerr << "% [verbose] building tables for factors " << config.range.min
                      << ".." << config.range.max << ", key " << config.decoder_key << "\n";
        }
        multicrypto::PuzzleGenerator generator(config);
        generator.set_verbose(g_verbose);
        print_stats(generator);

        auto clues = generator.generate_decoder_key_clues(rng);
        auto puzzle = generator.generate_puzzle(phrase, rng);

        print_decoder_key(clues);
        std::cout << "\n\n\n";
        print_puzzle(puzzle);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
