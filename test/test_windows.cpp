#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

#include <window_orchestrator.hpp>

namespace {

MergeParams small_params(size_t const max_codebook_size, size_t const max_subtokens, size_t const max_out_seq_length) {
    MergeParams params;
    params.initial_vocab_size = 100;
    params.max_codebook_size = max_codebook_size;
    params.max_subtokens = max_subtokens;
    params.max_out_seq_length = max_out_seq_length;
    params.eot_token_id = 0;
    return params;
}

// expands one window using its flat codebook table
std::vector<TokenId> expand_window(TokenId const* window, size_t const window_size, TokenId const* table, MergeParams const& params) {
    std::vector<TokenId> out;
    for(size_t i = 0; i < window_size; i++) {
        auto const x = window[i];
        if(x < params.initial_vocab_size) {
            out.push_back(x);
        } else {
            auto const* phrase = table + (x - params.initial_vocab_size) * params.max_subtokens;
            for(size_t j = 0; j < params.max_subtokens && phrase[j] != params.eot_token_id; j++) {
                out.push_back(phrase[j]);
            }
        }
    }
    return out;
}

std::vector<TokenId> const stream = { 0, 1, 2, 3, 4, 5, 6, 0, 7, 8, 9, 1, 2, 3, 4, 5 };

}

TEST_SUITE("windows") {
    TEST_CASE("drop tail") {
        auto const params = small_params(4, 2, 4);
        WindowOrchestrator windows(params, TailPolicy::drop);

        auto const tiled = windows.tile(stream);
        REQUIRE(tiled.num_windows == 4);
        REQUIRE(tiled.consumed == 14);
        REQUIRE(tiled.compressed == std::vector<TokenId>{
            0, 1, 2, 3,
            0, 4, 5, 6,
            0, 7, 8, 9,
            0, 1, 2, 3
        });

        REQUIRE(tiled.codebooks.size() == 4 * params.codebook_table_size());
        auto const first_table = std::vector<TokenId>(tiled.codebooks.begin(), tiled.codebooks.begin() + 8);
        REQUIRE(first_table == std::vector<TokenId>{ 1, 2, 2, 3, 3, 4, 0, 0 });
        REQUIRE(tiled.num_codebook_entries == 3 + 2 + 3 + 3);
    }

    TEST_CASE("pad tail") {
        auto const params = small_params(4, 2, 4);
        WindowOrchestrator windows(params, TailPolicy::pad);

        auto const tiled = windows.tile(stream);
        REQUIRE(tiled.num_windows == 5);
        REQUIRE(tiled.consumed == stream.size());
        REQUIRE(tiled.compressed.size() == 5 * 4);

        auto const last = std::vector<TokenId>(tiled.compressed.end() - 4, tiled.compressed.end());
        REQUIRE(last == std::vector<TokenId>{ 0, 4, 5, 0 });

        auto const last_table = std::vector<TokenId>(tiled.codebooks.end() - 8, tiled.codebooks.end());
        REQUIRE(last_table == std::vector<TokenId>{ 4, 5, 0, 0, 0, 0, 0, 0 });
    }

    TEST_CASE("short stream") {
        auto const params = small_params(4, 2, 16);

        WindowOrchestrator drop(params, TailPolicy::drop);
        auto const dropped = drop.tile(stream);
        REQUIRE(dropped.num_windows == 0);
        REQUIRE(dropped.compressed.empty());
        REQUIRE(dropped.codebooks.empty());

        WindowOrchestrator pad(params, TailPolicy::pad);
        auto const padded = pad.tile(stream);
        REQUIRE(padded.num_windows == 1);
        REQUIRE(padded.compressed.size() == 16);
        REQUIRE(padded.consumed == stream.size());
        REQUIRE(expand_window(padded.compressed.data(), 16, padded.codebooks.data(), params).size() >= stream.size());
    }

    TEST_CASE("window starts") {
        auto const params = small_params(4, 2, 4);
        WindowOrchestrator windows(params);

        {
            auto const w = windows.window(stream, 0);
            REQUIRE(w.compressed == std::vector<TokenId>{ 0, 1, 2, 3 });
            REQUIRE(w.consumed == 4);
        }
        {
            auto const w = windows.window(stream, 4);
            REQUIRE(w.compressed == std::vector<TokenId>{ 0, 4, 5, 6 });
            REQUIRE(w.consumed == 3);
            REQUIRE(w.next_boundary == 3);
        }
    }

    TEST_CASE("empty stream") {
        WindowOrchestrator windows(small_params(4, 2, 4), TailPolicy::pad);
        auto const tiled = windows.tile(std::vector<TokenId>());
        REQUIRE(tiled.num_windows == 0);
        REQUIRE(tiled.consumed == 0);
    }

    TEST_CASE("window too small") {
        CHECK_THROWS_AS(WindowOrchestrator{small_params(4, 2, 1)}, std::invalid_argument);
    }

    TEST_CASE("substitute ids beyond 16 bits") {
        auto params = small_params(1024, 4, 16);

        params.initial_vocab_size = 65'000;
        CHECK_THROWS_AS(WindowOrchestrator{params}, std::invalid_argument);

        // the largest substitute ID is exactly 65535
        params.initial_vocab_size = 64'512;
        CHECK_NOTHROW(WindowOrchestrator{params});
    }

    TEST_CASE("random stream") {
        std::mt19937 gen(1234);
        std::uniform_int_distribution<TokenId> token(1, 9);
        std::uniform_int_distribution<int> boundary(0, 63);

        std::vector<TokenId> ids;
        for(size_t i = 0; i < 5'000; i++) {
            ids.push_back(boundary(gen) == 0 ? 0 : token(gen));
        }

        for(auto const tail : { TailPolicy::drop, TailPolicy::pad }) {
            auto const params = small_params(16, 3, 64);
            WindowOrchestrator windows(params, tail);
            auto const tiled = windows.tile(ids);

            auto const window_size = params.max_out_seq_length;
            auto const table_size = params.codebook_table_size();
            REQUIRE(tiled.compressed.size() == tiled.num_windows * window_size);
            REQUIRE(tiled.codebooks.size() == tiled.num_windows * table_size);
            REQUIRE(tiled.num_codebook_entries <= tiled.num_windows * params.max_codebook_size);
            if(tail == TailPolicy::pad) REQUIRE(tiled.consumed == ids.size());

            // decode window by window and compare to the raw stream
            size_t offset = 0;
            for(size_t w = 0; w < tiled.num_windows; w++) {
                auto const* window = tiled.compressed.data() + w * window_size;
                auto const* table = tiled.codebooks.data() + w * table_size;

                // every window starts at a document boundary
                REQUIRE(window[0] == params.eot_token_id);
                for(size_t i = 0; i < window_size; i++) {
                    REQUIRE(window[i] < params.initial_vocab_size + params.max_codebook_size);
                }

                auto decoded = expand_window(window, window_size, table, params);
                if(ids[offset] != params.eot_token_id) {
                    // drop the inserted marker
                    decoded.erase(decoded.begin());
                }

                auto const expected_end = std::min(offset + decoded.size(), ids.size());
                auto const expected = std::vector<TokenId>(ids.begin() + offset, ids.begin() + expected_end);
                auto const actual = std::vector<TokenId>(decoded.begin(), decoded.begin() + expected.size());
                REQUIRE(actual == expected);

                // anything beyond the raw stream is padding
                for(size_t i = expected.size(); i < decoded.size(); i++) REQUIRE(decoded[i] == params.eot_token_id);

                offset += expected.size();
            }
            REQUIRE(offset == tiled.consumed);
        }
    }
}
