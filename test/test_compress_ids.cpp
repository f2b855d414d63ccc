#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <vector>

#include <compress_ids.hpp>

TEST_SUITE("compress_ids") {
    MergeParams params(size_t const max_subtokens, size_t const max_out_seq_length) {
        MergeParams p;
        p.initial_vocab_size = 100;
        p.max_codebook_size = 4;
        p.max_subtokens = max_subtokens;
        p.max_out_seq_length = max_out_seq_length;
        p.eot_token_id = 0;
        return p;
    }

    TEST_CASE("remaining documents") {
        std::vector<TokenId> const ids = { 1, 2, 3, 4, 0, 5, 6 };
        auto const r = compress_ids(ids, params(4, 3), std::vector<TokenId>{ 0 });

        REQUIRE(r.compressed == std::vector<TokenId>{ 1, 2, 3 });
        REQUIRE(r.codebook.size() == 4);
        REQUIRE(r.codebook[0] == std::vector<TokenId>{ 1, 2, 0, 0 });
        REQUIRE(r.codebook[1] == std::vector<TokenId>{ 2, 3, 0, 0 });
        REQUIRE(r.codebook[2] == std::vector<TokenId>{ 3, 4, 0, 0 });
        REQUIRE(r.codebook[3] == std::vector<TokenId>{ 0, 0, 0, 0 });

        REQUIRE(r.remaining.has_value());
        REQUIRE(*r.remaining == std::vector<TokenId>{ 0, 5, 6 });
    }

    TEST_CASE("no remaining documents") {
        std::vector<TokenId> const ids = { 5, 6, 0, 5, 6 };
        auto const r = compress_ids(ids, params(3, 10), std::vector<TokenId>{ 0 });

        REQUIRE(r.compressed == std::vector<TokenId>{ 5, 6, 0, 100 });
        REQUIRE(!r.remaining.has_value());
    }

    TEST_CASE("without disabled ids") {
        // the boundary marker is merged like any other token
        std::vector<TokenId> const ids = { 5, 6, 0, 5, 6 };
        auto const r = compress_ids(ids, params(3, 10));

        REQUIRE(r.compressed == std::vector<TokenId>{ 5, 6, 0, 100 });
        REQUIRE(r.codebook[0] == std::vector<TokenId>{ 5, 6, 0 });
        REQUIRE(r.codebook[1] == std::vector<TokenId>{ 6, 0, 0 });
        REQUIRE(r.codebook[2] == std::vector<TokenId>{ 0, 5, 0 });
        REQUIRE(r.codebook[3] == std::vector<TokenId>{ 0, 0, 0 });
    }

    TEST_CASE("codebook shape") {
        std::vector<TokenId> const ids;
        auto const r = compress_ids(ids, params(5, 10));
        REQUIRE(r.compressed.empty());
        REQUIRE(r.codebook.size() == 4);
        for(auto const& row : r.codebook) REQUIRE(row.size() == 5);
        REQUIRE(!r.remaining.has_value());
    }
}
