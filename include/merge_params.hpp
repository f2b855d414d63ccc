#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <ankerl/unordered_dense.h>

using TokenId = uint32_t;
using Phrase = std::vector<TokenId>;
using DisabledIds = ankerl::unordered_dense::set<TokenId>;

// token files store every ID in 16 bits
constexpr TokenId MAX_ENCODABLE_TOKEN = UINT16_MAX;

inline TokenId to_token_id(uint64_t const x) {
    if(x > UINT32_MAX) {
        throw std::invalid_argument("token ID " + std::to_string(x) + " is out of range");
    }
    return TokenId(x);
}

struct MergeParams {
    size_t initial_vocab_size = 50'257;
    size_t max_codebook_size = 1'024;
    size_t max_subtokens = 4;
    size_t max_out_seq_length = 1'024;
    TokenId eot_token_id = 50'256;

    size_t codebook_table_size() const { return max_codebook_size * max_subtokens; }

    // one past the largest substitute ID
    size_t id_universe() const { return initial_vocab_size + max_codebook_size; }

    void validate() const {
        if(max_subtokens == 0) {
            throw std::invalid_argument("max_subtokens must be at least 1");
        }
        if(max_out_seq_length == 0) {
            throw std::invalid_argument("max_out_seq_length must be at least 1");
        }
        if(eot_token_id >= initial_vocab_size) {
            throw std::invalid_argument("eot_token_id " + std::to_string(eot_token_id)
                + " is not part of the initial vocabulary of size " + std::to_string(initial_vocab_size));
        }
    }
};

template<typename Ids>
DisabledIds make_disabled_ids(Ids const& ids) {
    DisabledIds set;
    set.reserve(ids.size());
    for(auto const x : ids) {
        set.insert(TokenId(x));
    }
    return set;
}
