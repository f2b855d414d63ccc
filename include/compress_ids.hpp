#pragma once

#include <optional>
#include <span>
#include <vector>

#include "merger.hpp"

struct CompressedIds {
    std::vector<TokenId> compressed;
    std::vector<std::vector<TokenId>> codebook; // max_codebook_size rows of max_subtokens IDs
    std::optional<std::vector<TokenId>> remaining; // starts at the next boundary marker, if any
};

// Single-call interface for embedding hosts: compresses one window from the
// start of ids and hands back the part of the input that follows it.
//
// Without explicit disabled IDs, every ID takes part in merging.
inline CompressedIds compress_ids(std::span<TokenId const> const ids, MergeParams const& params, std::optional<std::vector<TokenId>> const& disabled_ids = std::nullopt) {
    DisabledIds disabled;
    if(disabled_ids) disabled = make_disabled_ids(*disabled_ids);

    auto r = merge(ids, params, disabled);

    CompressedIds result;
    result.compressed = std::move(r.compressed);
    result.codebook = r.codebook.rows(params.max_subtokens, params.eot_token_id);
    if(r.next_boundary) {
        result.remaining = std::vector<TokenId>(ids.begin() + *r.next_boundary, ids.end());
    }
    return result;
}
