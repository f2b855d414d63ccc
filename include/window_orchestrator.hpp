#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "merger.hpp"

enum class TailPolicy {
    drop, // discard the remainder that cannot fill a complete window
    pad   // compress the remainder into a final window padded with the boundary marker
};

struct TiledStream {
    std::vector<TokenId> compressed; // windows of max_out_seq_length IDs each, concatenated
    std::vector<TokenId> codebooks;  // one flat codebook table per window, concatenated
    size_t num_windows = 0;
    size_t num_codebook_entries = 0; // non-padding codebook entries over all windows
    size_t consumed = 0;             // raw IDs covered by the windows
    size_t num_input = 0;            // raw IDs in the input stream
};

// Cuts a token stream into consecutive windows and compresses each of them
// with a fresh Merger.
//
// Every window starts with the boundary marker: if the first raw ID of a
// window is not the marker, it is emitted in front and occupies one slot.
// The next window resumes right after the last raw ID represented in the
// previous one.
class WindowOrchestrator {
private:
    MergeParams params_;
    DisabledIds disabled_;
    TailPolicy tail_;

public:
    WindowOrchestrator(MergeParams const& params, TailPolicy const tail = TailPolicy::drop)
        : params_(params), tail_(tail) {

        params_.validate();
        if(params_.max_out_seq_length < 2) {
            throw std::invalid_argument("windows must have room for the boundary marker and at least one more ID");
        }
        if(params_.id_universe() > size_t(MAX_ENCODABLE_TOKEN) + 1) {
            throw std::invalid_argument("substitute IDs up to " + std::to_string(params_.id_universe() - 1)
                + " do not fit into token files (maximum: " + std::to_string(MAX_ENCODABLE_TOKEN) + ")");
        }
        disabled_.insert(params_.eot_token_id);
    }

    MergeParams const& params() const { return params_; }
    TailPolicy tail_policy() const { return tail_; }

    // compresses the window starting at the given offset
    MergeResult window(std::span<TokenId const> const ids, size_t const offset) const {
        auto const slice = ids.subspan(offset);
        Merger merger(params_, disabled_);
        if(slice.empty() || slice[0] != params_.eot_token_id) {
            merger.seed(params_.eot_token_id);
        }
        merger.consume(slice);
        return merger.finish(slice);
    }

    TiledStream tile(std::span<TokenId const> const ids) const {
        auto const n = ids.size();
        auto const window_size = params_.max_out_seq_length;

        TiledStream tiled;
        tiled.num_input = n;
        size_t offset = 0;
        while(offset < n) {
            if(tail_ == TailPolicy::drop && n - offset <= window_size) break;

            auto w = window(ids, offset);
            if(w.compressed.size() < window_size) {
                // the stream ended before the window was filled
                if(tail_ == TailPolicy::drop) break;
                w.compressed.resize(window_size, params_.eot_token_id);
            }

            tiled.compressed.insert(tiled.compressed.end(), w.compressed.begin(), w.compressed.end());

            auto const table = w.codebook.table(params_.max_subtokens, params_.eot_token_id);
            tiled.codebooks.insert(tiled.codebooks.end(), table.begin(), table.end());

            ++tiled.num_windows;
            tiled.num_codebook_entries += w.codebook.size();

            // at least one raw ID fits next to the marker, so this always advances
            offset += w.consumed;
            tiled.consumed = offset;
        }
        return tiled;
    }
};
