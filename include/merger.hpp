#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "codebook.hpp"
#include "merge_params.hpp"

struct MergeResult {
    std::vector<TokenId> compressed; // at most max_out_seq_length IDs
    Codebook codebook;               // the codebook learned along the way
    size_t consumed;                 // number of raw IDs represented in compressed
    std::optional<size_t> next_boundary; // position of the next boundary marker at or after consumed
};

// Greedy LZW-style phrase merging with bounded phrase length, bounded
// dictionary capacity and bounded output length.
//
// A Merger holds the encoder state for exactly one window. Raw IDs are
// consumed until either the input is exhausted or the output is full.
class Merger {
private:
    MergeParams const* params_;
    DisabledIds const* disabled_;

    Codebook codebook_;
    Phrase candidate_;
    std::vector<TokenId> out_;

    size_t consumed_;

    // emits an ID representing num_raw raw IDs, or drops it if the output is full
    void emit(TokenId const id, size_t const num_raw) {
        if(out_.size() < params_->max_out_seq_length) {
            out_.push_back(id);
            consumed_ += num_raw;
        }
    }

    void flush_candidate() {
        if(!candidate_.empty()) {
            emit(codebook_.lookup(candidate_), candidate_.size());
            candidate_.clear();
        }
    }

    void handle(TokenId const id) {
        if(disabled_->contains(id)) {
            // disabled IDs are never merged
            flush_candidate();
            emit(id, 1);
            return;
        }

        if(id >= params_->initial_vocab_size) {
            throw std::out_of_range("raw token ID " + std::to_string(id)
                + " exceeds the initial vocabulary of size " + std::to_string(params_->initial_vocab_size));
        }

        candidate_.push_back(id);
        if(!codebook_.contains(candidate_)) {
            // new phrase: learn it, emit the known prefix and restart from id
            codebook_.try_insert(candidate_);

            auto const prefix = std::span<TokenId const>(candidate_.data(), candidate_.size() - 1);
            emit(codebook_.lookup(prefix), prefix.size());

            candidate_.clear();
            candidate_.push_back(id);
        } else if(candidate_.size() == params_->max_subtokens) {
            flush_candidate();
        }
    }

public:
    Merger(MergeParams const& params, DisabledIds const& disabled)
        : params_(&params),
          disabled_(&disabled),
          codebook_(params.initial_vocab_size, params.max_codebook_size),
          consumed_(0) {

        candidate_.reserve(params.max_subtokens + 1);
        out_.reserve(params.max_out_seq_length);
    }

    bool output_full() const { return out_.size() >= params_->max_out_seq_length; }

    // emits an ID that does not represent any raw input
    void seed(TokenId const id) {
        emit(id, 0);
    }

    // consumes raw IDs until the input is exhausted or the output is full
    // returns the number of IDs read from ids
    size_t consume(std::span<TokenId const> const ids) {
        size_t i = 0;
        while(i < ids.size() && !output_full()) {
            handle(ids[i++]);
        }
        return i;
    }

    // flushes the pending phrase and returns the result
    // ids is the input the consumed count refers to, used to find the next boundary
    MergeResult finish(std::span<TokenId const> const ids) {
        if(candidate_.size() > params_->max_subtokens) {
            auto const last = candidate_.back();
            candidate_.pop_back();
            flush_candidate();
            candidate_.push_back(last);
        }
        flush_candidate();

        std::optional<size_t> next_boundary;
        {
            auto const it = std::find(ids.begin() + std::min(consumed_, ids.size()), ids.end(), params_->eot_token_id);
            if(it != ids.end()) next_boundary = size_t(it - ids.begin());
        }

        return MergeResult { std::move(out_), std::move(codebook_), consumed_, next_boundary };
    }
};

// compresses ids from the beginning, seeding the output with the given IDs
inline MergeResult merge(std::span<TokenId const> const ids, MergeParams const& params, DisabledIds const& disabled, std::span<TokenId const> const seed = {}) {
    params.validate();

    Merger merger(params, disabled);
    for(auto const x : seed) merger.seed(x);
    merger.consume(ids);
    return merger.finish(ids);
}
