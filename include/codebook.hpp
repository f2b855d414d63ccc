#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <ankerl/unordered_dense.h>

#include "merge_params.hpp"

// hashes a phrase as the raw bytes of its token sequence
struct PhraseHash {
    using is_transparent = void;
    using is_avalanching = void;

    uint64_t operator()(std::span<TokenId const> const phrase) const noexcept {
        auto const bytes = std::string_view((char const*)phrase.data(), phrase.size_bytes());
        return ankerl::unordered_dense::hash<std::string_view>()(bytes);
    }

    uint64_t operator()(Phrase const& phrase) const noexcept {
        return (*this)(std::span<TokenId const>(phrase));
    }
};

struct PhraseEqual {
    using is_transparent = void;

    bool operator()(std::span<TokenId const> const a, std::span<TokenId const> const b) const noexcept {
        return std::equal(a.begin(), a.end(), b.begin(), b.end());
    }
};

// Capacity-bounded dictionary of phrases of raw token IDs.
//
// Phrases of length one are never stored: a raw ID below the initial
// vocabulary size stands for itself. Longer phrases receive substitute IDs
// counting upwards from the initial vocabulary size in insertion order.
// Once the capacity is reached, insertions are refused, but all entries
// remain valid.
class Codebook {
private:
    using Map = ankerl::unordered_dense::map<Phrase, TokenId, PhraseHash, PhraseEqual>;

    size_t initial_vocab_size_;
    size_t capacity_;
    Map map_;

public:
    Codebook(size_t const initial_vocab_size, size_t const capacity)
        : initial_vocab_size_(initial_vocab_size), capacity_(capacity) {

        map_.reserve(capacity);
    }

    size_t size() const { return map_.size(); }
    size_t capacity() const { return capacity_; }
    bool full() const { return map_.size() >= capacity_; }

    size_t initial_vocab_size() const { return initial_vocab_size_; }

    // the substitute ID that the next successful insertion will receive
    TokenId next_id() const { return TokenId(initial_vocab_size_ + map_.size()); }

    bool contains(std::span<TokenId const> const phrase) const {
        assert(!phrase.empty());
        if(phrase.size() == 1) {
            return phrase[0] < initial_vocab_size_;
        } else {
            return map_.contains(phrase);
        }
    }

    TokenId lookup(std::span<TokenId const> const phrase) const {
        if(phrase.size() == 1) {
            return phrase[0];
        }

        auto it = map_.find(phrase);
        if(it == map_.end()) {
            throw std::logic_error("codebook lookup of unregistered phrase of length " + std::to_string(phrase.size()));
        }
        return it->second;
    }

    std::optional<TokenId> try_insert(std::span<TokenId const> const phrase) {
        if(full()) return std::nullopt;

        auto const id = next_id();
        auto const r = map_.try_emplace(Phrase(phrase.begin(), phrase.end()), id);
        assert(r.second);
        return id;
    }

    // reverse lookup of a substitute ID
    Phrase const& phrase(TokenId const id) const {
        assert(id >= initial_vocab_size_ && id < next_id());
        return map_.values()[id - initial_vocab_size_].first;
    }

    // entries in ascending order of their substitute IDs
    auto begin() const { return map_.values().begin(); }
    auto end() const { return map_.values().end(); }

    // the codebook table as one flat sequence of capacity * max_subtokens IDs
    std::vector<TokenId> table(size_t const max_subtokens, TokenId const padding) const {
        std::vector<TokenId> table;
        table.reserve(capacity_ * max_subtokens);
        for(auto const& [phrase, id] : map_.values()) {
            assert(phrase.size() <= max_subtokens);
            table.insert(table.end(), phrase.begin(), phrase.end());
            table.resize(table.size() + (max_subtokens - phrase.size()), padding);
        }
        table.resize(capacity_ * max_subtokens, padding);
        return table;
    }

    // the codebook table as capacity rows of max_subtokens IDs each
    std::vector<std::vector<TokenId>> rows(size_t const max_subtokens, TokenId const padding) const {
        std::vector<std::vector<TokenId>> rows;
        rows.reserve(capacity_);
        for(auto const& [phrase, id] : map_.values()) {
            auto& row = rows.emplace_back(phrase.begin(), phrase.end());
            row.resize(max_subtokens, padding);
        }
        rows.resize(capacity_, std::vector<TokenId>(max_subtokens, padding));
        return rows;
    }
};
