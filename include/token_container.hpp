#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <iopp/concepts.hpp>
#include <iopp/file_input_stream.hpp>
#include <iopp/file_output_stream.hpp>
#include <iopp/stream_output_iterator.hpp>

#include "merge_params.hpp"
#include "window_orchestrator.hpp"
#include "write_bytes.hpp"

constexpr int32_t TOKEN_FILE_MAGIC = 20240520;
constexpr int32_t TOKEN_FILE_VERSION = 1;

constexpr size_t TOKEN_BYTES = 2;

// The 1 KiB header in front of every token file: 256 little endian 32-bit
// integers, of which the first slots carry the format and the payload size.
class TokenFileHeader {
public:
    static constexpr size_t NUM_SLOTS = 256;
    static constexpr size_t SIZE_BYTES = NUM_SLOTS * 4;

    static constexpr size_t SLOT_MAGIC = 0;
    static constexpr size_t SLOT_VERSION = 1;
    static constexpr size_t SLOT_COUNT = 2;

    // metadata written into compressed files
    static constexpr size_t SLOT_NUM_WINDOWS = 3;
    static constexpr size_t SLOT_MAX_CODEBOOK_SIZE = 4;
    static constexpr size_t SLOT_MAX_SUBTOKENS = 5;
    static constexpr size_t SLOT_MAX_OUT_SEQ_LENGTH = 6;

private:
    std::array<int32_t, NUM_SLOTS> slots_;

public:
    TokenFileHeader() {
        slots_.fill(0);
        slots_[SLOT_MAGIC] = TOKEN_FILE_MAGIC;
        slots_[SLOT_VERSION] = TOKEN_FILE_VERSION;
    }

    explicit TokenFileHeader(size_t const count) : TokenFileHeader() {
        this->count(count);
    }

    template<iopp::InputIterator<char> In>
    TokenFileHeader(In& in, In const& end) {
        for(auto& x : slots_) {
            x = (int32_t)(uint32_t)read_uint(in, end, 4);
        }

        if(magic() != TOKEN_FILE_MAGIC) {
            throw std::runtime_error("wrong magic: " + std::to_string(magic()) + " (expected: " + std::to_string(TOKEN_FILE_MAGIC) + ")");
        }
        if(version() != TOKEN_FILE_VERSION) {
            throw std::runtime_error("unsupported version: " + std::to_string(version()));
        }
    }

    template<std::output_iterator<char> Out>
    void encode(Out& out) const {
        for(auto const x : slots_) {
            write_uint(out, (uint32_t)x, 4);
        }
    }

    int32_t slot(size_t const i) const { return slots_[i]; }
    void slot(size_t const i, int32_t const x) { slots_[i] = x; }

    int32_t magic() const { return slots_[SLOT_MAGIC]; }
    int32_t version() const { return slots_[SLOT_VERSION]; }

    size_t count() const { return size_t(uint32_t(slots_[SLOT_COUNT])); }
    void count(size_t const n) { slots_[SLOT_COUNT] = (int32_t)n; }

    // marks this header as the header of a compressed stream
    void describe(TiledStream const& tiled, MergeParams const& params) {
        count(tiled.compressed.size());
        slots_[SLOT_NUM_WINDOWS] = (int32_t)tiled.num_windows;
        slots_[SLOT_MAX_CODEBOOK_SIZE] = (int32_t)params.max_codebook_size;
        slots_[SLOT_MAX_SUBTOKENS] = (int32_t)params.max_subtokens;
        slots_[SLOT_MAX_OUT_SEQ_LENGTH] = (int32_t)params.max_out_seq_length;
    }
};

struct TokenFile {
    TokenFileHeader header;
    std::vector<TokenId> tokens;
};

template<iopp::InputIterator<char> In>
std::vector<TokenId> decode_tokens(In& in, In const& end, size_t const count) {
    std::vector<TokenId> tokens;
    tokens.reserve(count);
    try {
        for(size_t i = 0; i < count; i++) {
            tokens.push_back(TokenId(read_uint(in, end, TOKEN_BYTES)));
        }
    } catch(std::runtime_error const&) {
        throw std::runtime_error("truncated token data: expected " + std::to_string(count) + " tokens, found " + std::to_string(tokens.size()));
    }
    return tokens;
}

template<std::output_iterator<char> Out>
void encode_tokens(Out& out, std::span<TokenId const> const tokens) {
    for(auto const x : tokens) {
        if(x > MAX_ENCODABLE_TOKEN) {
            throw std::out_of_range("token ID " + std::to_string(x) + " does not fit into " + std::to_string(TOKEN_BYTES) + " bytes");
        }
        write_uint(out, x, TOKEN_BYTES);
    }
}

template<iopp::InputIterator<char> In>
TokenFile decode_token_file(In in, In const& end) {
    TokenFileHeader header(in, end);
    auto tokens = decode_tokens(in, end, header.count());
    return TokenFile { header, std::move(tokens) };
}

template<std::output_iterator<char> Out>
void encode_token_file(Out out, TokenFileHeader const& header, std::span<TokenId const> const tokens) {
    header.encode(out);
    encode_tokens(out, tokens);
}

inline TokenFile read_token_file(std::filesystem::path const& path) {
    if(!std::filesystem::is_regular_file(path)) {
        throw std::runtime_error("cannot read file");
    }

    iopp::FileInputStream fis(path.string());
    return decode_token_file(fis.begin(), fis.end());
}

inline void write_token_file(std::filesystem::path const& path, TokenFileHeader const& header, std::span<TokenId const> const tokens) {
    iopp::FileOutputStream fos(path.string());
    encode_token_file(iopp::StreamOutputIterator(fos), header, tokens);
}

// codebook tables are written as they are, without a header
inline void write_codebook_file(std::filesystem::path const& path, std::span<TokenId const> const codebooks) {
    iopp::FileOutputStream fos(path.string());
    auto out = iopp::StreamOutputIterator(fos);
    encode_tokens(out, codebooks);
}

// compresses a token file into a compressed token file and a codebook file
// the output header keeps everything from the input but the layout fields
inline TiledStream compress_token_file(
    std::filesystem::path const& input,
    std::filesystem::path const& compressed_path,
    std::filesystem::path const& codebooks_path,
    WindowOrchestrator const& windows) {

    auto const file = read_token_file(input);
    auto tiled = windows.tile(file.tokens);

    auto header = file.header;
    header.describe(tiled, windows.params());

    write_token_file(compressed_path, header, tiled.compressed);
    write_codebook_file(codebooks_path, tiled.codebooks);
    return tiled;
}
