#include "compressor_base.hpp"

#include <token_container.hpp>

struct Compressor : public CompressorBase {
    Compressor() : CompressorBase("compress-tokens", "Compresses token files into fixed-size windows of merged phrases.") {
    }

    virtual void init_result(pm::Result& result) override {
        result.add("algo", "merge-windows");
        CompressorBase::init_result(result);
    }

    virtual void compress(std::filesystem::path const& input, WindowOrchestrator const& windows, pm::Result& result) override {
        auto const dir = input.parent_path();
        auto const compressed_path = dir / ("compressed_" + input.filename().string());
        auto const codebooks_path = dir / ("codebooks_" + input.filename().string());

        auto const tiled = compress_token_file(input, compressed_path, codebooks_path, windows);

        result.add("n", (uint64_t)tiled.num_input);
        result.add("windows", (uint64_t)tiled.num_windows);
        result.add("codebook_entries", (uint64_t)tiled.num_codebook_entries);
        result.add("consumed", (uint64_t)tiled.consumed);
        result.add("nout", (uint64_t)tiled.compressed.size());
        result.add("codebook_size", (uint64_t)tiled.codebooks.size());
        if(tiled.consumed > 0) {
            result.add("ratio", std::round(100.0 * ((double)tiled.compressed.size() / (double)tiled.consumed)) / 100.0);
        }
    }
};

int main(int argc, char** argv) {
    Compressor c;
    return Application::run(c, argc, argv);
}
