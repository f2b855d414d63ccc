#include <oocmd.hpp>

#include <cmath>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <omp.h>

#include <pm/stopwatch.hpp>
#include <pm/result.hpp>

#include <merge_params.hpp>
#include <window_orchestrator.hpp>

using namespace oocmd;

struct CompressorBase : public ConfigObject {
    std::string name = "fineweb10B";
    uint64_t num_chunks = 1;
    uint64_t threads = 0;
    uint64_t eot_token_id = 50'256;
    bool pad_tail = false;

    MergeParams params;

    CompressorBase(std::string&& type_name, std::string&& desc) : ConfigObject(std::move(type_name), std::move(desc)) {
        param('n', "name", name, "The dataset directory to process if no input files are given.");
        param('c', "num-chunks", num_chunks, "The number of training chunks to process in addition to the validation chunk.");
        param('v', "initial-vocab-size", params.initial_vocab_size, "The size of the tokenizer vocabulary.");
        param('k', "max-codebook-size", params.max_codebook_size, "The maximum number of phrases learned per window.");
        param('s', "max-subtokens", params.max_subtokens, "The maximum number of tokens in a phrase.");
        param('l', "max-out-seq-length", params.max_out_seq_length, "The number of IDs in an output window.");
        param('e', "eot-token-id", eot_token_id, "The document boundary token, which is never merged.");
        param('p', "pad-tail", pad_tail, "Pad the final window instead of dropping the tail of each file.");
        param('t', "threads", threads, "The number of files to process in parallel (0 = OpenMP default).");
    }

    virtual void init_result(pm::Result& result) {
        result.add("initial_vocab_size", params.initial_vocab_size);
        result.add("max_codebook_size", params.max_codebook_size);
        result.add("max_subtokens", params.max_subtokens);
        result.add("max_out_seq_length", params.max_out_seq_length);
        result.add("eot_token_id", eot_token_id);
    }

    TailPolicy tail_policy() const { return pad_tail ? TailPolicy::pad : TailPolicy::drop; }

    // the chunk files of the dataset, validation chunk first
    std::vector<std::filesystem::path> dataset_files() const {
        std::vector<std::filesystem::path> files;
        auto const dir = std::filesystem::path(name);

        char filename[64];
        std::snprintf(filename, sizeof(filename), "fineweb_val_%06d.bin", 0);
        files.emplace_back(dir / filename);
        for(uint64_t chunk = 1; chunk <= num_chunks; chunk++) {
            std::snprintf(filename, sizeof(filename), "fineweb_train_%06llu.bin", (unsigned long long)chunk);
            files.emplace_back(dir / filename);
        }
        return files;
    }

    virtual void compress(std::filesystem::path const& input, WindowOrchestrator const& windows, pm::Result& result) = 0;

    int run(Application const& app) {
        std::vector<std::filesystem::path> inputs;
        if(!app.args().empty()) {
            for(auto const& arg : app.args()) inputs.emplace_back(arg);
        } else {
            inputs = dataset_files();
        }

        std::unique_ptr<WindowOrchestrator> windows;
        try {
            params.eot_token_id = to_token_id(eot_token_id);
            windows = std::make_unique<WindowOrchestrator>(params, tail_policy());
        } catch(std::invalid_argument const& e) {
            std::cerr << e.what() << std::endl;
            app.print_usage(*this);
            return -1;
        }

        if(threads) omp_set_num_threads((int)threads);

        size_t num_failed = 0;

        #pragma omp parallel for schedule(dynamic, 1) reduction(+:num_failed)
        for(size_t i = 0; i < inputs.size(); i++) {
            auto const& input = inputs[i];

            pm::Result result;
            result.add("file", input.filename().string());
            this->init_result(result);

            try {
                pm::Stopwatch t;
                t.start();

                compress(input, *windows, result);

                t.stop();
                result.add("time", (uint64_t)std::round(t.elapsed_time_millis()));
                result.sort();

                #pragma omp critical
                std::cout << result.str() << std::endl;
            } catch(std::exception const& e) {
                #pragma omp critical
                std::cerr << input.string() << ": " << e.what() << std::endl;
                ++num_failed;
            }
        }

        return num_failed ? 1 : 0;
    }
};
