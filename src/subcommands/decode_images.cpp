#include "decode_images.hpp"

#include <spdlog/spdlog.h>

#include "decoding_run.hpp"
#include "graph/debug.hpp"
#include "graph/debugging.hpp"
#include "io/images_set.hpp"
#include "spots/detection.hpp"

void DecodeImages::execute()
{
    run::set_threads(threads_);

    const auto params = run::load_params(decoding_options_);
    const auto parameters = run::decoding_parameters(decoding_options_, params);

    const base::ImageStack stack = io::ImageFilesDataset(dataset_folder_).read_stack();
    const auto candidates = spots::detection::detect_spots(stack, params.detector_);

    const auto result = graph::decode(candidates, stack.rounds(), stack.channels(), parameters);

    run::save_result(result, stack.rounds(), stack.channels(), output_folder_);
    if constexpr (kSaveDecodingOverlay)
    {
        graph::debug::save_decoding_overlay(stack.max_projection(), result.graph_, result.sequences_);
    }
}
