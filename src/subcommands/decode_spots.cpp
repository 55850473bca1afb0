#include "decode_spots.hpp"

#include "decoding_run.hpp"
#include "io/spots_io.hpp"

void DecodeSpots::execute()
{
    run::set_threads(threads_);

    const auto params = run::load_params(decoding_options_);
    const auto parameters = run::decoding_parameters(decoding_options_, params);

    const io::CandidateSpots candidates = io::read_candidates(spots_path_);
    const auto result =
        graph::decode(candidates.spots_, candidates.round_count_, candidates.channel_count_, parameters);

    run::save_result(result, candidates.round_count_, candidates.channel_count_, output_folder_);
}
