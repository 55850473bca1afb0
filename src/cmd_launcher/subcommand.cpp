#include "subcommand.hpp"

#include <spdlog/spdlog.h>

namespace utils
{
CLI::App& Subcommand::set_subcommand(CLI::App& app)
{
    CLI::App* subcommand = app.add_subcommand(name(), description());
    set_options(*subcommand);
    subcommand->callback(
        [this]()
        {
            spdlog::info("Launching {}", name());
            execute();
        });
    return *subcommand;
}

void Subcommand::set_main_command(CLI::App& app)
{
    set_options(app);
    app.callback([this]() { execute(); });
}

CLI::Option* Subcommand::add_dataset_path(CLI::App& cmd, std::filesystem::path& dataset_folder)
{
    return cmd.add_option("--dataset-dir", dataset_folder, "Directory with r<round>_c<channel>[_z<plane>] images")
        ->check(CLI::ExistingDirectory);
}

CLI::Option* Subcommand::add_path_to_save(CLI::App& cmd, std::filesystem::path& output_folder)
{
    return cmd.add_option("-o, --output-dir", output_folder, "Path to save directory");
}

CLI::Option* Subcommand::add_spots_path(CLI::App& cmd, std::filesystem::path& spots_path)
{
    return cmd.add_option("--spots", spots_path, "Candidate spots json")->check(CLI::ExistingFile);
}

CLI::Option* Subcommand::add_threads(CLI::App& cmd, int& threads)
{
    return cmd.add_option("--threads", threads, "Number of OpenMP threads, 0 keeps the OpenMP default")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);
}

void Subcommand::add_decoding_options(CLI::App& cmd, DecodingOptions& options)
{
    cmd.add_option("--params-path", options.params_path_, "Parameters json (decoding and detector).")
        ->check(CLI::ExistingFile);
    cmd.add_option("--search-radius", options.search_radius_,
                   "Maximal distance between spots of different rounds [pixel].");
    cmd.add_option("--search-radius-max", options.search_radius_max_,
                   "Maximal distance for edges repaired inside components [pixel], defaults to --search-radius.");
    cmd.add_option("--quality-weight", options.quality_weight_, "Weight of spot quality in the edge cost.");
    cmd.add_option("--merge-radius", options.merge_radius_,
                   "Distance under which detections of different channels in a round are merged [pixel].");
}

}  // namespace utils
