#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

namespace utils
{
/**
 * @brief Decoding values given on the command line, they override the ones of the parameters json.
 */
struct DecodingOptions
{
    std::filesystem::path params_path_;
    std::optional<float> search_radius_;
    std::optional<float> search_radius_max_;
    std::optional<float> quality_weight_;
    std::optional<float> merge_radius_;
};

class Subcommand
{
   protected:
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    virtual void set_options(CLI::App& cmd) = 0;
    virtual void execute() = 0;

    CLI::Option* add_dataset_path(CLI::App& cmd, std::filesystem::path& dataset_folder);
    CLI::Option* add_path_to_save(CLI::App& cmd, std::filesystem::path& output_folder);
    CLI::Option* add_spots_path(CLI::App& cmd, std::filesystem::path& spots_path);
    CLI::Option* add_threads(CLI::App& cmd, int& threads);
    void add_decoding_options(CLI::App& cmd, DecodingOptions& options);

   public:
    CLI::App& set_subcommand(CLI::App& app);
    void set_main_command(CLI::App& app);

    virtual ~Subcommand() = default;
};

}  // namespace utils
