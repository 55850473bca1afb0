#pragma once

#include <filesystem>

#include <cmd_launcher/subcommand.hpp>
#include <io/save_path.hpp>

class DecodeSpots : public utils::Subcommand
{
   private:
    std::filesystem::path spots_path_;
    std::filesystem::path output_folder_;
    utils::DecodingOptions decoding_options_;
    int threads_ = 0;

   public:
    std::string name() const override { return "DecodeSpots"; }

    std::string description() const override { return "Decode sequences from a candidate spots json"; }

    void set_options(CLI::App& cmd) override
    {
        add_spots_path(cmd, spots_path_)->required();
        add_path_to_save(cmd, output_folder_)->default_val(io::save_path());
        add_decoding_options(cmd, decoding_options_);
        add_threads(cmd, threads_);
    }

    void execute() override;
};
