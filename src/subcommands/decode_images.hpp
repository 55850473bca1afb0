#pragma once

#include <filesystem>

#include <cmd_launcher/subcommand.hpp>
#include <io/save_path.hpp>

class DecodeImages : public utils::Subcommand
{
   private:
    std::filesystem::path dataset_folder_;
    std::filesystem::path output_folder_;
    utils::DecodingOptions decoding_options_;
    int threads_ = 0;

   public:
    std::string name() const override { return "DecodeImages"; }

    std::string description() const override
    {
        return "Detect spots in r<round>_c<channel>[_z<plane>] images and decode sequences";
    }

    void set_options(CLI::App& cmd) override
    {
        add_dataset_path(cmd, dataset_folder_)->required();
        add_path_to_save(cmd, output_folder_)->default_val(io::save_path());
        add_decoding_options(cmd, decoding_options_);
        add_threads(cmd, threads_);
    }

    void execute() override;
};
