#include <cmd_launcher/cmd_launcher.hpp>

#include "subcommands/decode_images.hpp"
#include "subcommands/decode_spots.hpp"

static constexpr std::string_view kAbout = "spotdecode: decode spot sequences across imaging rounds";

int main(int argc, char* argv[])
{
    utils::CmdLauncher<DecodeSpots, DecodeImages> launcher(kAbout);
    return launcher.launch(argc, argv);
}
