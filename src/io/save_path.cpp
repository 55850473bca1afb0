#include "save_path.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

namespace
{
static constexpr const char* const kSavePathEnvName = "SPOTDECODE_SAVE_PATH";

#ifdef _WIN32
static constexpr const char* const kHomeEnvName = "USERPROFILE";
static constexpr const char* const kDefaultDirectory = "spotdecode";
#else
static constexpr const char* const kHomeEnvName = "HOME";
static constexpr const char* const kDefaultDirectory = ".spotdecode";
#endif

std::filesystem::path default_save_path()
{
    const char* const home = std::getenv(kHomeEnvName);
    if (home == nullptr)
    {
        throw std::runtime_error(
            std::format("{} environment variable is not defined. "
                        "If running by a user without home directory, specify {} environment variable.",
                        kHomeEnvName, kSavePathEnvName));
    }

    return std::filesystem::path(home) / kDefaultDirectory;
}
}  // namespace

namespace io
{
std::filesystem::path save_path()
{
    std::filesystem::path save_path;

    const char* const env_val = std::getenv(kSavePathEnvName);
    if (env_val == nullptr)
    {
        save_path = default_save_path();
    }
    else
    {
        save_path = env_val;
    }

    std::filesystem::create_directories(save_path);
    return save_path;
}

std::filesystem::path debug_save_path()
{
    const std::filesystem::path debug_save_path = save_path() / "debug";
    std::filesystem::create_directories(debug_save_path);
    return debug_save_path;
}
}  // namespace io
