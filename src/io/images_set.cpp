#include "images_set.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <tuple>

#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace io
{
const std::regex ImageFilesDataset::kRegexDataset =
    std::regex("^r(\\d+)_c(\\d+)(?:_z(\\d+))?$", std::regex_constants::ECMAScript);

std::vector<ImageFileDescriptor> ImageFilesDataset::operator()() const
{
    if (!std::filesystem::is_directory(path_))
    {
        throw std::invalid_argument(std::format("{} is not a directory", path_.string()));
    }

    std::vector<ImageFileDescriptor> result;
    for (const std::filesystem::path& entry : std::filesystem::directory_iterator(path_))
    {
        if (!ImageFileDescriptor::is_valid(entry))
        {
            continue;
        }
        const auto match = ImageFileDescriptor::match_filepath(entry, kRegexDataset);
        if (match.first.empty())
        {
            spdlog::debug("Skipping {}, name is not r<round>_c<channel>[_z<plane>]", entry.string());
            continue;
        }
        const int plane = match.first[3].matched ? std::stoi(match.first[3]) : 0;
        result.emplace_back(entry, std::stoi(match.first[1]), std::stoi(match.first[2]), plane);
    }

    if (result.empty())
    {
        throw std::invalid_argument(
            std::format("Dataset in correct format (r<round>_c<channel>[_z<plane>]) was not found at dir {}",
                        path_.string()));
    }

    std::sort(result.begin(), result.end(),
              [](const ImageFileDescriptor& lhs, const ImageFileDescriptor& rhs)
              {
                  return std::make_tuple(lhs.round(), lhs.channel(), lhs.plane()) <
                         std::make_tuple(rhs.round(), rhs.channel(), rhs.plane());
              });
    spdlog::info("Found {} images in {}", result.size(), path_.string());
    return result;
}

base::ImageStack ImageFilesDataset::read_stack() const
{
    const auto descriptors = (*this)();

    int rounds = 0;
    int channels = 0;
    int planes = 0;
    for (const auto& desc : descriptors)
    {
        rounds = std::max(rounds, desc.round() + 1);
        channels = std::max(channels, desc.channel() + 1);
        planes = std::max(planes, desc.plane() + 1);
    }
    if (int(descriptors.size()) != rounds * channels * planes)
    {
        throw std::runtime_error(std::format("{} holds {} images, expected {} rounds x {} channels x {} planes",
                                             path_.string(), descriptors.size(), rounds, channels, planes));
    }

    base::ImageStack stack(rounds, channels, planes);
    cv::Size size;
    for (const auto& desc : descriptors)
    {
        cv::Mat1f& plane = stack.plane(desc.round(), desc.channel(), desc.plane());
        if (!plane.empty())
        {
            throw std::runtime_error(std::format("{}: round {} channel {} plane {} is given twice", desc.path(),
                                                 desc.round(), desc.channel(), desc.plane()));
        }
        plane = desc.read_image();
        if (size.empty())
        {
            size = plane.size();
        }
        else if (plane.size() != size)
        {
            throw std::runtime_error(std::format("{}: image is {}x{}, expected {}x{}", desc.path(), plane.cols,
                                                 plane.rows, size.width, size.height));
        }
    }
    spdlog::info("Loaded {} rounds x {} channels x {} planes of {}x{}", rounds, channels, planes, size.width,
                 size.height);
    return stack;
}

cv::Mat1f ImageFileDescriptor::read_image() const
{
    cv::Mat img = cv::imread(path(), cv::IMREAD_ANYDEPTH | cv::IMREAD_GRAYSCALE);
    if (img.empty())
    {
        throw std::runtime_error(std::format("Could not read image {}", path()));
    }

    double scale = 1.0;
    switch (img.depth())
    {
        case CV_8U:
            scale = 1.0 / 255.0;
            break;
        case CV_16U:
            scale = 1.0 / 65535.0;
            break;
        default:
            break;
    }

    cv::Mat1f result;
    img.convertTo(result, CV_32F, scale);
    return result;
}
}  // namespace io
