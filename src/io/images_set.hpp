#pragma once

#include <algorithm>
#include <array>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

#include "spots.hpp"

namespace io
{
/*
 * @brief One image of a field of view, named r<round>_c<channel>[_z<plane>].<ext>
 */
class ImageFileDescriptor
{
    static constexpr std::array<std::string_view, 5> kPossibleExtensions = {".bmp", ".png", ".tiff", ".tif", ".jpg"};

   public:
    ImageFileDescriptor(const std::filesystem::path& entry, const int round, const int channel, const int plane)
        : path_(entry), round_(round), channel_(channel), plane_(plane) {};

    /**
     * @brief Read the image as a single channel float image, 8 and 16 bit images are normalized to [0, 1].
     * @throws std::runtime_error if the image can not be read
     */
    cv::Mat1f read_image() const;

    static bool is_valid(const std::filesystem::path& entry)
    {
        return std::filesystem::is_regular_file(entry) && is_valid_image(entry);
    }

    /**
     * @brief Provide regex matching.
     *
     * @param entry It's stem will be checked
     *
     * @returns SMatch of image regex AND ITS STRING. String CAN NOT BE DISCARDED because it invalidate iterators in
     * smatch
     */
    [[nodiscard]] static std::pair<std::smatch, std::string> match_filepath(const std::filesystem::path& entry,
                                                                            const std::regex& regex)
    {
        std::pair<std::smatch, std::string> results;
        results.second = entry.stem().string();
        std::regex_match(results.second, results.first, regex);
        return results;
    }

    std::string path() const { return path_.string(); }

    int round() const { return round_; }
    int channel() const { return channel_; }
    int plane() const { return plane_; }

   private:
    static bool is_valid_image(const std::filesystem::path& entry)
    {
        return std::any_of(kPossibleExtensions.cbegin(), kPossibleExtensions.cend(), [&entry](const auto& extension)
                           { return entry.extension().string().compare(extension) == 0; });
    }
    std::filesystem::path path_;
    int round_;
    int channel_;
    int plane_;
};

class ImageFilesDataset
{
    // regex for images with format r<round>_c<channel>[_z<plane>]
    static const std::regex kRegexDataset;

   public:
    explicit ImageFilesDataset(const std::filesystem::path& path) : path_(path) {};

    /**
     * @brief Image files of the directory ordered by (round, channel, plane).
     * @throws std::invalid_argument if `path` is not a directory or contains no matching image
     */
    std::vector<ImageFileDescriptor> operator()() const;

    /**
     * @brief Read all images into a stack. Every (round, channel, plane) up to the largest index must be present
     * and all images must have the same size.
     * @throws std::runtime_error on missing, duplicated or mismatching images
     */
    base::ImageStack read_stack() const;

   private:
    const std::filesystem::path path_;
};
}  // namespace io
