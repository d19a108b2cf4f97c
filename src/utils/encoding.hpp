#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace encoding
{
    // Standard base64 (RFC 4648) with '=' padding
    inline std::string base64Encode(const uint8_t *data, size_t size)
    {
        static const char chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string result;
        result.reserve(((size + 2) / 3) * 4);

        for (size_t i = 0; i < size; i += 3)
        {
            uint32_t tmp = 0;
            int padding = 0;

            for (int j = 0; j < 3; j++)
            {
                tmp <<= 8;
                if (i + j < size)
                    tmp |= data[i + j];
                else
                    padding++;
            }

            for (int j = 0; j < 4; j++)
            {
                if (j < 4 - padding)
                    result += chars[(tmp >> (6 * (3 - j))) & 0x3F];
                else
                    result += '=';
            }
        }

        return result;
    }

    inline std::string base64Encode(const std::vector<uint8_t> &data)
    {
        return base64Encode(data.data(), data.size());
    }

    // Encode a BGR frame as JPEG and return it as base64 text
    // Returns an empty string when the frame is empty or the codec fails
    inline std::string jpegBase64(const cv::Mat &bgr, int quality = 80)
    {
        if (bgr.empty())
            return "";

        std::vector<uchar> jpg;
        try
        {
            if (!cv::imencode(".jpg", bgr, jpg, {cv::IMWRITE_JPEG_QUALITY, quality}))
                return "";
        }
        catch (const cv::Exception &)
        {
            return "";
        }
        return base64Encode(jpg.data(), jpg.size());
    }

} // namespace encoding
