#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "logging.hpp"

using namespace cv;
using namespace std;

namespace encoding
{
    const string BASE64_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    const string JPEG_DATA_URL_PREFIX = "data:image/jpeg;base64,";

    inline string base64Encode(const vector<uchar> &data)
    {
        string result;
        result.reserve(((data.size() + 2) / 3) * 4);

        for (size_t i = 0; i < data.size(); i += 3)
        {
            uint32_t tmp = 0;
            int padding = 0;

            for (int j = 0; j < 3; j++)
            {
                tmp <<= 8;
                if (i + j < data.size())
                {
                    tmp |= data[i + j];
                }
                else
                {
                    padding++;
                }
            }

            for (int j = 0; j < 4; j++)
            {
                if (j < 4 - padding)
                {
                    result += BASE64_CHARS[(tmp >> (6 * (3 - j))) & 0x3F];
                }
                else
                {
                    result += '=';
                }
            }
        }

        return result;
    }

    // False on characters outside the alphabet or a truncated group
    inline bool base64Decode(const string &text, vector<uchar> &out)
    {
        out.clear();
        out.reserve((text.size() / 4) * 3);

        uint32_t buffer = 0;
        int bits = 0;
        size_t symbols = 0;
        size_t padding = 0;

        for (char c : text)
        {
            if (c == '=')
            {
                padding++;
                continue;
            }
            if (padding > 0)
            {
                return false; // data after padding
            }

            size_t value = BASE64_CHARS.find(c);
            if (value == string::npos)
            {
                return false;
            }

            buffer = (buffer << 6) | static_cast<uint32_t>(value);
            bits += 6;
            symbols++;

            if (bits >= 8)
            {
                bits -= 8;
                out.push_back(static_cast<uchar>((buffer >> bits) & 0xFF));
            }
        }

        if (padding > 2 || (symbols + padding) % 4 != 0)
        {
            return false;
        }
        return true;
    }

    // RGBA frame -> "data:image/jpeg;base64,..." at quality in [0,1]
    inline bool encodeDataURL(const Mat &frame, double quality, string &url)
    {
        if (frame.empty() || frame.type() != CV_8UC4)
        {
            log_warning("Cannot encode snapshot: expected a non-empty RGBA frame");
            return false;
        }

        Mat bgr;
        cvtColor(frame, bgr, COLOR_RGBA2BGR);

        int jpeg_quality = cvRound(std::min(1.0, std::max(0.0, quality)) * 100.0);
        vector<uchar> jpeg;
        if (!imencode(".jpg", bgr, jpeg, {IMWRITE_JPEG_QUALITY, jpeg_quality}))
        {
            log_warning("JPEG encoding of snapshot failed");
            return false;
        }

        url = JPEG_DATA_URL_PREFIX + base64Encode(jpeg);
        return true;
    }

    // Any "data:image/<type>;base64," URL -> RGBA frame
    inline bool decodeDataURL(const string &url, Mat &frame)
    {
        const string marker = ";base64,";
        size_t markerPos = url.find(marker);
        if (url.compare(0, 11, "data:image/") != 0 || markerPos == string::npos)
        {
            log_warning("Snapshot is not an image data URL");
            return false;
        }

        vector<uchar> bytes;
        if (!base64Decode(url.substr(markerPos + marker.size()), bytes) || bytes.empty())
        {
            log_warning("Snapshot payload is not valid base64");
            return false;
        }

        Mat bgr = imdecode(bytes, IMREAD_COLOR);
        if (bgr.empty())
        {
            log_warning("Snapshot payload is not a decodable image");
            return false;
        }

        cvtColor(bgr, frame, COLOR_BGR2RGBA);
        return true;
    }

} // namespace encoding
