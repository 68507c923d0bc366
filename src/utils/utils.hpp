#pragma once

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "logging.hpp"
#include "colors.hpp"

// Wall-clock time as "2025-08-16 14:32:10", used for history entries
inline std::string nowTimestamp()
{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    return std::string(buf);
}

// Fixed-point rendering for overlays and logs, e.g. 4.25 -> "4.3"
inline std::string formatDecimal(double value, int precision = 1)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// Base64 encode (standard alphabet, '=' padding)
inline std::string base64Encode(const std::vector<uint8_t> &data)
{
    static const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
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
                result += chars[(tmp >> (6 * (3 - j))) & 0x3F];
            }
            else
            {
                result += '=';
            }
        }
    }

    return result;
}
