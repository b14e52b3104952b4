#pragma once

#include "backoff.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace occsim
{
    // Strict command-line value parsers: the whole string must be consumed.

    inline bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    inline bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    inline bool parse_double(std::string_view s, double &out)
    {
        try
        {
            std::string tmp(s);
            size_t idx = 0;
            out = std::stod(tmp, &idx);
            return idx == tmp.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    inline std::vector<std::string_view> split_csv_list(std::string_view s)
    {
        std::vector<std::string_view> out;
        while (true)
        {
            const auto comma = s.find(',');
            out.push_back(s.substr(0, comma));
            if (comma == std::string_view::npos)
            {
                return out;
            }
            s.remove_prefix(comma + 1);
        }
    }

    // "10,20,30"; every element must be a positive integer.
    inline bool parse_u32_list(std::string_view s, std::vector<std::uint32_t> &out)
    {
        std::vector<std::uint32_t> tmp;
        for (const auto part : split_csv_list(s))
        {
            std::uint32_t v = 0;
            if (!parse_u32(part, v) || v == 0)
            {
                return false;
            }
            tmp.push_back(v);
        }
        out = std::move(tmp);
        return true;
    }

    // "None,FullJitter,Decorr"; "all" selects every variant.
    inline bool parse_variant_list(std::string_view s, std::vector<BackoffVariant> &out)
    {
        if (iequals(s, "all"))
        {
            out.assign(AllBackoffVariants.begin(), AllBackoffVariants.end());
            return true;
        }
        std::vector<BackoffVariant> tmp;
        for (const auto part : split_csv_list(s))
        {
            const auto v = parse_backoff_variant(part);
            if (!v)
            {
                return false;
            }
            tmp.push_back(*v);
        }
        out = std::move(tmp);
        return true;
    }
}
