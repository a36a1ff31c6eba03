/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "json.hpp"

namespace solkit::codec::json {
    value parse(const buffer &buf)
    {
        boost::system::error_code ec {};
        auto jv = boost::json::parse(static_cast<std::string_view>(buf), ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("invalid JSON: {}", ec.message()));
        return jv;
    }

    std::optional<std::string_view> get_string(const object &obj, const std::string_view name)
    {
        if (const auto *jv = obj.if_contains(name); jv && jv->is_string())
            return std::string_view { jv->get_string() };
        return {};
    }

    std::optional<uint64_t> get_uint(const object &obj, const std::string_view name)
    {
        const auto *jv = obj.if_contains(name);
        if (!jv)
            return {};
        if (jv->is_uint64())
            return jv->get_uint64();
        if (jv->is_int64() && jv->get_int64() >= 0)
            return static_cast<uint64_t>(jv->get_int64());
        return {};
    }
}
