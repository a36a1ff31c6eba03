#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <boost/json.hpp>
#include <solkit/common/bytes.hpp>

namespace solkit::codec::json {
    using namespace boost::json;

    extern value parse(const buffer &buf);

    // nullopt when the member is absent or is not of the requested type
    extern std::optional<std::string_view> get_string(const object &obj, std::string_view name);
    extern std::optional<uint64_t> get_uint(const object &obj, std::string_view name);
}
