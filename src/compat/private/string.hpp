#pragma once

#include "error.hpp"

#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace webframe::compat
{
    // Heap copy released by webframe_string_free.
    inline char *alloc(std::string_view value)
    {
        auto *rtn = static_cast<char *>(std::malloc(value.size() + 1));
        if (!rtn)
        {
            throw Error(ErrorCode::kUnknown, "out of memory");
        }

        std::memcpy(rtn, value.data(), value.size());
        rtn[value.size()] = '\0';

        return rtn;
    }

    // Valid until the next call on this thread.
    inline const char *scratch(std::string value)
    {
        thread_local std::string buffer;
        buffer = std::move(value);
        return buffer.c_str();
    }

    bool valid_utf8(std::string_view value);

    // Throws Error(kInvalidParameter) if @p value is not UTF-8.
    std::string to_string(const char *value, const char *field);
    std::optional<std::string> to_optional(const char *value, const char *field);
} // namespace webframe::compat
