#include "string.hpp"

#include <cstdint>

namespace webframe::compat
{
    bool valid_utf8(std::string_view value)
    {
        std::size_t i = 0;

        while (i < value.size())
        {
            const auto lead = static_cast<unsigned char>(value[i]);

            std::size_t length = 0;
            std::uint32_t code = 0;

            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            else if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                code   = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                code   = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                code   = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (i + length > value.size())
            {
                return false;
            }

            for (std::size_t k = 1; k < length; ++k)
            {
                const auto next = static_cast<unsigned char>(value[i + k]);
                if ((next & 0xC0) != 0x80)
                {
                    return false;
                }
                code = (code << 6) | (next & 0x3F);
            }

            // Overlong forms, surrogates and values past U+10FFFF.
            if ((length == 2 && code < 0x80) || (length == 3 && code < 0x800) || (length == 4 && code < 0x10000) ||
                (code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF)
            {
                return false;
            }

            i += length;
        }

        return true;
    }

    std::string to_string(const char *value, const char *field)
    {
        if (!value)
        {
            return {};
        }

        std::string rtn{value};
        if (!valid_utf8(rtn))
        {
            throw Error(ErrorCode::kInvalidParameter, std::string(field) + " is not valid UTF-8");
        }

        return rtn;
    }

    std::optional<std::string> to_optional(const char *value, const char *field)
    {
        if (!value)
        {
            return std::nullopt;
        }

        return to_string(value, field);
    }
} // namespace webframe::compat
