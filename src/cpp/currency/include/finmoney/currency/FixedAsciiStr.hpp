/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

enum class AsciiCharset : uint32_t
{
    NO_SPACE,   // '!' .. '~'
    WITH_SPACE  // ' ' .. '~'
};

//-------------------------------------------------------------------------

/**
 * Bounded, stack-allocated ASCII string holding between 0 and N printable
 * characters. Copying never allocates.
 */
template<size_t N>
class FixedAsciiStr
{
    static_assert(N > 0 && N <= UINT8_MAX);

public:
    static constexpr size_t kCapacity = N;

    constexpr FixedAsciiStr() noexcept = default;

    // Literal construction for compile-time constants; the caller vouches for the contents.
    template<size_t M>
    requires (M > 1 && M - 1 <= N)
    consteval FixedAsciiStr(const char (&lit)[M]) noexcept
        : m_size{static_cast<uint8_t>(M - 1)}
    {
        for (size_t i = 0; i < M - 1; ++i) {
            m_data[i] = lit[i];
        }
    }

    [[nodiscard]] static constexpr bool isValidChar(char c, AsciiCharset charset) noexcept
    {
        const char lowest = charset == AsciiCharset::WITH_SPACE ? ' ' : '!';
        return c >= lowest && c <= '~';
    }

    [[nodiscard]] static constexpr std::optional<FixedAsciiStr> parse(
        std::string_view str, AsciiCharset charset) noexcept
    {
        if (str.empty() || str.size() > N) {
            return std::nullopt;
        }
        FixedAsciiStr parsed;
        for (char c : str) {
            if (!isValidChar(c, charset)) {
                return std::nullopt;
            }
            parsed.m_data[parsed.m_size++] = c;
        }
        return parsed;
    }

    /**
     * Replaces every out-of-charset character with '_' and drops whatever
     * does not fit. Empty input stays empty.
     */
    [[nodiscard]] static constexpr FixedAsciiStr sanitize(
        std::string_view str, AsciiCharset charset) noexcept
    {
        FixedAsciiStr sanitized;
        for (char c : str.substr(0, std::min(str.size(), N))) {
            sanitized.m_data[sanitized.m_size++] = isValidChar(c, charset) ? c : '_';
        }
        return sanitized;
    }

    [[nodiscard]] constexpr FixedAsciiStr toUpper() const noexcept
    {
        FixedAsciiStr upper = *this;
        for (size_t i = 0; i < m_size; ++i) {
            if (upper.m_data[i] >= 'a' && upper.m_data[i] <= 'z') {
                upper.m_data[i] = static_cast<char>(upper.m_data[i] - 'a' + 'A');
            }
        }
        return upper;
    }

    [[nodiscard]] constexpr bool isValid(AsciiCharset charset) const noexcept
    {
        return std::all_of(
            m_data.begin(), m_data.begin() + m_size,
            [charset](char c) { return isValidChar(c, charset); });
    }

    [[nodiscard]] constexpr std::string_view view() const noexcept { return {m_data.data(), m_size}; }
    [[nodiscard]] constexpr size_t size() const noexcept { return m_size; }
    [[nodiscard]] constexpr bool empty() const noexcept { return m_size == 0; }

    friend constexpr bool operator==(const FixedAsciiStr& lhs, const FixedAsciiStr& rhs) noexcept
    {
        return lhs.view() == rhs.view();
    }

    friend std::ostream& operator<<(std::ostream& os, const FixedAsciiStr& str)
    {
        return os << str.view();
    }

private:
    std::array<char, N> m_data{};
    uint8_t m_size{};
};

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------

template<size_t N>
struct std::hash<finmoney::FixedAsciiStr<N>>
{
    size_t operator()(const finmoney::FixedAsciiStr<N>& str) const noexcept
    {
        return std::hash<std::string_view>{}(str.view());
    }
};

template<size_t N>
struct fmt::formatter<finmoney::FixedAsciiStr<N>> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const finmoney::FixedAsciiStr<N>& str, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(str.view(), ctx);
    }
};

//-------------------------------------------------------------------------
