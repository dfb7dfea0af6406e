#include "base64.hpp"

#include <cstdint>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static const char* const kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static int alphabet_index(unsigned char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

std::string base64_encode(std::string_view bytes)
{
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    const std::size_t len = bytes.size();
    for (std::size_t i = 0; i < len; i += 3)
    {
        const std::uint32_t a      = static_cast<unsigned char>(bytes[i]);
        const std::uint32_t b      = (i + 1 < len) ? static_cast<unsigned char>(bytes[i + 1]) : 0;
        const std::uint32_t c      = (i + 2 < len) ? static_cast<unsigned char>(bytes[i + 2]) : 0;
        const std::uint32_t triple = (a << 16) | (b << 8) | c;

        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back((i + 1 < len) ? kAlphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back((i + 2 < len) ? kAlphabet[triple & 0x3F] : '=');
    }
    return out;
}

std::optional<std::string> base64_decode(std::string_view text)
{
    std::string s;
    s.reserve(text.size());
    for (const char c : text)
    {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ')
            continue;
        s.push_back(c);
    }
    if (s.size() % 4 != 0)
        return std::nullopt;

    std::string out;
    out.reserve((s.size() / 4) * 3);
    for (std::size_t i = 0; i < s.size(); i += 4)
    {
        const bool last = i + 4 == s.size();
        const bool pad2 = s[i + 2] == '=';
        const bool pad3 = s[i + 3] == '=';
        // padding only in the final quad, and "x=y" is never valid
        if ((pad2 || pad3) && !last)
            return std::nullopt;
        if (pad2 && !pad3)
            return std::nullopt;

        const int v0 = alphabet_index(static_cast<unsigned char>(s[i]));
        const int v1 = alphabet_index(static_cast<unsigned char>(s[i + 1]));
        const int v2 = pad2 ? 0 : alphabet_index(static_cast<unsigned char>(s[i + 2]));
        const int v3 = pad3 ? 0 : alphabet_index(static_cast<unsigned char>(s[i + 3]));
        if (v0 < 0 || v1 < 0 || v2 < 0 || v3 < 0)
            return std::nullopt;

        const std::uint32_t triple = (static_cast<std::uint32_t>(v0) << 18) |
                                     (static_cast<std::uint32_t>(v1) << 12) |
                                     (static_cast<std::uint32_t>(v2) << 6) | static_cast<std::uint32_t>(v3);

        out.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (!pad2)
            out.push_back(static_cast<char>((triple >> 8) & 0xFF));
        if (!pad3)
            out.push_back(static_cast<char>(triple & 0xFF));
    }
    return out;
}
