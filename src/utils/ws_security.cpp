//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "ws_security.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <random>

static std::uint32_t rotl(std::uint32_t value, int shift)
{
    return (value << shift) | (value >> (32 - shift));
}

static std::uint32_t read_be32(const unsigned char *data)
{
    return (static_cast<std::uint32_t>(data[0]) << 24) | (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) | static_cast<std::uint32_t>(data[3]);
}

Sha1::Sha1()
    : _state{0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u, 0xc3d2e1f0u},
      _buffer{},
      _buffer_size(0),
      _bit_len(0)
{
}

void Sha1::update(const unsigned char *data, size_t len)
{
    _bit_len += static_cast<std::uint64_t>(len) * 8;

    size_t offset = 0;
    while (offset < len)
    {
        const size_t chunk = std::min<size_t>(64 - _buffer_size, len - offset);
        std::memcpy(_buffer + _buffer_size, data + offset, chunk);
        _buffer_size += chunk;
        offset += chunk;

        if (_buffer_size == 64)
        {
            transform(_buffer);
            _buffer_size = 0;
        }
    }
}

void Sha1::update(std::string const &data)
{
    update(reinterpret_cast<const unsigned char *>(data.data()), data.size());
}

std::vector<unsigned char> Sha1::finalize()
{
    const std::uint64_t bit_len = _bit_len;

    _buffer[_buffer_size++] = 0x80;
    if (_buffer_size > 56)
    {
        std::fill(_buffer + _buffer_size, _buffer + 64, 0);
        transform(_buffer);
        _buffer_size = 0;
    }
    std::fill(_buffer + _buffer_size, _buffer + 56, 0);

    for (int i = 7; i >= 0; --i)
    {
        _buffer[63 - i] = static_cast<unsigned char>((bit_len >> (i * 8)) & 0xff);
    }
    transform(_buffer);

    std::vector<unsigned char> res;
    for (size_t i = 0; i < 5; i++)
    {
        res.push_back(static_cast<unsigned char>(_state[i] >> 24));
        res.push_back(static_cast<unsigned char>(_state[i] >> 16));
        res.push_back(static_cast<unsigned char>(_state[i] >> 8));
        res.push_back(static_cast<unsigned char>(_state[i]));
    }
    return res;
}

std::vector<unsigned char> Sha1::digest(std::string const &data)
{
    Sha1 hasher;
    hasher.update(data);
    return hasher.finalize();
}

void Sha1::transform(const unsigned char block[64])
{
    std::uint32_t w[80];
    for (size_t i = 0; i < 16; i++)
    {
        w[i] = read_be32(block + i * 4);
    }
    for (size_t i = 16; i < 80; i++)
    {
        w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    std::uint32_t a = _state[0];
    std::uint32_t b = _state[1];
    std::uint32_t c = _state[2];
    std::uint32_t d = _state[3];
    std::uint32_t e = _state[4];

    for (size_t i = 0; i < 80; i++)
    {
        std::uint32_t f;
        std::uint32_t k;
        if (i < 20)
        {
            f = (b & c) | ((~b) & d);
            k = 0x5a827999u;
        }
        else if (i < 40)
        {
            f = b ^ c ^ d;
            k = 0x6ed9eba1u;
        }
        else if (i < 60)
        {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8f1bbcdcu;
        }
        else
        {
            f = b ^ c ^ d;
            k = 0xca62c1d6u;
        }

        const std::uint32_t temp = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = temp;
    }

    _state[0] += a;
    _state[1] += b;
    _state[2] += c;
    _state[3] += d;
    _state[4] += e;
}

std::string base64_encode(std::vector<unsigned char> const &data)
{
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string res;
    res.reserve((data.size() + 2) / 3 * 4);

    size_t idx = 0;
    for (; idx + 2 < data.size(); idx += 3)
    {
        const std::uint32_t v = (data[idx] << 16) | (data[idx + 1] << 8) | data[idx + 2];
        res.push_back(alphabet[(v >> 18) & 0x3f]);
        res.push_back(alphabet[(v >> 12) & 0x3f]);
        res.push_back(alphabet[(v >> 6) & 0x3f]);
        res.push_back(alphabet[v & 0x3f]);
    }

    const size_t remaining = data.size() - idx;
    if (remaining == 1)
    {
        const std::uint32_t v = data[idx] << 16;
        res.push_back(alphabet[(v >> 18) & 0x3f]);
        res.push_back(alphabet[(v >> 12) & 0x3f]);
        res += "==";
    }
    else if (remaining == 2)
    {
        const std::uint32_t v = (data[idx] << 16) | (data[idx + 1] << 8);
        res.push_back(alphabet[(v >> 18) & 0x3f]);
        res.push_back(alphabet[(v >> 12) & 0x3f]);
        res.push_back(alphabet[(v >> 6) & 0x3f]);
        res.push_back('=');
    }

    return res;
}

std::string base64_encode(std::string const &data)
{
    return base64_encode(std::vector<unsigned char>(data.begin(), data.end()));
}

std::string make_nonce(size_t length)
{
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 255);

    std::string res;
    for (size_t idx = 0; idx < length; idx++)
    {
        res.push_back(static_cast<char>(dist(rd)));
    }
    return res;
}

std::string make_created_timestamp()
{
    const std::time_t now = std::time(NULL);
    std::tm utc;
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string make_password_digest(std::string const &nonce, std::string const &created, std::string const &password)
{
    return base64_encode(Sha1::digest(nonce + created + password));
}
