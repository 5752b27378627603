//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Helpers for the WS-Security UsernameToken profile used by ONVIF devices.

class Sha1
{
  public:
    Sha1();

    void update(const unsigned char *data, size_t len);
    void update(std::string const &data);
    std::vector<unsigned char> finalize();

    static std::vector<unsigned char> digest(std::string const &data);

  private:
    void transform(const unsigned char block[64]);

    std::uint32_t _state[5];
    unsigned char _buffer[64];
    size_t _buffer_size;
    std::uint64_t _bit_len;
};

std::string base64_encode(std::vector<unsigned char> const &data);
std::string base64_encode(std::string const &data);

// Random bytes for the token nonce.
std::string make_nonce(size_t length = 16);

// UTC time in xsd:dateTime form, e.g. 2024-03-01T12:00:00Z
std::string make_created_timestamp();

// Base64(SHA1(nonce + created + password))
std::string make_password_digest(std::string const &nonce, std::string const &created, std::string const &password);
