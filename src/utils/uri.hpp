//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <stdexcept>
#include <string>

class UriParseError : public std::runtime_error
{
  public:
    UriParseError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

// Absolute hierarchical URI (scheme://[userinfo@]host[:port]/path[?query][#fragment]).
// to_string() gives the normalized form: lower case scheme and host, default
// port dropped, empty path written as "/", dot segments removed.
class Uri
{
  public:
    static Uri parse(std::string const &text);

    std::string const &scheme() const
    {
        return _scheme;
    }
    std::string const &userinfo() const
    {
        return _userinfo;
    }
    std::string const &host() const
    {
        return _host;
    }
    std::string const &path() const
    {
        return _path;
    }
    std::string const &query() const
    {
        return _query;
    }
    std::string const &fragment() const
    {
        return _fragment;
    }

    // Explicit port, or the scheme default (80/443), or -1 when unknown.
    int port() const;
    bool has_explicit_port() const
    {
        return _port != -1;
    }

    // Same scheme, host and port with the given path; query and fragment are dropped.
    Uri with_path(std::string const &path) const;

    // Scheme, host and port with path "/". Every service URI of a device must start with this.
    std::string authority_base() const;

    std::string to_string() const;

    static int default_port_for_scheme(std::string const &scheme);

  private:
    Uri() = default;

    std::string _scheme{};
    std::string _userinfo{};
    std::string _host{};
    int _port{-1};
    std::string _path{};
    std::string _query{};
    std::string _fragment{};
};
