//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "uri.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool is_scheme_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

static std::string trim(std::string const &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && static_cast<unsigned char>(s[begin]) <= 0x20)
    {
        begin++;
    }
    while (end > begin && static_cast<unsigned char>(s[end - 1]) <= 0x20)
    {
        end--;
    }
    return s.substr(begin, end - begin);
}

// RFC 3986 section 5.2.4
static std::string remove_dot_segments(std::string const &path)
{
    std::vector<std::string> out;
    std::string segment;
    std::istringstream ss(path.substr(1));
    bool trailing_slash = false;

    while (std::getline(ss, segment, '/'))
    {
        trailing_slash = false;
        if (segment == ".")
        {
            trailing_slash = true;
            continue;
        }
        if (segment == "..")
        {
            if (!out.empty())
            {
                out.pop_back();
            }
            trailing_slash = true;
            continue;
        }
        out.push_back(segment);
    }
    if (!path.empty() && path[path.size() - 1] == '/')
    {
        trailing_slash = true;
    }

    std::string res;
    for (auto const &s : out)
    {
        res += "/" + s;
    }
    if (res.empty() || trailing_slash)
    {
        res += "/";
    }
    return res;
}

int Uri::default_port_for_scheme(std::string const &scheme)
{
    if (scheme == "http" || scheme == "ws")
    {
        return 80;
    }
    if (scheme == "https" || scheme == "wss")
    {
        return 443;
    }
    return -1;
}

Uri Uri::parse(std::string const &input)
{
    const std::string text = trim(input);
    Uri res;

    const size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(text[0])))
    {
        throw UriParseError("relative URL without a base: " + text);
    }
    for (size_t idx = 0; idx < colon; idx++)
    {
        if (!is_scheme_char(text[idx]))
        {
            throw UriParseError("invalid scheme in " + text);
        }
    }
    res._scheme = to_lower(text.substr(0, colon));

    if (text.compare(colon + 1, 2, "//") != 0)
    {
        throw UriParseError("URI has no authority: " + text);
    }

    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            throw UriParseError("URI contains whitespace: " + text);
        }
    }

    std::string rest = text.substr(colon + 3);

    size_t pos = rest.find('#');
    if (pos != std::string::npos)
    {
        res._fragment = rest.substr(pos + 1);
        rest.erase(pos);
    }
    pos = rest.find('?');
    if (pos != std::string::npos)
    {
        res._query = rest.substr(pos + 1);
        rest.erase(pos);
    }

    pos = rest.find('/');
    std::string authority = rest.substr(0, pos);
    std::string path = (pos == std::string::npos) ? std::string("/") : rest.substr(pos);

    pos = authority.rfind('@');
    if (pos != std::string::npos)
    {
        res._userinfo = authority.substr(0, pos);
        authority.erase(0, pos + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[')
    {
        const size_t close = authority.find(']');
        if (close == std::string::npos)
        {
            throw UriParseError("invalid IPv6 address in " + text);
        }
        res._host = to_lower(authority.substr(0, close + 1));
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
            {
                throw UriParseError("invalid authority in " + text);
            }
            port_text = authority.substr(close + 2);
        }
    }
    else
    {
        pos = authority.find(':');
        res._host = to_lower(authority.substr(0, pos));
        if (pos != std::string::npos)
        {
            port_text = authority.substr(pos + 1);
        }
    }

    if (res._host.empty())
    {
        throw UriParseError("empty host in " + text);
    }

    if (!port_text.empty())
    {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
        {
            throw UriParseError("invalid port number in " + text);
        }
        const int port = std::stoi(port_text);
        if (port > 65535)
        {
            throw UriParseError("invalid port number in " + text);
        }
        if (port != default_port_for_scheme(res._scheme))
        {
            res._port = port;
        }
    }

    res._path = remove_dot_segments(path);
    return res;
}

int Uri::port() const
{
    if (_port != -1)
    {
        return _port;
    }
    return default_port_for_scheme(_scheme);
}

Uri Uri::with_path(std::string const &path) const
{
    Uri res = *this;
    res._path = (path.empty() || path[0] != '/') ? "/" + path : path;
    res._query.clear();
    res._fragment.clear();
    return res;
}

std::string Uri::authority_base() const
{
    return with_path("/").to_string();
}

std::string Uri::to_string() const
{
    std::ostringstream ss;
    ss << _scheme << "://";
    if (!_userinfo.empty())
    {
        ss << _userinfo << "@";
    }
    ss << _host;
    if (_port != -1)
    {
        ss << ":" << _port;
    }
    ss << _path;
    if (!_query.empty())
    {
        ss << "?" << _query;
    }
    if (!_fragment.empty())
    {
        ss << "#" << _fragment;
    }
    return ss.str();
}
