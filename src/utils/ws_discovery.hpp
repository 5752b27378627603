//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "inet_common.h"

class DiscoveryError : public std::runtime_error
{
  public:
    DiscoveryError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

// WS-Discovery client for ONVIF devices (multicast 239.255.255.250:3702).
class WsDiscovery
{
  public:
    static constexpr const char *MULTICAST_ADDRESS = "239.255.255.250";
    static constexpr int MULTICAST_PORT = 3702;
    static constexpr int RECEIVE_TIMEOUT_MS = 5000;
    static constexpr const char *ONVIF_SCOPE = "onvif://www.onvif.org";
    static constexpr const char *PROBE_ACTION = "http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe";
    static constexpr const char *PROBE_TO = "urn:schemas-xmlsoap-org:ws:2005:04:discovery";

    struct InterfaceItem
    {
        in_addr bind_address;
        std::string name;
    };

    struct ProbeMessage
    {
        std::string message_id; // uuid:<v4 uuid>
        std::string action;
        std::string to;

        std::string to_xml() const;
    };

    struct ProbeMatch
    {
        std::string endpoint_reference;
        std::vector<std::string> types;
        std::vector<std::string> scopes;
        std::vector<std::string> xaddrs;
        std::string metadata_version;
    };

    struct ProbeMatches
    {
        std::string relates_to; // empty when the header has none
        std::vector<ProbeMatch> matches;
    };

    // IPv4, non-loopback local addresses. Throws DiscoveryError when the
    // interface list cannot be read.
    static std::vector<InterfaceItem> enum_addresses();

    static ProbeMessage build_probe();

    // Throws SoapParseError for anything that is not a SOAP envelope. Other
    // messages (Probe, Hello, Bye) give an empty match list.
    static ProbeMatches parse_probe_matches(std::string const &text);

    // True when one of the scopes starts with ONVIF_SCOPE.
    static bool is_onvif_match(ProbeMatch const &match);

    // UTF-8 decode replacing each invalid sequence with U+FFFD.
    static std::string decode_lossy_utf8(const char *data, size_t len);

    // Handles one received datagram: decodes and parses it, drops replies to
    // other probes, non-ONVIF matches and devices already in reported, and
    // passes the rest to on_match. An unparsable datagram is logged and ignored.
    // Returns the number of matches reported.
    static size_t handle_datagram(const char *data, size_t len, std::string const &sender, ProbeMessage const &probe,
                                  std::set<std::string> &reported, std::function<void(ProbeMatch const &)> const &on_match);

    // Probes every local interface in turn and reports matches as they arrive.
    // Each interface is listened on until no datagram arrives for RECEIVE_TIMEOUT_MS.
    static void discovery(std::function<void(ProbeMatch const &)> on_match);
};
