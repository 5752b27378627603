//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later

#include "ws_discovery.hpp"

#include <SoapySDR/Logger.hpp>

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>

#include "portable_utils.h"
#include "soap_envelope.hpp"

constexpr const char *WsDiscovery::MULTICAST_ADDRESS;
constexpr int WsDiscovery::MULTICAST_PORT;
constexpr int WsDiscovery::RECEIVE_TIMEOUT_MS;
constexpr const char *WsDiscovery::ONVIF_SCOPE;
constexpr const char *WsDiscovery::PROBE_ACTION;
constexpr const char *WsDiscovery::PROBE_TO;

constexpr size_t receive_buffer_size = 16 * 1024;

// Win32 solution from
// https://learn.microsoft.com/en-us/windows/win32/api/iphlpapi/nf-iphlpapi-getadaptersaddresses

#ifdef _WIN32
#include <iphlpapi.h>
#define MALLOC(x) HeapAlloc(GetProcessHeap(), 0, (x))
#define FREE(x) HeapFree(GetProcessHeap(), 0, (x))
#define WORKING_BUFFER_SIZE 15000
#define MAX_TRIES 3

// Link with Iphlpapi.lib
#pragma comment(lib, "IPHLPAPI.lib")

static std::vector<WsDiscovery::InterfaceItem> _enum_addresses_win32()
{
    std::vector<WsDiscovery::InterfaceItem> res;

    DWORD dwRetVal = 0;
    ULONG flags = GAA_FLAG_INCLUDE_PREFIX;
    ULONG family = AF_INET;

    PIP_ADAPTER_ADDRESSES pAddresses = NULL;
    ULONG outBufLen = WORKING_BUFFER_SIZE;
    ULONG Iterations = 0;

    do
    {
        pAddresses = (IP_ADAPTER_ADDRESSES *)MALLOC(outBufLen);
        if (pAddresses == NULL)
        {
            throw DiscoveryError("Memory allocation failed for IP_ADAPTER_ADDRESSES struct");
        }

        dwRetVal = GetAdaptersAddresses(family, flags, NULL, pAddresses, &outBufLen);

        if (dwRetVal == ERROR_BUFFER_OVERFLOW)
        {
            FREE(pAddresses);
            pAddresses = NULL;
        }
        else
        {
            break;
        }

        Iterations++;

    } while ((dwRetVal == ERROR_BUFFER_OVERFLOW) && (Iterations < MAX_TRIES));

    if (dwRetVal == ERROR_NO_DATA)
    {
        if (pAddresses)
        {
            FREE(pAddresses);
        }
        return res;
    }

    if (dwRetVal != NO_ERROR)
    {
        if (pAddresses)
        {
            FREE(pAddresses);
        }
        std::ostringstream ss;
        ss << "Could not get local IP addresses: GetAdaptersAddresses error=" << dwRetVal;
        throw DiscoveryError(ss.str());
    }

    for (PIP_ADAPTER_ADDRESSES pCurrAddresses = pAddresses; pCurrAddresses; pCurrAddresses = pCurrAddresses->Next)
    {
        if (pCurrAddresses->IfType == IF_TYPE_SOFTWARE_LOOPBACK)
        {
            continue;
        }

        for (PIP_ADAPTER_UNICAST_ADDRESS pUnicast = pCurrAddresses->FirstUnicastAddress; pUnicast; pUnicast = pUnicast->Next)
        {
            if (pUnicast->Address.lpSockaddr->sa_family != AF_INET)
            {
                continue;
            }

            WsDiscovery::InterfaceItem item;
            item.bind_address = ((struct sockaddr_in *)pUnicast->Address.lpSockaddr)->sin_addr;
            if ((ntohl(item.bind_address.s_addr) >> 24) == 127)
            {
                continue;
            }
            item.name = pCurrAddresses->AdapterName;
            res.push_back(item);
        }
    }

    FREE(pAddresses);
    return res;
}

#else
#include <ifaddrs.h>
#include <net/if.h>

static std::vector<WsDiscovery::InterfaceItem> _enum_addresses_posix()
{
    std::vector<WsDiscovery::InterfaceItem> res;
    struct ifaddrs *addrs = NULL, *p;

    if (getifaddrs(&addrs))
    {
        throw DiscoveryError(std::string("Could not get local IP addresses: ") + get_error_text());
    }

    for (p = addrs; p; p = p->ifa_next)
    {
        if (p->ifa_addr == NULL || p->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }

        const sockaddr_in *sa_addr_in = (struct sockaddr_in *)(p->ifa_addr);

        // loopback either by flag or by 127.0.0.0/8 address
        if ((p->ifa_flags & IFF_LOOPBACK) != 0 || (ntohl(sa_addr_in->sin_addr.s_addr) >> 24) == 127)
        {
            continue;
        }

        WsDiscovery::InterfaceItem item;
        item.bind_address = sa_addr_in->sin_addr;
        item.name = p->ifa_name ? p->ifa_name : "";
        res.push_back(item);
    }

    freeifaddrs(addrs);
    return res;
}

#endif

std::vector<WsDiscovery::InterfaceItem> WsDiscovery::enum_addresses()
{
#ifdef _WIN32
    return _enum_addresses_win32();
#else
    return _enum_addresses_posix();
#endif
}

static std::string make_uuid_v4()
{
    std::random_device rd;
    std::mt19937_64 gen(((std::uint64_t)rd() << 32) ^ rd());
    std::uniform_int_distribution<int> dist(0, 255);

    unsigned char bytes[16];
    for (auto &b : bytes)
    {
        b = static_cast<unsigned char>(dist(gen));
    }
    bytes[6] = (bytes[6] & 0x0f) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3f) | 0x80; // RFC 4122 variant

    std::ostringstream ss;
    for (size_t idx = 0; idx < 16; idx++)
    {
        if (idx == 4 || idx == 6 || idx == 8 || idx == 10)
        {
            ss << "-";
        }
        ss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(bytes[idx]);
    }
    return ss.str();
}

WsDiscovery::ProbeMessage WsDiscovery::build_probe()
{
    ProbeMessage res;
    res.message_id = "uuid:" + make_uuid_v4();
    res.action = PROBE_ACTION;
    res.to = PROBE_TO;
    return res;
}

std::string WsDiscovery::ProbeMessage::to_xml() const
{
    SoapEnvelope envelope;
    envelope.declare_namespace("a", NS_WSA);
    envelope.declare_namespace("d", NS_WSD);

    auto header = envelope.header();
    header.append_child("a:MessageID").text() = message_id.c_str();
    header.append_child("a:Action").text() = action.c_str();
    header.append_child("a:To").text() = to.c_str();

    envelope.body().append_child("d:Probe");
    return envelope.to_string();
}

static std::vector<std::string> split_whitespace(std::string const &text)
{
    std::vector<std::string> res;
    std::istringstream ss(text);
    std::string item;
    while (ss >> item)
    {
        res.push_back(item);
    }
    return res;
}

WsDiscovery::ProbeMatches WsDiscovery::parse_probe_matches(std::string const &text)
{
    SoapResponse response(text);

    ProbeMatches res;
    res.relates_to = child_text(response.header(), "RelatesTo");

    auto payload = response.payload();
    if (local_name(payload) != "ProbeMatches")
    {
        return res;
    }

    for (auto const &node : children_local(payload, "ProbeMatch"))
    {
        ProbeMatch item;
        item.endpoint_reference = child_text(child_local(node, "EndpointReference"), "Address");
        item.types = split_whitespace(child_text(node, "Types"));
        item.scopes = split_whitespace(child_text(node, "Scopes"));
        item.xaddrs = split_whitespace(child_text(node, "XAddrs"));
        item.metadata_version = child_text(node, "MetadataVersion");
        res.matches.push_back(item);
    }
    return res;
}

bool WsDiscovery::is_onvif_match(ProbeMatch const &match)
{
    for (auto const &scope : match.scopes)
    {
        if (scope.compare(0, std::strlen(ONVIF_SCOPE), ONVIF_SCOPE) == 0)
        {
            return true;
        }
    }
    return false;
}

std::string WsDiscovery::decode_lossy_utf8(const char *data, size_t len)
{
    static const char replacement[] = "\xEF\xBF\xBD";

    const unsigned char *s = reinterpret_cast<const unsigned char *>(data);
    std::string res;
    res.reserve(len);

    size_t idx = 0;
    while (idx < len)
    {
        const unsigned char c = s[idx];
        if (c < 0x80)
        {
            res.push_back(static_cast<char>(c));
            idx++;
            continue;
        }

        size_t need = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xbf;
        if (c >= 0xc2 && c <= 0xdf)
        {
            need = 1;
        }
        else if (c >= 0xe0 && c <= 0xef)
        {
            need = 2;
            lo = (c == 0xe0) ? 0xa0 : 0x80;
            hi = (c == 0xed) ? 0x9f : 0xbf;
        }
        else if (c >= 0xf0 && c <= 0xf4)
        {
            need = 3;
            lo = (c == 0xf0) ? 0x90 : 0x80;
            hi = (c == 0xf4) ? 0x8f : 0xbf;
        }
        else
        {
            res += replacement;
            idx++;
            continue;
        }

        // consume the longest valid prefix of the sequence
        size_t got = 0;
        while (got < need && idx + 1 + got < len)
        {
            const unsigned char cc = s[idx + 1 + got];
            const unsigned char min = (got == 0) ? lo : 0x80;
            const unsigned char max = (got == 0) ? hi : 0xbf;
            if (cc < min || cc > max)
            {
                break;
            }
            got++;
        }

        if (got == need)
        {
            res.append(data + idx, need + 1);
        }
        else
        {
            res += replacement;
        }
        idx += got + 1;
    }

    return res;
}

size_t WsDiscovery::handle_datagram(const char *data, size_t len, std::string const &sender, ProbeMessage const &probe,
                                    std::set<std::string> &reported, std::function<void(ProbeMatch const &)> const &on_match)
{
    const std::string text = decode_lossy_utf8(data, len);

    ProbeMatches response;
    try
    {
        response = parse_probe_matches(text);
    }
    catch (SoapParseError const &ex)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "Ignoring unparsable datagram from %s: %s", sender.c_str(), ex.what());
        return 0;
    }

    if (!response.relates_to.empty() && response.relates_to != probe.message_id)
    {
        SoapySDR::logf(SOAPY_SDR_DEBUG, "Ignoring reply from %s to another probe (%s)", sender.c_str(), response.relates_to.c_str());
        return 0;
    }

    size_t count = 0;
    for (auto const &match : response.matches)
    {
        if (!is_onvif_match(match))
        {
            continue;
        }

        // the same device answers on every interface it can see
        if (!match.endpoint_reference.empty() && !reported.insert(match.endpoint_reference).second)
        {
            SoapySDR::logf(SOAPY_SDR_DEBUG, "Device %s already reported", match.endpoint_reference.c_str());
            continue;
        }

        on_match(match);
        count++;
    }
    return count;
}

// Reports matches from one interface. Returns when no datagram arrives within the timeout.
static void net_recv_operation(MYSOCKET sock, WsDiscovery::ProbeMessage const &probe, std::set<std::string> &reported,
                               std::function<void(WsDiscovery::ProbeMatch const &)> const &on_match)
{
    std::vector<char> rx_buf(receive_buffer_size);

    for (;;)
    {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(sock, &readfds);

        struct timeval tv = {WsDiscovery::RECEIVE_TIMEOUT_MS / 1000, (WsDiscovery::RECEIVE_TIMEOUT_MS % 1000) * 1000};
        int ret = select((int)sock + 1, &readfds, NULL, NULL, &tv);
        if (ret == 0)
        {
            // timeout, nothing more from this interface
            break;
        }
        if (ret < 0)
        {
            SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery select error: %s", get_error_text());
            break;
        }

        struct sockaddr_in client_addr;
        std::memset(&client_addr, 0, sizeof(client_addr));
        socklen_t client_addr_len = sizeof(client_addr);

        int bytes_did_read = recvfrom(sock, &rx_buf[0], (int)rx_buf.size(), 0, (struct sockaddr *)&client_addr, &client_addr_len);
        if (bytes_did_read < 0)
        {
            SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery receive error: %s", get_error_text());
            break;
        }

        char sender[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, sender, sizeof(sender));

        WsDiscovery::handle_datagram(&rx_buf[0], static_cast<size_t>(bytes_did_read), sender, probe, reported, on_match);
    }
}

static void probe_interface(WsDiscovery::InterfaceItem const &addr, std::set<std::string> &reported,
                            std::function<void(WsDiscovery::ProbeMatch const &)> const &on_match)
{
    char local[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.bind_address, local, sizeof(local));

    MYSOCKET sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery socket error on %s: %s", local, get_error_text());
        return;
    }

    {
        const int reuseEnable = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, (const char *)&reuseEnable, sizeof(reuseEnable));
    }

    struct sockaddr_in sockaddr_local;
    std::memset(&sockaddr_local, 0, sizeof(sockaddr_local));
    sockaddr_local.sin_family = AF_INET;
    sockaddr_local.sin_port = htons(0); // ephemeral
    sockaddr_local.sin_addr = addr.bind_address;

    if (bind(sock, (struct sockaddr *)&sockaddr_local, sizeof(sockaddr_local)) < 0)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery bind error on %s: %s", local, get_error_text());
        closesocket(sock);
        return;
    }

    struct sockaddr_in sockaddr_group;
    std::memset(&sockaddr_group, 0, sizeof(sockaddr_group));
    sockaddr_group.sin_family = AF_INET;
    sockaddr_group.sin_port = htons(WsDiscovery::MULTICAST_PORT);
    inet_pton(AF_INET, WsDiscovery::MULTICAST_ADDRESS, &sockaddr_group.sin_addr);

    struct ip_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    mreq.imr_multiaddr = sockaddr_group.sin_addr;
    mreq.imr_interface = addr.bind_address;
    if (setsockopt(sock, IPPROTO_IP, IP_ADD_MEMBERSHIP, (const char *)&mreq, sizeof(mreq)) < 0)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery cannot join multicast group on %s: %s", local, get_error_text());
        closesocket(sock);
        return;
    }
    setsockopt(sock, IPPROTO_IP, IP_MULTICAST_IF, (const char *)&addr.bind_address, sizeof(addr.bind_address));

    const auto probe = WsDiscovery::build_probe();
    const std::string probe_xml = probe.to_xml();

    if (sendto(sock, probe_xml.data(), (int)probe_xml.size(), 0, (struct sockaddr *)&sockaddr_group, sizeof(sockaddr_group)) < 0)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "WS-Discovery cannot send probe on %s: %s", local, get_error_text());
        closesocket(sock);
        return;
    }

    try
    {
        net_recv_operation(sock, probe, reported, on_match);
    }
    catch (...)
    {
        closesocket(sock);
        throw;
    }

    closesocket(sock);
}

void WsDiscovery::discovery(std::function<void(ProbeMatch const &)> on_match)
{
    network_startup();

    const auto addresses = enum_addresses();

    // endpoint references reported during this run
    std::set<std::string> reported;

    for (auto const &addr : addresses)
    {
        char local[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.bind_address, local, sizeof(local));
        SoapySDR::logf(SOAPY_SDR_INFO, "Checking %s (%s) for cameras...", local, addr.name.c_str());

        probe_interface(addr, reported, on_match);
    }
}
