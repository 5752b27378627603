//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <pugixml.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#define NS_SOAP_ENV "http://www.w3.org/2003/05/soap-envelope"
#define NS_WSA "http://schemas.xmlsoap.org/ws/2004/08/addressing"
#define NS_WSD "http://schemas.xmlsoap.org/ws/2005/04/discovery"
#define NS_WSSE "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd"
#define NS_WSU "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd"
#define NS_TDS "http://www.onvif.org/ver10/device/wsdl"
#define NS_TRT "http://www.onvif.org/ver10/media/wsdl"
#define NS_TT "http://www.onvif.org/ver10/schema"

class SoapParseError : public std::runtime_error
{
  public:
    SoapParseError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

// Outgoing SOAP 1.2 envelope.
class SoapEnvelope
{
  public:
    SoapEnvelope();
    SoapEnvelope(SoapEnvelope const &) = delete;

    pugi::xml_node header();
    pugi::xml_node body();

    void declare_namespace(std::string const &prefix, std::string const &uri);

    // Appends wsse:Security with a PasswordDigest UsernameToken to the header.
    void add_username_token(std::string const &username, std::string const &password, std::string const &nonce,
                            std::string const &created);

    // Parses xml (a single element, namespaces declared on it) and appends it to the body.
    void append_body_fragment(std::string const &xml);

    std::string to_string() const;

  private:
    pugi::xml_document _doc;
    pugi::xml_node _envelope;
    pugi::xml_node _header;
    pugi::xml_node _body;
};

// Incoming SOAP envelope.
class SoapResponse
{
  public:
    // Throws SoapParseError when text is not a SOAP envelope with a Body.
    explicit SoapResponse(std::string const &text);
    SoapResponse(SoapResponse const &) = delete;

    pugi::xml_node header() const;
    pugi::xml_node body() const;

    // First element child of the Body (the operation response).
    pugi::xml_node payload() const;

    bool is_fault() const;
    std::string fault_reason() const;
    // Subcode values with their prefixes stripped, outermost first.
    std::vector<std::string> fault_subcodes() const;

  private:
    pugi::xml_document _doc;
    pugi::xml_node _envelope;
};

// Element name without its namespace prefix.
std::string local_name(pugi::xml_node node);

pugi::xml_node child_local(pugi::xml_node parent, const char *name);
std::vector<pugi::xml_node> children_local(pugi::xml_node parent, const char *name);

// Trimmed text of the named child, empty when absent.
std::string child_text(pugi::xml_node parent, const char *name);

// Depth-first search by local name.
pugi::xml_node find_local(pugi::xml_node root, const char *name);

// Serializes node together with the namespace declarations in scope for it,
// so the result stays well formed outside its original document.
std::string capture_fragment(pugi::xml_node node);

std::string serialize_node(pugi::xml_node node);
