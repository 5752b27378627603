//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "soap_envelope.hpp"

#include "ws_security.hpp"

#include <cstring>
#include <set>
#include <sstream>

static std::string trim(std::string const &s)
{
    const char *ws = " \t\r\n";
    const size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
    {
        return std::string();
    }
    const size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

SoapEnvelope::SoapEnvelope()
{
    auto decl = _doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "utf-8";

    _envelope = _doc.append_child("s:Envelope");
    _envelope.append_attribute("xmlns:s") = NS_SOAP_ENV;
    _header = _envelope.append_child("s:Header");
    _body = _envelope.append_child("s:Body");
}

pugi::xml_node SoapEnvelope::header()
{
    return _header;
}

pugi::xml_node SoapEnvelope::body()
{
    return _body;
}

void SoapEnvelope::declare_namespace(std::string const &prefix, std::string const &uri)
{
    const std::string attr = "xmlns:" + prefix;
    if (!_envelope.attribute(attr.c_str()))
    {
        _envelope.append_attribute(attr.c_str()) = uri.c_str();
    }
}

void SoapEnvelope::add_username_token(std::string const &username, std::string const &password, std::string const &nonce,
                                      std::string const &created)
{
    declare_namespace("wsse", NS_WSSE);
    declare_namespace("wsu", NS_WSU);

    auto security = _header.append_child("wsse:Security");
    security.append_attribute("s:mustUnderstand") = "1";

    auto token = security.append_child("wsse:UsernameToken");
    token.append_child("wsse:Username").text() = username.c_str();

    auto pass = token.append_child("wsse:Password");
    pass.append_attribute("Type") = "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest";
    pass.text() = make_password_digest(nonce, created, password).c_str();

    auto nonce_node = token.append_child("wsse:Nonce");
    nonce_node.append_attribute("EncodingType") =
        "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary";
    nonce_node.text() = base64_encode(nonce).c_str();

    token.append_child("wsu:Created").text() = created.c_str();
}

void SoapEnvelope::append_body_fragment(std::string const &xml)
{
    pugi::xml_parse_result rc = _body.append_buffer(xml.data(), xml.size());
    if (!rc)
    {
        throw SoapParseError(std::string("request body is not well formed: ") + rc.description());
    }
}

std::string SoapEnvelope::to_string() const
{
    std::ostringstream ss;
    _doc.save(ss, "", pugi::format_raw);
    return ss.str();
}

SoapResponse::SoapResponse(std::string const &text)
{
    pugi::xml_parse_result rc = _doc.load_buffer(text.data(), text.size());
    if (!rc)
    {
        std::ostringstream ss;
        ss << "malformed XML at offset " << rc.offset << ": " << rc.description();
        throw SoapParseError(ss.str());
    }

    _envelope = _doc.document_element();
    if (local_name(_envelope) != "Envelope")
    {
        throw SoapParseError("document element is not a SOAP Envelope");
    }
    if (!child_local(_envelope, "Body"))
    {
        throw SoapParseError("SOAP Envelope has no Body");
    }
}

pugi::xml_node SoapResponse::header() const
{
    return child_local(_envelope, "Header");
}

pugi::xml_node SoapResponse::body() const
{
    return child_local(_envelope, "Body");
}

pugi::xml_node SoapResponse::payload() const
{
    for (auto child : body().children())
    {
        if (child.type() == pugi::node_element)
        {
            return child;
        }
    }
    return pugi::xml_node();
}

bool SoapResponse::is_fault() const
{
    return local_name(payload()) == "Fault";
}

std::string SoapResponse::fault_reason() const
{
    auto fault = payload();
    // SOAP 1.2: Reason/Text, SOAP 1.1: faultstring
    auto reason = child_local(fault, "Reason");
    if (reason)
    {
        return child_text(reason, "Text");
    }
    return child_text(fault, "faultstring");
}

std::vector<std::string> SoapResponse::fault_subcodes() const
{
    std::vector<std::string> res;
    auto code = child_local(payload(), "Code");
    for (auto sub = child_local(code, "Subcode"); sub; sub = child_local(sub, "Subcode"))
    {
        std::string value = child_text(sub, "Value");
        const size_t colon = value.find(':');
        if (colon != std::string::npos)
        {
            value.erase(0, colon + 1);
        }
        res.push_back(value);
    }
    return res;
}

std::string local_name(pugi::xml_node node)
{
    const char *name = node.name();
    const char *colon = std::strchr(name, ':');
    return colon ? std::string(colon + 1) : std::string(name);
}

pugi::xml_node child_local(pugi::xml_node parent, const char *name)
{
    for (auto child : parent.children())
    {
        if (child.type() == pugi::node_element && local_name(child) == name)
        {
            return child;
        }
    }
    return pugi::xml_node();
}

std::vector<pugi::xml_node> children_local(pugi::xml_node parent, const char *name)
{
    std::vector<pugi::xml_node> res;
    for (auto child : parent.children())
    {
        if (child.type() == pugi::node_element && local_name(child) == name)
        {
            res.push_back(child);
        }
    }
    return res;
}

std::string child_text(pugi::xml_node parent, const char *name)
{
    return trim(child_local(parent, name).text().get());
}

pugi::xml_node find_local(pugi::xml_node root, const char *name)
{
    return root.find_node([name](pugi::xml_node node) { return node.type() == pugi::node_element && local_name(node) == name; });
}

std::string capture_fragment(pugi::xml_node node)
{
    pugi::xml_document doc;
    auto copy = doc.append_copy(node);

    std::set<std::string> declared;
    for (auto attr : copy.attributes())
    {
        declared.insert(attr.name());
    }

    for (auto parent = node.parent(); parent; parent = parent.parent())
    {
        for (auto attr : parent.attributes())
        {
            const std::string name = attr.name();
            if ((name == "xmlns" || name.compare(0, 6, "xmlns:") == 0) && declared.insert(name).second)
            {
                copy.append_attribute(name.c_str()) = attr.value();
            }
        }
    }

    return serialize_node(copy);
}

std::string serialize_node(pugi::xml_node node)
{
    std::ostringstream ss;
    node.print(ss, "", pugi::format_raw);
    return ss.str();
}
