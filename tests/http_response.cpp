#include "http_soap_transport.hpp"
#include "soap_envelope.hpp"

#include <cassert>
#include <string>

namespace
{

bool parse_fails(std::string const &raw)
{
    try
    {
        parse_http_response(raw);
    }
    catch (TransportError const &)
    {
        return true;
    }
    return false;
}

// 0: accepted, 1: TransportAuthorizationError, 2: TransportError
int check(int status, std::string const &body, std::string *message = nullptr)
{
    HttpResponse response;
    response.status = status;
    response.reason = "Reason";
    response.body = body;
    try
    {
        check_soap_response(response);
    }
    catch (TransportAuthorizationError const &ex)
    {
        if (message)
        {
            *message = ex.what();
        }
        return 1;
    }
    catch (TransportError const &ex)
    {
        if (message)
        {
            *message = ex.what();
        }
        return 2;
    }
    return 0;
}

std::string fault(std::string const &subcode, std::string const &reason)
{
    return "<env:Envelope xmlns:env=\"http://www.w3.org/2003/05/soap-envelope\" xmlns:ter=\"http://www.onvif.org/ver10/error\">"
           "<env:Body><env:Fault><env:Code><env:Value>env:Sender</env:Value>"
           "<env:Subcode><env:Value>" +
           subcode +
           "</env:Value></env:Subcode></env:Code>"
           "<env:Reason><env:Text xml:lang=\"en\">" +
           reason + "</env:Text></env:Reason></env:Fault></env:Body></env:Envelope>";
}

const char *users_ok = "<env:Envelope xmlns:env=\"http://www.w3.org/2003/05/soap-envelope\">"
                       "<env:Body><tds:GetUsersResponse xmlns:tds=\"http://www.onvif.org/ver10/device/wsdl\"/></env:Body>"
                       "</env:Envelope>";

} // namespace

int main()
{
    // Content-Length framing
    {
        const std::string head = "HTTP/1.1 200 OK\r\nContent-Type: application/soap+xml\r\ncontent-length: 10\r\n\r\n";
        assert(!http_response_complete("HTTP/1.1 200 OK\r\nContent-Le"));
        assert(!http_response_complete(head + "01234"));
        assert(http_response_complete(head + "0123456789"));

        const auto res = parse_http_response(head + "0123456789");
        assert(res.status == 200);
        assert(res.reason == "OK");
        assert(res.body == "0123456789");

        assert(parse_fails(head + "01234"));
    }

    // chunked framing
    {
        const std::string head = "HTTP/1.1 500 Internal Server Error\r\nTransfer-Encoding: chunked\r\n\r\n";
        const std::string body = "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n";
        assert(!http_response_complete(head + "5\r\nhel"));
        assert(!http_response_complete(head + "5\r\nhello\r\n"));
        assert(http_response_complete(head + body));

        const auto res = parse_http_response(head + body);
        assert(res.status == 500);
        assert(res.reason == "Internal Server Error");
        assert(res.body == "hello world");

        assert(parse_fails(head + "5\r\nhello\r\n"));
        assert(parse_fails(head + "zz\r\nhello\r\n0\r\n\r\n"));
    }

    // no framing: body runs until the connection closes
    {
        const std::string raw = "HTTP/1.0 401 Unauthorized\r\nWWW-Authenticate: Digest realm=\"x\"\r\n\r\n<html/>";
        assert(!http_response_complete(raw));
        const auto res = parse_http_response(raw);
        assert(res.status == 401);
        assert(res.body == "<html/>");
    }

    assert(parse_fails(""));
    assert(parse_fails("HTTP/1.1 200 OK\r\n"));
    assert(parse_fails("SIP/2.0 200 OK\r\n\r\n"));
    assert(parse_fails("HTTP/1.1 abc OK\r\n\r\n"));

    // status and fault mapping
    {
        std::string message;
        assert(check(200, users_ok) == 0);
        assert(check(202, users_ok) == 0);

        assert(check(401, "<html>Unauthorized</html>", &message) == 1);
        assert(message == "HTTP 401 Reason");
        assert(check(403, "") == 1);
        assert(check(401, users_ok) == 1);

        assert(check(500, fault("ter:NotAuthorized", "Sender not Authorized"), &message) == 1);
        assert(message == "Sender not Authorized");
        assert(check(400, fault("ter:NotAuthorized", ""), &message) == 1);
        assert(message == "NotAuthorized");

        assert(check(500, fault("ter:ActionNotSupported", "Optional Action Not Implemented"), &message) == 2);
        assert(message == "SOAP fault: Optional Action Not Implemented");
        assert(check(200, fault("ter:InvalidArgVal", "bad value"), &message) == 2);
        assert(message == "SOAP fault: bad value");

        assert(check(200, "not xml", &message) == 2);
        assert(message.compare(0, 22, "invalid SOAP response:") == 0);
        assert(check(500, "<html>oops</html>", &message) == 2);
        assert(message == "HTTP 500 Reason");
        assert(check(302, users_ok) == 2);
    }

    // only plain http is spoken, anything else fails before connecting
    {
        HttpSoapTransport transport("https://10.0.0.5/onvif/device_service", nullptr, 1000);
        assert(transport.endpoint() == "https://10.0.0.5/onvif/device_service");
        bool thrown = false;
        try
        {
            transport.invoke(std::string(NS_TDS) + "/GetUsers", "<tds:GetUsers xmlns:tds=\"" NS_TDS "\"/>");
        }
        catch (TransportAuthorizationError const &)
        {
            assert(false);
        }
        catch (TransportError const &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    // the factory hands out HTTP transports bound to the requested endpoint
    {
        auto factory = HttpSoapTransport::factory();
        auto creds = std::make_shared<Credentials>(Credentials{"admin", "secret"});
        auto transport = factory("http://10.0.0.5/onvif/events", creds, 10000);
        assert(transport);
        assert(transport->endpoint() == "http://10.0.0.5/onvif/events");
    }

    return 0;
}
