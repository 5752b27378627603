#include "ws_security.hpp"

#include <cassert>
#include <iomanip>
#include <sstream>
#include <string>

namespace
{

std::string to_hex(std::vector<unsigned char> const &data)
{
    std::ostringstream ss;
    for (auto b : data)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

} // namespace

int main()
{
    assert(to_hex(Sha1::digest("abc")) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    assert(to_hex(Sha1::digest("")) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    assert(to_hex(Sha1::digest("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
           "84983e441c3bd26ebaae4aa1f95129e5e54670f1");

    // incremental updates across block boundaries give the same digest
    {
        const std::string text(200, 'x');
        Sha1 sha;
        for (size_t idx = 0; idx < text.size(); idx += 7)
        {
            sha.update(text.substr(idx, 7));
        }
        assert(to_hex(sha.finalize()) == to_hex(Sha1::digest(text)));
    }

    assert(base64_encode(std::string()) == "");
    assert(base64_encode(std::string("f")) == "Zg==");
    assert(base64_encode(std::string("fo")) == "Zm8=");
    assert(base64_encode(std::string("foo")) == "Zm9v");
    assert(base64_encode(std::string("foobar")) == "Zm9vYmFy");
    assert(base64_encode(std::string("nonce-bytes")) == "bm9uY2UtYnl0ZXM=");

    assert(make_password_digest("nonce-bytes", "2024-03-01T12:00:00Z", "secret") == "wqk7H+26RrmH3bCv9AWAlrLsoAk=");

    {
        const auto a = make_nonce();
        const auto b = make_nonce();
        assert(a.size() == 16);
        assert(make_nonce(24).size() == 24);
        assert(a != b);
    }

    {
        const auto created = make_created_timestamp();
        assert(created.size() == 20);
        assert(created[4] == '-' && created[7] == '-' && created[10] == 'T');
        assert(created[13] == ':' && created[16] == ':' && created[19] == 'Z');
    }

    return 0;
}
