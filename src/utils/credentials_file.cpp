//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "credentials_file.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

std::shared_ptr<Credentials> parse_credentials(std::string const &json_text, std::string const &serial)
{
    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse(json_text);
    }
    catch (nlohmann::json::parse_error const &ex)
    {
        throw CredentialsFileError(ex.what());
    }

    if (!doc.is_array())
    {
        throw CredentialsFileError("credential file must contain a JSON array");
    }

    for (auto const &record : doc)
    {
        std::string user;
        std::string pass;
        std::vector<std::string> serials;
        try
        {
            user = record.at("user").get<std::string>();
            pass = record.at("pass").get<std::string>();
            if (record.contains("serial"))
            {
                serials = record.at("serial").get<std::vector<std::string>>();
            }
        }
        catch (nlohmann::json::exception const &ex)
        {
            throw CredentialsFileError(ex.what());
        }

        if (!serial.empty() && !serials.empty())
        {
            if (std::find(serials.begin(), serials.end(), serial) == serials.end())
            {
                continue;
            }
        }

        return std::make_shared<Credentials>(Credentials{user, pass});
    }

    return nullptr;
}

std::shared_ptr<Credentials> load_credentials(std::string const &path, std::string const &serial)
{
    std::ifstream in(path.c_str());
    if (!in)
    {
        throw CredentialsFileError("cannot open " + path);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_credentials(ss.str(), serial);
}
