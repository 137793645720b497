#pragma once

#include <string>

class ServerConfig
{
public:
    static constexpr const char *API_TITLE = "Media Downloader & Converter API";
    static constexpr const char *API_VERSION = "1.0.0";
    static constexpr const char *API_DOCS_PATH = "/docs";
    static constexpr const char *SWAGGER_JSON_PATH = "/swagger.json";

    static std::string getServerUrl(const std::string &host, int port)
    {
        return std::string("http://") + host + ":" + std::to_string(port);
    }
};
