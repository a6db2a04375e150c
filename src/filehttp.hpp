#pragma once

#include "http.hpp"

#include <fstream>
#include <string>

// Serves file:// urls and plain paths through the Http interface.
class FileHttp : public Http
{
public:
    FileHttp(const std::string& path = {});

    HttpResponseHead head(const std::string& url) override;
    std::future<HttpResponseHead> start(
            const std::string& url, uint64_t first, uint64_t last) override;
    int64_t read(uint8_t* buffer, uint64_t size) override;
    void abort() override;

    explicit operator bool() const override;

private:
    std::string override_path;
    std::ifstream f;
    uint64_t remaining{0};

    std::string path_for(const std::string& url) const;
};
