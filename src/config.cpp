#include "config.hpp"

#include "file.hpp"
#include "httputil.hpp"
#include "log.hpp"

#include <fmt/format.h>

#include <strings.h>

static char* skipnonws(char* text, char* end)
{
    while (text < end && *text != ' ' && *text != '\n' && *text != '\r')
    {
        text++;
    }
    return text;
}

static char* skipline(char* text, char* end)
{
    while (text < end && *text != '\n' && *text != '\r')
    {
        text++;
    }
    return text;
}

static char* skipws(char* text, char* end)
{
    while (text < end && (*text == ' ' || *text == '\n' || *text == '\r'))
    {
        text++;
    }
    return text;
}

static uint64_t parse_number(const char* key, const char* value)
{
    const auto number = dlsync_parse_content_length(value);
    if (!number)
        throw formatEx<ConfigError>("invalid {} value: {}", key, value);
    return *number;
}

static MissingTimestamp parse_missing_timestamp(const char* value)
{
    if (strcasecmp(value, "refetch") == 0)
        return MissingTimestamp::AlwaysOutdated;
    else if (strcasecmp(value, "size") == 0)
        return MissingTimestamp::SizeOnly;
    else
        throw formatEx<ConfigError>("invalid missing_timestamp value: {}", value);
}

static const char* missing_timestamp_str(MissingTimestamp mode)
{
    switch (mode)
    {
    case MissingTimestamp::AlwaysOutdated:
        return "refetch";
    case MissingTimestamp::SizeOnly:
        return "size";
    }
    return "";
}

Config dlsync_load_config(const std::string& path)
{
    Config config{};

    LOGF("config location: {}", path);

    if (!dlsync_file_exists(path))
        return config;

    auto data = dlsync_load(path);
    data.push_back('\n');

    LOG("config loaded, parsing");
    auto text = reinterpret_cast<char*>(data.data());
    const auto end = text + data.size();

    text = skipws(text, end);
    while (text < end)
    {
        const auto key = text;

        text = skipnonws(text, end);
        if (text == end)
            break;

        *text++ = 0;

        text = skipws(text, end);
        if (text == end)
            break;

        const auto value = text;

        // user_agent takes the rest of the line
        if (strcasecmp(key, "user_agent") == 0)
        {
            text = skipline(text, end);
            if (text == end)
                break;
            auto last = text;
            while (last > value && last[-1] == ' ')
                --last;
            *last = 0;
            text++;
        }
        else
        {
            text = skipnonws(text, end);
            if (text == end)
                break;

            *text++ = 0;
        }

        text = skipws(text, end);

        if (strcasecmp(key, "chunk_size") == 0)
        {
            config.chunk_size = parse_number(key, value);
            if (config.chunk_size == 0 || config.chunk_size > UINT32_MAX)
                throw formatEx<ConfigError>("invalid chunk_size value: {}", value);
        }
        else if (strcasecmp(key, "header_timeout") == 0)
            config.header_timeout =
                    std::chrono::milliseconds(parse_number(key, value));
        else if (strcasecmp(key, "stall_timeout") == 0)
            config.stall_timeout =
                    std::chrono::milliseconds(parse_number(key, value));
        else if (strcasecmp(key, "missing_timestamp") == 0)
            config.missing_timestamp = parse_missing_timestamp(value);
        else if (strcasecmp(key, "max_redirects") == 0)
            config.max_redirects = parse_number(key, value);
        else if (strcasecmp(key, "user_agent") == 0)
            config.user_agent = value;
    }
    return config;
}

void dlsync_save_config(const std::string& path, const Config& config)
{
    const auto data = fmt::format(
            "chunk_size {}\n"
            "header_timeout {}\n"
            "stall_timeout {}\n"
            "missing_timestamp {}\n"
            "max_redirects {}\n"
            "user_agent {}\n",
            config.chunk_size,
            config.header_timeout.count(),
            config.stall_timeout.count(),
            missing_timestamp_str(config.missing_timestamp),
            config.max_redirects,
            config.user_agent);

    dlsync_save(path, data.data(), data.size());
}
