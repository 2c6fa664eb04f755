#include "MessageReader.hpp"

#include "DateTime.hpp"
#include "../utils/ErrorReporter.hpp"

#include <deque>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace monitor
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string strip_cr(const std::string& line)
{
    if (!line.empty() && line.back() == '\r')
        return line.substr(0, line.size() - 1);
    return line;
}

// Ids and chat ids arrive either as numbers or as strings
std::string scalar_to_string(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_number_integer())
        return std::to_string(value.get<std::int64_t>());
    return {};
}

std::optional<InboundMessage> parseJsonMessage(const json& obj, std::size_t line_number)
{
    InboundMessage message;
    message.id = static_cast<std::int64_t>(line_number);

    if (obj.contains("id"))
    {
        const auto& id = obj["id"];
        if (id.is_number_integer())
        {
            message.id = id.get<std::int64_t>();
        }
        else if (id.is_string())
        {
            try
            {
                message.id = std::stoll(id.get<std::string>());
            }
            catch (const std::exception&)
            {
                PLOG_WARNING << "MessageReader: non-numeric id on line " << line_number << ", using line number";
            }
        }
    }

    if (obj.contains("text") && obj["text"].is_string())
        message.text = obj["text"].get<std::string>();

    if (obj.contains("date") && obj["date"].is_string())
    {
        message.date = parse_iso8601(obj["date"].get<std::string>());
        if (!message.date)
            PLOG_WARNING << "MessageReader: unreadable date on line " << line_number;
    }

    message.channel_name = obj.value("channel", "");
    if (obj.contains("chat_id"))
        message.chat_id = scalar_to_string(obj["chat_id"]);
    message.link = obj.value("link", "");

    return message;
}
} // namespace

std::optional<InboundMessage> MessageReader::parseLine(const std::string& raw_line, std::size_t line_number)
{
    const std::string line = strip_cr(raw_line);
    if (is_blank(line))
        return std::nullopt;

    const auto first = line.find_first_not_of(" \t");
    if (line[first] == '{')
    {
        try
        {
            json obj = json::parse(line);
            if (obj.is_object())
                return parseJsonMessage(obj, line_number);
        }
        catch (const json::parse_error& e)
        {
            PLOG_DEBUG << "MessageReader: line " << line_number << " is not JSON, reading as text: " << e.what();
        }
        catch (const json::type_error& e)
        {
            PLOG_WARNING << "MessageReader: unexpected field type on line " << line_number << ": " << e.what();
        }
    }

    InboundMessage message;
    message.id = static_cast<std::int64_t>(line_number);
    message.text = line;
    return message;
}

std::vector<InboundMessage> MessageReader::readAll(std::istream& in, std::size_t limit)
{
    std::deque<InboundMessage> window;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line))
    {
        ++line_number;
        auto message = parseLine(line, line_number);
        if (!message)
            continue;

        window.push_back(std::move(*message));
        if (limit > 0 && window.size() > limit)
            window.pop_front();
    }

    return {std::make_move_iterator(window.begin()), std::make_move_iterator(window.end())};
}

std::vector<InboundMessage> MessageReader::readFile(const std::string& path, std::size_t limit)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to open message history",
                                          "Path: " + path);
        return {};
    }

    auto messages = readAll(file, limit);
    PLOG_INFO << "MessageReader: read " << messages.size() << " messages from " << path;
    return messages;
}

} // namespace monitor
