#pragma once

#include "MonitorTypes.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace monitor
{

/**
 * @brief Turns line-oriented input into InboundMessage records.
 *
 * A line holding a JSON object is read field by field:
 *   {"id": 42, "text": "...", "date": "2024-05-01T10:00:00Z",
 *    "channel": "deals", "chat_id": "-100123", "link": "https://..."}
 * Any other non-blank line is the message text itself, with the line
 * number as its id. Blank lines yield nothing.
 */
class MessageReader
{
public:
    [[nodiscard]] static std::optional<InboundMessage> parseLine(const std::string& line, std::size_t line_number);

    // Reads the whole stream; with limit > 0 only the last `limit` messages are kept, oldest first
    [[nodiscard]] static std::vector<InboundMessage> readAll(std::istream& in, std::size_t limit = 0);

    [[nodiscard]] static std::vector<InboundMessage> readFile(const std::string& path, std::size_t limit = 0);
};

} // namespace monitor
