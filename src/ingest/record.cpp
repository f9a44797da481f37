#include "ingest/record.hpp"

void append_jsonl(std::string& out, const Record& record)
{
    out += record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += '\n';
}

std::string encode_jsonl(const std::vector<Record>& records)
{
    std::string body;
    for (const auto& r : records)
        append_jsonl(body, r);
    return body;
}
