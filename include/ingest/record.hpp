#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Any caller value is converted to a JSON document at ingest time; the
// client imposes no schema, so batches may mix record shapes freely.
using Record = nlohmann::json;

// One compact JSON document followed by '\n'. Invalid UTF-8 in strings is
// replaced rather than rejected so a single bad record cannot wedge a batch.
void append_jsonl(std::string& out, const Record& record);

std::string encode_jsonl(const std::vector<Record>& records);
