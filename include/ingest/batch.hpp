#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ingest/record.hpp"

// Worker-owned accumulator. Not thread-safe: only the ingest worker touches it.
class Batch
{
public:
    explicit Batch(std::size_t reserve) { vec_.reserve(reserve); }

    void append(Record r) { vec_.push_back(std::move(r)); }
    void clear() { vec_.clear(); }

    // Drops the oldest records so at most `limit` remain; returns the count dropped.
    std::size_t trim_oldest(std::size_t limit);

    std::size_t size() const { return vec_.size(); }
    bool empty() const { return vec_.empty(); }
    const std::vector<Record>& records() const { return vec_; }

    std::string encode() const { return encode_jsonl(vec_); }

private:
    std::vector<Record> vec_;
};
