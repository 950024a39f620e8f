#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// one persisted record; id is assigned by the store
struct Entry {
    int id = 0;
    std::string item;
    bool completed = false;
};

// one element of a batch submitted by a client (no id)
struct NewEntry {
    std::string item;
    bool completed = false;
};

// a POST body that is valid JSON but not a batch of entries
class BatchError : public std::runtime_error {
public:
    explicit BatchError(const std::string& what) : std::runtime_error(what) {}
};

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

void to_json(nlohmann::json& j, const NewEntry& e);
void from_json(const nlohmann::json& j, NewEntry& e);

// parse a POST body into a batch, throws nlohmann::json::exception or BatchError on bad input
std::vector<NewEntry> parse_batch(const std::string& body);

// serialize a collection the way it is persisted and served
std::string serialize_collection(const std::vector<Entry>& entries);
