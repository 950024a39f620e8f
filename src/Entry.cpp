#include "Entry.hpp"

using json = nlohmann::json;

void to_json(json& j, const Entry& e) {
    j = json{{"id", e.id}, {"item", e.item}, {"completed", e.completed}};
}

void from_json(const json& j, Entry& e) {
    j.at("id").get_to(e.id);
    j.at("item").get_to(e.item);
    j.at("completed").get_to(e.completed);
}

void to_json(json& j, const NewEntry& e) {
    j = json{{"item", e.item}, {"completed", e.completed}};
}

/*
    Read a batch element. Missing fields keep their defaults, a null element is
    an entry with all defaults, any "id" sent by the client is ignored.
    Args:
        j: a JSON object
        e: the entry to fill
    Returns:
        void (throws BatchError if j is not an object, json::type_error if a field has the wrong type)
*/
void from_json(const json& j, NewEntry& e) {
    if (j.is_null()) {
        e = NewEntry{}; // [null] adds a blank entry
        return;
    }
    if (!j.is_object()) {
        throw BatchError(std::string("batch element must be an object, got ") + j.type_name());
    }
    e = NewEntry{};
    auto it = j.find("item");
    if (it != j.end()) {
        it->get_to(e.item);
    }
    it = j.find("completed");
    if (it != j.end()) {
        it->get_to(e.completed);
    }
}

/*
    Parse a POST body into the list of entries to add.
    Args:
        body: raw request body
    Returns:
        the batch in submission order; JSON null is an empty batch
*/
std::vector<NewEntry> parse_batch(const std::string& body) {
    json j = json::parse(body);
    if (j.is_null()) {
        return {};
    }
    if (!j.is_array()) {
        throw BatchError(std::string("batch must be an array, got ") + j.type_name());
    }
    return j.get<std::vector<NewEntry>>();
}

std::string serialize_collection(const std::vector<Entry>& entries) {
    json j = json::array();
    for (const auto& e : entries) {
        j.push_back(e);
    }
    return j.dump(2); // two-space indent, human readable on disk
}
