#include "EntryStore.hpp"
#include <cerrno>
#include <cstdio>   // std::rename, std::remove
#include <cstring>  // strerror
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <utility>

using json = nlohmann::json;

/*
    Constructor method for EntryStore class.
    Args:
        path: file holding the serialized collection, created on first append
*/
EntryStore::EntryStore(std::string path) : path_(std::move(path)) {}

/*
    Load the persisted collection. Caller must hold mtx_.
    Args:
        none
    Returns:
        the collection in insertion order (empty if the file does not exist yet)
*/
std::vector<Entry> EntryStore::load() const {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return {}; // nothing persisted yet
        }
        throw StoreError("cannot stat " + path_ + ": " + std::strerror(errno));
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw StoreError("cannot open " + path_ + ": " + std::strerror(errno));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw StoreError("cannot read " + path_);
    }

    std::string text = contents.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {}; // empty file
    }

    try {
        json j = json::parse(text);
        if (j.is_null()) {
            return {};
        }
        if (!j.is_array()) {
            throw StoreError(path_ + " does not hold a collection");
        }
        return j.get<std::vector<Entry>>();
    } catch (const json::exception& e) {
        throw StoreError("malformed data in " + path_ + ": " + e.what());
    }
}

/*
    Rewrite the whole collection. Caller must hold mtx_.
    The new contents go to a sibling temp file which then replaces path_,
    so a failed write leaves the previous collection in place.
    Args:
        entries: the full collection to persist
    Returns:
        void
*/
void EntryStore::save(const std::vector<Entry>& entries) const {
    std::string text;
    try {
        text = serialize_collection(entries);
    } catch (const json::exception& e) {
        throw StoreError(std::string("cannot serialize collection: ") + e.what());
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreError("cannot open " + tmp + ": " + std::strerror(errno));
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            std::remove(tmp.c_str());
            throw StoreError("cannot write " + tmp);
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        int err = errno;
        std::remove(tmp.c_str());
        throw StoreError("cannot replace " + path_ + ": " + std::strerror(err));
    }
}

/*
    Read every entry in the store.
    Args:
        none
    Returns:
        the full collection (throws StoreError if it cannot be read or parsed)
*/
std::vector<Entry> EntryStore::read_all() {
    std::unique_lock<std::mutex> lock(mtx_);
    return load();
}

/*
    Append a batch of entries, assigning ids count_before + 1, count_before + 2, ...
    in batch order, and persist the resulting collection.
    Args:
        batch: entries to add, in submission order
    Returns:
        the collection after the append (throws StoreError on any load or save failure,
        in which case nothing is persisted)
*/
std::vector<Entry> EntryStore::append_batch(const std::vector<NewEntry>& batch) {
    std::unique_lock<std::mutex> lock(mtx_);

    std::vector<Entry> entries = load();
    const int count_before = static_cast<int>(entries.size());
    entries.reserve(entries.size() + batch.size());

    for (size_t i = 0; i < batch.size(); ++i) {
        Entry e;
        e.id = count_before + static_cast<int>(i) + 1;
        e.item = batch[i].item;
        e.completed = batch[i].completed;
        entries.push_back(e);
    }

    save(entries);
    return entries;
}
