#pragma once
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "Entry.hpp"

// the persisted collection could not be read, parsed or written
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

class EntryStore {
private:
    std::string path_;
    std::mutex mtx_; // covers the whole read-modify-write span

    std::vector<Entry> load() const;
    void save(const std::vector<Entry>& entries) const;
public:
    explicit EntryStore(std::string path);

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    std::vector<Entry> read_all();
    std::vector<Entry> append_batch(const std::vector<NewEntry>& batch);

    const std::string& path() const { return path_; }
};
