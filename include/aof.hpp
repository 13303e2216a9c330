#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"

namespace hk
{
    // Append side of the durability log. append() is called with the database
    // lock held, so records land in the same order the mutations were applied.
    class AofWriter
    {
    public:
        // Opens (creating if needed) the file for appending. Throws std::system_error.
        AofWriter(const std::string &path, FsyncPolicy policy);

        ~AofWriter();

        AofWriter(const AofWriter &) = delete;
        AofWriter &operator=(const AofWriter &) = delete;

        bool append(const std::vector<std::string> &args);

        // fsync if anything was written since the last sync.
        bool sync();

        std::uint64_t records() const { return appended.load(); }

        const std::string &path() const { return file_path; }

    private:
        void flush_loop();

        std::string file_path;
        FsyncPolicy policy;
        int fd = -1;
        std::atomic<std::uint64_t> appended{0};
        std::atomic<bool> unsynced{false};

        std::thread flusher;
        std::mutex flusher_mutex;
        std::condition_variable flusher_cv;
        bool stopping = false;
    };

    // Sequential reader used once at startup. A partial or malformed last record
    // is discarded; a malformed record followed by valid ones throws CorruptLogError.
    class AofReader
    {
    public:
        // A missing file reads as empty.
        static AofReader open(const std::string &path);

        static AofReader from_buffer(std::string contents, std::string name = "<buffer>");

        // False at end of log.
        bool next(std::vector<std::string> &record);

        // Offset just past the last complete record returned.
        std::size_t valid_bytes() const { return cursor; }

        std::size_t discarded_bytes() const { return discarded; }

        const std::string &path() const { return name; }

        // Cuts a discarded tail off the file so new records start on a boundary.
        void truncate_tail() const;

    private:
        AofReader(std::string contents, std::string name, bool on_disk);

        bool later_record_exists(std::size_t from) const;

        std::string data;
        std::string name;
        bool on_disk;
        std::size_t cursor = 0;
        std::size_t discarded = 0;
    };
}
