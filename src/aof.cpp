#include "aof.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace hk
{
    AofWriter::AofWriter(const std::string &path, FsyncPolicy policy) : file_path(path), policy(policy)
    {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            throw std::system_error(errno, std::generic_category(), "open " + path);
        }
        if (policy == FsyncPolicy::EverySec)
        {
            flusher = std::thread(&AofWriter::flush_loop, this);
        }
    }

    AofWriter::~AofWriter()
    {
        {
            std::lock_guard<std::mutex> lock(flusher_mutex);
            stopping = true;
        }
        flusher_cv.notify_all();
        if (flusher.joinable())
        {
            flusher.join();
        }
        if (policy != FsyncPolicy::No && !sync())
        {
            log(LogLevel::Error, "final fsync of " + file_path + " failed");
        }
        ::close(fd);
    }

    bool AofWriter::append(const std::vector<std::string> &args)
    {
        if (!write_all(fd, encode_resp_array(args)))
        {
            return false;
        }
        appended.fetch_add(1);
        if (policy == FsyncPolicy::Always)
        {
            return ::fdatasync(fd) == 0;
        }
        unsynced.store(true);
        return true;
    }

    bool AofWriter::sync()
    {
        if (!unsynced.exchange(false))
        {
            return true;
        }
        return ::fdatasync(fd) == 0;
    }

    void AofWriter::flush_loop()
    {
        std::unique_lock<std::mutex> lock(flusher_mutex);
        while (!stopping)
        {
            flusher_cv.wait_for(lock, std::chrono::seconds(1), [this] { return stopping; });
            if (stopping)
            {
                break;
            }
            lock.unlock();
            if (!sync())
            {
                log(LogLevel::Error, "fsync of " + file_path + " failed: " + std::error_code(errno, std::generic_category()).message());
            }
            lock.lock();
        }
    }

    AofReader::AofReader(std::string contents, std::string name, bool on_disk)
        : data(std::move(contents)), name(std::move(name)), on_disk(on_disk)
    {
    }

    AofReader AofReader::open(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            if (std::filesystem::exists(path))
            {
                throw std::system_error(errno, std::generic_category(), "open " + path);
            }
            return AofReader(std::string(), path, false);
        }
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return AofReader(std::move(contents), path, true);
    }

    AofReader AofReader::from_buffer(std::string contents, std::string name)
    {
        return AofReader(std::move(contents), std::move(name), false);
    }

    bool AofReader::later_record_exists(std::size_t from) const
    {
        std::string_view view(data);
        std::size_t pos = view.find("\r\n*", from);
        while (pos != std::string_view::npos)
        {
            std::size_t consumed = 0;
            std::vector<std::string> args;
            if (parse_resp_array(view.substr(pos + 2), consumed, args) == RespParseStatus::Ok)
            {
                return true;
            }
            pos = view.find("\r\n*", pos + 1);
        }
        return false;
    }

    bool AofReader::next(std::vector<std::string> &record)
    {
        while (cursor < data.size())
        {
            std::size_t consumed = 0;
            auto st = parse_resp_array(std::string_view(data).substr(cursor), consumed, record);
            if (st == RespParseStatus::Ok)
            {
                cursor += consumed;
                if (record.empty())
                {
                    continue;
                }
                return true;
            }
            // an unfinished record is only a torn tail when nothing parseable follows it
            if (later_record_exists(cursor))
            {
                throw CorruptLogError(name, cursor);
            }
            discarded = data.size() - cursor;
            log(LogLevel::Warn, "durability log " + name + ": discarding " + std::to_string(discarded) +
                                    " bytes of incomplete trailing record at offset " + std::to_string(cursor));
            data.resize(cursor);
            return false;
        }
        return false;
    }

    void AofReader::truncate_tail() const
    {
        if (!on_disk || discarded == 0)
        {
            return;
        }
        std::filesystem::resize_file(name, cursor);
    }
}
