#ifndef FLUXDB_STORAGE_WAL_H_
#define FLUXDB_STORAGE_WAL_H_

#include <cstdint>
#include <string>
#include <functional>
#include <fstream>
#include <vector>
#include <mutex>
#include "fluxdb/core/result.h"

namespace fluxdb {
namespace storage {

/**
 * @brief Segmented append-only log of length-prefixed records.
 *
 * Layout inside the directory:
 *   snapshot.dat      compacted records written by checkpoint()
 *   wal_NNNNNN.log    segments appended since the last checkpoint
 *
 * Every record is framed as [u32 length][payload]. The log does not
 * interpret payloads.
 */
class WriteAheadLog {
public:
    using ReplayCallback = std::function<core::Result<void>(const uint8_t* data, size_t size)>;

    WriteAheadLog(const std::string& dir, size_t max_segment_bytes);
    ~WriteAheadLog();

    WriteAheadLog(const WriteAheadLog&) = delete;
    WriteAheadLog& operator=(const WriteAheadLog&) = delete;

    /**
     * @brief Feeds every persisted record to callback, snapshot first.
     *
     * A torn frame or zero-filled tail at the end of the newest segment is
     * cut off and logged.
     * Torn frames anywhere else, or a callback error, fail the replay with
     * IO_FAILURE. Must be called before open().
     */
    core::Result<void> replay(const ReplayCallback& callback);

    // Opens the newest segment for appending, creating the directory if needed
    core::Result<void> open();

    /**
     * @brief Appends one record.
     *
     * On failure nothing of the record is left in the segment, so a record
     * the caller saw fail is never replayed. Empty payloads and payloads over
     * core::kMaxFrameLength are rejected with INVALID_ARGUMENT.
     */
    core::Result<void> append(const std::vector<uint8_t>& payload, bool flush_now = true);
    core::Result<void> flush();

    /**
     * @brief Replaces the snapshot with the given records and drops all segments
     */
    core::Result<void> checkpoint(const std::vector<std::vector<uint8_t>>& records);

    void close();
    bool is_open() const;

    const std::string& dir() const { return wal_dir_; }

    // Segment files currently on disk, oldest first
    std::vector<std::string> segment_files() const;

private:
    std::string get_segment_path(int segment) const;
    std::string snapshot_path() const;
    bool write_frame(std::ofstream& out, const std::vector<uint8_t>& payload);
    core::Result<void> rotate_segment();
    core::Result<void> discard_tail(uint64_t offset);
    core::Result<void> replay_file(const std::string& path, bool allow_torn_tail,
                                   const ReplayCallback& callback);

    std::string wal_dir_;
    size_t max_segment_bytes_;
    int current_segment_;
    uint64_t current_size_;  // bytes in the current segment
    std::ofstream current_file_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_WAL_H_
