#include "fluxdb/storage/wal.h"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "fluxdb/common/logger.h"
#include "fluxdb/core/limits.h"

namespace fluxdb {
namespace storage {

namespace {

const char kSnapshotFile[] = "snapshot.dat";
const char kSnapshotTempFile[] = "snapshot.tmp";

core::Result<void> IOError(const std::string& message) {
    return core::Result<void>::error(message, core::Error::Code::IO_FAILURE);
}

bool IsSegmentName(const std::string& filename) {
    return filename.size() > 8 && filename.compare(0, 4, "wal_") == 0 &&
           filename.compare(filename.size() - 4, 4, ".log") == 0;
}

int SegmentNumber(const std::string& path) {
    std::string filename = std::filesystem::path(path).filename().string();
    try {
        return std::stoi(filename.substr(4, filename.size() - 8));
    } catch (const std::exception&) {
        return -1;
    }
}

} // namespace

WriteAheadLog::WriteAheadLog(const std::string& dir, size_t max_segment_bytes)
    : wal_dir_(dir), max_segment_bytes_(max_segment_bytes), current_segment_(0), current_size_(0) {}

WriteAheadLog::~WriteAheadLog() {
    close();
}

std::vector<std::string> WriteAheadLog::segment_files() const {
    std::vector<std::string> segment_files;
    std::error_code ec;
    if (!std::filesystem::is_directory(wal_dir_, ec)) {
        return segment_files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(wal_dir_, ec)) {
        if (entry.is_regular_file(ec) && IsSegmentName(entry.path().filename().string())) {
            segment_files.push_back(entry.path().string());
        }
    }
    // Zero-padded names sort by segment number
    std::sort(segment_files.begin(), segment_files.end());
    return segment_files;
}

core::Result<void> WriteAheadLog::replay(const ReplayCallback& callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(wal_dir_, ec)) {
        // No directory means nothing was ever logged
        return core::Result<void>();
    }
    if (!std::filesystem::is_directory(wal_dir_, ec)) {
        return IOError("log path is not a directory: " + wal_dir_);
    }

    // A leftover temp snapshot is an interrupted checkpoint; the old state is intact
    std::filesystem::remove(std::filesystem::path(wal_dir_) / kSnapshotTempFile, ec);

    if (std::filesystem::exists(snapshot_path(), ec)) {
        auto result = replay_file(snapshot_path(), false, callback);
        if (!result.ok()) {
            return result;
        }
    }

    auto segments = segment_files();
    for (size_t i = 0; i < segments.size(); ++i) {
        bool newest = (i + 1 == segments.size());
        auto result = replay_file(segments[i], newest, callback);
        if (!result.ok()) {
            return result;
        }
    }
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::replay_file(const std::string& path, bool allow_torn_tail,
                                              const ReplayCallback& callback) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return IOError("failed to open log file for replay: " + path);
    }

    file.seekg(0, std::ios::end);
    std::streamoff file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::streamoff offset = 0;
    size_t records = 0;
    while (offset < file_size) {
        bool torn = false;
        uint32_t data_length = 0;
        if (file_size - offset < static_cast<std::streamoff>(sizeof(uint32_t))) {
            torn = true;
        } else {
            unsigned char len_bytes[4];
            file.read(reinterpret_cast<char*>(len_bytes), sizeof(len_bytes));
            if (file.gcount() != static_cast<std::streamsize>(sizeof(len_bytes))) {
                return IOError("failed to read log file: " + path);
            }
            for (int i = 0; i < 4; ++i) {
                data_length |= static_cast<uint32_t>(len_bytes[i]) << (8 * i);
            }
            if (data_length == 0 && allow_torn_tail) {
                // Zero-filled tail left by a crash; no record is ever empty
                torn = true;
            } else if (data_length == 0 || data_length > core::kMaxFrameLength) {
                return IOError("invalid record length in " + path + " at offset " + std::to_string(offset));
            } else if (file_size - offset - 4 < static_cast<std::streamoff>(data_length)) {
                torn = true;
            }
        }

        if (torn) {
            if (!allow_torn_tail) {
                return IOError("truncated record in " + path + " at offset " + std::to_string(offset));
            }
            FLUXDB_WARN("Log {} ends with a torn record at offset {}, truncating {} bytes",
                        path, offset, file_size - offset);
            file.close();
            std::error_code ec;
            std::filesystem::resize_file(path, static_cast<uintmax_t>(offset), ec);
            if (ec) {
                return IOError("failed to truncate " + path + ": " + ec.message());
            }
            break;
        }

        std::vector<uint8_t> data(data_length);
        file.read(reinterpret_cast<char*>(data.data()), data_length);
        if (file.gcount() != static_cast<std::streamsize>(data_length)) {
            return IOError("failed to read log file: " + path);
        }

        auto result = callback(data.data(), data.size());
        if (!result.ok()) {
            return IOError(path + ": " + result.error());
        }

        offset += 4 + static_cast<std::streamoff>(data_length);
        records++;
    }

    FLUXDB_DEBUG("Replayed {} records from {}", records, path);
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        return core::Result<void>();
    }

    std::error_code ec;
    std::filesystem::create_directories(wal_dir_, ec);
    if (ec) {
        return IOError("failed to create log directory " + wal_dir_ + ": " + ec.message());
    }

    auto segments = segment_files();
    current_segment_ = segments.empty() ? 0 : std::max(0, SegmentNumber(segments.back()));

    std::string segment_path = get_segment_path(current_segment_);
    current_file_.open(segment_path, std::ios::binary | std::ios::app);
    if (!current_file_.is_open()) {
        return IOError("failed to open log segment: " + segment_path);
    }
    current_size_ = std::filesystem::file_size(segment_path, ec);
    if (ec) {
        current_file_.close();
        return IOError("failed to stat log segment " + segment_path + ": " + ec.message());
    }
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::append(const std::vector<uint8_t>& payload, bool flush_now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!current_file_.is_open()) {
        return core::Result<void>::error("log is not open: " + wal_dir_, core::Error::Code::CLOSED);
    }
    if (payload.empty() || payload.size() > core::kMaxFrameLength) {
        return core::Result<void>::error("invalid record size " + std::to_string(payload.size()),
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    // Rotate first so a failed rotation never follows a record already on disk
    if (max_segment_bytes_ > 0 && current_size_ >= max_segment_bytes_) {
        auto rotated = rotate_segment();
        if (!rotated.ok()) {
            return rotated;
        }
    }

    // A record that failed to write or flush must not be replayed later
    uint64_t start = current_size_;
    bool written = write_frame(current_file_, payload);
    if (written && flush_now) {
        current_file_.flush();
        written = current_file_.good();
    }
    if (!written) {
        std::string message = "failed to write to log segment " + get_segment_path(current_segment_);
        auto discarded = discard_tail(start);
        if (!discarded.ok()) {
            FLUXDB_ERROR("Log {} is unusable after a failed write: {}", wal_dir_, discarded.error());
            message += "; " + discarded.error();
        }
        return IOError(message);
    }

    current_size_ += sizeof(uint32_t) + payload.size();
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
        if (!current_file_.good()) {
            return IOError("failed to flush log " + wal_dir_);
        }
    }
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::checkpoint(const std::vector<std::vector<uint8_t>>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool was_open = current_file_.is_open();
    if (was_open) {
        current_file_.close();
    }

    std::error_code ec;
    std::filesystem::create_directories(wal_dir_, ec);
    std::string temp_path = (std::filesystem::path(wal_dir_) / kSnapshotTempFile).string();
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return IOError("failed to create snapshot " + temp_path);
        }
        for (const auto& record : records) {
            if (!write_frame(out, record)) {
                return IOError("failed to write snapshot " + temp_path);
            }
        }
        out.flush();
        if (!out.good()) {
            return IOError("failed to flush snapshot " + temp_path);
        }
    }

    std::filesystem::rename(temp_path, snapshot_path(), ec);
    if (ec) {
        return IOError("failed to install snapshot " + snapshot_path() + ": " + ec.message());
    }

    for (const auto& segment : segment_files()) {
        std::filesystem::remove(segment, ec);
        if (ec) {
            return IOError("failed to remove log segment " + segment + ": " + ec.message());
        }
    }
    current_segment_ = 0;

    if (was_open) {
        current_file_.open(get_segment_path(current_segment_), std::ios::binary | std::ios::app);
        if (!current_file_.is_open()) {
            return IOError("failed to reopen log segment after checkpoint");
        }
        current_size_ = 0;
    }
    return core::Result<void>();
}

void WriteAheadLog::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

bool WriteAheadLog::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_.is_open();
}

bool WriteAheadLog::write_frame(std::ofstream& out, const std::vector<uint8_t>& payload) {
    uint32_t data_length = static_cast<uint32_t>(payload.size());
    char len_bytes[4];
    for (int i = 0; i < 4; ++i) {
        len_bytes[i] = static_cast<char>(data_length >> (8 * i));
    }
    out.write(len_bytes, sizeof(len_bytes));
    out.write(reinterpret_cast<const char*>(payload.data()), payload.size());
    return out.good();
}

core::Result<void> WriteAheadLog::rotate_segment() {
    // Open the next segment before giving up the current one
    std::string next_path = get_segment_path(current_segment_ + 1);
    std::ofstream next(next_path, std::ios::binary | std::ios::app);
    if (!next.is_open()) {
        return IOError("failed to open new log segment " + next_path);
    }
    current_file_.close();
    current_file_ = std::move(next);
    current_segment_++;
    current_size_ = 0;
    FLUXDB_DEBUG("Rotated log {} to segment {}", wal_dir_, current_segment_);
    return core::Result<void>();
}

core::Result<void> WriteAheadLog::discard_tail(uint64_t offset) {
    std::string path = get_segment_path(current_segment_);

    // Closing pushes out whatever the stream still buffers so the cut is final
    current_file_.close();
    current_file_.clear();

    std::error_code ec;
    std::filesystem::resize_file(path, offset, ec);
    if (ec) {
        return IOError("failed to truncate " + path + ": " + ec.message());
    }
    current_file_.open(path, std::ios::binary | std::ios::app);
    if (!current_file_.is_open()) {
        return IOError("failed to reopen log segment " + path);
    }
    current_size_ = offset;
    return core::Result<void>();
}

std::string WriteAheadLog::get_segment_path(int segment) const {
    std::ostringstream oss;
    oss << wal_dir_ << "/wal_" << std::setfill('0') << std::setw(6) << segment << ".log";
    return oss.str();
}

std::string WriteAheadLog::snapshot_path() const {
    return (std::filesystem::path(wal_dir_) / kSnapshotFile).string();
}

} // namespace storage
} // namespace fluxdb
