/**
 * @file local_target.cpp
 * @brief LocalTarget and AtomicWriter implementation.
 */

#include "target/local_target.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace taskpipe {

namespace {

std::string random_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng()
        << std::setw(16) << rng();
    return oss.str();
}

std::filesystem::path with_suffix(const std::filesystem::path& path, const std::string& suffix) {
    auto out = path;
    out += suffix;
    return out;
}

}  // namespace

// ── LocalTarget ──────────────────────────────

LocalTarget::LocalTarget(std::filesystem::path path, bool force)
    : path_(std::move(path)), force_(force) {}

bool LocalTarget::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec) && !force_;
}

std::string LocalTarget::describe() const {
    return "LocalTarget(" + path_.string() + (force_ ? ", force" : "") + ")";
}

Result<std::unique_ptr<std::ifstream>> LocalTarget::open_read(std::ios::openmode mode) const {
    auto stream = std::make_unique<std::ifstream>(path_, mode | std::ios::in);
    if (!stream->is_open()) {
        return Error{ErrorKind::Target, "cannot open " + path_.string() + " for reading"};
    }
    return stream;
}

Result<std::string> LocalTarget::read_all() const {
    auto stream = open_read(std::ios::binary);
    if (!stream) return stream.error();
    std::ostringstream oss;
    oss << (*stream)->rdbuf();
    return oss.str();
}

Result<std::unique_ptr<LocalTarget::AtomicWriter>> LocalTarget::begin_write(
    std::ios::openmode mode) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::Target,
                         "cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    auto id = random_id();
    auto tmp = with_suffix(path_, "-TMP-" + id);
    auto writer = std::make_unique<AtomicWriter>(path_, tmp, id, mode);
    if (!writer->stream().is_open()) {
        return Error{ErrorKind::Target, "cannot open " + tmp.string() + " for writing"};
    }
    return writer;
}

Result<void> LocalTarget::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorKind::Target, "cannot remove " + path_.string() + ": " + ec.message()};
    }
    return {};
}

// ── AtomicWriter ─────────────────────────────

LocalTarget::AtomicWriter::AtomicWriter(std::filesystem::path final_path,
                                        std::filesystem::path tmp_path,
                                        std::string id,
                                        std::ios::openmode mode)
    : final_path_(std::move(final_path))
    , tmp_path_(std::move(tmp_path))
    , id_(std::move(id))
    , stream_(tmp_path_, mode | std::ios::out) {}

LocalTarget::AtomicWriter::~AtomicWriter() {
    if (committed_) return;
    if (stream_.is_open()) stream_.close();

    // Keep the partial output around for inspection under a FAILED name.
    std::error_code ec;
    if (std::filesystem::exists(tmp_path_, ec)) {
        std::filesystem::rename(tmp_path_, with_suffix(final_path_, "-FAILED-" + id_), ec);
    }
}

Result<void> LocalTarget::AtomicWriter::commit() {
    if (committed_) {
        return Error{ErrorKind::Target, "writer for " + final_path_.string() + " already committed"};
    }
    stream_.flush();
    if (!stream_) {
        return Error{ErrorKind::Target, "write to " + tmp_path_.string() + " failed"};
    }
    stream_.close();

    std::error_code ec;
    std::filesystem::rename(tmp_path_, final_path_, ec);
    if (ec) {
        return Error{ErrorKind::Target,
                     "cannot commit " + final_path_.string() + ": " + ec.message()};
    }
    committed_ = true;
    return {};
}

}  // namespace taskpipe
