/**
 * @file local_target.hpp
 * @brief Filesystem target with atomic commit-or-discard writes.
 */

#pragma once

#include "core/result.hpp"
#include "target/target.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace taskpipe {

/**
 * @brief A file on the local filesystem.
 *
 * Writers never touch the final path until they commit: data goes to a
 * sibling `<path>-TMP-<id>` file that is renamed onto `<path>` on commit, or
 * renamed to `<path>-FAILED-<id>` if the writer is destroyed uncommitted.
 * Readers therefore never observe a partially written output, and exists()
 * never reports an output whose producing task failed.
 */
class LocalTarget final : public Target {
public:
    class AtomicWriter;

    explicit LocalTarget(std::filesystem::path path, bool force = false);

    /// True when the file exists, unless `force` asks for regeneration.
    [[nodiscard]] bool exists() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool force() const noexcept { return force_; }

    [[nodiscard]] Result<std::unique_ptr<std::ifstream>> open_read(
        std::ios::openmode mode = std::ios::in) const;

    /// Read the whole file into a string.
    [[nodiscard]] Result<std::string> read_all() const;

    /// Start an atomic write; parent directories are created as needed.
    [[nodiscard]] Result<std::unique_ptr<AtomicWriter>> begin_write(
        std::ios::openmode mode = std::ios::out) const;

    /// Remove the file if present.
    Result<void> remove() const;

private:
    std::filesystem::path path_;
    bool force_;
};

/**
 * @brief Scoped write handle with guaranteed commit-or-discard on exit.
 */
class LocalTarget::AtomicWriter {
public:
    AtomicWriter(std::filesystem::path final_path, std::filesystem::path tmp_path,
                 std::string id, std::ios::openmode mode);
    ~AtomicWriter();

    AtomicWriter(const AtomicWriter&) = delete;
    AtomicWriter& operator=(const AtomicWriter&) = delete;

    [[nodiscard]] std::ofstream& stream() noexcept { return stream_; }
    [[nodiscard]] const std::filesystem::path& tmp_path() const noexcept { return tmp_path_; }

    /// Flush, close and rename the temporary file onto the final path.
    Result<void> commit();

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    std::filesystem::path final_path_;
    std::filesystem::path tmp_path_;
    std::string id_;
    std::ofstream stream_;
    bool committed_{false};
};

}  // namespace taskpipe
