#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "ipod/common/types.hpp"
#include "ipod/data/results.hpp"

namespace ipod::io {

/**
 * @brief Writes final run results to an HDF5 file.
 *
 * Layout: /runs/<run_name>/{orbits,members,candidates,summaries}, one
 * gzip-compressed dataset per column and a num_rows attribute per
 * collection. Timestamps are stored as <column>_days and <column>_nanos,
 * booleans as uint8.
 */
class ResultWriter {
public:
    enum class Mode : std::uint8_t { kWrite, kAppend };

    explicit ResultWriter(std::filesystem::path filename,
                          Mode mode = Mode::kWrite);
    ~ResultWriter()                              = default;
    ResultWriter(const ResultWriter&)            = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;
    ResultWriter(ResultWriter&&)                 = delete;
    ResultWriter& operator=(ResultWriter&&)      = delete;

    // Throws if run_name already exists in the file
    void write_results(const std::string& run_name,
                       const data::ResultBatches& results);

    [[nodiscard]] const std::filesystem::path& get_filepath() const noexcept {
        return m_filepath;
    }

private:
    std::filesystem::path m_filepath;
    Mode m_mode;
    bool m_opened{false};
    inline static std::mutex m_hdf5_mutex;
};

struct ResultCounts {
    SizeType orbits{};
    SizeType members{};
    SizeType candidates{};
    SizeType summaries{};
};

// Row counts of one run written by ResultWriter
[[nodiscard]] ResultCounts read_result_counts(
    const std::filesystem::path& filename, const std::string& run_name);

} // namespace ipod::io
