#pragma once

/// @file ledger_writer.hpp
/// @brief Export a job ledger as JSON.
/// @ingroup io_writers

#include <qcloudsim/core/job_ledger.hpp>

#include <filesystem>
#include <ostream>
#include <string>

namespace qcloudsim::io {

/// @brief Serialise @p ledger to a JSON object string.
///
/// The output maps each job id (as a string key) to an object of its
/// entries. Jobs are written in ascending id order and keys in ascending
/// lexical order, so two identical runs produce byte-identical output. A
/// key logged once is written as a scalar, a repeated key as a list.
///
/// @code{.json}
/// {"1":{"arrival":0.0,"cpu_finish":[4.1,9.3],"devc_name":["qpu0","cpu0"]}}
/// @endcode
[[nodiscard]] std::string ledger_to_json(const core::JobLedger& ledger);

/// @brief Write the JSON form of @p ledger to @p out.
void write_ledger_to_stream(const core::JobLedger& ledger, std::ostream& out);

/// @brief Write the JSON form of @p ledger to a file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_ledger(const core::JobLedger& ledger, const std::filesystem::path& path);

} // namespace qcloudsim::io
