#pragma once

/// @file job_loader.hpp
/// @brief Load dispatcher job lists from CSV or JSON files.
/// @ingroup io_loaders

#include <qcloudsim/core/job.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace qcloudsim::io {

/// @brief Load a job list, choosing the format from the file extension.
///
/// `.csv` files are read with load_jobs_from_csv_string(), `.json` files
/// with load_jobs_from_json_string(). Jobs are returned in file order.
///
/// @throws LoaderError  On an unsupported extension, an unreadable file or
///                      an invalid entry.
std::vector<core::Job> load_jobs(const std::filesystem::path& path);

/// @brief Parse a CSV job list.
///
/// The first line is a header naming the columns, in any order:
/// `job_id,num_qubits,depth,num_shots,priority` are required,
/// `arrival_time`, `iterations`, `cpu_units` and `mem_bw` are optional.
/// A blank `arrival_time` means time 0, a blank `iterations` means 1 and
/// a blank `cpu_units` or `mem_bw` leaves the compute defaults in place.
///
/// @throws LoaderError  With a `line N` context on any invalid row.
std::vector<core::Job> load_jobs_from_csv_string(std::string_view csv);

/// @brief Parse a JSON job list of the form `{"jobs": [{...}, ...]}`.
///
/// Objects carry the same fields as the CSV columns.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
std::vector<core::Job> load_jobs_from_json_string(std::string_view json);

} // namespace qcloudsim::io
