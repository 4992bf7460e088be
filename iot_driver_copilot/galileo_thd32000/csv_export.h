#ifndef CSV_EXPORT_H
#define CSV_EXPORT_H

#include <ctime>
#include <string>
#include <vector>

#include "measurement.h"
#include "series.h"

// Removes characters that are not allowed in file names: \ / * ? : " < > |
std::string sanitize_file_component(const std::string& s);

// YYYY-MM-DD__HH-MM-SS__EQUIPMENT[__TAG].csv, local time of `when`.
std::string build_export_file_name(std::time_t when, const std::string& equipment, const std::string& tag);

// Writes the series as ';'-separated CSV into dir (created if missing).
// Returns false and fills error on I/O failure.
bool export_series_csv(const std::string& dir, const std::string& file_name, const std::string& equipment,
                       const std::string& tag, const Series& series, const DeviceInfo& info, std::string& error);

// Export files in dir, newest first by modification time. A missing
// directory lists nothing.
std::vector<std::string> list_export_files(const std::string& dir);

enum class ExportLoadStatus {
    Loaded,
    InvalidName,   // empty, not *.csv, or carries a path separator
    NotFound,
    Malformed
};

struct LoadedExport {
    std::string equipment;
    std::string tag;
    std::string model;
    Series series;
};

// Reads back a file written by export_series_csv. Equipment and tag come from
// the metadata row, or from the file name when the row is absent.
ExportLoadStatus load_export_csv(const std::string& dir, const std::string& file_name, LoadedExport& out,
                                 std::string& error);

#endif // CSV_EXPORT_H
