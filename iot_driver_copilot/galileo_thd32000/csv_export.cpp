#include "csv_export.h"

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

std::string sanitize_file_component(const std::string& s) {
    static const char kForbidden[] = "\\/*?:\"<>|";
    std::string out;
    for (char c : s) {
        if (std::strchr(kForbidden, c) == nullptr) out += c;
    }
    while (!out.empty() && (out.front() == ' ' || out.front() == '\t')) out.erase(out.begin());
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
    return out;
}

std::string build_export_file_name(std::time_t when, const std::string& equipment, const std::string& tag) {
    std::tm tm{};
    localtime_r(&when, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d__%H-%M-%S", &tm);

    std::string name = std::string(ts) + "__" + sanitize_file_component(equipment);
    std::string clean_tag = sanitize_file_component(tag);
    if (!clean_tag.empty()) name += "__" + clean_tag;
    return name + ".csv";
}

static bool make_dirs(const std::string& dir, std::string& error) {
    std::string partial;
    std::istringstream iss(dir);
    std::string part;
    if (!dir.empty() && dir[0] == '/') partial = "/";
    while (std::getline(iss, part, '/')) {
        if (part.empty()) continue;
        partial += part;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            error = "mkdir " + partial + " failed: " + std::strerror(errno);
            return false;
        }
        partial += "/";
    }
    return true;
}

// Metadata values share the row with their labels.
static std::string metadata_field(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c != ';' && c != '\r' && c != '\n') out += c;
    }
    return out;
}

bool export_series_csv(const std::string& dir, const std::string& file_name, const std::string& equipment,
                       const std::string& tag, const Series& series, const DeviceInfo& info, std::string& error) {
    if (!make_dirs(dir, error)) return false;

    std::string path = dir + "/" + file_name;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        error = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }

    out << "#;Equipment:;" << metadata_field(equipment) << ";Tag:;" << metadata_field(tag) << ";Model:;"
        << metadata_field(info.model) << "\n";
    out << "timestamp;temperature;humidity;status\n";
    out << std::fixed << std::setprecision(1);
    for (const MeasurementRecord& r : series.records()) {
        out << format_timestamp(r.timestamp) << ";" << r.temperature << ";" << r.humidity << ";"
            << status_to_string(r.status) << "\n";
    }

    out.flush();
    if (!out) {
        error = "write to " + path + " failed";
        return false;
    }
    return true;
}

std::vector<std::string> list_export_files(const std::string& dir) {
    std::vector<std::pair<time_t, std::string>> found;
    DIR* d = ::opendir(dir.c_str());
    if (!d) return {};
    while (dirent* ent = ::readdir(d)) {
        std::string name = ent->d_name;
        if (name.size() <= 4 || name.compare(name.size() - 4, 4, ".csv") != 0) continue;
        struct stat st;
        if (::stat((dir + "/" + name).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        found.push_back(std::make_pair(st.st_mtime, name));
    }
    ::closedir(d);

    // names start with the export time, so they break mtime ties
    std::sort(found.begin(), found.end(), [](const std::pair<time_t, std::string>& a,
                                             const std::pair<time_t, std::string>& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second > b.second;
    });
    std::vector<std::string> names;
    for (const auto& f : found) names.push_back(f.second);
    return names;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, sep)) parts.push_back(item);
    return parts;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end != s.c_str() && *end == '\0';
}

static bool valid_export_name(const std::string& name) {
    if (name.size() <= 4 || name.compare(name.size() - 4, 4, ".csv") != 0) return false;
    if (name[0] == '.') return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

ExportLoadStatus load_export_csv(const std::string& dir, const std::string& file_name, LoadedExport& out,
                                 std::string& error) {
    if (!valid_export_name(file_name)) {
        error = "invalid export file name: " + file_name;
        return ExportLoadStatus::InvalidName;
    }

    std::string path = dir + "/" + file_name;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        error = "no such export: " + file_name;
        return ExportLoadStatus::NotFound;
    }
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path + ": " + std::strerror(errno);
        return ExportLoadStatus::NotFound;
    }

    // DATE__TIME__EQUIPMENT[__TAG].csv
    LoadedExport loaded;
    std::string stem = file_name.substr(0, file_name.size() - 4);
    std::vector<std::string> name_parts;
    for (size_t pos = 0;;) {
        size_t next = stem.find("__", pos);
        name_parts.push_back(stem.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) break;
        pos = next + 2;
    }
    if (name_parts.size() >= 3) loaded.equipment = name_parts[2];
    if (name_parts.size() >= 4) loaded.tag = name_parts[3];

    std::vector<MeasurementRecord> records;
    std::string line;
    size_t line_no = 0;
    bool header_seen = false;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::vector<std::string> fields = split(line, ';');

        if (line_no == 1 && !fields.empty() && fields[0] == "#") {
            for (size_t i = 1; i + 1 < fields.size(); i += 2) {
                if (fields[i] == "Equipment:") loaded.equipment = fields[i + 1];
                else if (fields[i] == "Tag:") loaded.tag = fields[i + 1];
                else if (fields[i] == "Model:") loaded.model = fields[i + 1];
            }
            continue;
        }
        if (!header_seen) {
            header_seen = true;
            continue;
        }
        if (fields.size() < 3) continue;

        MeasurementRecord r;
        r.index = (uint32_t)records.size();
        if (!parse_timestamp(fields[0], r.timestamp) || !parse_double(fields[1], r.temperature) ||
            !parse_double(fields[2], r.humidity) || (fields.size() > 3 && !parse_status(fields[3], r.status))) {
            error = file_name + ": malformed row at line " + std::to_string(line_no);
            return ExportLoadStatus::Malformed;
        }
        records.push_back(r);
    }

    loaded.series = Series(std::move(records), 0);
    out = std::move(loaded);
    return ExportLoadStatus::Loaded;
}
