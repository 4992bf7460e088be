#ifndef SERIES_H
#define SERIES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "measurement.h"

// Ordered, immutable measurement series.
class Series {
public:
    Series() : missing_(0) {}
    Series(std::vector<MeasurementRecord> records, size_t missing);

    const std::vector<MeasurementRecord>& records() const { return records_; }
    const MeasurementRecord& operator[](size_t i) const { return records_[i]; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Indices absent between the lowest and highest index seen at assembly.
    size_t missingCount() const { return missing_; }

private:
    std::vector<MeasurementRecord> records_;
    size_t missing_;
};

// Chunks are decoded record groups in the order they arrived. A duplicate
// index keeps the record received last; the result is stable-sorted by
// timestamp, ties keep arrival order.
Series assemble(const std::vector<std::vector<MeasurementRecord>>& chunks_in_arrival_order);

struct ChannelStats {
    bool has_data = false;
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    size_t min_pos = 0;        // position in the series
    size_t max_pos = 0;
    int64_t min_timestamp = 0;
    int64_t max_timestamp = 0;
};

struct Statistics {
    size_t begin = 0;
    size_t end = 0;
    ChannelStats temperature;
    ChannelStats humidity;
};

// Faulted channels are skipped; a channel with no usable record has
// has_data == false. Range is [begin, end), clamped to the series.
Statistics compute_statistics(const Series& series);
Statistics compute_statistics(const Series& series, size_t begin, size_t end);

struct Summary {
    bool has_data = false;
    std::string start;
    std::string end;
    size_t samples = 0;
    Statistics stats;
};

Summary summarize(const Series& series);

#endif // SERIES_H
