#include "series.h"

#include <algorithm>
#include <unordered_map>
#include <utility>

Series::Series(std::vector<MeasurementRecord> records, size_t missing)
: records_(std::move(records)), missing_(missing) {}

Series assemble(const std::vector<std::vector<MeasurementRecord>>& chunks_in_arrival_order) {
    std::vector<MeasurementRecord> arrived;
    for (const auto& chunk : chunks_in_arrival_order) {
        arrived.insert(arrived.end(), chunk.begin(), chunk.end());
    }

    std::unordered_map<uint32_t, size_t> last_seen;
    for (size_t i = 0; i < arrived.size(); ++i) {
        last_seen[arrived[i].index] = i;
    }

    std::vector<MeasurementRecord> kept;
    kept.reserve(last_seen.size());
    for (size_t i = 0; i < arrived.size(); ++i) {
        if (last_seen[arrived[i].index] == i) kept.push_back(arrived[i]);
    }

    std::stable_sort(kept.begin(), kept.end(), [](const MeasurementRecord& a, const MeasurementRecord& b) {
        return a.timestamp < b.timestamp;
    });

    size_t missing = 0;
    if (!kept.empty()) {
        auto mm = std::minmax_element(kept.begin(), kept.end(), [](const MeasurementRecord& a, const MeasurementRecord& b) {
            return a.index < b.index;
        });
        size_t span = (size_t)(mm.second->index - mm.first->index) + 1;
        missing = span - kept.size();
    }
    return Series(std::move(kept), missing);
}

namespace {

struct Accumulator {
    ChannelStats s;
    double sum = 0.0;

    void add(double v, size_t pos, int64_t ts) {
        if (!s.has_data) {
            s.has_data = true;
            s.min = s.max = v;
            s.min_pos = s.max_pos = pos;
            s.min_timestamp = s.max_timestamp = ts;
        } else {
            // strict comparisons keep the first occurrence
            if (v < s.min) { s.min = v; s.min_pos = pos; s.min_timestamp = ts; }
            if (v > s.max) { s.max = v; s.max_pos = pos; s.max_timestamp = ts; }
        }
        sum += v;
        ++s.count;
    }

    ChannelStats result() const {
        ChannelStats out = s;
        if (out.count > 0) out.avg = sum / (double)out.count;
        return out;
    }
};

}  // namespace

Statistics compute_statistics(const Series& series) {
    return compute_statistics(series, 0, series.size());
}

Statistics compute_statistics(const Series& series, size_t begin, size_t end) {
    Statistics st;
    st.end = std::min(end, series.size());
    st.begin = std::min(begin, st.end);

    Accumulator temp, hum;
    for (size_t i = st.begin; i < st.end; ++i) {
        const MeasurementRecord& r = series[i];
        if (!r.temperatureFaulted()) temp.add(r.temperature, i, r.timestamp);
        if (!r.humidityFaulted()) hum.add(r.humidity, i, r.timestamp);
    }
    st.temperature = temp.result();
    st.humidity = hum.result();
    return st;
}

Summary summarize(const Series& series) {
    Summary sum;
    sum.samples = series.size();
    sum.stats = compute_statistics(series);
    if (series.empty()) return sum;
    sum.has_data = true;
    sum.start = format_timestamp(series.records().front().timestamp);
    sum.end = format_timestamp(series.records().back().timestamp);
    return sum;
}
