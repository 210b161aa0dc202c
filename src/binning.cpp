#include "fee/binning.hpp"
#include "fee/diagnostics.hpp"
#include "fee/features.hpp"
#include "fee/predicate.hpp"
#include <algorithm>
#include <cstdio>
#include <limits>
#include <map>
#include <stdexcept>

namespace fee {

namespace {

struct WeightedPoint { double value; double weight; };

// Prefix sums for O(1) weighted within-segment sum of squares.
struct SegmentCost {
    std::vector<double> w, wx, wxx;
    explicit SegmentCost(const std::vector<WeightedPoint>& pts) : w(pts.size()+1, 0.0), wx(pts.size()+1, 0.0), wxx(pts.size()+1, 0.0) {
        for(size_t i=0;i<pts.size();++i){
            w[i+1] = w[i] + pts[i].weight;
            wx[i+1] = wx[i] + pts[i].weight*pts[i].value;
            wxx[i+1] = wxx[i] + pts[i].weight*pts[i].value*pts[i].value;
        }
    }
    // Cost of points [a, b] inclusive.
    double operator()(size_t a, size_t b) const {
        double sw = w[b+1]-w[a], sx = wx[b+1]-wx[a], sxx = wxx[b+1]-wxx[a];
        if(sw<=0.0) return 0.0;
        double c = sxx - sx*sx/sw;
        return c<0.0? 0.0 : c;
    }
};

} // namespace

std::vector<std::vector<size_t>> cluster_values(const std::vector<double>& values, size_t k){
    if(k==0) throw std::invalid_argument("bin count must be at least 1");
    if(k>max_bin_count) throw std::invalid_argument("bin count exceeds max_bin_count");
    std::vector<std::vector<size_t>> groups(k);
    if(values.empty()) return groups;

    std::map<double, std::vector<size_t>> by_value;
    for(size_t i=0;i<values.size();++i) by_value[values[i]].push_back(i);
    std::vector<WeightedPoint> pts; std::vector<const std::vector<size_t>*> members;
    for(const auto& kv : by_value){ pts.push_back({kv.first, (double)kv.second.size()}); members.push_back(&kv.second); }

    const size_t n = pts.size();
    const size_t used = std::min(k, n);
    SegmentCost cost(pts);
    const double inf = std::numeric_limits<double>::infinity();
    // dp[c][i]: best cost of the first i+1 points in c+1 clusters; cut[c][i]: start of the last cluster
    std::vector<std::vector<double>> dp(used, std::vector<double>(n, inf));
    std::vector<std::vector<size_t>> cut(used, std::vector<size_t>(n, 0));
    for(size_t i=0;i<n;++i) dp[0][i] = cost(0, i);
    for(size_t c=1;c<used;++c){
        for(size_t i=c;i<n;++i){
            for(size_t j=c;j<=i;++j){
                double d = dp[c-1][j-1] + cost(j, i);
                if(d < dp[c][i]){ dp[c][i] = d; cut[c][i] = j; }
            }
        }
    }

    size_t end = n;
    for(size_t c=used; c-- > 0;){
        size_t start = c==0? 0 : cut[c][end-1];
        for(size_t p=start;p<end;++p) groups[c].insert(groups[c].end(), members[p]->begin(), members[p]->end());
        std::sort(groups[c].begin(), groups[c].end());
        end = start;
    }
    return groups;
}

std::vector<GlyphBin> bin_glyphs_by_metric(const FontModel& font, const GlyphSet& glyphs, Metric metric, size_t bincount){
    std::vector<double> values; values.reserve(glyphs.size());
    for(const auto& g : glyphs) values.push_back((double)metric_value(metrics_or_zero(font, g), metric));
    auto groups = cluster_values(values, bincount);
    std::vector<GlyphBin> bins;
    for(const auto& grp : groups){
        GlyphBin bin;
        double total = 0.0;
        for(size_t idx : grp){ bin.glyphs.push_back(glyphs[idx]); total += values[idx]; }
        if(!grp.empty()) bin.average = total / (double)grp.size();
        bins.push_back(std::move(bin));
    }
    if(trace_enabled()) std::fprintf(stderr, "[dbg][binning] %zu glyphs by %s into %zu bins\n", glyphs.size(), metric_name(metric), bincount);
    return bins;
}

} // namespace fee
