#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

namespace diag {

    // Fixed-capacity ring of the most recent samples.
    template <typename T>
    class RollingWindow {
    public:
        explicit RollingWindow(size_t cap = 240) : cap_(cap > 0 ? cap : 1) { data_.reserve(cap_); }

        void clear() { data_.clear(); next_ = 0; }

        void push(T v) {
            if (data_.size() < cap_) data_.push_back(v);
            else data_[next_] = v;
            next_ = (next_ + 1) % cap_;
        }

        size_t size() const { return data_.size(); }
        bool empty() const { return data_.empty(); }
        size_t capacity() const { return cap_; }

        T sum() const {
            T s{};
            for (const T& v : data_) s += v;
            return s;
        }
        T max() const { return data_.empty() ? T{} : *std::max_element(data_.begin(), data_.end()); }

    private:
        size_t cap_;
        std::vector<T> data_;
        size_t next_ = 0;
    };

    class FrameStats {
    public:
        explicit FrameStats(size_t window = 240) : frameMs_(window) {}

        void push(double frameMs) { frameMs_.push(frameMs); ++frames_; }

        double averageMs() const { return frameMs_.empty() ? 0.0 : frameMs_.sum() / double(frameMs_.size()); }
        double maxMs() const { return frameMs_.max(); }
        double fps() const {
            const double avg = averageMs();
            return avg > 0.0 ? 1000.0 / avg : 0.0;
        }
        size_t samples() const { return frameMs_.size(); }
        unsigned long long totalFrames() const { return frames_; }

    private:
        RollingWindow<double> frameMs_;
        unsigned long long frames_ = 0;
    };

}
